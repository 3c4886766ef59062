// Plan.hpp
// Immutable recipe for building a destination value from a source value
#pragma once

#include <NGIN/Transform/Export.hpp>
#include <NGIN/Transform/Override.hpp>
#include <NGIN/Transform/Shape.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace NGIN::Transform
{

  enum class ConstructionStrategy : NGIN::UInt8
  {
    Identity,
    Constructor,
    CustomConstructor,
    BeanSetters,
    Singleton,
    SumDispatch,
    WrapOptional,
    MapOptional,
    UnwrapOptional,
    MapCollection,
    UserTransformer,
  };

  enum class StepKind : NGIN::UInt8
  {
    DirectCopy,
    Nested,
    Const,
    ConstPartial,
    Computed,
    ComputedPartial,
    Default,
  };

  [[nodiscard]] NGIN_TRANSFORM_API std::string_view StrategyName(ConstructionStrategy strategy) noexcept;

  struct TransformationPlan;
  using PlanPtr = std::shared_ptr<const TransformationPlan>;

  using Loader = Any (*)(const void *);

  // Produces one destination member.
  struct PlanStep
  {
    StepKind kind{StepKind::DirectCopy};
    std::string_view target{};
    // Source members read by DirectCopy and Nested steps, outermost first.
    Path source{};
    NGIN::Containers::Vector<Loader> loaders{};
    void (*Store)(void *, Any &){nullptr};
    PlanPtr nested{};
    UnaryThunk value{};
    UnaryPartialThunk partialValue{};
    std::function<Any()> defaultValue{};
  };

  // Handles one source variant of a sum.
  struct VariantBranch
  {
    std::string_view source{};
    NGIN::UInt64 discriminant{0};
    std::string_view dest{};
    NGIN::UIntSize destIndex{0};
    // Enumerator destinations are copied from here; no payload conversion.
    bool destSingleton{false};
    Any singletonValue{};
    PlanPtr plan{};
    bool handled{false};
    UnaryThunk handler{};
    UnaryPartialThunk partialHandler{};
    std::optional<NGIN::UIntSize> wrapIndex{};
  };

  struct TransformationPlan
  {
    ConstructionStrategy strategy{ConstructionStrategy::Identity};
    TypeRef from{};
    TypeRef to{};
    // Some step, branch or child can fail at transform time.
    bool partial{false};
    ShapeOps sourceOps{};
    ShapeOps targetOps{};
    NGIN::Containers::Vector<PlanStep> steps{};
    NGIN::Containers::Vector<VariantBranch> branches{};
    // Inner plan of wrapper strategies.
    PlanPtr element{};
    ConstructorThunk construct{};
    ConstructorPartialThunk partialConstruct{};
    UnaryThunk transform{};
    UnaryPartialThunk partialTransform{};
  };

  // Deterministic one-line rendering, e.g. "Constructor(copy id, copy name, const tag)".
  [[nodiscard]] NGIN_TRANSFORM_API std::string DescribePlan(const TransformationPlan &plan);

} // namespace NGIN::Transform
