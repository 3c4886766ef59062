// Matcher.hpp
// Pairs source members with destination members (products) and variants (sums)
#pragma once

#include <NGIN/Transform/Export.hpp>
#include <NGIN/Transform/Override.hpp>
#include <NGIN/Transform/Shape.hpp>

#include <optional>
#include <string>

namespace NGIN::Transform
{

  enum class MatchKind : NGIN::UInt8
  {
    Matched,
    OverriddenBy,
    Renamed,
    Unmatched,
  };

  struct MemberMatch
  {
    MatchKind kind{MatchKind::Unmatched};
    const ParameterDescriptor *target{nullptr};
    // Members read from the source, outermost first. One entry unless renamed from a nested path.
    NGIN::Containers::Vector<const FieldDescriptor *> source{};
    const Override *override{nullptr};
    std::string detail{};
  };

  struct VariantMatch
  {
    NGIN::UIntSize sourceIndex{0};
    std::optional<NGIN::UIntSize> destIndex{};
    const Override *handler{nullptr};
    // Destination alternative a handler's result is wrapped into; empty when it returns the sum itself.
    std::optional<NGIN::UIntSize> handlerDestIndex{};
    // Handler for this variant whose result the destination cannot hold; set only when no handler applies.
    const Override *rejectedHandler{nullptr};
  };

  struct SumMatch
  {
    // One entry per source variant, in source order.
    NGIN::Containers::Vector<VariantMatch> variants{};
    // Destination variants no source variant or handler produces.
    NGIN::Containers::Vector<NGIN::UIntSize> uncovered{};
  };

  // One match per destination member, in `targets` order.
  [[nodiscard]] NGIN_TRANSFORM_API NGIN::Containers::Vector<MemberMatch> MatchProduct(const ShapeModel &source,
                                                                                   const NGIN::Containers::Vector<ParameterDescriptor> &targets,
                                                                                   const OverrideScope &scope,
                                                                                   const TransformerFlags &flags,
                                                                                   ShapeCache &shapes);

  [[nodiscard]] NGIN_TRANSFORM_API SumMatch MatchSum(const ShapeModel &source, const ShapeModel &dest, const OverrideScope &scope);

  // Readable member of `source` called `name`, honouring the accessor flags.
  [[nodiscard]] NGIN_TRANSFORM_API const FieldDescriptor *FindSourceField(const ShapeModel &source, std::string_view name,
                                                                          const TransformerFlags &flags) noexcept;

} // namespace NGIN::Transform
