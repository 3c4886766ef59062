// Shape.hpp
// Structural description of a type: scalar, product, sum or wrapper, plus the thunks that read and build it
#pragma once

#include <NGIN/Transform/Types.hpp>
#include <NGIN/Transform/Export.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Containers/HashMap.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace NGIN::Transform
{

  struct ShapeModel;

  // Lightweight handle to a type; `Inspect` builds its shape on demand.
  struct TypeRef
  {
    TypeId id{0};
    std::string_view name{};
    ShapeModel (*Inspect)(){nullptr};

    friend constexpr bool operator==(const TypeRef &a, const TypeRef &b) noexcept { return a.id == b.id; }
  };

  template <class T>
  TypeRef TypeRefOf();

  template <class T>
  ShapeModel InspectShape();

  enum class ShapeKind : NGIN::UInt8
  {
    Scalar,
    Product,
    Sum,
    Wrapper,
  };

  enum class ProductKind : NGIN::UInt8
  {
    Record,
    Bean,
    Singleton,
    // Readable but without an accessible way to build it.
    Opaque,
  };

  enum class FieldSourceKind : NGIN::UInt8
  {
    ConstructorParameter,
    AccessorMethod,
    BeanGetter,
    BeanSetter,
    ConstructorVal,
  };

  enum class WrapperKind : NGIN::UInt8
  {
    Optional,
    Collection,
  };

  // Readable member of a product.
  struct FieldDescriptor
  {
    std::string_view name{};
    TypeRef type{};
    FieldSourceKind sourceKind{FieldSourceKind::ConstructorVal};
    MemberKey memberKey{nullptr};
    Any (*Load)(const void *){nullptr};
  };

  // Member the destination is built from: a constructor parameter or a bean setter.
  struct ParameterDescriptor
  {
    std::string_view name{};
    TypeRef type{};
    FieldSourceKind targetKind{FieldSourceKind::ConstructorParameter};
    NGIN::UInt32 position{0};
    MemberKey memberKey{nullptr};
    bool hasDefault{false};
    std::function<Any()> Default{};
    void (*Store)(void *, Any &){nullptr};
  };

  struct VariantDescriptor
  {
    std::string_view name{};
    TypeRef type{};
    // Alternative index for std::variant, underlying value for enumerations.
    NGIN::UInt64 discriminant{0};
    // Enumerators carry no payload; the value itself is kept here.
    bool singleton{false};
    Any value{};
  };

  struct ProductShape
  {
    ProductKind kind{ProductKind::Opaque};
    NGIN::Containers::Vector<FieldDescriptor> fields{};
    NGIN::Containers::Vector<ParameterDescriptor> parameters{};
  };

  struct SumShape
  {
    NGIN::Containers::Vector<VariantDescriptor> variants{};
  };

  struct WrapperShape
  {
    WrapperKind kind{WrapperKind::Optional};
    TypeRef inner{};
  };

  // Type-erased operations generated per type. Unused entries stay null.
  struct ShapeOps
  {
    Any (*Clone)(const void *){nullptr};
    // Products: constructor arguments in parameter order; beans and singletons ignore them.
    Any (*Construct)(Any *){nullptr};
    // Sums
    NGIN::UInt64 (*Discriminant)(const void *){nullptr};
    Any (*Extract)(const void *){nullptr};
    Any (*Make)(NGIN::UIntSize, Any &){nullptr};
    // Optional wrappers
    bool (*HasValue)(const void *){nullptr};
    Any (*Unwrap)(const void *){nullptr};
    Any (*MakeEmpty)(){nullptr};
    Any (*Wrap)(Any &){nullptr};
    // Collections
    NGIN::UIntSize (*Size)(const void *){nullptr};
    Any (*ElementAt)(const void *, NGIN::UIntSize){nullptr};
    Any (*Build)(NGIN::Containers::Vector<Any> &){nullptr};
  };

  struct ShapeModel
  {
    ShapeKind kind{ShapeKind::Scalar};
    TypeRef self{};
    std::string_view displayName{};
    ProductShape product{};
    SumShape sum{};
    WrapperShape wrapper{};
    ShapeOps ops{};
    // Description problems found while inspecting (duplicate names, mistyped defaults).
    NGIN::Containers::Vector<std::string> issues{};

    [[nodiscard]] bool IsProduct() const noexcept { return kind == ShapeKind::Product; }
    [[nodiscard]] bool IsSum() const noexcept { return kind == ShapeKind::Sum; }
    [[nodiscard]] bool IsOptional() const noexcept { return kind == ShapeKind::Wrapper && wrapper.kind == WrapperKind::Optional; }
    [[nodiscard]] bool IsCollection() const noexcept { return kind == ShapeKind::Wrapper && wrapper.kind == WrapperKind::Collection; }

    [[nodiscard]] const FieldDescriptor *FindField(std::string_view name) const
    {
      for (NGIN::UIntSize i = 0; i < product.fields.Size(); ++i)
        if (product.fields[i].name == name)
          return &product.fields[i];
      return nullptr;
    }

    [[nodiscard]] const ParameterDescriptor *FindParameter(std::string_view name) const
    {
      for (NGIN::UIntSize i = 0; i < product.parameters.Size(); ++i)
        if (product.parameters[i].name == name)
          return &product.parameters[i];
      return nullptr;
    }

    [[nodiscard]] std::optional<NGIN::UIntSize> FindVariant(std::string_view name) const
    {
      for (NGIN::UIntSize i = 0; i < sum.variants.Size(); ++i)
        if (sum.variants[i].name == name)
          return i;
      return std::nullopt;
    }
  };

  // Shapes inspected during one derivation, computed at most once per type.
  class NGIN_TRANSFORM_API ShapeCache
  {
  public:
    [[nodiscard]] const ShapeModel &Get(const TypeRef &type);

  private:
    NGIN::Containers::FlatHashMap<TypeId, std::shared_ptr<const ShapeModel>> m_shapes{};
  };

} // namespace NGIN::Transform
