// Override.hpp
// User customizations of a derivation, kept in registration order; the most recent one wins
#pragma once

#include <NGIN/Transform/Export.hpp>
#include <NGIN/Transform/PartialResult.hpp>
#include <NGIN/Transform/Path.hpp>
#include <NGIN/Transform/Shape.hpp>

#include <functional>
#include <string_view>

namespace NGIN::Transform
{

  enum class OverrideKind : NGIN::UInt8
  {
    Const,
    ConstPartial,
    Computed,
    ComputedPartial,
    Renamed,
    SubtypeHandled,
    SubtypeHandledPartial,
    CustomConstructor,
    CustomConstructorPartial,
    NestedTransformer,
    NestedTransformerPartial,
  };

  [[nodiscard]] NGIN_TRANSFORM_API std::string_view KindName(OverrideKind kind) noexcept;

  // Thunks receive either the root source value (field values) or the value being converted (handlers, transformers).
  using UnaryThunk = std::function<Any(const void *)>;
  using UnaryPartialThunk = std::function<PartialAny(const void *)>;
  // Constructor thunks receive one argument per declared parameter, in declaration order.
  using ConstructorThunk = std::function<Any(Any *)>;
  using ConstructorPartialThunk = std::function<PartialAny(Any *)>;

  struct Override
  {
    OverrideKind kind{OverrideKind::Const};
    // Destination path for field overrides and renames; root for constructors.
    Path target{};
    // Source path of a rename, relative to the source value at the target's parent.
    Path source{};
    // Field value type, handled subtype or transformer input.
    TypeRef valueType{};
    // Handler, constructor or transformer result.
    TypeRef resultType{};
    // Enumerator name for handlers keyed by case rather than by type.
    std::string_view caseName{};
    NGIN::Containers::Vector<ParameterDescriptor> parameters{};

    UnaryThunk Apply{};
    UnaryPartialThunk ApplyPartial{};
    ConstructorThunk Construct{};
    ConstructorPartialThunk ConstructPartial{};

    [[nodiscard]] bool IsPartial() const noexcept
    {
      switch (kind)
      {
      case OverrideKind::ConstPartial:
      case OverrideKind::ComputedPartial:
      case OverrideKind::SubtypeHandledPartial:
      case OverrideKind::CustomConstructorPartial:
      case OverrideKind::NestedTransformerPartial:
        return true;
      default:
        return false;
      }
    }

    // Const and Computed, total or partial.
    [[nodiscard]] bool IsValue() const noexcept
    {
      return kind == OverrideKind::Const || kind == OverrideKind::ConstPartial || kind == OverrideKind::Computed ||
             kind == OverrideKind::ComputedPartial;
    }

    [[nodiscard]] bool IsPathKeyed() const noexcept { return IsValue() || kind == OverrideKind::Renamed; }
    [[nodiscard]] bool IsSubtypeHandler() const noexcept { return kind == OverrideKind::SubtypeHandled || kind == OverrideKind::SubtypeHandledPartial; }
    [[nodiscard]] bool IsConstructor() const noexcept { return kind == OverrideKind::CustomConstructor || kind == OverrideKind::CustomConstructorPartial; }
    [[nodiscard]] bool IsTransformer() const noexcept { return kind == OverrideKind::NestedTransformer || kind == OverrideKind::NestedTransformerPartial; }
  };

  class NGIN_TRANSFORM_API OverrideRegistry
  {
  public:
    void Add(Override o);

    [[nodiscard]] bool Empty() const noexcept { return m_overrides.Size() == 0; }
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_overrides.Size(); }
    [[nodiscard]] const Override &At(NGIN::UIntSize i) const { return m_overrides[i]; }

  private:
    NGIN::Containers::Vector<Override> m_overrides{};
  };

  // View of the registry as seen from one node of the destination tree.
  // Path-keyed overrides are matched on the segments below the node; the others apply everywhere.
  class NGIN_TRANSFORM_API OverrideScope
  {
  public:
    struct Entry
    {
      const Override *override{nullptr};
      NGIN::UIntSize depth{0};

      [[nodiscard]] NGIN::UIntSize Remaining() const noexcept { return override->target.Size() - depth; }
      [[nodiscard]] const PathSegment &Segment(NGIN::UIntSize k) const { return override->target[depth + k]; }
    };

    [[nodiscard]] static OverrideScope Root(const OverrideRegistry &registry);
    [[nodiscard]] OverrideScope Child(std::string_view field) const;
    // Handler and transformer overrides only; used below sum branches.
    [[nodiscard]] OverrideScope TypeKeyedOnly() const;

    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_entries.Size(); }
    [[nodiscard]] const Entry &At(NGIN::UIntSize i) const { return m_entries[i]; }

    [[nodiscard]] const Override *FindValue(std::string_view field) const;
    [[nodiscard]] const Override *FindRename(std::string_view field) const;
    [[nodiscard]] const Override *FindConstructor() const;
    [[nodiscard]] const Override *FindTransformer(TypeId from, TypeId to) const;
    [[nodiscard]] bool HasPathOverrides() const noexcept;

  private:
    NGIN::Containers::Vector<Entry> m_entries{};
  };

} // namespace NGIN::Transform
