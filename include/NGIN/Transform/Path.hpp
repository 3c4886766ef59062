// Path.hpp
// Location of a member inside a value: ".field", "(index)" and "[Variant]" segments
#pragma once

#include <NGIN/Transform/Export.hpp>
#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <string>
#include <string_view>

namespace NGIN::Transform
{

  enum class PathSegmentKind : NGIN::UInt8
  {
    Field,
    Index,
    Variant,
  };

  struct PathSegment
  {
    PathSegmentKind kind{PathSegmentKind::Field};
    std::string name{};
    NGIN::UIntSize index{0};

    [[nodiscard]] static PathSegment Field(std::string_view name) { return PathSegment{PathSegmentKind::Field, std::string{name}, 0}; }
    [[nodiscard]] static PathSegment Index(NGIN::UIntSize i) { return PathSegment{PathSegmentKind::Index, {}, i}; }
    [[nodiscard]] static PathSegment Variant(std::string_view name) { return PathSegment{PathSegmentKind::Variant, std::string{name}, 0}; }

    friend bool operator==(const PathSegment &a, const PathSegment &b) noexcept
    {
      return a.kind == b.kind && a.name == b.name && a.index == b.index;
    }
  };

  class NGIN_TRANSFORM_API Path
  {
  public:
    Path() = default;

    // Accepts "a.b", ".a.b" and the empty string for the root.
    [[nodiscard]] static Path Parse(std::string_view dotted);

    [[nodiscard]] bool IsRoot() const noexcept { return m_segments.Size() == 0; }
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_segments.Size(); }
    [[nodiscard]] const PathSegment &operator[](NGIN::UIntSize i) const { return m_segments[i]; }

    [[nodiscard]] Path Append(PathSegment segment) const;
    [[nodiscard]] Path Field(std::string_view name) const { return Append(PathSegment::Field(name)); }
    [[nodiscard]] Path Index(NGIN::UIntSize i) const { return Append(PathSegment::Index(i)); }
    [[nodiscard]] Path Variant(std::string_view name) const { return Append(PathSegment::Variant(name)); }
    [[nodiscard]] Path Prepend(const PathSegment &segment) const;
    // Segments from `offset` to the end.
    [[nodiscard]] Path Suffix(NGIN::UIntSize offset) const;

    [[nodiscard]] bool StartsWith(const Path &prefix) const noexcept;
    [[nodiscard]] std::string ToString() const;

    friend NGIN_TRANSFORM_API bool operator==(const Path &a, const Path &b) noexcept;

  private:
    NGIN::Containers::Vector<PathSegment> m_segments{};
  };

} // namespace NGIN::Transform
