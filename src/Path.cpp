#include <NGIN/Transform/Path.hpp>

namespace NGIN::Transform
{

  Path Path::Parse(std::string_view dotted)
  {
    Path out;
    NGIN::UIntSize start = 0;
    while (start <= dotted.size())
    {
      auto dot = dotted.find('.', start);
      if (dot == std::string_view::npos)
        dot = dotted.size();
      if (dot > start)
        out.m_segments.PushBack(PathSegment::Field(dotted.substr(start, dot - start)));
      start = dot + 1;
    }
    return out;
  }

  Path Path::Append(PathSegment segment) const
  {
    Path out{*this};
    out.m_segments.PushBack(std::move(segment));
    return out;
  }

  Path Path::Prepend(const PathSegment &segment) const
  {
    Path out;
    out.m_segments.Reserve(m_segments.Size() + 1);
    out.m_segments.PushBack(segment);
    for (NGIN::UIntSize i = 0; i < m_segments.Size(); ++i)
      out.m_segments.PushBack(m_segments[i]);
    return out;
  }

  Path Path::Suffix(NGIN::UIntSize offset) const
  {
    Path out;
    for (NGIN::UIntSize i = offset; i < m_segments.Size(); ++i)
      out.m_segments.PushBack(m_segments[i]);
    return out;
  }

  bool Path::StartsWith(const Path &prefix) const noexcept
  {
    if (prefix.Size() > Size())
      return false;
    for (NGIN::UIntSize i = 0; i < prefix.Size(); ++i)
      if (!(m_segments[i] == prefix.m_segments[i]))
        return false;
    return true;
  }

  std::string Path::ToString() const
  {
    std::string out;
    for (NGIN::UIntSize i = 0; i < m_segments.Size(); ++i)
    {
      const auto &s = m_segments[i];
      switch (s.kind)
      {
      case PathSegmentKind::Field:
        out += '.';
        out += s.name;
        break;
      case PathSegmentKind::Index:
        out += '(';
        out += std::to_string(s.index);
        out += ')';
        break;
      case PathSegmentKind::Variant:
        out += '[';
        out += s.name;
        out += ']';
        break;
      }
    }
    return out;
  }

  bool operator==(const Path &a, const Path &b) noexcept
  {
    return a.Size() == b.Size() && a.StartsWith(b);
  }

} // namespace NGIN::Transform
