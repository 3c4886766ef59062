#include <NGIN/Transform/PartialResult.hpp>

namespace NGIN::Transform
{

  PartialErrors::PartialErrors(std::string message)
  {
    Add(Path{}, std::move(message));
  }

  void PartialErrors::Add(Path path, std::string message)
  {
    m_errors.PushBack(PartialError{std::move(path), std::move(message)});
  }

  void PartialErrors::Append(const PartialErrors &other, const PathSegment &prefix)
  {
    for (NGIN::UIntSize i = 0; i < other.m_errors.Size(); ++i)
      Add(other.m_errors[i].path.Prepend(prefix), other.m_errors[i].message);
  }

  const PartialError *PartialErrors::Find(std::string_view path) const
  {
    for (NGIN::UIntSize i = 0; i < m_errors.Size(); ++i)
      if (m_errors[i].path.ToString() == path)
        return &m_errors[i];
    return nullptr;
  }

  std::string PartialErrors::Render() const
  {
    std::string out;
    for (NGIN::UIntSize i = 0; i < m_errors.Size(); ++i)
    {
      const auto &e = m_errors[i];
      out += e.path.IsRoot() ? std::string{"<root>"} : e.path.ToString();
      out += ": ";
      out += e.message;
      out += '\n';
    }
    return out;
  }

} // namespace NGIN::Transform
