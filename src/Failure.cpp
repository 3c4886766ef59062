#include <NGIN/Transform/Failure.hpp>

namespace NGIN::Transform
{

  std::string_view ReasonName(FailureReason reason) noexcept
  {
    switch (reason)
    {
    case FailureReason::NoMatchingMember:
      return "NoMatchingMember";
    case FailureReason::AmbiguousOverride:
      return "AmbiguousOverride";
    case FailureReason::UnmappedSumVariant:
      return "UnmappedSumVariant";
    case FailureReason::TypeMismatch:
      return "TypeMismatch";
    case FailureReason::NoAccessibleConstructor:
      return "NoAccessibleConstructor";
    case FailureReason::RecursiveTypeUnsupported:
      return "RecursiveTypeUnsupported";
    case FailureReason::PartialStepInTotalMode:
      return "PartialStepInTotalMode";
    }
    return "Unknown";
  }

  bool DerivationFailure::Contains(FailureReason reason) const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_entries.Size(); ++i)
      if (m_entries[i].reason == reason)
        return true;
    return false;
  }

  bool DerivationFailure::Contains(std::string_view path, FailureReason reason) const
  {
    for (NGIN::UIntSize i = 0; i < m_entries.Size(); ++i)
      if (m_entries[i].reason == reason && m_entries[i].path.ToString() == path)
        return true;
    return false;
  }

  std::string DerivationFailure::Render() const
  {
    std::string out;
    for (NGIN::UIntSize i = 0; i < m_entries.Size(); ++i)
    {
      const auto &e = m_entries[i];
      out += e.path.IsRoot() ? std::string{"<root>"} : e.path.ToString();
      out += ": ";
      out += ReasonName(e.reason);
      out += ": ";
      out += e.detail;
      out += '\n';
    }
    return out;
  }

  void FailureCollector::Record(Path path, FailureReason reason, std::string detail)
  {
    m_failure.m_entries.PushBack(FailureEntry{std::move(path), reason, std::move(detail)});
  }

  void FailureCollector::Merge(const DerivationFailure &nested, const Path &prefix)
  {
    for (NGIN::UIntSize i = 0; i < nested.m_entries.Size(); ++i)
    {
      Path full{prefix};
      const auto &inner = nested.m_entries[i].path;
      for (NGIN::UIntSize k = 0; k < inner.Size(); ++k)
        full = full.Append(inner[k]);
      Record(std::move(full), nested.m_entries[i].reason, nested.m_entries[i].detail);
    }
  }

  DerivationFailure FailureCollector::Finish() &&
  {
    return std::move(m_failure);
  }

} // namespace NGIN::Transform
