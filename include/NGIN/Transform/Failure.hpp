// Failure.hpp
// Path-tagged reasons a derivation could not prove a transformation total
#pragma once

#include <NGIN/Transform/Export.hpp>
#include <NGIN/Transform/Path.hpp>

#include <string>
#include <string_view>

namespace NGIN::Transform
{

  enum class FailureReason : NGIN::UInt8
  {
    NoMatchingMember,
    AmbiguousOverride,
    UnmappedSumVariant,
    TypeMismatch,
    NoAccessibleConstructor,
    RecursiveTypeUnsupported,
    PartialStepInTotalMode,
  };

  [[nodiscard]] NGIN_TRANSFORM_API std::string_view ReasonName(FailureReason reason) noexcept;

  struct FailureEntry
  {
    Path path{};
    FailureReason reason{FailureReason::NoMatchingMember};
    std::string detail{};
  };

  // Every problem found by one derivation, in discovery order.
  class NGIN_TRANSFORM_API DerivationFailure
  {
  public:
    DerivationFailure() = default;

    [[nodiscard]] bool Empty() const noexcept { return m_entries.Size() == 0; }
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_entries.Size(); }
    [[nodiscard]] const FailureEntry &At(NGIN::UIntSize i) const { return m_entries[i]; }

    [[nodiscard]] bool Contains(FailureReason reason) const noexcept;
    [[nodiscard]] bool Contains(std::string_view path, FailureReason reason) const;
    // Lines of "<path>: <Reason>: <detail>"; the root path renders as "<root>".
    [[nodiscard]] std::string Render() const;

  private:
    friend class FailureCollector;
    NGIN::Containers::Vector<FailureEntry> m_entries{};
  };

  // Accumulates failures across all recursion levels of a derivation.
  class NGIN_TRANSFORM_API FailureCollector
  {
  public:
    void Record(Path path, FailureReason reason, std::string detail);
    // Adopts failures found relative to `prefix`.
    void Merge(const DerivationFailure &nested, const Path &prefix);

    [[nodiscard]] NGIN::UIntSize Count() const noexcept { return m_failure.Size(); }
    [[nodiscard]] bool Empty() const noexcept { return m_failure.Empty(); }
    [[nodiscard]] DerivationFailure Finish() &&;

  private:
    DerivationFailure m_failure{};
  };

} // namespace NGIN::Transform
