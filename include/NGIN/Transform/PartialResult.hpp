// PartialResult.hpp
// Value-or-accumulated-errors outcome of a partial transformation
#pragma once

#include <NGIN/Transform/Export.hpp>
#include <NGIN/Transform/Path.hpp>
#include <NGIN/Transform/Types.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace NGIN::Transform
{

  struct PartialError
  {
    Path path{};
    std::string message{};
  };

  class NGIN_TRANSFORM_API PartialErrors
  {
  public:
    PartialErrors() = default;
    // Single error located at the value being transformed.
    explicit PartialErrors(std::string message);

    void Add(Path path, std::string message);
    // Appends `other`, relocating each error under `prefix`.
    void Append(const PartialErrors &other, const PathSegment &prefix);

    [[nodiscard]] bool Empty() const noexcept { return m_errors.Size() == 0; }
    [[nodiscard]] NGIN::UIntSize Size() const noexcept { return m_errors.Size(); }
    [[nodiscard]] const PartialError &At(NGIN::UIntSize i) const { return m_errors[i]; }
    [[nodiscard]] const PartialError *Find(std::string_view path) const;
    // One "path: message" line per error; the root path renders as "<root>".
    [[nodiscard]] std::string Render() const;

  private:
    NGIN::Containers::Vector<PartialError> m_errors{};
  };

  template <class T>
  using PartialResult = std::expected<T, PartialErrors>;

  using PartialAny = PartialResult<Any>;

  [[nodiscard]] inline std::unexpected<PartialErrors> PartialFailure(std::string message)
  {
    return std::unexpected(PartialErrors{std::move(message)});
  }

} // namespace NGIN::Transform
