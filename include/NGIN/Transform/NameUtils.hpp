// NameUtils.hpp
// Member names from pointer-to-member constants, short type names and accessor naming rules.
#pragma once

#include <NGIN/Transform/Export.hpp>

#include <string>
#include <string_view>

namespace NGIN::Transform::detail
{

  template <auto MemberPtr>
  consteval std::string_view MemberNameFromPretty() noexcept
  {
#if defined(_MSC_VER)
    constexpr std::string_view sig = __FUNCSIG__;
    // "std::string_view __cdecl NGIN::Transform::detail::MemberNameFromPretty< &Class::member >(void) noexcept"
    constexpr std::string_view key = "< &";
    auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    auto start = kpos + key.size();
    auto end = sig.find(" >", start);
    if (end == std::string_view::npos || end <= start)
      return {};
    auto full = sig.substr(start, end - start);
#elif defined(__clang__)
    constexpr std::string_view sig = __PRETTY_FUNCTION__;
    // "std::string_view NGIN::Transform::detail::MemberNameFromPretty() [MemberPtr = &Class::member]"
    constexpr std::string_view key = "[MemberPtr = &";
    auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    auto start = kpos + key.size();
    auto end = sig.find(']', start);
    if (end == std::string_view::npos || end <= start)
      return {};
    auto full = sig.substr(start, end - start);
#elif defined(__GNUC__)
    constexpr std::string_view sig = __PRETTY_FUNCTION__;
    // "std::string_view NGIN::Transform::detail::MemberNameFromPretty() [with auto MemberPtr = &Class::member]"
    constexpr std::string_view key = "[with auto MemberPtr = &";
    auto kpos = sig.find(key);
    if (kpos == std::string_view::npos)
      return {};
    auto start = kpos + key.size();
    auto end = sig.find(']', start);
    if (end == std::string_view::npos || end <= start)
      return {};
    auto full = sig.substr(start, end - start);
#else
    return {};
#endif
    auto dc = full.rfind("::");
    if (dc == std::string_view::npos)
      return full;
    return full.substr(dc + 2);
  }

  // Unqualified display name of a type: "Shapes::Circle" -> "Circle", template arguments kept intact.
  constexpr std::string_view ShortTypeName(std::string_view qualified) noexcept
  {
    int depth = 0;
    std::size_t start = 0;
    for (std::size_t i = 0; i < qualified.size(); ++i)
    {
      const char c = qualified[i];
      if (c == '<' || c == '(')
        ++depth;
      else if (c == '>' || c == ')')
        --depth;
      else if (depth == 0 && c == ':' && i + 1 < qualified.size() && qualified[i + 1] == ':')
      {
        start = i + 2;
        ++i;
      }
    }
    auto out = qualified.substr(start);
    // MSVC prefixes elaborated type specifiers
    for (std::string_view prefix : {std::string_view{"struct "}, std::string_view{"class "}, std::string_view{"enum "}, std::string_view{"union "}})
    {
      if (out.size() > prefix.size() && out.substr(0, prefix.size()) == prefix)
        return out.substr(prefix.size());
    }
    return out;
  }

  // Property name behind a bean accessor: "GetName"/"isActive" -> "name"/"active".
  NGIN_TRANSFORM_API std::string BeanPropertyName(std::string_view accessor, bool setter);

  // Methods every type carries that never count as data members.
  NGIN_TRANSFORM_API bool IsBoilerplateName(std::string_view name) noexcept;

  // Stable storage for names computed at inspection time.
  NGIN_TRANSFORM_API std::string_view InternName(std::string_view name);

} // namespace NGIN::Transform::detail
