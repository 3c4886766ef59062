#include <NGIN/Transform/NameUtils.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <array>
#include <cctype>
#include <mutex>

namespace NGIN::Transform::detail
{

  namespace
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    StringInterner g_names{};
    std::mutex g_namesMutex{};

    // Equality, hashing and string conversion.
    constexpr std::array<std::string_view, 6> kBoilerplate{
        "ToString", "to_string", "Hash", "hash", "GetHashCode", "Equals",
    };

    bool StartsWithWord(std::string_view name, std::string_view prefix) noexcept
    {
      if (name.size() <= prefix.size())
        return false;
      if (name.substr(0, prefix.size()) != prefix)
        return false;
      // "Settings" is not a setter for "tings"
      const unsigned char next = static_cast<unsigned char>(name[prefix.size()]);
      return std::isupper(next) || name[prefix.size()] == '_';
    }

    std::string Decapitalize(std::string_view name)
    {
      std::string out{name};
      while (!out.empty() && out.front() == '_')
        out.erase(out.begin());
      if (!out.empty())
        out.front() = static_cast<char>(std::tolower(static_cast<unsigned char>(out.front())));
      return out;
    }
  } // namespace

  std::string BeanPropertyName(std::string_view accessor, bool setter)
  {
    if (setter)
    {
      for (std::string_view p : {std::string_view{"Set"}, std::string_view{"set"}})
        if (StartsWithWord(accessor, p))
          return Decapitalize(accessor.substr(p.size()));
      return std::string{accessor};
    }
    for (std::string_view p : {std::string_view{"Get"}, std::string_view{"get"}, std::string_view{"Is"}, std::string_view{"is"}})
      if (StartsWithWord(accessor, p))
        return Decapitalize(accessor.substr(p.size()));
    return std::string{accessor};
  }

  bool IsBoilerplateName(std::string_view name) noexcept
  {
    if (name.substr(0, 8) == "operator")
      return true;
    for (auto b : kBoilerplate)
      if (b == name)
        return true;
    return false;
  }

  std::string_view InternName(std::string_view name)
  {
    std::lock_guard lock{g_namesMutex};
    return g_names.Intern(name);
  }

} // namespace NGIN::Transform::detail
