// Types.hpp
// Type identity and derivation options shared by all stages
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <NGIN/Meta/TypeName.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <string_view>
#include <type_traits>

namespace NGIN::Transform
{

  using Any = NGIN::Utilities::Any<>;
  using TypeId = NGIN::UInt64;

  // Identity of a described member, used to map type-safe selectors onto shape names.
  using MemberKey = const void *;

  // Total derivations must produce a value for every input; partial ones may fail per value.
  enum class DerivationMode : NGIN::UInt8
  {
    Total,
    Partial,
  };

  // Behavioural switches consulted during derivation. Defaults match the common case.
  struct TransformerFlags
  {
    bool defaultValues{true};
    bool beanGetters{true};
    bool beanSetters{true};
    bool methodAccessors{true};
    bool optionDefaultsToNone{false};
  };

  namespace detail
  {
    template <class T>
    inline TypeId TypeIdOf()
    {
      using U = std::remove_cvref_t<T>;
      const auto sv = NGIN::Meta::TypeName<U>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    template <auto MemberPtr>
    inline constexpr char kMemberKeyAnchor = 0;

    template <auto MemberPtr>
    constexpr MemberKey MemberKeyOf() noexcept
    {
      return &kMemberKeyAnchor<MemberPtr>;
    }
  } // namespace detail

} // namespace NGIN::Transform
