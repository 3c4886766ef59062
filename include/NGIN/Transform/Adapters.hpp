// Adapters.hpp - Sequence/variant/optional detection and the type-erased ops built from them
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>
#include <NGIN/Containers/Vector.hpp>

#include <cstddef>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace NGIN::Transform::Adapters {

using Any = NGIN::Utilities::Any<>;

// Sequence detection (std::vector, NGIN::Containers::Vector)
template<class T>
struct is_sequence : std::false_type {};

template<class T, class A>
struct is_sequence<std::vector<T, A>> : std::true_type {};

template<class T, class Alloc>
struct is_sequence<NGIN::Containers::Vector<T, Alloc>> : std::true_type {};

template<class T>
inline constexpr bool is_sequence_v = is_sequence<T>::value;

template<class Seq>
struct SequenceOps {
  using Elem = std::remove_cvref_t<decltype(std::declval<const Seq&>()[0])>;

  static NGIN::UIntSize Size(const void* obj) {
    const auto& s = *static_cast<const Seq*>(obj);
    if constexpr (requires(const Seq& q){ q.size(); }) {
      return static_cast<NGIN::UIntSize>(s.size());
    } else {
      return static_cast<NGIN::UIntSize>(s.Size());
    }
  }

  static Any ElementAt(const void* obj, NGIN::UIntSize i) {
    const auto& s = *static_cast<const Seq*>(obj);
    return Any{static_cast<const Elem&>(s[static_cast<std::size_t>(i)])};
  }

  static Any Build(NGIN::Containers::Vector<Any>& elements) {
    Seq out{};
    if constexpr (requires(Seq& q){ q.push_back(std::declval<Elem>()); }) {
      out.reserve(static_cast<std::size_t>(elements.Size()));
      for (NGIN::UIntSize i = 0; i < elements.Size(); ++i)
        out.push_back(std::move(elements[i].template Cast<Elem>()));
    } else {
      out.Reserve(elements.Size());
      for (NGIN::UIntSize i = 0; i < elements.Size(); ++i)
        out.PushBack(std::move(elements[i].template Cast<Elem>()));
    }
    return Any{std::move(out)};
  }
};

// Variant-like
template<class T>
struct is_variant_like : std::false_type {};

template<class... Ts>
struct is_variant_like<std::variant<Ts...>> : std::true_type {};

template<class T>
inline constexpr bool is_variant_like_v = is_variant_like<T>::value;

template<class Var>
struct VariantOps {
  static NGIN::UInt64 Discriminant(const void* obj) {
    return static_cast<NGIN::UInt64>(static_cast<const Var*>(obj)->index());
  }

  static Any Extract(const void* obj) {
    Any out = Any::MakeVoid();
    std::visit([&](const auto& val){ out = Any{val}; }, *static_cast<const Var*>(obj));
    return out;
  }

  template<std::size_t I>
  static Any MakeAt(Any& payload) {
    using Alt = std::variant_alternative_t<I, Var>;
    return Any{Var{std::in_place_index<I>, std::move(payload.template Cast<Alt>())}};
  }

  static Any Make(NGIN::UIntSize index, Any& payload) {
    return [&]<std::size_t... I>(std::index_sequence<I...>) {
      using Fn = Any (*)(Any&);
      constexpr Fn table[] = {&VariantOps::MakeAt<I>...};
      return table[index](payload);
    }(std::make_index_sequence<std::variant_size_v<Var>>{});
  }
};

// Optional-like
template<class T>
struct is_optional : std::false_type {};

template<class T>
struct is_optional<std::optional<T>> : std::true_type {};

template<class T>
inline constexpr bool is_optional_v = is_optional<T>::value;

template<class Opt>
struct OptionalOps {
  using Elem = typename Opt::value_type;

  static bool HasValue(const void* obj) { return static_cast<const Opt*>(obj)->has_value(); }
  static Any Unwrap(const void* obj) { return Any{**static_cast<const Opt*>(obj)}; }
  static Any MakeEmpty() { return Any{Opt{}}; }
  static Any Wrap(Any& inner) { return Any{Opt{std::move(inner.template Cast<Elem>())}}; }
};

} // namespace NGIN::Transform::Adapters
