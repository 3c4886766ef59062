// Inspector.hpp
// Builds the ShapeModel of a type: user descriptions first, then automatic classification
#pragma once

#include <NGIN/Transform/Adapters.hpp>
#include <NGIN/Transform/ShapeBuilder.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <concepts>
#include <type_traits>
#include <variant>

namespace NGIN::Transform
{

  namespace detail
  {
    template <class T>
    concept HasNginShapeWithBuilder = requires(ShapeBuilder<T> &b) {
      // ADL hook should be declared as: friend void NginShape(Tag<T>, ShapeBuilder<T>&)
      { NginShape(Tag<T>{}, b) } -> std::same_as<void>;
    };

    // Detection for Describe<T>::Do(ShapeBuilder<T>&)
    template <class, class = void>
    struct HasDescribeImpl : std::false_type
    {
    };
    template <class T>
    struct HasDescribeImpl<T, std::void_t<decltype(NGIN::Transform::Describe<T>::Do(std::declval<ShapeBuilder<T> &>()))>>
        : std::true_type
    {
    };
    template <class T>
    concept HasDescribeWithBuilder = HasDescribeImpl<T>::value;

    template <class U, std::size_t I>
    void AddAlternative(ShapeModel &m)
    {
      using Alt = std::variant_alternative_t<I, U>;
      VariantDescriptor v{};
      v.type = TypeRefOf<Alt>();
      v.name = InspectShape<Alt>().displayName;
      v.discriminant = static_cast<NGIN::UInt64>(I);
      m.sum.variants.PushBack(std::move(v));
    }

    template <class U>
    void InspectVariant(ShapeModel &m)
    {
      using Ops = Adapters::VariantOps<U>;
      m.kind = ShapeKind::Sum;
      [&]<std::size_t... I>(std::index_sequence<I...>)
      {
        (AddAlternative<U, I>(m), ...);
      }(std::make_index_sequence<std::variant_size_v<U>>{});
      m.ops.Discriminant = &Ops::Discriminant;
      m.ops.Extract = &Ops::Extract;
      m.ops.Make = &Ops::Make;
      CheckDuplicateNames(m);
    }

    template <class U>
    void InspectOptional(ShapeModel &m)
    {
      using Ops = Adapters::OptionalOps<U>;
      m.kind = ShapeKind::Wrapper;
      m.wrapper.kind = WrapperKind::Optional;
      m.wrapper.inner = TypeRefOf<typename Ops::Elem>();
      m.ops.HasValue = &Ops::HasValue;
      m.ops.Unwrap = &Ops::Unwrap;
      m.ops.MakeEmpty = &Ops::MakeEmpty;
      m.ops.Wrap = &Ops::Wrap;
    }

    template <class U>
    void InspectSequence(ShapeModel &m)
    {
      using Ops = Adapters::SequenceOps<U>;
      m.kind = ShapeKind::Wrapper;
      m.wrapper.kind = WrapperKind::Collection;
      m.wrapper.inner = TypeRefOf<typename Ops::Elem>();
      m.ops.Size = &Ops::Size;
      m.ops.ElementAt = &Ops::ElementAt;
      m.ops.Build = &Ops::Build;
    }
  } // namespace detail

  template <class T>
  ShapeModel InspectShape()
  {
    using U = std::remove_cvref_t<T>;
    ShapeModel m{};
    m.self = TypeRefOf<U>();
    m.displayName = detail::ShortTypeName(NGIN::Meta::TypeName<U>::qualifiedName);
    if constexpr (std::is_copy_constructible_v<U>)
      m.ops.Clone = &detail::CloneValue<U>;

    if constexpr (Adapters::is_variant_like_v<U>)
    {
      detail::InspectVariant<U>(m);
    }
    else if constexpr (detail::HasNginShapeWithBuilder<U>)
    {
      ShapeBuilder<U> b{m};
      NginShape(Tag<U>{}, b); // ADL: user describes members
      b.Finish();
    }
    else if constexpr (detail::HasDescribeWithBuilder<U>)
    {
      ShapeBuilder<U> b{m};
      NGIN::Transform::Describe<U>::Do(b); // Trait fallback for types we cannot modify
      b.Finish();
    }
    else if constexpr (Adapters::is_optional_v<U>)
    {
      detail::InspectOptional<U>(m);
    }
    else if constexpr (Adapters::is_sequence_v<U>)
    {
      detail::InspectSequence<U>(m);
    }
    else if constexpr (std::is_class_v<U> && std::is_empty_v<U> && std::is_default_constructible_v<U>)
    {
      m.kind = ShapeKind::Product;
      m.product.kind = ProductKind::Singleton;
      m.ops.Construct = &detail::DefaultConstruct<U>;
    }
    return m;
  }

  template <class T>
  TypeRef TypeRefOf()
  {
    using U = std::remove_cvref_t<T>;
    return TypeRef{detail::TypeIdOf<U>(), NGIN::Meta::TypeName<U>::qualifiedName, &InspectShape<U>};
  }

} // namespace NGIN::Transform
