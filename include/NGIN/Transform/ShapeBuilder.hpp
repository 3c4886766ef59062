// ShapeBuilder.hpp
// Public ShapeBuilder<T> used inside the ADL hook to describe how a type is read and built
#pragma once

#include <NGIN/Transform/Shape.hpp>
#include <NGIN/Transform/NameUtils.hpp>

#include <concepts>
#include <functional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Transform
{

  // ADL tag for user descriptions: friend void NginShape(Tag<T>, ShapeBuilder<T>&)
  template <class T>
  struct Tag
  {
  };

  // Specialize for types you cannot modify:
  // template<> struct Describe<MyType> { static void Do(ShapeBuilder<MyType>&); };
  template <class T>
  struct Describe;

  namespace detail
  {
    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;

    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    template <typename>
    struct MethodTraits;

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...)>
    {
      using Class = C;
      using Ret = R;
      static constexpr bool IsConst = false;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      using Args = std::tuple<A...>;
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const>
    {
      using Class = C;
      using Ret = R;
      static constexpr bool IsConst = true;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      using Args = std::tuple<A...>;
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) noexcept> : MethodTraits<R (C::*)(A...)>
    {
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const noexcept> : MethodTraits<R (C::*)(A...) const>
    {
    };

    template <auto Fn>
    using MethodRetT = std::remove_cvref_t<typename MethodTraits<decltype(Fn)>::Ret>;

    template <auto Fn>
    using SetterArgT = std::remove_cvref_t<std::tuple_element_t<0, typename MethodTraits<decltype(Fn)>::Args>>;

    // ==== Thunks generated per member ====

    template <auto MemberPtr>
    Any FieldLoad(const void *obj)
    {
      using C = MemberClassT<MemberPtr>;
      using M = MemberTypeT<MemberPtr>;
      auto *c = static_cast<const C *>(obj);
      return Any{static_cast<const M &>(c->*MemberPtr)};
    }

    template <auto Fn>
    Any AccessorLoad(const void *obj)
    {
      using C = typename MethodTraits<decltype(Fn)>::Class;
      auto *c = static_cast<const C *>(obj);
      return Any{MethodRetT<Fn>((c->*Fn)())};
    }

    template <auto Fn>
    void SetterStore(void *obj, Any &value)
    {
      using C = typename MethodTraits<decltype(Fn)>::Class;
      auto *c = static_cast<C *>(obj);
      (c->*Fn)(std::move(value.template Cast<SetterArgT<Fn>>()));
    }

    template <class T, class... A>
    Any ConstructFromArgs([[maybe_unused]] Any *args)
    {
      return [&]<std::size_t... I>(std::index_sequence<I...>)
      {
        if constexpr (std::is_aggregate_v<T>)
          return Any{T{std::move(args[I].template Cast<std::remove_cvref_t<A>>())...}};
        else
          return Any{T(std::move(args[I].template Cast<std::remove_cvref_t<A>>())...)};
      }(std::index_sequence_for<A...>{});
    }

    template <class T>
    Any DefaultConstruct(Any *)
    {
      return Any{T{}};
    }

    template <class T>
    Any CloneValue(const void *obj)
    {
      return Any{*static_cast<const T *>(obj)};
    }

    template <class E>
    NGIN::UInt64 EnumDiscriminant(E value) noexcept
    {
      return static_cast<NGIN::UInt64>(static_cast<std::underlying_type_t<E>>(value));
    }

    template <class E>
    NGIN::UInt64 LoadEnumDiscriminant(const void *obj)
    {
      return EnumDiscriminant(*static_cast<const E *>(obj));
    }

    NGIN_TRANSFORM_API void CheckDuplicateNames(ShapeModel &model);
  } // namespace detail

  template <class T>
  class ShapeBuilder
  {
  public:
    explicit ShapeBuilder(ShapeModel &model) : m_model(&model) {}

    // Display name used in diagnostics and variant matching. Defaults to the unqualified type name.
    ShapeBuilder &SetName(std::string_view name)
    {
      m_model->displayName = detail::InternName(name);
      return *this;
    }

    // Public data member, readable when T is a source. Name auto-derived if omitted.
    template <auto MemberPtr>
    ShapeBuilder &Field(std::string_view name = {})
    {
      using M = detail::MemberTypeT<MemberPtr>;
      static_assert(std::is_same_v<detail::MemberClassT<MemberPtr>, T>, "Field must belong to T");
      static_assert(!std::is_function_v<M>, "use Accessor for member functions");
      FieldDescriptor f{};
      f.name = detail::InternName(name.empty() ? detail::MemberNameFromPretty<MemberPtr>() : name);
      f.type = TypeRefOf<M>();
      f.sourceKind = FieldSourceKind::ConstructorVal;
      f.memberKey = detail::MemberKeyOf<MemberPtr>();
      f.Load = &detail::FieldLoad<MemberPtr>;
      m_model->product.fields.PushBack(std::move(f));
      return *this;
    }

    // Aggregate shorthand: every member is readable and the aggregate is built from them in order.
    template <auto... Members>
    ShapeBuilder &Fields()
    {
      static_assert(sizeof...(Members) > 0, "Fields needs at least one member");
      (Field<Members>(), ...);
      (AddParameter<detail::MemberTypeT<Members>>(detail::MemberNameFromPretty<Members>(), detail::MemberKeyOf<Members>()), ...);
      m_model->ops.Construct = &detail::ConstructFromArgs<T, detail::MemberTypeT<Members>...>;
      m_hasConstructor = true;
      return *this;
    }

    // Zero-argument const member function exposed as a readable member.
    // Unnamed boilerplate (ToString, Hash, operators) is skipped; an explicit name always registers.
    template <auto Fn>
    ShapeBuilder &Accessor(std::string_view name = {})
    {
      if (!name.empty())
        AddAccessor<Fn>(name, FieldSourceKind::AccessorMethod);
      else if (!detail::IsBoilerplateName(detail::MemberNameFromPretty<Fn>()))
        AddAccessor<Fn>(detail::MemberNameFromPretty<Fn>(), FieldSourceKind::AccessorMethod);
      return *this;
    }

    // Bean getter: "GetName", "IsActive" read as "name", "active".
    template <auto Fn>
    ShapeBuilder &Getter(std::string_view name = {})
    {
      if (!name.empty())
        AddAccessor<Fn>(name, FieldSourceKind::BeanGetter);
      else if (!detail::IsBoilerplateName(detail::MemberNameFromPretty<Fn>()))
        AddAccessor<Fn>(detail::BeanPropertyName(detail::MemberNameFromPretty<Fn>(), false), FieldSourceKind::BeanGetter);
      return *this;
    }

    // Bean setter: "SetName" writes "name". Only used when T is built as a bean.
    template <auto Fn>
    ShapeBuilder &Setter(std::string_view name = {})
    {
      using Traits = detail::MethodTraits<decltype(Fn)>;
      static_assert(std::is_same_v<typename Traits::Class, T>, "Setter must belong to T");
      static_assert(Traits::Arity == 1 && !Traits::IsConst, "Setter takes exactly one argument");
      const auto pretty = detail::MemberNameFromPretty<Fn>();
      if (name.empty() && detail::IsBoilerplateName(pretty))
        return *this;
      const std::string derived = detail::BeanPropertyName(pretty, true);
      ParameterDescriptor p{};
      p.name = detail::InternName(name.empty() ? std::string_view{derived} : name);
      p.type = TypeRefOf<detail::SetterArgT<Fn>>();
      p.targetKind = FieldSourceKind::BeanSetter;
      p.position = static_cast<NGIN::UInt32>(m_setters.Size());
      p.memberKey = detail::MemberKeyOf<Fn>();
      p.Store = &detail::SetterStore<Fn>;
      m_setters.PushBack(std::move(p));
      return *this;
    }

    // Constructor T(A...) with its parameter names, in declaration order.
    template <class... A, class... Names>
      requires(sizeof...(A) == sizeof...(Names) && (std::convertible_to<Names, std::string_view> && ...))
    ShapeBuilder &Constructor(Names... names)
    {
      static_assert(std::is_constructible_v<T, A...> || std::is_aggregate_v<T>, "T is not constructible from A...");
      m_model->product.parameters = NGIN::Containers::Vector<ParameterDescriptor>{};
      (AddParameter<std::remove_cvref_t<A>>(std::string_view{names}, MemberKey{nullptr}), ...);
      m_model->ops.Construct = &detail::ConstructFromArgs<T, A...>;
      m_hasConstructor = true;
      return *this;
    }

    // Default for the constructor parameter at `Position`.
    template <NGIN::UIntSize Position, class F>
    ShapeBuilder &DefaultAt(F &&provider)
    {
      using R = std::remove_cvref_t<std::invoke_result_t<F &>>;
      PendingDefault d{};
      d.position = static_cast<NGIN::UInt32>(Position);
      d.type = TypeRefOf<R>();
      d.provider = [f = std::forward<F>(provider)]() { return Any{R(f())}; };
      m_defaults.PushBack(std::move(d));
      return *this;
    }

    // Default taken from the member's initializer in a value-initialized T.
    template <auto MemberPtr>
    ShapeBuilder &DefaultFromInitializer()
    {
      using M = detail::MemberTypeT<MemberPtr>;
      static_assert(std::is_default_constructible_v<T>, "initializer defaults need a default-constructible T");
      PendingDefault d{};
      d.key = detail::MemberKeyOf<MemberPtr>();
      d.member = detail::MemberNameFromPretty<MemberPtr>();
      d.type = TypeRefOf<M>();
      d.provider = []() { return Any{M(T{}.*MemberPtr)}; };
      m_defaults.PushBack(std::move(d));
      return *this;
    }

    ShapeBuilder &EnumValue(std::string_view name, T value)
      requires std::is_enum_v<T>
    {
      VariantDescriptor v{};
      v.name = detail::InternName(name);
      v.type = TypeRefOf<T>();
      v.discriminant = detail::EnumDiscriminant(value);
      v.singleton = true;
      v.value = Any{value};
      m_model->kind = ShapeKind::Sum;
      m_model->sum.variants.PushBack(std::move(v));
      m_model->ops.Discriminant = &detail::LoadEnumDiscriminant<T>;
      m_model->ops.Extract = &detail::CloneValue<T>;
      return *this;
    }

    // A type with exactly one value, built by default construction.
    ShapeBuilder &Singleton()
    {
      static_assert(std::is_default_constructible_v<T>, "singletons must be default-constructible");
      m_singleton = true;
      return *this;
    }

    void Finish()
    {
      if (m_model->kind == ShapeKind::Sum)
      {
        detail::CheckDuplicateNames(*m_model);
        return;
      }
      auto &product = m_model->product;
      if (m_singleton)
      {
        if constexpr (std::is_default_constructible_v<T>)
          m_model->ops.Construct = &detail::DefaultConstruct<T>;
        product.kind = ProductKind::Singleton;
        product.parameters = NGIN::Containers::Vector<ParameterDescriptor>{};
      }
      else if (m_hasConstructor)
      {
        product.kind = ProductKind::Record;
      }
      else if (m_setters.Size() > 0 && std::is_default_constructible_v<T>)
      {
        if constexpr (std::is_default_constructible_v<T>)
          m_model->ops.Construct = &detail::DefaultConstruct<T>;
        product.kind = ProductKind::Bean;
        product.parameters = m_setters;
      }
      else if (product.fields.Size() == 0)
      {
        // Nothing described: nothing to read or build.
        return;
      }
      else
      {
        product.kind = ProductKind::Opaque;
      }
      m_model->kind = ShapeKind::Product;
      ApplyDefaults();
      detail::CheckDuplicateNames(*m_model);
    }

  private:
    struct PendingDefault
    {
      MemberKey key{nullptr};
      std::string_view member{};
      NGIN::UInt32 position{0};
      TypeRef type{};
      std::function<Any()> provider{};
    };

    template <class A>
    void AddParameter(std::string_view name, MemberKey key)
    {
      ParameterDescriptor p{};
      p.name = detail::InternName(name);
      p.type = TypeRefOf<A>();
      p.targetKind = FieldSourceKind::ConstructorParameter;
      p.position = static_cast<NGIN::UInt32>(m_model->product.parameters.Size());
      p.memberKey = key;
      m_model->product.parameters.PushBack(std::move(p));
    }

    template <auto Fn>
    void AddAccessor(std::string_view name, FieldSourceKind kind)
    {
      using Traits = detail::MethodTraits<decltype(Fn)>;
      static_assert(std::is_same_v<typename Traits::Class, T>, "accessor must belong to T");
      static_assert(Traits::Arity == 0 && Traits::IsConst, "accessors are const and take no arguments");
      static_assert(!std::is_void_v<typename Traits::Ret>, "accessors must return a value");
      FieldDescriptor f{};
      f.name = detail::InternName(name);
      f.type = TypeRefOf<detail::MethodRetT<Fn>>();
      f.sourceKind = kind;
      f.memberKey = detail::MemberKeyOf<Fn>();
      f.Load = &detail::AccessorLoad<Fn>;
      m_model->product.fields.PushBack(std::move(f));
    }

    void ApplyDefaults()
    {
      auto &params = m_model->product.parameters;
      for (NGIN::UIntSize i = 0; i < m_defaults.Size(); ++i)
      {
        auto &d = m_defaults[i];
        ParameterDescriptor *target = nullptr;
        for (NGIN::UIntSize j = 0; j < params.Size() && !target; ++j)
        {
          const bool hit = d.key ? params[j].memberKey == d.key : params[j].position == d.position;
          if (hit)
            target = &params[j];
        }
        // Parameters declared through Constructor<A...> carry only a name; reach them through the member's Field.
        if (!target && d.key)
        {
          std::string_view fieldName{};
          for (NGIN::UIntSize j = 0; j < m_model->product.fields.Size(); ++j)
            if (m_model->product.fields[j].memberKey == d.key)
              fieldName = m_model->product.fields[j].name;
          for (NGIN::UIntSize j = 0; j < params.Size() && !target && !fieldName.empty(); ++j)
            if (params[j].name == fieldName)
              target = &params[j];
        }
        if (!target)
        {
          if (d.key)
            m_model->issues.PushBack("initializer default for member `" + std::string{d.member} + "`, which is not a constructor parameter of " +
                                     std::string{m_model->displayName} + " (register it with Field under the parameter's name)");
          else
            m_model->issues.PushBack("default value for parameter position " + std::to_string(d.position) + ", but the constructor of " +
                                     std::string{m_model->displayName} + " takes " + std::to_string(params.Size()));
          continue;
        }
        if (target->type.id != d.type.id)
        {
          m_model->issues.PushBack("default value for `" + std::string{target->name} + "` has type " + std::string{d.type.name} +
                                   ", expected " + std::string{target->type.name});
          continue;
        }
        target->hasDefault = true;
        target->Default = std::move(d.provider);
      }
    }

    ShapeModel *m_model{nullptr};
    bool m_hasConstructor{false};
    bool m_singleton{false};
    NGIN::Containers::Vector<ParameterDescriptor> m_setters{};
    NGIN::Containers::Vector<PendingDefault> m_defaults{};
  };

} // namespace NGIN::Transform
