// Transformer.hpp
// Fluent transformer definitions and the transformers they build
#pragma once

#include <NGIN/Transform/Derivation.hpp>
#include <NGIN/Transform/Executor.hpp>
#include <NGIN/Transform/Inspector.hpp>

#include <expected>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace NGIN::Transform
{

  template <class From, class To, DerivationMode Mode>
  class BasicTransformerDefinition;

  // Built by TransformerDefinition<From, To>::Build(); cannot fail once built.
  template <class From, class To>
  class Transformer
  {
  public:
    // Throws std::bad_expected_access only for an enumerator value the enum's description does not list.
    [[nodiscard]] To Transform(const From &source) const
    {
      auto result = Execute(*m_plan, &source, &source);
      return std::move(result.value().template Cast<To>());
    }

    [[nodiscard]] const TransformationPlan &Plan() const noexcept { return *m_plan; }

  private:
    template <class, class, DerivationMode>
    friend class BasicTransformerDefinition;

    explicit Transformer(PlanPtr plan) : m_plan(std::move(plan)) {}

    PlanPtr m_plan{};
  };

  // Built by PartialTransformerDefinition<From, To>::Build(); each call yields a value or path-tagged errors.
  template <class From, class To>
  class PartialTransformer
  {
  public:
    [[nodiscard]] PartialResult<To> Transform(const From &source, bool failFast = false) const
    {
      auto result = Execute(*m_plan, &source, &source, ExecutionOptions{failFast});
      if (!result)
        return std::unexpected(std::move(result.error()));
      return std::move(result->template Cast<To>());
    }

    [[nodiscard]] const TransformationPlan &Plan() const noexcept { return *m_plan; }

  private:
    template <class, class, DerivationMode>
    friend class BasicTransformerDefinition;

    explicit PartialTransformer(PlanPtr plan) : m_plan(std::move(plan)) {}

    PlanPtr m_plan{};
  };

  namespace detail
  {
    template <class F>
    struct CallableTraits : CallableTraits<decltype(&F::operator())>
    {
    };

    template <class R, class... A>
    struct CallableTraits<R (*)(A...)>
    {
      using Ret = R;
      using Args = std::tuple<A...>;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
    };

    template <class C, class R, class... A>
    struct CallableTraits<R (C::*)(A...) const> : CallableTraits<R (*)(A...)>
    {
    };

    template <class C, class R, class... A>
    struct CallableTraits<R (C::*)(A...)> : CallableTraits<R (*)(A...)>
    {
    };

    template <class C, class R, class... A>
    struct CallableTraits<R (C::*)(A...) const noexcept> : CallableTraits<R (*)(A...)>
    {
    };

    template <class T>
    struct PartialValue;
    template <class T>
    struct PartialValue<PartialResult<T>>
    {
      using type = T;
    };
    template <class T>
    using PartialValueT = typename PartialValue<std::remove_cvref_t<T>>::type;

    // Selector chains start at a member of Owner and follow member types.
    template <class Owner, auto First, auto... Rest>
    constexpr bool IsMemberChain()
    {
      if constexpr (!std::is_same_v<MemberClassT<First>, Owner>)
        return false;
      else if constexpr (sizeof...(Rest) == 0)
        return true;
      else
        return IsMemberChain<MemberTypeT<First>, Rest...>();
    }

    template <auto... Members>
    using ChainTargetT = std::remove_cvref_t<std::tuple_element_t<sizeof...(Members) - 1, std::tuple<MemberTypeT<Members>...>>>;

    // Shape name of a member, so selectors agree with names given in NginShape.
    template <auto MemberPtr>
    std::string_view FieldNameFor()
    {
      const ShapeModel shape = InspectShape<MemberClassT<MemberPtr>>();
      const MemberKey key = MemberKeyOf<MemberPtr>();
      for (NGIN::UIntSize i = 0; i < shape.product.parameters.Size(); ++i)
        if (shape.product.parameters[i].memberKey == key)
          return shape.product.parameters[i].name;
      for (NGIN::UIntSize i = 0; i < shape.product.fields.Size(); ++i)
        if (shape.product.fields[i].memberKey == key)
          return shape.product.fields[i].name;
      return MemberNameFromPretty<MemberPtr>();
    }

    template <auto... Members>
    Path PathOf()
    {
      Path p;
      ((p = p.Field(FieldNameFor<Members>())), ...);
      return p;
    }

    template <class V>
    UnaryThunk ConstThunk(V value)
    {
      return [v = std::move(value)](const void *) { return Any{v}; };
    }

    template <class V>
    UnaryPartialThunk ConstPartialThunk(PartialResult<V> value)
    {
      return [r = std::move(value)](const void *) -> PartialAny
      {
        if (!r)
          return std::unexpected(r.error());
        return Any{*r};
      };
    }

    template <class In, class Out, class F>
    UnaryThunk ApplyThunk(F fn)
    {
      return [f = std::move(fn)](const void *in) { return Any{Out(f(*static_cast<const In *>(in)))}; };
    }

    template <class In, class Out, class F>
    UnaryPartialThunk ApplyPartialThunk(F fn)
    {
      return [f = std::move(fn)](const void *in) -> PartialAny
      {
        auto r = f(*static_cast<const In *>(in));
        if (!r)
          return std::unexpected(std::move(r.error()));
        return Any{Out(std::move(*r))};
      };
    }

    template <class Args, NGIN::UIntSize N>
    NGIN::Containers::Vector<ParameterDescriptor> ParametersOf(const std::string_view (&names)[N])
    {
      NGIN::Containers::Vector<ParameterDescriptor> out;
      [&]<std::size_t... I>(std::index_sequence<I...>)
      {
        (out.PushBack(ParameterDescriptor{InternName(names[I]), TypeRefOf<std::tuple_element_t<I, Args>>(),
                                          FieldSourceKind::ConstructorParameter, static_cast<NGIN::UInt32>(I)}),
         ...);
      }(std::make_index_sequence<N>{});
      return out;
    }

    template <class Args, class F>
    ConstructorThunk MakeConstructorThunk(F fn)
    {
      return [f = std::move(fn)](Any *args)
      {
        return [&]<std::size_t... I>(std::index_sequence<I...>)
        {
          return Any{f(args[I].template Cast<std::remove_cvref_t<std::tuple_element_t<I, Args>>>()...)};
        }(std::make_index_sequence<std::tuple_size_v<Args>>{});
      };
    }

    template <class Args, class F>
    ConstructorPartialThunk MakeConstructorPartialThunk(F fn)
    {
      return [f = std::move(fn)](Any *args)
      {
        return [&]<std::size_t... I>(std::index_sequence<I...>) -> PartialAny
        {
          auto r = f(args[I].template Cast<std::remove_cvref_t<std::tuple_element_t<I, Args>>>()...);
          if (!r)
            return std::unexpected(std::move(r.error()));
          return Any{std::move(*r)};
        }(std::make_index_sequence<std::tuple_size_v<Args>>{});
      };
    }
  } // namespace detail

  // Collects overrides for (From, To); Build() runs the derivation once.
  template <class From, class To, DerivationMode Mode>
  class BasicTransformerDefinition
  {
  public:
    using Result = std::conditional_t<Mode == DerivationMode::Total, Transformer<From, To>, PartialTransformer<From, To>>;
    static constexpr bool kPartial = Mode == DerivationMode::Partial;

    // ==== Field values ====

    // WithFieldConst<&To::address, &Address::street>("Main St")
    template <auto... Members, class U>
      requires(sizeof...(Members) > 0 && std::is_convertible_v<U, detail::ChainTargetT<Members...>>)
    BasicTransformerDefinition &WithFieldConst(U &&value)
    {
      static_assert(detail::IsMemberChain<To, Members...>(), "selector must start at a member of To");
      using V = detail::ChainTargetT<Members...>;
      return AddValue(OverrideKind::Const, detail::PathOf<Members...>(), TypeRefOf<V>(), detail::ConstThunk(V(std::forward<U>(value))), {});
    }

    // Path form: ".address.street" or "address.street". The value type must equal the member type.
    template <class U>
    BasicTransformerDefinition &WithFieldConst(std::string_view path, U &&value)
    {
      using V = std::decay_t<U>;
      return AddValue(OverrideKind::Const, Path::Parse(path), TypeRefOf<V>(), detail::ConstThunk(V(std::forward<U>(value))), {});
    }

    template <auto... Members, class U>
      requires(kPartial && sizeof...(Members) > 0 && std::is_convertible_v<U, detail::ChainTargetT<Members...>>)
    BasicTransformerDefinition &WithFieldConstPartial(PartialResult<U> value)
    {
      static_assert(detail::IsMemberChain<To, Members...>(), "selector must start at a member of To");
      using V = detail::ChainTargetT<Members...>;
      PartialResult<V> converted = value ? PartialResult<V>{V(std::move(*value))} : PartialResult<V>{std::unexpected(std::move(value.error()))};
      return AddValue(OverrideKind::ConstPartial, detail::PathOf<Members...>(), TypeRefOf<V>(), {}, detail::ConstPartialThunk(std::move(converted)));
    }

    template <class U>
      requires kPartial
    BasicTransformerDefinition &WithFieldConstPartial(std::string_view path, PartialResult<U> value)
    {
      return AddValue(OverrideKind::ConstPartial, Path::Parse(path), TypeRefOf<U>(), {}, detail::ConstPartialThunk(std::move(value)));
    }

    // Value computed from the whole source: fn(const From&).
    template <auto... Members, class F>
      requires(sizeof...(Members) > 0 && std::is_invocable_v<F &, const From &>)
    BasicTransformerDefinition &WithFieldComputed(F &&fn)
    {
      static_assert(detail::IsMemberChain<To, Members...>(), "selector must start at a member of To");
      using V = detail::ChainTargetT<Members...>;
      static_assert(std::is_convertible_v<std::invoke_result_t<F &, const From &>, V>, "computed value must convert to the member type");
      return AddValue(OverrideKind::Computed, detail::PathOf<Members...>(), TypeRefOf<V>(), detail::ApplyThunk<From, V>(std::forward<F>(fn)), {});
    }

    template <class F>
      requires std::is_invocable_v<F &, const From &>
    BasicTransformerDefinition &WithFieldComputed(std::string_view path, F &&fn)
    {
      using V = std::remove_cvref_t<std::invoke_result_t<F &, const From &>>;
      return AddValue(OverrideKind::Computed, Path::Parse(path), TypeRefOf<V>(), detail::ApplyThunk<From, V>(std::forward<F>(fn)), {});
    }

    // fn(const From&) -> PartialResult<U>
    template <auto... Members, class F>
      requires(kPartial && sizeof...(Members) > 0 && std::is_invocable_v<F &, const From &>)
    BasicTransformerDefinition &WithFieldComputedPartial(F &&fn)
    {
      static_assert(detail::IsMemberChain<To, Members...>(), "selector must start at a member of To");
      using V = detail::ChainTargetT<Members...>;
      static_assert(std::is_convertible_v<detail::PartialValueT<std::invoke_result_t<F &, const From &>>, V>,
                    "computed value must convert to the member type");
      return AddValue(OverrideKind::ComputedPartial, detail::PathOf<Members...>(), TypeRefOf<V>(), {},
                      detail::ApplyPartialThunk<From, V>(std::forward<F>(fn)));
    }

    template <class F>
      requires(kPartial && std::is_invocable_v<F &, const From &>)
    BasicTransformerDefinition &WithFieldComputedPartial(std::string_view path, F &&fn)
    {
      using V = detail::PartialValueT<std::invoke_result_t<F &, const From &>>;
      return AddValue(OverrideKind::ComputedPartial, Path::Parse(path), TypeRefOf<V>(), {}, detail::ApplyPartialThunk<From, V>(std::forward<F>(fn)));
    }

    // Destination member filled from a differently named source member.
    template <auto FromMember, auto ToMember>
    BasicTransformerDefinition &WithFieldRenamed()
    {
      static_assert(detail::IsMemberChain<From, FromMember>(), "first selector must be a member of From");
      static_assert(detail::IsMemberChain<To, ToMember>(), "second selector must be a member of To");
      return AddRename(detail::PathOf<FromMember>(), detail::PathOf<ToMember>());
    }

    // The from-path is read from the source value at the level of the target's parent.
    BasicTransformerDefinition &WithFieldRenamed(std::string_view fromPath, std::string_view toPath)
    {
      return AddRename(Path::Parse(fromPath), Path::Parse(toPath));
    }

    // ==== Sums ====

    // fn(const Subtype&) returns To, or the destination alternative it maps to.
    template <class Subtype, class F>
      requires std::is_invocable_v<F &, const Subtype &>
    BasicTransformerDefinition &WithSubtypeHandled(F &&fn)
    {
      using R = std::remove_cvref_t<std::invoke_result_t<F &, const Subtype &>>;
      return AddHandler(OverrideKind::SubtypeHandled, TypeRefOf<Subtype>(), TypeRefOf<R>(), {},
                        detail::ApplyThunk<Subtype, R>(std::forward<F>(fn)), {});
    }

    template <class Subtype, class F>
      requires(kPartial && std::is_invocable_v<F &, const Subtype &>)
    BasicTransformerDefinition &WithSubtypeHandledPartial(F &&fn)
    {
      using R = detail::PartialValueT<std::invoke_result_t<F &, const Subtype &>>;
      return AddHandler(OverrideKind::SubtypeHandledPartial, TypeRefOf<Subtype>(), TypeRefOf<R>(), {}, {},
                        detail::ApplyPartialThunk<Subtype, R>(std::forward<F>(fn)));
    }

    template <class Subtype, class F>
      requires std::is_invocable_v<F &, const Subtype &>
    BasicTransformerDefinition &WithEnumCaseHandled(F &&fn)
    {
      return WithSubtypeHandled<Subtype>(std::forward<F>(fn));
    }

    // Enumerators share one type, so they are handled by name: fn(Enum).
    template <class Enum, class F>
      requires(std::is_enum_v<Enum> && std::is_invocable_v<F &, Enum>)
    BasicTransformerDefinition &WithEnumCaseHandled(std::string_view caseName, F &&fn)
    {
      using R = std::remove_cvref_t<std::invoke_result_t<F &, Enum>>;
      return AddHandler(OverrideKind::SubtypeHandled, TypeRefOf<Enum>(), TypeRefOf<R>(), caseName,
                        detail::ApplyThunk<Enum, R>(std::forward<F>(fn)), {});
    }

    template <class Enum, class F>
      requires(kPartial && std::is_enum_v<Enum> && std::is_invocable_v<F &, Enum>)
    BasicTransformerDefinition &WithEnumCaseHandledPartial(std::string_view caseName, F &&fn)
    {
      using R = detail::PartialValueT<std::invoke_result_t<F &, Enum>>;
      return AddHandler(OverrideKind::SubtypeHandledPartial, TypeRefOf<Enum>(), TypeRefOf<R>(), caseName, {},
                        detail::ApplyPartialThunk<Enum, R>(std::forward<F>(fn)));
    }

    // ==== Construction ====

    // WithConstructor([](int id, std::string name) { return To{...}; }, {"id", "name"})
    template <class F, NGIN::UIntSize N>
    BasicTransformerDefinition &WithConstructor(F &&fn, const std::string_view (&names)[N])
    {
      using Traits = detail::CallableTraits<std::decay_t<F>>;
      static_assert(Traits::Arity == N, "one name per constructor parameter");
      static_assert(std::is_same_v<std::remove_cvref_t<typename Traits::Ret>, To>, "constructor must return To");
      return AddConstructor(OverrideKind::CustomConstructor, detail::ParametersOf<typename Traits::Args>(names),
                            detail::MakeConstructorThunk<typename Traits::Args>(std::forward<F>(fn)), {});
    }

    template <class F>
      requires std::is_invocable_v<F &>
    BasicTransformerDefinition &WithConstructor(F &&fn)
    {
      static_assert(std::is_same_v<std::remove_cvref_t<std::invoke_result_t<F &>>, To>, "constructor must return To");
      return AddConstructor(OverrideKind::CustomConstructor, {}, detail::MakeConstructorThunk<std::tuple<>>(std::forward<F>(fn)), {});
    }

    // fn(args...) -> PartialResult<To>
    template <class F, NGIN::UIntSize N>
      requires kPartial
    BasicTransformerDefinition &WithConstructorPartial(F &&fn, const std::string_view (&names)[N])
    {
      using Traits = detail::CallableTraits<std::decay_t<F>>;
      static_assert(Traits::Arity == N, "one name per constructor parameter");
      static_assert(std::is_same_v<detail::PartialValueT<typename Traits::Ret>, To>, "constructor must return PartialResult<To>");
      return AddConstructor(OverrideKind::CustomConstructorPartial, detail::ParametersOf<typename Traits::Args>(names), {},
                            detail::MakeConstructorPartialThunk<typename Traits::Args>(std::forward<F>(fn)));
    }

    // ==== Nested transformers ====

    // Used wherever (A, B) occurs below the root instead of deriving it.
    template <class A, class B, class F>
      requires std::is_invocable_v<F &, const A &>
    BasicTransformerDefinition &WithTransformer(F &&fn)
    {
      return AddHandler(OverrideKind::NestedTransformer, TypeRefOf<A>(), TypeRefOf<B>(), {}, detail::ApplyThunk<A, B>(std::forward<F>(fn)), {});
    }

    template <class A, class B>
    BasicTransformerDefinition &WithTransformer(const Transformer<A, B> &transformer)
    {
      return WithTransformer<A, B>([transformer](const A &a) { return transformer.Transform(a); });
    }

    template <class A, class B, class F>
      requires(kPartial && std::is_invocable_v<F &, const A &>)
    BasicTransformerDefinition &WithTransformerPartial(F &&fn)
    {
      return AddHandler(OverrideKind::NestedTransformerPartial, TypeRefOf<A>(), TypeRefOf<B>(), {}, {},
                        detail::ApplyPartialThunk<A, B>(std::forward<F>(fn)));
    }

    template <class A, class B>
      requires kPartial
    BasicTransformerDefinition &WithTransformerPartial(const PartialTransformer<A, B> &transformer)
    {
      return WithTransformerPartial<A, B>([transformer](const A &a) { return transformer.Transform(a); });
    }

    // ==== Flags ====

    BasicTransformerDefinition &EnableDefaultValues(bool enabled = true)
    {
      m_flags.defaultValues = enabled;
      return *this;
    }

    BasicTransformerDefinition &EnableBeanGetters(bool enabled = true)
    {
      m_flags.beanGetters = enabled;
      return *this;
    }

    BasicTransformerDefinition &EnableBeanSetters(bool enabled = true)
    {
      m_flags.beanSetters = enabled;
      return *this;
    }

    BasicTransformerDefinition &EnableMethodAccessors(bool enabled = true)
    {
      m_flags.methodAccessors = enabled;
      return *this;
    }

    BasicTransformerDefinition &EnableOptionDefaultsToNone(bool enabled = true)
    {
      m_flags.optionDefaultsToNone = enabled;
      return *this;
    }

    BasicTransformerDefinition &WithFlags(const TransformerFlags &flags)
    {
      m_flags = flags;
      return *this;
    }

    [[nodiscard]] const TransformerFlags &Flags() const noexcept { return m_flags; }
    [[nodiscard]] const OverrideRegistry &Overrides() const noexcept { return m_overrides; }

    [[nodiscard]] std::expected<Result, DerivationFailure> Build() const
    {
      auto plan = Derive(TypeRefOf<From>(), TypeRefOf<To>(), m_overrides, Mode, m_flags);
      if (!plan)
        return std::unexpected(std::move(plan.error()));
      return Result{std::move(*plan)};
    }

  private:
    BasicTransformerDefinition &AddValue(OverrideKind kind, Path target, TypeRef type, UnaryThunk apply, UnaryPartialThunk applyPartial)
    {
      Override o{};
      o.kind = kind;
      o.target = std::move(target);
      o.valueType = type;
      o.Apply = std::move(apply);
      o.ApplyPartial = std::move(applyPartial);
      m_overrides.Add(std::move(o));
      return *this;
    }

    BasicTransformerDefinition &AddRename(Path from, Path to)
    {
      Override o{};
      o.kind = OverrideKind::Renamed;
      o.source = std::move(from);
      o.target = std::move(to);
      m_overrides.Add(std::move(o));
      return *this;
    }

    BasicTransformerDefinition &AddHandler(OverrideKind kind, TypeRef input, TypeRef result, std::string_view caseName, UnaryThunk apply,
                                           UnaryPartialThunk applyPartial)
    {
      Override o{};
      o.kind = kind;
      o.valueType = input;
      o.resultType = result;
      o.caseName = caseName.empty() ? std::string_view{} : detail::InternName(caseName);
      o.Apply = std::move(apply);
      o.ApplyPartial = std::move(applyPartial);
      m_overrides.Add(std::move(o));
      return *this;
    }

    BasicTransformerDefinition &AddConstructor(OverrideKind kind, NGIN::Containers::Vector<ParameterDescriptor> parameters,
                                               ConstructorThunk construct, ConstructorPartialThunk constructPartial)
    {
      Override o{};
      o.kind = kind;
      o.resultType = TypeRefOf<To>();
      o.parameters = std::move(parameters);
      o.Construct = std::move(construct);
      o.ConstructPartial = std::move(constructPartial);
      m_overrides.Add(std::move(o));
      return *this;
    }

    OverrideRegistry m_overrides{};
    TransformerFlags m_flags{};
  };

  template <class From, class To>
  using TransformerDefinition = BasicTransformerDefinition<From, To, DerivationMode::Total>;

  template <class From, class To>
  using PartialTransformerDefinition = BasicTransformerDefinition<From, To, DerivationMode::Partial>;

  template <class From, class To>
  [[nodiscard]] TransformerDefinition<From, To> Define()
  {
    return {};
  }

  template <class From, class To>
  [[nodiscard]] PartialTransformerDefinition<From, To> DefinePartial()
  {
    return {};
  }

  // Override-free total transformation; the plan is derived on first use for each (From, To).
  template <class To, class From>
  [[nodiscard]] std::expected<To, DerivationFailure> Into(const From &source)
  {
    static const auto transformer = Define<From, To>().Build();
    if (!transformer)
      return std::unexpected(transformer.error());
    return transformer->Transform(source);
  }

} // namespace NGIN::Transform
