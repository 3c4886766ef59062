#include <NGIN/Transform/Executor.hpp>

namespace NGIN::Transform
{

  namespace
  {
    struct State
    {
      const void *root{nullptr};
      ExecutionOptions options{};
    };

    PartialAny Run(const TransformationPlan &plan, const void *source, const State &state);

    const void *DataOf(const Any &value)
    {
      return static_cast<const void *>(value.Data());
    }

    Any LoadChain(const PlanStep &step, const void *source)
    {
      Any current = step.loaders[0](source);
      for (NGIN::UIntSize i = 1; i < step.loaders.Size(); ++i)
      {
        Any next = step.loaders[i](DataOf(current));
        current = std::move(next);
      }
      return current;
    }

    PartialAny RunStep(const PlanStep &step, const void *source, const State &state)
    {
      switch (step.kind)
      {
      case StepKind::DirectCopy:
        return LoadChain(step, source);
      case StepKind::Nested:
      {
        const Any value = LoadChain(step, source);
        return Run(*step.nested, DataOf(value), state);
      }
      case StepKind::Const:
      case StepKind::Computed:
        return step.value(state.root);
      case StepKind::ConstPartial:
      case StepKind::ComputedPartial:
        return step.partialValue(state.root);
      case StepKind::Default:
        return step.defaultValue();
      }
      return PartialFailure("unknown step kind");
    }

    // Evaluates every step; failures are tagged with the member they belong to.
    PartialResult<NGIN::Containers::Vector<Any>> RunSteps(const TransformationPlan &plan, const void *source, const State &state)
    {
      PartialErrors errors;
      NGIN::Containers::Vector<Any> args;
      args.Reserve(plan.steps.Size());
      for (NGIN::UIntSize i = 0; i < plan.steps.Size(); ++i)
      {
        const auto &step = plan.steps[i];
        auto r = RunStep(step, source, state);
        if (r)
        {
          args.PushBack(std::move(*r));
          continue;
        }
        errors.Append(r.error(), PathSegment::Field(step.target));
        if (state.options.failFast)
          return std::unexpected(std::move(errors));
        args.PushBack(Any::MakeVoid());
      }
      if (!errors.Empty())
        return std::unexpected(std::move(errors));
      return args;
    }

    Any *ArgsData(NGIN::Containers::Vector<Any> &args)
    {
      return args.Size() ? &args[0] : nullptr;
    }

    PartialAny RunSum(const TransformationPlan &plan, const void *source, const State &state)
    {
      const auto discriminant = plan.sourceOps.Discriminant(source);
      for (NGIN::UIntSize i = 0; i < plan.branches.Size(); ++i)
      {
        const auto &b = plan.branches[i];
        if (b.discriminant != discriminant)
          continue;
        if (!b.handled && b.destSingleton)
          return b.singletonValue;

        const Any payload = plan.sourceOps.Extract(source);
        PartialAny r = b.handled ? (b.partialHandler ? b.partialHandler(DataOf(payload)) : PartialAny{b.handler(DataOf(payload))})
                                 : Run(*b.plan, DataOf(payload), state);
        if (!r)
          return r;
        if (b.handled && !b.wrapIndex)
          return r;
        return plan.targetOps.Make(b.handled ? *b.wrapIndex : b.destIndex, *r);
      }
      return PartialFailure("value of " + std::string{plan.from.name} + " is not one of its described variants");
    }

    PartialAny RunCollection(const TransformationPlan &plan, const void *source, const State &state)
    {
      PartialErrors errors;
      NGIN::Containers::Vector<Any> out;
      const auto count = plan.sourceOps.Size(source);
      out.Reserve(count);
      for (NGIN::UIntSize i = 0; i < count; ++i)
      {
        const Any element = plan.sourceOps.ElementAt(source, i);
        auto r = Run(*plan.element, DataOf(element), state);
        if (r)
        {
          out.PushBack(std::move(*r));
          continue;
        }
        errors.Append(r.error(), PathSegment::Index(i));
        if (state.options.failFast)
          break;
      }
      if (!errors.Empty())
        return std::unexpected(std::move(errors));
      return plan.targetOps.Build(out);
    }

    PartialAny Run(const TransformationPlan &plan, const void *source, const State &state)
    {
      switch (plan.strategy)
      {
      case ConstructionStrategy::Identity:
        return plan.sourceOps.Clone(source);
      case ConstructionStrategy::Singleton:
        return plan.targetOps.Construct(nullptr);
      case ConstructionStrategy::Constructor:
      {
        auto args = RunSteps(plan, source, state);
        if (!args)
          return std::unexpected(std::move(args.error()));
        return plan.targetOps.Construct(ArgsData(*args));
      }
      case ConstructionStrategy::CustomConstructor:
      {
        auto args = RunSteps(plan, source, state);
        if (!args)
          return std::unexpected(std::move(args.error()));
        if (plan.partialConstruct)
          return plan.partialConstruct(ArgsData(*args));
        return plan.construct(ArgsData(*args));
      }
      case ConstructionStrategy::BeanSetters:
      {
        auto args = RunSteps(plan, source, state);
        if (!args)
          return std::unexpected(std::move(args.error()));
        Any bean = plan.targetOps.Construct(nullptr);
        void *raw = const_cast<void *>(DataOf(bean));
        for (NGIN::UIntSize i = 0; i < plan.steps.Size(); ++i)
          plan.steps[i].Store(raw, (*args)[i]);
        return bean;
      }
      case ConstructionStrategy::SumDispatch:
        return RunSum(plan, source, state);
      case ConstructionStrategy::WrapOptional:
      {
        auto inner = Run(*plan.element, source, state);
        if (!inner)
          return inner;
        return plan.targetOps.Wrap(*inner);
      }
      case ConstructionStrategy::MapOptional:
      {
        if (!plan.sourceOps.HasValue(source))
          return plan.targetOps.MakeEmpty();
        const Any value = plan.sourceOps.Unwrap(source);
        auto inner = Run(*plan.element, DataOf(value), state);
        if (!inner)
          return inner;
        return plan.targetOps.Wrap(*inner);
      }
      case ConstructionStrategy::UnwrapOptional:
      {
        if (!plan.sourceOps.HasValue(source))
          return PartialFailure("empty value");
        const Any value = plan.sourceOps.Unwrap(source);
        return Run(*plan.element, DataOf(value), state);
      }
      case ConstructionStrategy::MapCollection:
        return RunCollection(plan, source, state);
      case ConstructionStrategy::UserTransformer:
        if (plan.partialTransform)
          return plan.partialTransform(source);
        return plan.transform(source);
      }
      return PartialFailure("unknown construction strategy");
    }
  } // namespace

  PartialAny Execute(const TransformationPlan &plan, const void *source, const void *root, const ExecutionOptions &options)
  {
    return Run(plan, source, State{root, options});
  }

} // namespace NGIN::Transform
