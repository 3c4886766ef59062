#include <NGIN/Transform/Derivation.hpp>
#include <NGIN/Transform/Matcher.hpp>

#include <utility>
#include <vector>

namespace NGIN::Transform
{

  namespace
  {
    using MutablePlan = std::shared_ptr<TransformationPlan>;

    std::string Quote(std::string_view name)
    {
      return "`" + std::string{name} + "`";
    }

    StepKind StepKindOf(OverrideKind kind) noexcept
    {
      switch (kind)
      {
      case OverrideKind::ConstPartial:
        return StepKind::ConstPartial;
      case OverrideKind::Computed:
        return StepKind::Computed;
      case OverrideKind::ComputedPartial:
        return StepKind::ComputedPartial;
      default:
        return StepKind::Const;
      }
    }

    bool SameNames(const NGIN::Containers::Vector<ParameterDescriptor> &a, const NGIN::Containers::Vector<ParameterDescriptor> &b)
    {
      if (a.Size() != b.Size())
        return false;
      for (NGIN::UIntSize i = 0; i < a.Size(); ++i)
      {
        bool found = false;
        for (NGIN::UIntSize j = 0; j < b.Size() && !found; ++j)
          found = a[i].name == b[j].name;
        if (!found)
          return false;
      }
      return true;
    }

    class Session
    {
    public:
      Session(DerivationMode mode, const TransformerFlags &flags) : m_mode(mode), m_flags(flags) {}

      // Failures are recorded relative to the node being derived.
      PlanPtr Node(const TypeRef &from, const TypeRef &to, const OverrideScope &scope, bool atRoot, FailureCollector &failures)
      {
        if (!atRoot)
        {
          if (const auto *t = scope.FindTransformer(from.id, to.id))
            return UserTransformer(*t, from, to, failures);
        }

        const ShapeModel &src = m_shapes.Get(from);
        const ShapeModel &dst = m_shapes.Get(to);

        if (from.id == to.id && !CopyBypassesOverrides(from, scope, atRoot))
        {
          if (!src.ops.Clone)
          {
            failures.Record(Path{}, FailureReason::TypeMismatch, std::string{to.name} + " is not copyable");
            return nullptr;
          }
          return NewPlan(ConstructionStrategy::Identity, src, dst);
        }

        for (const auto &active : m_active)
        {
          if (active.first == from.id && active.second == to.id)
          {
            failures.Record(Path{}, FailureReason::RecursiveTypeUnsupported,
                            std::string{from.name} + " -> " + std::string{to.name} +
                                " refers back to itself; supply WithTransformer for this pair");
            return nullptr;
          }
        }
        m_active.emplace_back(from.id, to.id);
        auto plan = Structural(src, dst, scope, failures);
        m_active.pop_back();
        return plan;
      }

    private:
      // True when copying `type` as-is would skip an override that applies inside it.
      bool CopyBypassesOverrides(const TypeRef &type, const OverrideScope &scope, bool atRoot)
      {
        if (scope.HasPathOverrides())
          return true;
        if (atRoot)
        {
          if (const auto *ctor = scope.FindConstructor(); ctor && ctor->resultType.id == type.id)
            return true;
        }
        else if (scope.FindTransformer(type.id, type.id))
        {
          return true;
        }

        bool typeKeyed = false;
        for (NGIN::UIntSize i = 0; i < scope.Size() && !typeKeyed; ++i)
          typeKeyed = scope.At(i).override->IsSubtypeHandler() || scope.At(i).override->IsTransformer();
        if (!typeKeyed)
          return false;

        // Walk every type reachable from `type`: handlers keyed by a variant, transformers for a nested pair.
        std::vector<TypeRef> pending{type};
        std::vector<TypeId> seen{};
        const auto visit = [&](const TypeRef &child) {
          if (scope.FindTransformer(child.id, child.id))
            return true;
          pending.push_back(child);
          return false;
        };
        while (!pending.empty())
        {
          const TypeRef current = pending.back();
          pending.pop_back();
          bool visited = false;
          for (const auto id : seen)
            visited = visited || id == current.id;
          if (visited)
            continue;
          seen.push_back(current.id);

          const ShapeModel &shape = m_shapes.Get(current);
          if (shape.IsSum())
          {
            for (NGIN::UIntSize v = 0; v < shape.sum.variants.Size(); ++v)
            {
              const auto &variant = shape.sum.variants[v];
              for (NGIN::UIntSize i = 0; i < scope.Size(); ++i)
              {
                const auto *o = scope.At(i).override;
                if (o->IsSubtypeHandler() && o->valueType.id == variant.type.id && (o->caseName.empty() || o->caseName == variant.name))
                  return true;
              }
              if (!variant.singleton && visit(variant.type))
                return true;
            }
          }
          else if (shape.IsProduct())
          {
            for (NGIN::UIntSize f = 0; f < shape.product.fields.Size(); ++f)
              if (visit(shape.product.fields[f].type))
                return true;
            for (NGIN::UIntSize p = 0; p < shape.product.parameters.Size(); ++p)
              if (visit(shape.product.parameters[p].type))
                return true;
          }
          else if (shape.kind == ShapeKind::Wrapper && visit(shape.wrapper.inner))
          {
            return true;
          }
        }
        return false;
      }

      PlanPtr Structural(const ShapeModel &src, const ShapeModel &dst, const OverrideScope &scope, FailureCollector &failures)
      {
        // A custom constructor for this node's type takes precedence over its shape.
        if (const Override *ctor = scope.FindConstructor(); ctor && ctor->resultType.id == dst.self.id)
          return Product(src, dst, scope, failures);
        if (dst.IsOptional())
        {
          if (src.IsOptional())
            return Wrapped(ConstructionStrategy::MapOptional, src, dst, src.wrapper.inner, dst.wrapper.inner, scope, failures);
          return Wrapped(ConstructionStrategy::WrapOptional, src, dst, src.self, dst.wrapper.inner, scope, failures);
        }
        if (src.IsOptional())
        {
          if (m_mode == DerivationMode::Partial)
            return Wrapped(ConstructionStrategy::UnwrapOptional, src, dst, src.wrapper.inner, dst.self, scope, failures);
          return Mismatch(src, dst, failures);
        }
        if (dst.IsCollection())
        {
          if (src.IsCollection())
            return Wrapped(ConstructionStrategy::MapCollection, src, dst, src.wrapper.inner, dst.wrapper.inner, scope, failures);
          return Mismatch(src, dst, failures);
        }
        if (dst.IsSum())
        {
          if (src.IsSum())
            return Sum(src, dst, scope, failures);
          return Mismatch(src, dst, failures);
        }
        if (dst.IsProduct())
          return Product(src, dst, scope, failures);
        return Mismatch(src, dst, failures);
      }

      PlanPtr Mismatch(const ShapeModel &src, const ShapeModel &dst, FailureCollector &failures)
      {
        std::string detail = "no transformation from " + std::string{src.self.name} + " to " + std::string{dst.self.name};
        if (src.IsOptional() && !dst.IsOptional())
          detail += "; unwrapping an optional needs a partial transformer";
        failures.Record(Path{}, FailureReason::TypeMismatch, std::move(detail));
        return nullptr;
      }

      PlanPtr UserTransformer(const Override &t, const TypeRef &from, const TypeRef &to, FailureCollector &failures)
      {
        if (!AllowedInMode(t, Path{}, failures))
          return nullptr;
        auto plan = std::make_shared<TransformationPlan>();
        plan->strategy = ConstructionStrategy::UserTransformer;
        plan->from = from;
        plan->to = to;
        plan->partial = t.IsPartial();
        plan->transform = t.Apply;
        plan->partialTransform = t.ApplyPartial;
        return plan;
      }

      PlanPtr Wrapped(ConstructionStrategy strategy, const ShapeModel &src, const ShapeModel &dst, const TypeRef &innerFrom,
                      const TypeRef &innerTo, const OverrideScope &scope, FailureCollector &failures)
      {
        auto element = Node(innerFrom, innerTo, scope, false, failures);
        if (!element)
          return nullptr;
        auto plan = NewPlan(strategy, src, dst);
        plan->partial = element->partial || strategy == ConstructionStrategy::UnwrapOptional;
        plan->element = std::move(element);
        return plan;
      }

      PlanPtr Product(const ShapeModel &src, const ShapeModel &dst, const OverrideScope &scope, FailureCollector &failures)
      {
        if (ReportIssues(dst, failures))
          return nullptr;

        const Override *ctor = scope.FindConstructor();
        if (ctor && ctor->resultType.id != dst.self.id)
          ctor = nullptr;

        const NGIN::Containers::Vector<ParameterDescriptor> *targets = &dst.product.parameters;
        ConstructionStrategy strategy = ConstructionStrategy::Constructor;
        if (ctor)
        {
          if (!AllowedInMode(*ctor, Path{}, failures) || !CheckConstructorConflicts(*ctor, scope, failures))
            return nullptr;
          strategy = ConstructionStrategy::CustomConstructor;
          targets = &ctor->parameters;
        }
        else if (!dst.IsProduct())
        {
          return Mismatch(src, dst, failures);
        }
        else
        {
          switch (dst.product.kind)
          {
          case ProductKind::Singleton:
          {
            static const NGIN::Containers::Vector<ParameterDescriptor> kNone{};
            if (CheckScope(scope, kNone, dst, failures))
              return nullptr;
            return NewPlan(ConstructionStrategy::Singleton, src, dst);
          }
          case ProductKind::Opaque:
            failures.Record(Path{}, FailureReason::NoAccessibleConstructor,
                            std::string{dst.displayName} + " is described without a constructor or setters");
            return nullptr;
          case ProductKind::Bean:
            if (!m_flags.beanSetters)
            {
              failures.Record(Path{}, FailureReason::NoAccessibleConstructor,
                              std::string{dst.displayName} + " can only be built through setters, which are disabled");
              return nullptr;
            }
            strategy = ConstructionStrategy::BeanSetters;
            break;
          case ProductKind::Record:
            break;
          }
        }

        const auto before = failures.Count();
        CheckScope(scope, *targets, dst, failures);

        auto plan = NewPlan(strategy, src, dst);
        if (ctor)
        {
          plan->construct = ctor->Construct;
          plan->partialConstruct = ctor->ConstructPartial;
          plan->partial = ctor->IsPartial();
        }

        const auto matches = MatchProduct(src, *targets, scope, m_flags, m_shapes);
        for (NGIN::UIntSize i = 0; i < matches.Size(); ++i)
        {
          PlanStep step{};
          if (BuildStep(matches[i], src, scope, step, plan->partial, failures))
            plan->steps.PushBack(std::move(step));
        }
        if (failures.Count() != before)
          return nullptr;
        return plan;
      }

      bool BuildStep(const MemberMatch &m, const ShapeModel &src, const OverrideScope &scope, PlanStep &step, bool &partial,
                     FailureCollector &failures)
      {
        const auto &target = *m.target;
        const Path at = Path{}.Field(target.name);
        step.target = target.name;
        step.Store = target.Store;

        switch (m.kind)
        {
        case MatchKind::OverriddenBy:
        {
          const auto &o = *m.override;
          if (!AllowedInMode(o, at, failures))
            return false;
          if (o.valueType.id != target.type.id)
          {
            failures.Record(at, FailureReason::TypeMismatch,
                            "override value has type " + std::string{o.valueType.name} + ", but " + Quote(target.name) + " is " +
                                std::string{target.type.name});
            return false;
          }
          step.kind = StepKindOf(o.kind);
          step.value = o.Apply;
          step.partialValue = o.ApplyPartial;
          partial = partial || o.IsPartial();
          return true;
        }
        case MatchKind::Matched:
        case MatchKind::Renamed:
        {
          for (NGIN::UIntSize i = 0; i < m.source.Size(); ++i)
          {
            step.source = step.source.Field(m.source[i]->name);
            step.loaders.PushBack(m.source[i]->Load);
          }
          const auto &read = *m.source[m.source.Size() - 1];
          const OverrideScope child = scope.Child(target.name);
          if (read.type.id == target.type.id && !CopyBypassesOverrides(read.type, child, false))
          {
            step.kind = StepKind::DirectCopy;
            return true;
          }
          FailureCollector nested;
          auto plan = Node(read.type, target.type, child, false, nested);
          if (!nested.Empty() || !plan)
          {
            failures.Merge(std::move(nested).Finish(), at);
            return false;
          }
          step.kind = StepKind::Nested;
          partial = partial || plan->partial;
          step.nested = std::move(plan);
          return true;
        }
        case MatchKind::Unmatched:
          break;
        }

        if (target.hasDefault && m_flags.defaultValues)
        {
          step.kind = StepKind::Default;
          step.defaultValue = target.Default;
          return true;
        }
        if (m_flags.optionDefaultsToNone)
        {
          const ShapeModel &shape = m_shapes.Get(target.type);
          if (shape.IsOptional())
          {
            step.kind = StepKind::Const;
            step.value = [makeEmpty = shape.ops.MakeEmpty](const void *) { return makeEmpty(); };
            return true;
          }
        }
        std::string detail = m.detail;
        if (detail.empty())
          detail = "no source member " + Quote(target.name) + " in " + std::string{src.displayName} + " and no default value";
        failures.Record(at, FailureReason::NoMatchingMember, std::move(detail));
        return false;
      }

      PlanPtr Sum(const ShapeModel &src, const ShapeModel &dst, const OverrideScope &scope, FailureCollector &failures)
      {
        const bool srcIssues = ReportIssues(src, failures);
        if (ReportIssues(dst, failures) || srcIssues)
          return nullptr;

        const auto before = failures.Count();
        static const NGIN::Containers::Vector<ParameterDescriptor> kNone{};
        CheckScope(scope, kNone, dst, failures);

        auto plan = NewPlan(ConstructionStrategy::SumDispatch, src, dst);
        const SumMatch match = MatchSum(src, dst, scope);
        const OverrideScope branchScope = scope.TypeKeyedOnly();
        for (NGIN::UIntSize i = 0; i < match.variants.Size(); ++i)
        {
          const auto &vm = match.variants[i];
          const auto &sv = src.sum.variants[vm.sourceIndex];
          const Path at = Path{}.Variant(sv.name);
          VariantBranch branch{};
          branch.source = sv.name;
          branch.discriminant = sv.discriminant;

          if (vm.handler)
          {
            if (!AllowedInMode(*vm.handler, at, failures))
              continue;
            branch.handled = true;
            branch.handler = vm.handler->Apply;
            branch.partialHandler = vm.handler->ApplyPartial;
            branch.wrapIndex = vm.handlerDestIndex;
            plan->partial = plan->partial || vm.handler->IsPartial();
          }
          else if (!vm.destIndex && vm.rejectedHandler)
          {
            failures.Record(at, FailureReason::TypeMismatch,
                            "handler for " + Quote(sv.name) + " returns " + std::string{vm.rejectedHandler->resultType.name} +
                                ", which is neither " + std::string{dst.displayName} + " nor one of its alternatives");
            continue;
          }
          else if (!vm.destIndex)
          {
            failures.Record(at, FailureReason::UnmappedSumVariant,
                            "source variant " + Quote(sv.name) + " of " + std::string{src.displayName} + " has no counterpart in " +
                                std::string{dst.displayName});
            continue;
          }
          else
          {
            const auto &dv = dst.sum.variants[*vm.destIndex];
            branch.dest = dv.name;
            branch.destIndex = *vm.destIndex;
            if (dv.singleton)
            {
              branch.destSingleton = true;
              branch.singletonValue = dv.value;
            }
            else
            {
              FailureCollector nested;
              auto inner = Node(sv.type, dv.type, branchScope, false, nested);
              if (!nested.Empty() || !inner)
              {
                failures.Merge(std::move(nested).Finish(), at);
                continue;
              }
              plan->partial = plan->partial || inner->partial;
              branch.plan = std::move(inner);
            }
          }
          plan->branches.PushBack(std::move(branch));
        }

        for (NGIN::UIntSize i = 0; i < match.uncovered.Size(); ++i)
        {
          const auto &dv = dst.sum.variants[match.uncovered[i]];
          failures.Record(Path{}.Variant(dv.name), FailureReason::UnmappedSumVariant,
                          "destination variant " + Quote(dv.name) + " of " + std::string{dst.displayName} + " is never produced from " +
                              std::string{src.displayName});
        }
        if (failures.Count() != before)
          return nullptr;
        return plan;
      }

      // Overrides below this node that name no member of it, and value overrides that hide deeper ones.
      bool CheckScope(const OverrideScope &scope, const NGIN::Containers::Vector<ParameterDescriptor> &targets, const ShapeModel &dst,
                      FailureCollector &failures)
      {
        const auto before = failures.Count();
        for (NGIN::UIntSize i = 0; i < scope.Size(); ++i)
        {
          const auto &e = scope.At(i);
          if (!e.override->IsPathKeyed() || e.Remaining() == 0)
            continue;
          const auto &head = e.Segment(0);
          bool known = false;
          for (NGIN::UIntSize t = 0; t < targets.Size() && !known; ++t)
            known = head.kind == PathSegmentKind::Field && targets[t].name == head.name;
          if (!known)
          {
            failures.Record(e.override->target.Suffix(e.depth), FailureReason::NoMatchingMember,
                            std::string{KindName(e.override->kind)} + " override targets " + Quote(head.name) + ", which " +
                                std::string{dst.displayName} + " does not have");
            continue;
          }
          if (!e.override->IsValue() || e.Remaining() != 1 || scope.FindValue(head.name) != e.override)
            continue;
          for (NGIN::UIntSize j = 0; j < scope.Size(); ++j)
          {
            const auto &d = scope.At(j);
            if (d.override->IsPathKeyed() && d.Remaining() > 1 && d.Segment(0).name == head.name)
            {
              failures.Record(Path{}.Field(head.name), FailureReason::AmbiguousOverride,
                              "value override for " + Quote(head.name) + " hides the override at " + d.override->target.ToString());
              break;
            }
          }
        }
        return failures.Count() != before;
      }

      bool CheckConstructorConflicts(const Override &ctor, const OverrideScope &scope, FailureCollector &failures)
      {
        for (NGIN::UIntSize i = 0; i < scope.Size(); ++i)
        {
          const auto *o = scope.At(i).override;
          if (o == &ctor || !o->IsConstructor() || o->resultType.id != ctor.resultType.id)
            continue;
          if (!SameNames(o->parameters, ctor.parameters))
          {
            failures.Record(Path{}, FailureReason::AmbiguousOverride,
                            "custom constructors for " + std::string{ctor.resultType.name} + " declare different parameters");
            return false;
          }
        }
        return true;
      }

      bool AllowedInMode(const Override &o, const Path &at, FailureCollector &failures)
      {
        if (m_mode == DerivationMode::Total && o.IsPartial())
        {
          failures.Record(at, FailureReason::PartialStepInTotalMode,
                          std::string{KindName(o.kind)} + " override can fail; use a partial transformer");
          return false;
        }
        return true;
      }

      bool ReportIssues(const ShapeModel &shape, FailureCollector &failures)
      {
        for (NGIN::UIntSize i = 0; i < shape.issues.Size(); ++i)
          failures.Record(Path{}, FailureReason::TypeMismatch, shape.issues[i]);
        return shape.issues.Size() > 0;
      }

      static MutablePlan NewPlan(ConstructionStrategy strategy, const ShapeModel &src, const ShapeModel &dst)
      {
        auto plan = std::make_shared<TransformationPlan>();
        plan->strategy = strategy;
        plan->from = src.self;
        plan->to = dst.self;
        plan->sourceOps = src.ops;
        plan->targetOps = dst.ops;
        return plan;
      }

      DerivationMode m_mode{DerivationMode::Total};
      TransformerFlags m_flags{};
      ShapeCache m_shapes{};
      std::vector<std::pair<TypeId, TypeId>> m_active{};
    };
  } // namespace

  DerivationResult Derive(const TypeRef &from, const TypeRef &to, const OverrideRegistry &overrides, DerivationMode mode,
                          const TransformerFlags &flags)
  {
    Session session{mode, flags};
    FailureCollector failures;
    auto plan = session.Node(from, to, OverrideScope::Root(overrides), true, failures);
    if (!failures.Empty() || !plan)
      return std::unexpected(std::move(failures).Finish());
    return plan;
  }

} // namespace NGIN::Transform
