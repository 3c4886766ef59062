#include <NGIN/Transform/Plan.hpp>

namespace NGIN::Transform
{

  namespace
  {
    std::string DescribeStep(const PlanStep &step)
    {
      std::string out;
      switch (step.kind)
      {
      case StepKind::DirectCopy:
      {
        out = "copy " + std::string{step.target};
        const auto from = step.source.ToString().substr(1);
        if (from != step.target)
          out += " <- " + from;
        return out;
      }
      case StepKind::Nested:
        return "nest " + std::string{step.target} + " = " + (step.nested ? DescribePlan(*step.nested) : std::string{"?"});
      case StepKind::Const:
        return "const " + std::string{step.target};
      case StepKind::ConstPartial:
        return "const? " + std::string{step.target};
      case StepKind::Computed:
        return "computed " + std::string{step.target};
      case StepKind::ComputedPartial:
        return "computed? " + std::string{step.target};
      case StepKind::Default:
        return "default " + std::string{step.target};
      }
      return out;
    }

    std::string DescribeBranch(const VariantBranch &b)
    {
      if (b.handled)
        return std::string{b.source} + " handled";
      std::string out = std::string{b.source} + " -> " + std::string{b.dest};
      if (b.plan)
        out += ": " + DescribePlan(*b.plan);
      return out;
    }

    template <class Vec, class Fn>
    std::string Join(const Vec &items, Fn &&describe)
    {
      std::string out;
      for (NGIN::UIntSize i = 0; i < items.Size(); ++i)
      {
        if (i)
          out += ", ";
        out += describe(items[i]);
      }
      return out;
    }
  } // namespace

  std::string_view StrategyName(ConstructionStrategy strategy) noexcept
  {
    switch (strategy)
    {
    case ConstructionStrategy::Identity:
      return "Identity";
    case ConstructionStrategy::Constructor:
      return "Constructor";
    case ConstructionStrategy::CustomConstructor:
      return "CustomConstructor";
    case ConstructionStrategy::BeanSetters:
      return "BeanSetters";
    case ConstructionStrategy::Singleton:
      return "Singleton";
    case ConstructionStrategy::SumDispatch:
      return "SumDispatch";
    case ConstructionStrategy::WrapOptional:
      return "WrapOptional";
    case ConstructionStrategy::MapOptional:
      return "MapOptional";
    case ConstructionStrategy::UnwrapOptional:
      return "UnwrapOptional";
    case ConstructionStrategy::MapCollection:
      return "MapCollection";
    case ConstructionStrategy::UserTransformer:
      return "UserTransformer";
    }
    return "Unknown";
  }

  std::string DescribePlan(const TransformationPlan &plan)
  {
    std::string out{StrategyName(plan.strategy)};
    switch (plan.strategy)
    {
    case ConstructionStrategy::Constructor:
    case ConstructionStrategy::CustomConstructor:
    case ConstructionStrategy::BeanSetters:
      out += "(" + Join(plan.steps, DescribeStep) + ")";
      break;
    case ConstructionStrategy::SumDispatch:
      out += "(" + Join(plan.branches, DescribeBranch) + ")";
      break;
    case ConstructionStrategy::WrapOptional:
    case ConstructionStrategy::MapOptional:
    case ConstructionStrategy::UnwrapOptional:
    case ConstructionStrategy::MapCollection:
      out += "(" + (plan.element ? DescribePlan(*plan.element) : std::string{"?"}) + ")";
      break;
    default:
      break;
    }
    return out;
  }

} // namespace NGIN::Transform
