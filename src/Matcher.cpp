#include <NGIN/Transform/Matcher.hpp>

namespace NGIN::Transform
{

  namespace
  {
    bool Readable(const FieldDescriptor &f, const TransformerFlags &flags) noexcept
    {
      switch (f.sourceKind)
      {
      case FieldSourceKind::BeanGetter:
        return flags.beanGetters;
      case FieldSourceKind::AccessorMethod:
        return flags.methodAccessors;
      default:
        return true;
      }
    }

    // Follows a rename's from-path through nested products.
    bool ResolveChain(const ShapeModel &source, const Path &from, const TransformerFlags &flags, ShapeCache &shapes,
                      MemberMatch &match)
    {
      const ShapeModel *current = &source;
      for (NGIN::UIntSize i = 0; i < from.Size(); ++i)
      {
        const auto &seg = from[i];
        const FieldDescriptor *f = current && current->IsProduct() && seg.kind == PathSegmentKind::Field
                                       ? FindSourceField(*current, seg.name, flags)
                                       : nullptr;
        if (!f)
        {
          match.source = NGIN::Containers::Vector<const FieldDescriptor *>{};
          match.detail = "renamed from " + from.ToString() + ", but " + std::string{current ? current->displayName : std::string_view{}} +
                         " has no member `" + seg.name + "`";
          return false;
        }
        match.source.PushBack(f);
        current = i + 1 < from.Size() ? &shapes.Get(f->type) : nullptr;
      }
      return match.source.Size() > 0;
    }

    std::optional<NGIN::UIntSize> AlternativeOfType(const ShapeModel &dest, TypeId type) noexcept
    {
      for (NGIN::UIntSize i = 0; i < dest.sum.variants.Size(); ++i)
        if (!dest.sum.variants[i].singleton && dest.sum.variants[i].type.id == type)
          return i;
      return std::nullopt;
    }

    // Most recent handler for the source variant whose result the destination can hold.
    // `rejected` receives the most recent one for the variant that returns anything else.
    const Override *FindHandler(const VariantDescriptor &variant, const ShapeModel &dest, const OverrideScope &scope,
                                const Override *&rejected)
    {
      for (NGIN::UIntSize i = scope.Size(); i-- > 0;)
      {
        const auto *o = scope.At(i).override;
        if (!o->IsSubtypeHandler() || o->valueType.id != variant.type.id)
          continue;
        if (!o->caseName.empty() && o->caseName != variant.name)
          continue;
        if (o->resultType.id == dest.self.id || AlternativeOfType(dest, o->resultType.id))
          return o;
        if (!rejected)
          rejected = o;
      }
      return nullptr;
    }
  } // namespace

  const FieldDescriptor *FindSourceField(const ShapeModel &source, std::string_view name, const TransformerFlags &flags) noexcept
  {
    for (NGIN::UIntSize i = 0; i < source.product.fields.Size(); ++i)
    {
      const auto &f = source.product.fields[i];
      if (f.name == name && Readable(f, flags))
        return &f;
    }
    return nullptr;
  }

  NGIN::Containers::Vector<MemberMatch> MatchProduct(const ShapeModel &source,
                                                    const NGIN::Containers::Vector<ParameterDescriptor> &targets,
                                                    const OverrideScope &scope,
                                                    const TransformerFlags &flags,
                                                    ShapeCache &shapes)
  {
    NGIN::Containers::Vector<MemberMatch> out;
    out.Reserve(targets.Size());
    for (NGIN::UIntSize i = 0; i < targets.Size(); ++i)
    {
      const auto &target = targets[i];
      MemberMatch m{};
      m.target = &target;
      if (const auto *o = scope.FindValue(target.name))
      {
        m.kind = MatchKind::OverriddenBy;
        m.override = o;
      }
      else if (const auto *f = source.IsProduct() ? FindSourceField(source, target.name, flags) : nullptr)
      {
        m.kind = MatchKind::Matched;
        m.source.PushBack(f);
      }
      else if (const auto *r = scope.FindRename(target.name))
      {
        m.override = r;
        m.kind = ResolveChain(source, r->source, flags, shapes, m) ? MatchKind::Renamed : MatchKind::Unmatched;
      }
      else
      {
        m.kind = MatchKind::Unmatched;
      }
      out.PushBack(std::move(m));
    }
    return out;
  }

  SumMatch MatchSum(const ShapeModel &source, const ShapeModel &dest, const OverrideScope &scope)
  {
    SumMatch out;
    const auto &variants = source.sum.variants;
    for (NGIN::UIntSize i = 0; i < variants.Size(); ++i)
    {
      VariantMatch vm{};
      vm.sourceIndex = i;
      const Override *rejected = nullptr;
      if (const auto *h = FindHandler(variants[i], dest, scope, rejected))
      {
        vm.handler = h;
        if (h->resultType.id != dest.self.id)
          vm.handlerDestIndex = AlternativeOfType(dest, h->resultType.id);
      }
      else
      {
        vm.destIndex = dest.FindVariant(variants[i].name);
        vm.rejectedHandler = rejected;
      }
      out.variants.PushBack(std::move(vm));
    }

    for (NGIN::UIntSize d = 0; d < dest.sum.variants.Size(); ++d)
    {
      bool covered = source.FindVariant(dest.sum.variants[d].name).has_value();
      for (NGIN::UIntSize i = 0; i < out.variants.Size() && !covered; ++i)
        covered = out.variants[i].handlerDestIndex == d;
      if (!covered)
        out.uncovered.PushBack(d);
    }
    return out;
  }

} // namespace NGIN::Transform
