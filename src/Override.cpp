#include <NGIN/Transform/Override.hpp>

namespace NGIN::Transform
{

  namespace
  {
    bool TargetsField(const OverrideScope::Entry &e, std::string_view field) noexcept
    {
      return e.Remaining() == 1 && e.Segment(0).kind == PathSegmentKind::Field && e.Segment(0).name == field;
    }
  } // namespace

  std::string_view KindName(OverrideKind kind) noexcept
  {
    switch (kind)
    {
    case OverrideKind::Const:
      return "Const";
    case OverrideKind::ConstPartial:
      return "ConstPartial";
    case OverrideKind::Computed:
      return "Computed";
    case OverrideKind::ComputedPartial:
      return "ComputedPartial";
    case OverrideKind::Renamed:
      return "Renamed";
    case OverrideKind::SubtypeHandled:
      return "SubtypeHandled";
    case OverrideKind::SubtypeHandledPartial:
      return "SubtypeHandledPartial";
    case OverrideKind::CustomConstructor:
      return "CustomConstructor";
    case OverrideKind::CustomConstructorPartial:
      return "CustomConstructorPartial";
    case OverrideKind::NestedTransformer:
      return "NestedTransformer";
    case OverrideKind::NestedTransformerPartial:
      return "NestedTransformerPartial";
    }
    return "Unknown";
  }

  void OverrideRegistry::Add(Override o)
  {
    m_overrides.PushBack(std::move(o));
  }

  OverrideScope OverrideScope::Root(const OverrideRegistry &registry)
  {
    OverrideScope scope;
    scope.m_entries.Reserve(registry.Size());
    for (NGIN::UIntSize i = 0; i < registry.Size(); ++i)
      scope.m_entries.PushBack(Entry{&registry.At(i), 0});
    return scope;
  }

  OverrideScope OverrideScope::Child(std::string_view field) const
  {
    OverrideScope scope;
    for (NGIN::UIntSize i = 0; i < m_entries.Size(); ++i)
    {
      const auto &e = m_entries[i];
      if (e.override->IsSubtypeHandler() || e.override->IsTransformer())
      {
        scope.m_entries.PushBack(e);
        continue;
      }
      if (!e.override->IsPathKeyed() || e.Remaining() < 2)
        continue;
      const auto &head = e.Segment(0);
      if (head.kind == PathSegmentKind::Field && head.name == field)
        scope.m_entries.PushBack(Entry{e.override, e.depth + 1});
    }
    return scope;
  }

  OverrideScope OverrideScope::TypeKeyedOnly() const
  {
    OverrideScope scope;
    for (NGIN::UIntSize i = 0; i < m_entries.Size(); ++i)
      if (m_entries[i].override->IsSubtypeHandler() || m_entries[i].override->IsTransformer())
        scope.m_entries.PushBack(m_entries[i]);
    return scope;
  }

  const Override *OverrideScope::FindValue(std::string_view field) const
  {
    for (NGIN::UIntSize i = m_entries.Size(); i-- > 0;)
      if (m_entries[i].override->IsValue() && TargetsField(m_entries[i], field))
        return m_entries[i].override;
    return nullptr;
  }

  const Override *OverrideScope::FindRename(std::string_view field) const
  {
    for (NGIN::UIntSize i = m_entries.Size(); i-- > 0;)
      if (m_entries[i].override->kind == OverrideKind::Renamed && TargetsField(m_entries[i], field))
        return m_entries[i].override;
    return nullptr;
  }

  const Override *OverrideScope::FindConstructor() const
  {
    for (NGIN::UIntSize i = m_entries.Size(); i-- > 0;)
      if (m_entries[i].override->IsConstructor() && m_entries[i].Remaining() == 0)
        return m_entries[i].override;
    return nullptr;
  }

  const Override *OverrideScope::FindTransformer(TypeId from, TypeId to) const
  {
    for (NGIN::UIntSize i = m_entries.Size(); i-- > 0;)
    {
      const auto *o = m_entries[i].override;
      if (o->IsTransformer() && o->valueType.id == from && o->resultType.id == to)
        return o;
    }
    return nullptr;
  }

  bool OverrideScope::HasPathOverrides() const noexcept
  {
    for (NGIN::UIntSize i = 0; i < m_entries.Size(); ++i)
      if (m_entries[i].override->IsPathKeyed() && m_entries[i].Remaining() > 0)
        return true;
    return false;
  }

} // namespace NGIN::Transform
