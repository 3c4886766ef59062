#include <NGIN/Transform/ShapeBuilder.hpp>

namespace NGIN::Transform::detail
{

  namespace
  {
    template <class Vec>
    void CheckNames(ShapeModel &model, const Vec &items, std::string_view what)
    {
      for (NGIN::UIntSize i = 0; i < items.Size(); ++i)
        for (NGIN::UIntSize j = i + 1; j < items.Size(); ++j)
          if (items[i].name == items[j].name)
          {
            model.issues.PushBack(std::string{model.displayName} + " declares " + std::string{what} + " `" +
                                  std::string{items[i].name} + "` more than once");
            break;
          }
    }
  } // namespace

  void CheckDuplicateNames(ShapeModel &model)
  {
    if (model.kind == ShapeKind::Sum)
    {
      CheckNames(model, model.sum.variants, "variant");
      return;
    }
    CheckNames(model, model.product.fields, "field");
    CheckNames(model, model.product.parameters, "parameter");
  }

} // namespace NGIN::Transform::detail

namespace NGIN::Transform
{

  const ShapeModel &ShapeCache::Get(const TypeRef &type)
  {
    if (auto *p = m_shapes.GetPtr(type.id))
      return **p;
    auto model = std::make_shared<const ShapeModel>(type.Inspect());
    m_shapes.Insert(type.id, model);
    return *model;
  }

} // namespace NGIN::Transform
