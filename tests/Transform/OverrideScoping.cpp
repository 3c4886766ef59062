// OverrideScoping.cpp - tests for paths, the override registry and member matching

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Transform/Transform.hpp>

#include <string>

namespace ScopeDemo {
using NGIN::Transform::ShapeBuilder;
using NGIN::Transform::Tag;

struct From {
  int id{0};
  std::string label;
  friend void NginShape(Tag<From>, ShapeBuilder<From> &b) { b.Fields<&From::id, &From::label>(); }
};

struct To {
  int id{0};
  std::string title;
  std::string note;
  friend void NginShape(Tag<To>, ShapeBuilder<To> &b) { b.Fields<&To::id, &To::title, &To::note>(); }
};

NGIN::Transform::Override ConstAt(std::string_view path) {
  NGIN::Transform::Override o{};
  o.kind = NGIN::Transform::OverrideKind::Const;
  o.target = NGIN::Transform::Path::Parse(path);
  return o;
}
} // namespace ScopeDemo

TEST_CASE("PathParsingAndFormatting", "[transform][Scoping]") {
  using namespace NGIN::Transform;

  const Path p = Path::Parse(".address.street");
  CHECK(p.Size() == 2);
  CHECK(p.ToString() == ".address.street");
  CHECK(Path::Parse("address.street") == p);
  CHECK(Path::Parse("").IsRoot());
  CHECK(Path{}.Field("items").Index(3).Variant("Circle").ToString() == ".items(3)[Circle]");
  CHECK(p.StartsWith(Path::Parse("address")));
  CHECK_FALSE(p.StartsWith(Path::Parse("street")));
  CHECK(p.Suffix(1).ToString() == ".street");
  CHECK(p.Prepend(PathSegment::Index(0)).ToString() == "(0).address.street");
}

TEST_CASE("MostRecentOverrideIsFoundFirst", "[transform][Scoping]") {
  using namespace NGIN::Transform;
  using namespace ScopeDemo;

  OverrideRegistry registry;
  registry.Add(ConstAt("note"));
  registry.Add(ConstAt("title"));
  registry.Add(ConstAt("note"));

  const auto scope = OverrideScope::Root(registry);
  CHECK(scope.Size() == 3);
  CHECK(scope.FindValue("note") == &registry.At(2));
  CHECK(scope.FindValue("title") == &registry.At(1));
  CHECK(scope.FindValue("id") == nullptr);
  CHECK(scope.HasPathOverrides());
}

TEST_CASE("ChildScopeKeepsOnlyDeeperOverrides", "[transform][Scoping]") {
  using namespace NGIN::Transform;
  using namespace ScopeDemo;

  OverrideRegistry registry;
  registry.Add(ConstAt("address.street"));
  registry.Add(ConstAt("address"));
  registry.Add(ConstAt("name"));
  Override handler{};
  handler.kind = OverrideKind::NestedTransformer;
  handler.valueType = TypeRefOf<int>();
  handler.resultType = TypeRefOf<long>();
  registry.Add(std::move(handler));

  const auto child = OverrideScope::Root(registry).Child("address");
  CHECK(child.Size() == 2);
  CHECK(child.FindValue("street") == &registry.At(0));
  CHECK(child.FindTransformer(TypeRefOf<int>().id, TypeRefOf<long>().id) == &registry.At(3));
  CHECK(child.FindTransformer(TypeRefOf<long>().id, TypeRefOf<int>().id) == nullptr);

  const auto leaf = child.Child("street");
  CHECK(leaf.Size() == 1);
  CHECK_FALSE(leaf.HasPathOverrides());
  CHECK(leaf.TypeKeyedOnly().Size() == 1);
}

TEST_CASE("MatcherPrefersOverridesThenNamesThenRenames", "[transform][Scoping]") {
  using namespace NGIN::Transform;
  using namespace ScopeDemo;

  OverrideRegistry registry;
  registry.Add(ConstAt("id"));
  Override rename{};
  rename.kind = OverrideKind::Renamed;
  rename.source = Path::Parse("label");
  rename.target = Path::Parse("title");
  registry.Add(std::move(rename));

  ShapeCache shapes;
  const auto &src = shapes.Get(TypeRefOf<From>());
  const auto &dst = shapes.Get(TypeRefOf<To>());
  const auto matches = MatchProduct(src, dst.product.parameters, OverrideScope::Root(registry), TransformerFlags{}, shapes);

  REQUIRE(matches.Size() == 3);
  CHECK(matches[0].kind == MatchKind::OverriddenBy);
  CHECK(matches[0].override == &registry.At(0));
  CHECK(matches[1].kind == MatchKind::Renamed);
  REQUIRE(matches[1].source.Size() == 1);
  CHECK(matches[1].source[0]->name == std::string_view{"label"});
  CHECK(matches[2].kind == MatchKind::Unmatched);

  const auto plain = MatchProduct(src, dst.product.parameters, OverrideScope::Root(OverrideRegistry{}), TransformerFlags{}, shapes);
  CHECK(plain[0].kind == MatchKind::Matched);
  CHECK(plain[1].kind == MatchKind::Unmatched);
}

TEST_CASE("ShapeCacheInspectsEachTypeOnce", "[transform][Scoping]") {
  using namespace NGIN::Transform;
  using namespace ScopeDemo;

  ShapeCache shapes;
  const auto &first = shapes.Get(TypeRefOf<From>());
  const auto &second = shapes.Get(TypeRefOf<From>());
  CHECK(&first == &second);
  CHECK(first.displayName == std::string_view{"From"});
}
