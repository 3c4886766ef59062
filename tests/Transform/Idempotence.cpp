// Idempotence.cpp - tests that derivation is deterministic and plans are self-contained

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Transform/Transform.hpp>

#include <optional>
#include <string>
#include <vector>

namespace IdemDemo {
using NGIN::Transform::ShapeBuilder;
using NGIN::Transform::Tag;

struct Inner {
  int x{0};
  friend void NginShape(Tag<Inner>, ShapeBuilder<Inner> &b) { b.Fields<&Inner::x>(); }
};

struct InnerDto {
  int x{0};
  int y{0};
  friend void NginShape(Tag<InnerDto>, ShapeBuilder<InnerDto> &b) { b.Fields<&InnerDto::x, &InnerDto::y>(); }
};

struct Outer {
  std::vector<Inner> inners;
  std::optional<Inner> maybe;
  friend void NginShape(Tag<Outer>, ShapeBuilder<Outer> &b) { b.Fields<&Outer::inners, &Outer::maybe>(); }
};

struct OuterDto {
  std::vector<InnerDto> inners;
  std::optional<InnerDto> maybe;
  friend void NginShape(Tag<OuterDto>, ShapeBuilder<OuterDto> &b) { b.Fields<&OuterDto::inners, &OuterDto::maybe>(); }
};
} // namespace IdemDemo

TEST_CASE("RepeatedDerivationYieldsIdenticalPlans", "[transform][Idempotence]") {
  using namespace NGIN::Transform;
  using namespace IdemDemo;

  auto definition = Define<Outer, OuterDto>().WithTransformer<Inner, InnerDto>([](const Inner &i) { return InnerDto{i.x, i.x * 2}; });
  auto first = definition.Build();
  auto second = definition.Build();
  REQUIRE(first.has_value());
  REQUIRE(second.has_value());
  CHECK(DescribePlan(first->Plan()) == DescribePlan(second->Plan()));
  CHECK(DescribePlan(first->Plan()) ==
        "Constructor(nest inners = MapCollection(UserTransformer), nest maybe = MapOptional(UserTransformer))");
}

TEST_CASE("RepeatedFailuresAreIdentical", "[transform][Idempotence]") {
  using namespace NGIN::Transform;
  using namespace IdemDemo;

  auto first = Define<Outer, OuterDto>().Build();
  auto second = Define<Outer, OuterDto>().Build();
  REQUIRE_FALSE(first.has_value());
  REQUIRE_FALSE(second.has_value());
  CHECK(first.error().Render() == second.error().Render());
  CHECK(first.error().Size() == 2);
  CHECK(first.error().Contains(".inners.y", FailureReason::NoMatchingMember));
  CHECK(first.error().Contains(".maybe.y", FailureReason::NoMatchingMember));
}

TEST_CASE("TransformerOutlivesItsDefinition", "[transform][Idempotence]") {
  using namespace NGIN::Transform;
  using namespace IdemDemo;

  std::optional<Transformer<Outer, OuterDto>> kept;
  {
    auto built = Define<Outer, OuterDto>().WithFieldConst(".inners.y", 5).WithFieldConst(".maybe.y", 6).Build();
    REQUIRE(built.has_value());
    kept.emplace(*built);
  }
  const OuterDto dto = kept->Transform(Outer{{Inner{1}, Inner{2}}, Inner{3}});
  REQUIRE(dto.inners.size() == 2);
  CHECK(dto.inners[1].x == 2);
  CHECK(dto.inners[1].y == 5);
  REQUIRE(dto.maybe.has_value());
  CHECK(dto.maybe->y == 6);
}
