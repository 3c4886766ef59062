// Recursion.cpp - tests for recursive types and nested transformers

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Transform/Transform.hpp>

#include <string>
#include <vector>

namespace TreeDemo {
using NGIN::Transform::ShapeBuilder;
using NGIN::Transform::Tag;

struct TreeA {
  int value{0};
  std::vector<TreeA> children;
  friend void NginShape(Tag<TreeA>, ShapeBuilder<TreeA> &b) { b.Fields<&TreeA::value, &TreeA::children>(); }
};

struct TreeB {
  int value{0};
  std::vector<TreeB> children;
  friend void NginShape(Tag<TreeB>, ShapeBuilder<TreeB> &b) { b.Fields<&TreeB::value, &TreeB::children>(); }
};

TreeB ConvertTree(const TreeA &tree) {
  static const auto transformer = NGIN::Transform::Define<TreeA, TreeB>().WithTransformer<TreeA, TreeB>(&ConvertTree).Build().value();
  return transformer.Transform(tree);
}

struct Celsius {
  double degrees{0};
};

struct Fahrenheit {
  double degrees{0};
};

struct Reading {
  std::string station;
  Celsius temperature;
  friend void NginShape(Tag<Reading>, ShapeBuilder<Reading> &b) { b.Fields<&Reading::station, &Reading::temperature>(); }
};

struct ReadingDto {
  std::string station;
  Fahrenheit temperature;
  friend void NginShape(Tag<ReadingDto>, ShapeBuilder<ReadingDto> &b) { b.Fields<&ReadingDto::station, &ReadingDto::temperature>(); }
};
} // namespace TreeDemo

TEST_CASE("RecursiveTypeWithoutTransformerFails", "[transform][Recursion]") {
  using namespace NGIN::Transform;
  using namespace TreeDemo;

  auto built = Define<TreeA, TreeB>().Build();
  REQUIRE_FALSE(built.has_value());
  CHECK(built.error().Contains(".children", FailureReason::RecursiveTypeUnsupported));
}

TEST_CASE("RecursiveTypeWithNestedTransformerSucceeds", "[transform][Recursion]") {
  using namespace TreeDemo;

  const TreeA tree{1, {TreeA{2, {}}, TreeA{3, {TreeA{4, {}}}}}};
  const TreeB out = ConvertTree(tree);
  CHECK(out.value == 1);
  REQUIRE(out.children.size() == 2);
  CHECK(out.children[0].value == 2);
  REQUIRE(out.children[1].children.size() == 1);
  CHECK(out.children[1].children[0].value == 4);
}

TEST_CASE("NestedTransformerIsIgnoredAtTheRoot", "[transform][Recursion]") {
  using namespace NGIN::Transform;
  using namespace TreeDemo;

  auto built = Define<TreeA, TreeB>().WithTransformer<TreeA, TreeB>(&ConvertTree).Build();
  REQUIRE(built.has_value());
  CHECK(DescribePlan(built->Plan()) == "Constructor(copy value, nest children = MapCollection(UserTransformer))");
}

TEST_CASE("NestedTransformerConvertsUnrelatedMemberTypes", "[transform][Recursion]") {
  using namespace NGIN::Transform;
  using namespace TreeDemo;

  auto missing = Define<Reading, ReadingDto>().Build();
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().Contains(".temperature", FailureReason::TypeMismatch));

  auto built = Define<Reading, ReadingDto>()
                   .WithTransformer<Celsius, Fahrenheit>([](const Celsius &c) { return Fahrenheit{c.degrees * 9.0 / 5.0 + 32.0}; })
                   .Build();
  REQUIRE(built.has_value());
  CHECK(DescribePlan(built->Plan()) == "Constructor(copy station, nest temperature = UserTransformer)");
  CHECK(built->Transform(Reading{"oslo", Celsius{100}}).temperature.degrees == 212.0);
}
