// PartialComposition.cpp - tests for partial transformers and error accumulation

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Transform/Transform.hpp>

#include <charconv>
#include <string>
#include <vector>

namespace PartialDemo {
using NGIN::Transform::PartialFailure;
using NGIN::Transform::PartialResult;
using NGIN::Transform::ShapeBuilder;
using NGIN::Transform::Tag;

inline PartialResult<int> ParseInt(const std::string &text) {
  int value = 0;
  const auto *end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(text.data(), end, value);
  if (ec != std::errc{} || ptr != end)
    return PartialFailure("not a number: " + text);
  return value;
}

struct RawTriple {
  std::string a;
  std::string b;
  std::string c;
  friend void NginShape(Tag<RawTriple>, ShapeBuilder<RawTriple> &b) { b.Fields<&RawTriple::a, &RawTriple::b, &RawTriple::c>(); }
};

struct Triple {
  int a{0};
  int b{0};
  int c{0};
  friend void NginShape(Tag<Triple>, ShapeBuilder<Triple> &b) { b.Fields<&Triple::a, &Triple::b, &Triple::c>(); }
};

struct RawLine {
  std::string qty;
  friend void NginShape(Tag<RawLine>, ShapeBuilder<RawLine> &b) { b.Fields<&RawLine::qty>(); }
};

struct Line {
  int qty{0};
  friend void NginShape(Tag<Line>, ShapeBuilder<Line> &b) { b.Fields<&Line::qty>(); }
};

struct RawInvoice {
  std::vector<RawLine> lines;
  friend void NginShape(Tag<RawInvoice>, ShapeBuilder<RawInvoice> &b) { b.Fields<&RawInvoice::lines>(); }
};

struct Invoice {
  std::vector<Line> lines;
  friend void NginShape(Tag<Invoice>, ShapeBuilder<Invoice> &b) { b.Fields<&Invoice::lines>(); }
};

struct Source {
  int id{0};
  friend void NginShape(Tag<Source>, ShapeBuilder<Source> &b) { b.Fields<&Source::id>(); }
};

struct Target {
  int id{0};
  int checksum{0};
  friend void NginShape(Tag<Target>, ShapeBuilder<Target> &b) { b.Fields<&Target::id, &Target::checksum>(); }
};

NGIN::Transform::PartialTransformerDefinition<RawTriple, Triple> TripleDefinition() {
  using namespace NGIN::Transform;
  return DefinePartial<RawTriple, Triple>()
      .WithFieldComputedPartial<&Triple::a>([](const RawTriple &r) { return ParseInt(r.a); })
      .WithFieldComputedPartial<&Triple::b>([](const RawTriple &r) { return ParseInt(r.b); })
      .WithFieldComputedPartial<&Triple::c>([](const RawTriple &r) { return ParseInt(r.c); });
}
} // namespace PartialDemo

TEST_CASE("PartialStepsProduceValueWhenAllSucceed", "[transform][Partial]") {
  using namespace NGIN::Transform;
  using namespace PartialDemo;

  auto built = TripleDefinition().Build();
  REQUIRE(built.has_value());
  CHECK(built->Plan().partial);
  CHECK(DescribePlan(built->Plan()) == "Constructor(computed? a, computed? b, computed? c)");

  auto ok = built->Transform(RawTriple{"1", "2", "3"});
  REQUIRE(ok.has_value());
  CHECK(ok->a == 1);
  CHECK(ok->c == 3);
}

TEST_CASE("FailingStepIsReportedAtItsPathOnly", "[transform][Partial]") {
  using namespace NGIN::Transform;
  using namespace PartialDemo;

  auto built = TripleDefinition().Build();
  REQUIRE(built.has_value());

  auto result = built->Transform(RawTriple{"x", "2", "3"});
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.error().Size() == 1);
  CHECK(result.error().At(0).path.ToString() == ".a");
  CHECK(result.error().At(0).message == "not a number: x");
  CHECK(result.error().Render() == ".a: not a number: x\n");
}

TEST_CASE("ErrorsAccumulateUnlessFailFast", "[transform][Partial]") {
  using namespace NGIN::Transform;
  using namespace PartialDemo;

  auto built = TripleDefinition().Build();
  REQUIRE(built.has_value());

  auto all = built->Transform(RawTriple{"x", "2", "z"});
  REQUIRE_FALSE(all.has_value());
  CHECK(all.error().Size() == 2);
  CHECK(all.error().Find(".a") != nullptr);
  CHECK(all.error().Find(".c") != nullptr);

  auto first = built->Transform(RawTriple{"x", "2", "z"}, true);
  REQUIRE_FALSE(first.has_value());
  CHECK(first.error().Size() == 1);
  CHECK(first.error().Find(".a") != nullptr);
}

TEST_CASE("CollectionErrorsCarryElementIndex", "[transform][Partial]") {
  using namespace NGIN::Transform;
  using namespace PartialDemo;

  auto line = DefinePartial<RawLine, Line>()
                  .WithFieldComputedPartial<&Line::qty>([](const RawLine &r) { return ParseInt(r.qty); })
                  .Build();
  REQUIRE(line.has_value());

  auto built = DefinePartial<RawInvoice, Invoice>().WithTransformerPartial(*line).Build();
  REQUIRE(built.has_value());

  auto ok = built->Transform(RawInvoice{{RawLine{"1"}, RawLine{"4"}}});
  REQUIRE(ok.has_value());
  CHECK(ok->lines[1].qty == 4);

  auto bad = built->Transform(RawInvoice{{RawLine{"1"}, RawLine{"four"}, RawLine{"five"}}});
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().Size() == 2);
  CHECK(bad.error().Find(".lines(1).qty") != nullptr);
  CHECK(bad.error().Find(".lines(2).qty") != nullptr);
}

TEST_CASE("ConstPartialOverrideFailsAtRuntime", "[transform][Partial]") {
  using namespace NGIN::Transform;
  using namespace PartialDemo;

  auto built = DefinePartial<Source, Target>().WithFieldConstPartial<&Target::checksum>(ParseInt("oops")).Build();
  REQUIRE(built.has_value());
  CHECK(DescribePlan(built->Plan()) == "Constructor(copy id, const? checksum)");
  auto result = built->Transform(Source{1});
  REQUIRE_FALSE(result.has_value());
  CHECK(result.error().Find(".checksum") != nullptr);
}

TEST_CASE("PartialOverrideInTotalDerivationIsRejected", "[transform][Partial]") {
  using namespace NGIN::Transform;
  using namespace PartialDemo;

  OverrideRegistry overrides;
  Override o{};
  o.kind = OverrideKind::ConstPartial;
  o.target = Path::Parse("checksum");
  o.valueType = TypeRefOf<int>();
  o.ApplyPartial = [](const void *) -> PartialAny { return Any{7}; };
  overrides.Add(std::move(o));

  auto total = Derive(TypeRefOf<Source>(), TypeRefOf<Target>(), overrides, DerivationMode::Total);
  REQUIRE_FALSE(total.has_value());
  CHECK(total.error().Contains(".checksum", FailureReason::PartialStepInTotalMode));

  auto partial = Derive(TypeRefOf<Source>(), TypeRefOf<Target>(), overrides, DerivationMode::Partial);
  REQUIRE(partial.has_value());
  CHECK((*partial)->partial);
}

TEST_CASE("TotalDerivationUsableInPartialMode", "[transform][Partial]") {
  using namespace NGIN::Transform;
  using namespace PartialDemo;

  auto built = DefinePartial<Source, Target>().WithFieldConst<&Target::checksum>(9).Build();
  REQUIRE(built.has_value());
  CHECK_FALSE(built->Plan().partial);
  auto result = built->Transform(Source{2});
  REQUIRE(result.has_value());
  CHECK(result->checksum == 9);
}
