// WrapperDerivation.cpp - tests for optional and collection derivation

#include <catch2/catch_test_macros.hpp>

#include <NGIN/Transform/Transform.hpp>

#include <optional>
#include <string>
#include <vector>

namespace WrapDemo {
using NGIN::Transform::ShapeBuilder;
using NGIN::Transform::Tag;

struct Item {
  std::string sku;
  int qty{0};
  friend void NginShape(Tag<Item>, ShapeBuilder<Item> &b) { b.Fields<&Item::sku, &Item::qty>(); }
};

struct ItemDto {
  std::string sku;
  int qty{0};
  friend void NginShape(Tag<ItemDto>, ShapeBuilder<ItemDto> &b) { b.Fields<&ItemDto::sku, &ItemDto::qty>(); }
};

struct Order {
  int id{0};
  std::vector<Item> items;
  std::optional<Item> gift;
  friend void NginShape(Tag<Order>, ShapeBuilder<Order> &b) { b.Fields<&Order::id, &Order::items, &Order::gift>(); }
};

struct OrderDto {
  std::optional<int> id;
  NGIN::Containers::Vector<ItemDto> items;
  std::optional<ItemDto> gift;
  friend void NginShape(Tag<OrderDto>, ShapeBuilder<OrderDto> &b) { b.Fields<&OrderDto::id, &OrderDto::items, &OrderDto::gift>(); }
};

struct MaybeId {
  std::optional<int> id;
  friend void NginShape(Tag<MaybeId>, ShapeBuilder<MaybeId> &b) { b.Fields<&MaybeId::id>(); }
};

struct RequiredId {
  int id{0};
  friend void NginShape(Tag<RequiredId>, ShapeBuilder<RequiredId> &b) { b.Fields<&RequiredId::id>(); }
};

struct Batch {
  Item items;
  friend void NginShape(Tag<Batch>, ShapeBuilder<Batch> &b) { b.Fields<&Batch::items>(); }
};

struct BatchDto {
  std::vector<ItemDto> items;
  friend void NginShape(Tag<BatchDto>, ShapeBuilder<BatchDto> &b) { b.Fields<&BatchDto::items>(); }
};
} // namespace WrapDemo

TEST_CASE("OptionalsAndCollectionsAreMapped", "[transform][Wrappers]") {
  using namespace NGIN::Transform;
  using namespace WrapDemo;

  auto built = Define<Order, OrderDto>().Build();
  REQUIRE(built.has_value());
  CHECK(DescribePlan(built->Plan()) ==
        "Constructor(nest id = WrapOptional(Identity), nest items = MapCollection(Constructor(copy sku, copy qty)), "
        "nest gift = MapOptional(Constructor(copy sku, copy qty)))");

  Order order{5, {Item{"a", 1}, Item{"b", 2}}, std::nullopt};
  const OrderDto dto = built->Transform(order);
  REQUIRE(dto.id.has_value());
  CHECK(*dto.id == 5);
  REQUIRE(dto.items.Size() == 2);
  CHECK(dto.items[1].sku == "b");
  CHECK(dto.items[1].qty == 2);
  CHECK_FALSE(dto.gift.has_value());

  order.gift = Item{"bow", 1};
  const OrderDto withGift = built->Transform(order);
  REQUIRE(withGift.gift.has_value());
  CHECK(withGift.gift->sku == "bow");
}

TEST_CASE("UnwrappingOptionalNeedsPartialMode", "[transform][Wrappers]") {
  using namespace NGIN::Transform;
  using namespace WrapDemo;

  auto total = Define<MaybeId, RequiredId>().Build();
  REQUIRE_FALSE(total.has_value());
  CHECK(total.error().Contains(".id", FailureReason::TypeMismatch));

  auto partial = DefinePartial<MaybeId, RequiredId>().Build();
  REQUIRE(partial.has_value());
  CHECK(DescribePlan(partial->Plan()) == "Constructor(nest id = UnwrapOptional(Identity))");

  auto ok = partial->Transform(MaybeId{12});
  REQUIRE(ok.has_value());
  CHECK(ok->id == 12);

  auto empty = partial->Transform(MaybeId{std::nullopt});
  REQUIRE_FALSE(empty.has_value());
  REQUIRE(empty.error().Size() == 1);
  const auto *error = empty.error().Find(".id");
  REQUIRE(error != nullptr);
  CHECK(error->message == "empty value");
}

TEST_CASE("CollectionFromNonCollectionIsATypeMismatch", "[transform][Wrappers]") {
  using namespace NGIN::Transform;
  using namespace WrapDemo;

  auto built = Define<Batch, BatchDto>().Build();
  REQUIRE_FALSE(built.has_value());
  CHECK(built.error().Contains(".items", FailureReason::TypeMismatch));
}

TEST_CASE("ElementFailuresAreReportedUnderTheCollection", "[transform][Wrappers]") {
  using namespace NGIN::Transform;
  using namespace WrapDemo;

  auto built = Define<std::vector<Item>, std::vector<RequiredId>>().Build();
  REQUIRE_FALSE(built.has_value());
  CHECK(built.error().Contains(".id", FailureReason::NoMatchingMember));
}
