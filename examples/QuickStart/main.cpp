#include <NGIN/Transform/Transform.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace Demo {
  using NGIN::Transform::ShapeBuilder;
  using NGIN::Transform::Tag;

  struct Line { std::string sku; int qty; };
  struct Order { int id; std::string customer; std::vector<Line> lines; };

  struct LineDto { std::string sku; int qty; };
  struct OrderDto { int id; std::string buyer; std::vector<LineDto> lines; std::optional<std::string> note; };

  void NginShape(Tag<Line>, ShapeBuilder<Line> &b) { b.Fields<&Line::sku, &Line::qty>(); }
  void NginShape(Tag<Order>, ShapeBuilder<Order> &b) { b.Fields<&Order::id, &Order::customer, &Order::lines>(); }
  void NginShape(Tag<LineDto>, ShapeBuilder<LineDto> &b) { b.Fields<&LineDto::sku, &LineDto::qty>(); }
  void NginShape(Tag<OrderDto>, ShapeBuilder<OrderDto> &b) { b.Fields<&OrderDto::id, &OrderDto::buyer, &OrderDto::lines, &OrderDto::note>(); }
}

int main() {
  using namespace NGIN::Transform;
  using namespace Demo;
  std::cout << "Library: " << LibraryName() << "\n";

  // Without overrides the derivation explains what it could not prove
  auto failed = Define<Order, OrderDto>().Build();
  if (!failed)
    std::cout << "Derivation failed:\n" << failed.error().Render();

  auto built = Define<Order, OrderDto>()
                   .WithFieldRenamed<&Order::customer, &OrderDto::buyer>()
                   .EnableOptionDefaultsToNone()
                   .Build();
  if (!built) {
    std::cout << built.error().Render();
    return 1;
  }
  std::cout << "Plan: " << DescribePlan(built->Plan()) << "\n";

  const OrderDto dto = built->Transform(Order{7, "ada", {Line{"A-1", 2}, Line{"B-9", 1}}});
  std::cout << "id=" << dto.id << " buyer=" << dto.buyer << " lines=" << dto.lines.size()
            << " note=" << (dto.note ? *dto.note : std::string{"<none>"}) << "\n";
  return 0;
}
