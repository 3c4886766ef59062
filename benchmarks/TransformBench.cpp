#include <iostream>

#include <NGIN/Benchmark.hpp>
#include <NGIN/Transform/Transform.hpp>

#include <string>
#include <vector>

using namespace NGIN;

namespace BenchDemo
{
  struct Point
  {
    int x{0};
    int y{0};
    friend void NginShape(Transform::Tag<Point>, Transform::ShapeBuilder<Point> &b) { b.Fields<&Point::x, &Point::y>(); }
  };
  struct PointDto
  {
    int x{0};
    int y{0};
    friend void NginShape(Transform::Tag<PointDto>, Transform::ShapeBuilder<PointDto> &b) { b.Fields<&PointDto::x, &PointDto::y>(); }
  };
  struct Route
  {
    std::string name;
    std::vector<Point> points;
    friend void NginShape(Transform::Tag<Route>, Transform::ShapeBuilder<Route> &b) { b.Fields<&Route::name, &Route::points>(); }
  };
  struct RouteDto
  {
    std::string name;
    std::vector<PointDto> points;
    friend void NginShape(Transform::Tag<RouteDto>, Transform::ShapeBuilder<RouteDto> &b) { b.Fields<&RouteDto::name, &RouteDto::points>(); }
  };
}

int main()
{
  using namespace NGIN::Transform;
  using BenchDemo::Route;
  using BenchDemo::RouteDto;
  using BenchDemo::Point;
  using BenchDemo::PointDto;

  const auto point = Define<Point, PointDto>().Build().value();
  const auto path = Define<Route, RouteDto>().Build().value();

  Route sample{"route", {}};
  for (int i = 0; i < 64; ++i)
    sample.points.push_back(Point{i, -i});

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      sum += point.Transform(Point{i, 1}).x;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Transform Point->PointDto 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int sum = 0;
    for (int i=0;i<10000;++i) {
      const Point p{i, 1};
      sum += PointDto{p.x, p.y}.x;
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Direct Point->PointDto 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    NGIN::UIntSize total = 0;
    for (int i=0;i<1000;++i) {
      total += path.Transform(sample).points.size();
    }
    ctx.doNotOptimize(total);
    ctx.stop(); }, "Transform Route(64 points) 1k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    NGIN::UIntSize steps = 0;
    for (int i=0;i<1000;++i) {
      auto built = Define<Route, RouteDto>().Build();
      steps += built->Plan().steps.Size();
    }
    ctx.doNotOptimize(steps);
    ctx.stop(); }, "Derive Route->RouteDto 1k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
