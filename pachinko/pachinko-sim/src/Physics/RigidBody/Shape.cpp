// Ticket: 0003_rigid_body_stepper

#include "pachinko-sim/src/Physics/RigidBody/Shape.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numbers>
#include <stdexcept>
#include <string>

namespace pachinko_sim
{

PolygonShape PolygonShape::rectangle(double width, double height)
{
  if (width <= 0.0 || height <= 0.0)
  {
    throw std::invalid_argument("Rectangle dimensions must be positive, got: " +
                                std::to_string(width) + " x " +
                                std::to_string(height));
  }

  double const hw = width / 2.0;
  double const hh = height / 2.0;
  return PolygonShape{{Coordinate{-hw, -hh},
                       Coordinate{hw, -hh},
                       Coordinate{hw, hh},
                       Coordinate{-hw, hh}}};
}

PolygonShape PolygonShape::regular(int sides, double radius)
{
  if (sides < 3)
  {
    throw std::invalid_argument("Polygon needs at least 3 sides, got: " +
                                std::to_string(sides));
  }
  if (radius <= 0.0)
  {
    throw std::invalid_argument("Polygon radius must be positive, got: " +
                                std::to_string(radius));
  }

  double const theta = 2.0 * std::numbers::pi / sides;
  double const offset = theta * 0.5;

  PolygonShape polygon;
  polygon.vertices.reserve(static_cast<size_t>(sides));
  for (int i = 0; i < sides; ++i)
  {
    double const angle = offset + i * theta;
    polygon.vertices.emplace_back(std::cos(angle) * radius,
                                  std::sin(angle) * radius);
  }
  return polygon;
}

PolygonShape PolygonShape::rotated(double angle) const
{
  double const c = std::cos(angle);
  double const s = std::sin(angle);

  PolygonShape result;
  result.vertices.reserve(vertices.size());
  for (const auto& v : vertices)
  {
    result.vertices.emplace_back(v.x() * c - v.y() * s, v.x() * s + v.y() * c);
  }
  return result;
}

Coordinate PolygonShape::centroid() const
{
  Coordinate sum{0.0, 0.0};
  if (vertices.empty())
  {
    return sum;
  }
  for (const auto& v : vertices)
  {
    sum += v;
  }
  return Coordinate{sum / static_cast<double>(vertices.size())};
}

namespace
{

struct AabbVisitor
{
  const Coordinate& position;

  Aabb operator()(const CircleShape& circle) const
  {
    Coordinate const extent{circle.radius, circle.radius};
    return Aabb{Coordinate{position - extent}, Coordinate{position + extent}};
  }

  Aabb operator()(const PolygonShape& polygon) const
  {
    double minX = std::numeric_limits<double>::infinity();
    double minY = std::numeric_limits<double>::infinity();
    double maxX = -std::numeric_limits<double>::infinity();
    double maxY = -std::numeric_limits<double>::infinity();

    for (const auto& v : polygon.vertices)
    {
      minX = std::min(minX, v.x());
      minY = std::min(minY, v.y());
      maxX = std::max(maxX, v.x());
      maxY = std::max(maxY, v.y());
    }

    return Aabb{Coordinate{position.x() + minX, position.y() + minY},
                Coordinate{position.x() + maxX, position.y() + maxY}};
  }
};

}  // namespace

Aabb computeAabb(const Shape& shape, const Coordinate& position)
{
  return std::visit(AabbVisitor{position}, shape);
}

}  // namespace pachinko_sim
