// Ticket: 0003_rigid_body_stepper

#include "pachinko-sim/src/Physics/Collision/CollisionHandler.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <vector>

namespace pachinko_sim
{

CollisionHandler::CollisionHandler(double epsilon) : epsilon_{epsilon}
{
}

std::optional<CollisionResult> CollisionHandler::checkCollision(
  const Body& bodyA,
  const Body& bodyB) const
{
  const auto* circleA = std::get_if<CircleShape>(&bodyA.getShape());
  const auto* circleB = std::get_if<CircleShape>(&bodyB.getShape());

  if (circleA != nullptr && circleB != nullptr)
  {
    return circleCircle(bodyA.getPosition(),
                        circleA->radius,
                        bodyB.getPosition(),
                        circleB->radius);
  }

  auto toWorld = [](const PolygonShape& polygon, const Coordinate& position)
  {
    std::vector<Coordinate> world;
    world.reserve(polygon.vertices.size());
    for (const auto& v : polygon.vertices)
    {
      world.emplace_back(position + v);
    }
    return world;
  };

  if (circleA != nullptr)
  {
    const auto& polygonB = std::get<PolygonShape>(bodyB.getShape());
    return circlePolygon(bodyA.getPosition(),
                         circleA->radius,
                         toWorld(polygonB, bodyB.getPosition()));
  }

  if (circleB != nullptr)
  {
    const auto& polygonA = std::get<PolygonShape>(bodyA.getShape());
    auto result = circlePolygon(bodyB.getPosition(),
                                circleB->radius,
                                toWorld(polygonA, bodyA.getPosition()));
    if (!result)
    {
      return std::nullopt;
    }
    // Computed with B as the circle; report from A's side
    return result->flipped();
  }

  return std::nullopt;
}

std::optional<CollisionResult> CollisionHandler::circleCircle(
  const Coordinate& centreA,
  double radiusA,
  const Coordinate& centreB,
  double radiusB) const
{
  Coordinate const delta{centreB - centreA};
  double const distance = delta.norm();
  double const radiusSum = radiusA + radiusB;

  if (distance >= radiusSum)
  {
    return std::nullopt;
  }

  // Coincident centres: separate A upward (B is "below")
  Coordinate const normal =
    distance > epsilon_ ? Coordinate{delta / distance} : Coordinate{0.0, 1.0};

  return CollisionResult{normal,
                         radiusSum - distance,
                         Coordinate{centreA + normal * radiusA}};
}

std::optional<CollisionResult> CollisionHandler::circlePolygon(
  const Coordinate& centre,
  double radius,
  const std::vector<Coordinate>& worldVertices) const
{
  const size_t n = worldVertices.size();
  if (n < 3)
  {
    return std::nullopt;
  }

  Coordinate centroid{0.0, 0.0};
  for (const auto& v : worldVertices)
  {
    centroid += v;
  }
  centroid /= static_cast<double>(n);

  // Separation of the circle centre from every edge along its outward normal.
  // The largest separation identifies the reference edge.
  double maxSeparation = -std::numeric_limits<double>::infinity();
  Coordinate referenceNormal{0.0, -1.0};

  for (size_t i = 0; i < n; ++i)
  {
    const Coordinate& a = worldVertices[i];
    const Coordinate& b = worldVertices[(i + 1) % n];
    Coordinate const edge{b - a};
    double const length = edge.norm();
    if (length < epsilon_)
    {
      continue;
    }

    Coordinate outward{edge.y() / length, -edge.x() / length};
    if (outward.dot(a - centroid) < 0.0)
    {
      outward = Coordinate{-outward};
    }

    double const separation = outward.dot(centre - a);
    if (separation > maxSeparation)
    {
      maxSeparation = separation;
      referenceNormal = outward;
    }
  }

  if (maxSeparation > radius)
  {
    return std::nullopt;
  }

  if (maxSeparation <= epsilon_)
  {
    // Centre inside (or on) the polygon: exit through the reference edge
    return CollisionResult{Coordinate{-referenceNormal},
                           radius - maxSeparation,
                           Coordinate{centre - referenceNormal * radius}};
  }

  // Centre outside: closest point on the boundary decides the contact
  double minDistance = std::numeric_limits<double>::infinity();
  Coordinate closest{centre};

  for (size_t i = 0; i < n; ++i)
  {
    const Coordinate& a = worldVertices[i];
    const Coordinate& b = worldVertices[(i + 1) % n];
    Coordinate const edge{b - a};
    double const lengthSquared = edge.squaredNorm();

    double t = 0.0;
    if (lengthSquared > epsilon_)
    {
      t = std::clamp(edge.dot(centre - a) / lengthSquared, 0.0, 1.0);
    }

    Coordinate const candidate{a + edge * t};
    double const distance = (centre - candidate).norm();
    if (distance < minDistance)
    {
      minDistance = distance;
      closest = candidate;
    }
  }

  if (minDistance >= radius)
  {
    return std::nullopt;
  }

  Coordinate const outward{(centre - closest) / minDistance};
  return CollisionResult{Coordinate{-outward},
                         radius - minDistance,
                         Coordinate{centre - outward * radius}};
}

}  // namespace pachinko_sim
