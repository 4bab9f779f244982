// Ticket: 0003_rigid_body_stepper

#ifndef PACHINKO_SIM_PHYSICS_SHAPE_HPP
#define PACHINKO_SIM_PHYSICS_SHAPE_HPP

#include <variant>
#include <vector>

#include "pachinko-sim/src/DataTypes/Coordinate.hpp"

namespace pachinko_sim
{

/**
 * @brief Circle collision shape centred on the body position.
 */
struct CircleShape
{
  double radius{0.0};  // [px]
};

/**
 * @brief Convex polygon collision shape.
 *
 * Vertices are stored relative to the body position with any rotation
 * already applied. Winding order is not significant; edge normals are
 * oriented away from the centroid.
 */
struct PolygonShape
{
  std::vector<Coordinate> vertices;

  /**
   * @brief Axis-aligned rectangle centred on the origin.
   * @throws std::invalid_argument if width or height is not positive
   */
  [[nodiscard]] static PolygonShape rectangle(double width, double height);

  /**
   * @brief Regular polygon inscribed in a circle of @p radius.
   *
   * The first vertex sits at half the angular step, so a triangle has one
   * vertex pointing along -x and a flat edge facing +x.
   *
   * @throws std::invalid_argument if sides < 3 or radius is not positive
   */
  [[nodiscard]] static PolygonShape regular(int sides, double radius);

  /**
   * @brief Copy of this polygon rotated by @p angle [rad] about the origin.
   */
  [[nodiscard]] PolygonShape rotated(double angle) const;

  /**
   * @brief Mean of the vertices (local frame)
   */
  [[nodiscard]] Coordinate centroid() const;
};

using Shape = std::variant<CircleShape, PolygonShape>;

/**
 * @brief Axis-aligned bounding box in world coordinates.
 */
struct Aabb
{
  Coordinate min;
  Coordinate max;

  [[nodiscard]] bool overlaps(const Aabb& other) const
  {
    return min.x() <= other.max.x() && max.x() >= other.min.x() &&
           min.y() <= other.max.y() && max.y() >= other.min.y();
  }
};

/**
 * @brief World-space bounding box of a shape placed at @p position.
 */
[[nodiscard]] Aabb computeAabb(const Shape& shape, const Coordinate& position);

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_SHAPE_HPP
