// Ticket: 0003_rigid_body_stepper

#ifndef PACHINKO_SIM_PHYSICS_COLLISION_RESULT_HPP
#define PACHINKO_SIM_PHYSICS_COLLISION_RESULT_HPP

#include <limits>

#include "pachinko-sim/src/DataTypes/Coordinate.hpp"

namespace pachinko_sim
{

/**
 * @brief Contact information for one overlapping body pair.
 *
 * Returned by CollisionHandler inside a std::optional; std::nullopt means no
 * overlap, so there is no 'intersecting' flag.
 *
 * All coordinates are in world space.
 * Contact normal points from object A toward object B.
 */
struct CollisionResult
{
  Coordinate normal;  // Contact normal (world space, A->B, unit length)
  double penetrationDepth{
    std::numeric_limits<double>::quiet_NaN()};  // Overlap distance [px]
  Coordinate contactPoint;  // Deepest point of A inside B (world space)

  CollisionResult() = default;

  CollisionResult(const Coordinate& n, double depth, const Coordinate& point)
    : normal{n}, penetrationDepth{depth}, contactPoint{point}
  {
  }

  /// @brief Same contact seen from B's side (normal reversed)
  [[nodiscard]] CollisionResult flipped() const
  {
    return CollisionResult{Coordinate{-normal}, penetrationDepth, contactPoint};
  }

  CollisionResult(const CollisionResult&) = default;
  CollisionResult(CollisionResult&&) noexcept = default;
  CollisionResult& operator=(const CollisionResult&) = default;
  CollisionResult& operator=(CollisionResult&&) noexcept = default;
  ~CollisionResult() = default;
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_COLLISION_RESULT_HPP
