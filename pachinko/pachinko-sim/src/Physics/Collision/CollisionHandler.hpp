// Ticket: 0003_rigid_body_stepper

#ifndef PACHINKO_SIM_PHYSICS_COLLISION_HANDLER_HPP
#define PACHINKO_SIM_PHYSICS_COLLISION_HANDLER_HPP

#include <optional>
#include <vector>

#include "pachinko-sim/src/Physics/Collision/CollisionResult.hpp"
#include "pachinko-sim/src/Physics/RigidBody/Body.hpp"

namespace pachinko_sim
{

/**
 * @brief Narrow-phase overlap test between two bodies.
 *
 * Supported shape pairs:
 * - circle / circle: centre distance against the radius sum
 * - circle / convex polygon: closest boundary feature, or the minimum
 *   penetration edge when the circle centre is inside the polygon
 *
 * Polygon / polygon pairs only ever occur between static bodies, which never
 * collide with each other, and report no contact.
 */
class CollisionHandler
{
public:
  /**
   * @brief Construct handler with specified tolerance.
   *
   * @param epsilon Numerical tolerance for degenerate distances (default:
   * 1e-9)
   */
  explicit CollisionHandler(double epsilon = 1e-9);

  /**
   * @brief Check for overlap between two bodies at their current positions.
   *
   * @return std::nullopt if the shapes do not overlap, CollisionResult with
   *         normal A->B and positive depth otherwise
   */
  [[nodiscard]] std::optional<CollisionResult> checkCollision(
    const Body& bodyA,
    const Body& bodyB) const;

  /**
   * @brief Circle at @p centreA against circle at @p centreB.
   */
  [[nodiscard]] std::optional<CollisionResult> circleCircle(
    const Coordinate& centreA,
    double radiusA,
    const Coordinate& centreB,
    double radiusB) const;

  /**
   * @brief Circle against a convex polygon with world-space vertices.
   *
   * Normal points from the circle toward the polygon.
   */
  [[nodiscard]] std::optional<CollisionResult> circlePolygon(
    const Coordinate& centre,
    double radius,
    const std::vector<Coordinate>& worldVertices) const;

  CollisionHandler(const CollisionHandler&) = default;
  CollisionHandler(CollisionHandler&&) noexcept = default;
  CollisionHandler& operator=(const CollisionHandler&) = default;
  CollisionHandler& operator=(CollisionHandler&&) noexcept = default;
  ~CollisionHandler() = default;

private:
  double epsilon_;
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_COLLISION_HANDLER_HPP
