// Ticket: 0003_rigid_body_stepper

#ifndef PACHINKO_SIM_PHYSICS_CONTACT_CONSTRAINT_HPP
#define PACHINKO_SIM_PHYSICS_CONTACT_CONSTRAINT_HPP

#include "pachinko-sim/src/DataTypes/Coordinate.hpp"
#include "pachinko-sim/src/Physics/Collision/CollisionResult.hpp"
#include "pachinko-sim/src/Physics/RigidBody/Body.hpp"

namespace pachinko_sim
{

/**
 * @brief Non-penetration constraint for one touching body pair.
 *
 * Holds non-owning pointers to the bodies in the WorldModel; a constraint is
 * only valid for the sub-step it was created in.
 *
 * Sign convention: normal points from A toward B, and the relative normal
 * velocity (v_B - v_A) . n is negative while the bodies approach.
 */
struct ContactConstraint
{
  Body* bodyA{nullptr};
  Body* bodyB{nullptr};
  Coordinate normal;
  double penetrationDepth{0.0};  // [px]
  Coordinate contactPoint;

  double restitution{0.0};
  double friction{0.0};
  double slop{0.0};  // [px]

  // Relative normal velocity the solver drives toward [px/tick]
  double targetNormalVelocity{0.0};

  // Accumulated impulses (velocity units, unit mass)
  double normalImpulse{0.0};
  double tangentImpulse{0.0};
};

namespace contact_constraint_factory
{

/**
 * @brief Build a contact constraint from a collision result.
 *
 * Material coefficients are combined with restitution = max, friction = min
 * and slop = max. Restitution only applies when the bodies approach faster
 * than @p restingThreshold; slower contacts come to rest instead of
 * bouncing.
 *
 * @param bodyA First body (normal points away from it)
 * @param bodyB Second body
 * @param result Collision result from CollisionHandler (A->B)
 * @param restingThreshold Approach speed below which e = 0 [px/tick]
 */
[[nodiscard]] ContactConstraint createFromCollision(Body& bodyA,
                                                    Body& bodyB,
                                                    const CollisionResult& result,
                                                    double restingThreshold);

/**
 * @brief Relative normal velocity (v_B - v_A) . n [px/tick]
 *
 * Negative: bodies approaching. Positive: bodies separating.
 */
[[nodiscard]] double computeRelativeNormalVelocity(const Body& bodyA,
                                                   const Body& bodyB,
                                                   const Coordinate& normal);

}  // namespace contact_constraint_factory

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_CONTACT_CONSTRAINT_HPP
