// Ticket: 0003_rigid_body_stepper

#include "pachinko-sim/src/Physics/Constraints/ContactConstraint.hpp"

namespace pachinko_sim::contact_constraint_factory
{

ContactConstraint createFromCollision(Body& bodyA,
                                      Body& bodyB,
                                      const CollisionResult& result,
                                      double restingThreshold)
{
  const MaterialProperties& materialA = bodyA.getMaterial();
  const MaterialProperties& materialB = bodyB.getMaterial();

  ContactConstraint contact;
  contact.bodyA = &bodyA;
  contact.bodyB = &bodyB;
  contact.normal = result.normal;
  contact.penetrationDepth = result.penetrationDepth;
  contact.contactPoint = result.contactPoint;
  contact.restitution =
    MaterialProperties::combineRestitution(materialA, materialB);
  contact.friction = MaterialProperties::combineFriction(materialA, materialB);
  contact.slop = MaterialProperties::combineSlop(materialA, materialB);

  double const approach =
    computeRelativeNormalVelocity(bodyA, bodyB, result.normal);

  // v_target = -e * v_pre for impacts, resting contacts just stop
  contact.targetNormalVelocity =
    -approach > restingThreshold ? -contact.restitution * approach : 0.0;

  return contact;
}

double computeRelativeNormalVelocity(const Body& bodyA,
                                     const Body& bodyB,
                                     const Coordinate& normal)
{
  return (bodyB.getVelocity() - bodyA.getVelocity()).dot(normal);
}

}  // namespace pachinko_sim::contact_constraint_factory
