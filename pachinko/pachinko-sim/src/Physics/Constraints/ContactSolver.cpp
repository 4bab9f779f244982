// Ticket: 0003_rigid_body_stepper

#include "pachinko-sim/src/Physics/Constraints/ContactSolver.hpp"

#include <algorithm>

namespace pachinko_sim
{

void ContactSolver::solve(std::vector<ContactConstraint>& contacts) const
{
  Config const config{};
  solve(contacts, config);
}

void ContactSolver::solve(std::vector<ContactConstraint>& contacts,
                          const Config& config) const
{
  for (int iteration = 0; iteration < config.velocityIterations; ++iteration)
  {
    for (auto& contact : contacts)
    {
      double const inverseMassSum =
        contact.bodyA->getInverseMass() + contact.bodyB->getInverseMass();
      if (inverseMassSum <= 0.0)
      {
        continue;
      }

      // ===== Normal impulse =====
      double const vn = contact_constraint_factory::computeRelativeNormalVelocity(
        *contact.bodyA, *contact.bodyB, contact.normal);
      double lambda = (contact.targetNormalVelocity - vn) / inverseMassSum;
      double const accumulated = std::max(contact.normalImpulse + lambda, 0.0);
      lambda = accumulated - contact.normalImpulse;
      contact.normalImpulse = accumulated;
      applyImpulse(contact, contact.normal, lambda);

      // ===== Friction impulse =====
      Coordinate const tangent{-contact.normal.y(), contact.normal.x()};
      double const vt =
        (contact.bodyB->getVelocity() - contact.bodyA->getVelocity())
          .dot(tangent);
      double const maxFriction = contact.friction * contact.normalImpulse;
      double const tangentAccumulated = std::clamp(
        contact.tangentImpulse - vt / inverseMassSum, -maxFriction, maxFriction);
      double const tangentLambda = tangentAccumulated - contact.tangentImpulse;
      contact.tangentImpulse = tangentAccumulated;
      applyImpulse(contact, tangent, tangentLambda);
    }
  }
}

void ContactSolver::applyImpulse(ContactConstraint& contact,
                                 const Coordinate& direction,
                                 double magnitude)
{
  Body& bodyA = *contact.bodyA;
  Body& bodyB = *contact.bodyB;

  if (bodyA.getInverseMass() > 0.0)
  {
    bodyA.setVelocity(Velocity{bodyA.getVelocity() -
                               direction * magnitude * bodyA.getInverseMass()});
  }
  if (bodyB.getInverseMass() > 0.0)
  {
    bodyB.setVelocity(Velocity{bodyB.getVelocity() +
                               direction * magnitude * bodyB.getInverseMass()});
  }
}

}  // namespace pachinko_sim
