// Ticket: 0003_rigid_body_stepper

#include "pachinko-sim/src/Physics/Constraints/PositionCorrector.hpp"

#include <algorithm>

namespace pachinko_sim
{

void PositionCorrector::correctPositions(
  std::vector<ContactConstraint>& contacts,
  const CollisionHandler& handler) const
{
  Config const config{};
  correctPositions(contacts, handler, config);
}

void PositionCorrector::correctPositions(
  std::vector<ContactConstraint>& contacts,
  const CollisionHandler& handler,
  const Config& config) const
{
  if (contacts.empty())
  {
    return;
  }

  for (int iteration = 0; iteration < config.maxIterations; ++iteration)
  {
    bool anyCorrection = false;

    for (auto& contact : contacts)
    {
      Body& bodyA = *contact.bodyA;
      Body& bodyB = *contact.bodyB;

      double const inverseMassSum =
        bodyA.getInverseMass() + bodyB.getInverseMass();
      if (inverseMassSum <= 0.0)
      {
        continue;
      }

      auto const result = handler.checkCollision(bodyA, bodyB);
      if (!result)
      {
        contact.penetrationDepth = 0.0;
        continue;
      }

      contact.normal = result->normal;
      contact.penetrationDepth = result->penetrationDepth;

      double const correction =
        config.beta * std::max(result->penetrationDepth - contact.slop, 0.0);
      if (correction <= 0.0)
      {
        continue;
      }
      anyCorrection = true;

      if (bodyA.getInverseMass() > 0.0)
      {
        double const share = bodyA.getInverseMass() / inverseMassSum;
        bodyA.setPosition(Coordinate{bodyA.getPosition() -
                                     result->normal * (correction * share)});
      }
      if (bodyB.getInverseMass() > 0.0)
      {
        double const share = bodyB.getInverseMass() / inverseMassSum;
        bodyB.setPosition(Coordinate{bodyB.getPosition() +
                                     result->normal * (correction * share)});
      }
    }

    // Early exit once every penetration is within slop
    if (!anyCorrection)
    {
      return;
    }
  }
}

}  // namespace pachinko_sim
