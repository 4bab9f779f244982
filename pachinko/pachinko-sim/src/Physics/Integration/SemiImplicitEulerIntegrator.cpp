// Ticket: 0003_rigid_body_stepper

#include "pachinko-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"

#include <algorithm>

namespace pachinko_sim
{

void SemiImplicitEulerIntegrator::step(Body& body,
                                       const Coordinate& acceleration,
                                       double h)
{
  if (body.isStatic())
  {
    return;
  }

  double const damping =
    std::max(1.0 - body.getMaterial().airFriction * h, 0.0);

  Velocity const velocity{body.getVelocity() * damping + acceleration * h};
  body.setVelocity(velocity);
  body.setPosition(Coordinate{body.getPosition() + velocity * h});
}

}  // namespace pachinko_sim
