// Ticket: 0003_rigid_body_stepper

#ifndef PACHINKO_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
#define PACHINKO_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP

#include "pachinko-sim/src/Physics/Integration/Integrator.hpp"

namespace pachinko_sim
{

/**
 * @brief Semi-implicit Euler integrator (symplectic) with air friction
 *
 * Integration order:
 * 1. Update velocity: v = v * (1 - k_air * h) + a * h
 * 2. Update position: x = x + v * h (uses NEW velocity)
 *
 * k_air is the body's MaterialProperties::airFriction.
 */
class SemiImplicitEulerIntegrator : public Integrator
{
public:
  SemiImplicitEulerIntegrator() = default;
  ~SemiImplicitEulerIntegrator() override = default;

  void step(Body& body, const Coordinate& acceleration, double h) override;

  // Rule of Five
  SemiImplicitEulerIntegrator(const SemiImplicitEulerIntegrator&) = default;
  SemiImplicitEulerIntegrator& operator=(const SemiImplicitEulerIntegrator&) =
    default;
  SemiImplicitEulerIntegrator(SemiImplicitEulerIntegrator&&) noexcept = default;
  SemiImplicitEulerIntegrator& operator=(
    SemiImplicitEulerIntegrator&&) noexcept = default;
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
