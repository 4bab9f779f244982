// Ticket: 0003_rigid_body_stepper

#ifndef PACHINKO_SIM_PHYSICS_INTEGRATOR_HPP
#define PACHINKO_SIM_PHYSICS_INTEGRATOR_HPP

#include "pachinko-sim/src/DataTypes/Coordinate.hpp"
#include "pachinko-sim/src/Physics/RigidBody/Body.hpp"

namespace pachinko_sim
{

/**
 * @brief Abstract interface for numerical integration of body motion
 *
 * Decouples the integration scheme from WorldModel so that the stepping
 * order can be tested in isolation.
 *
 * Thread safety: Implementations should be stateless and thread-safe
 */
class Integrator
{
public:
  virtual ~Integrator() = default;

  /**
   * @brief Integrate a dynamic body forward by one sub-step
   * @param body Body to advance (modified in place, must be dynamic)
   * @param acceleration External acceleration [px/tick^2]
   * @param h Sub-step length [ticks]
   */
  virtual void step(Body& body, const Coordinate& acceleration, double h) = 0;

protected:
  Integrator() = default;
  Integrator(const Integrator&) = default;
  Integrator& operator=(const Integrator&) = default;
  Integrator(Integrator&&) noexcept = default;
  Integrator& operator=(Integrator&&) noexcept = default;
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_INTEGRATOR_HPP
