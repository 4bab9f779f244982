// Ticket: 0003_rigid_body_stepper

#ifndef PACHINKO_SIM_PHYSICS_CONTACT_SOLVER_HPP
#define PACHINKO_SIM_PHYSICS_CONTACT_SOLVER_HPP

#include <vector>

#include "pachinko-sim/src/Physics/Constraints/ContactConstraint.hpp"

namespace pachinko_sim
{

/**
 * @brief Velocity-level contact solver (sequential impulses).
 *
 * Each iteration visits every constraint in order and applies the normal
 * impulse that drives the relative normal velocity toward its target, with
 * the accumulated impulse clamped to be non-negative. A Coulomb friction
 * impulse bounded by friction * normalImpulse is applied along the tangent.
 *
 * Static bodies (inverse mass 0) are never modified.
 *
 * Thread safety: Stateless, thread-safe
 */
class ContactSolver
{
public:
  struct Config
  {
    int velocityIterations{6};
  };

  ContactSolver() = default;

  /**
   * @brief Solve with default configuration
   */
  void solve(std::vector<ContactConstraint>& contacts) const;

  /**
   * @brief Solve all contacts, writing velocities back to the bodies.
   *
   * @param contacts Constraints for the current sub-step; accumulated
   *        impulses are updated in place
   * @param config Solver parameters
   */
  void solve(std::vector<ContactConstraint>& contacts,
             const Config& config) const;

  ContactSolver(const ContactSolver&) = default;
  ContactSolver& operator=(const ContactSolver&) = default;
  ContactSolver(ContactSolver&&) noexcept = default;
  ContactSolver& operator=(ContactSolver&&) noexcept = default;
  ~ContactSolver() = default;

private:
  static void applyImpulse(ContactConstraint& contact,
                           const Coordinate& direction,
                           double magnitude);
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_CONTACT_SOLVER_HPP
