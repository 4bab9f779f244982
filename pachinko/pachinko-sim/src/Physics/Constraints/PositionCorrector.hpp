// Ticket: 0003_rigid_body_stepper

#ifndef PACHINKO_SIM_PHYSICS_POSITION_CORRECTOR_HPP
#define PACHINKO_SIM_PHYSICS_POSITION_CORRECTOR_HPP

#include <vector>

#include "pachinko-sim/src/Physics/Collision/CollisionHandler.hpp"
#include "pachinko-sim/src/Physics/Constraints/ContactConstraint.hpp"

namespace pachinko_sim
{

/// @brief Position-level penetration correction
///
/// Moves bodies apart along the contact normal without touching their
/// velocities, so correction never turns into kinetic energy.
///
/// Algorithm, repeated maxIterations times:
/// 1. Recompute penetration for each contact at the current positions
/// 2. correction = beta * max(depth - slop, 0)
/// 3. Split the correction between the bodies by inverse mass
///
/// Static bodies (inverse mass 0) are never moved.
class PositionCorrector
{
public:
  /// @brief Configuration parameters for position correction
  struct Config
  {
    double beta{0.8};      ///< Fraction of penetration removed per pass [0, 1]
    int maxIterations{8};  ///< Position correction passes per sub-step
  };

  PositionCorrector() = default;
  ~PositionCorrector() = default;

  /// @brief Correct body positions to resolve penetration (default config)
  void correctPositions(std::vector<ContactConstraint>& contacts,
                        const CollisionHandler& handler) const;

  /// @brief Correct body positions to resolve penetration
  ///
  /// @param contacts Contacts of the current sub-step; penetrationDepth is
  /// refreshed on every pass
  /// @param handler Narrow phase used to re-measure penetration
  /// @param config Position correction parameters
  void correctPositions(std::vector<ContactConstraint>& contacts,
                        const CollisionHandler& handler,
                        const Config& config) const;

  // Rule of Five
  PositionCorrector(const PositionCorrector&) = default;
  PositionCorrector& operator=(const PositionCorrector&) = default;
  PositionCorrector(PositionCorrector&&) noexcept = default;
  PositionCorrector& operator=(PositionCorrector&&) noexcept = default;
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_POSITION_CORRECTOR_HPP
