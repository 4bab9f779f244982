// Ticket: 0008_stability_controller
// Ticket: 0011_reproducible_stall_corrections

#ifndef PACHINKO_SIM_STABILITY_CONTROLLER_HPP
#define PACHINKO_SIM_STABILITY_CONTROLLER_HPP

#include <cstddef>
#include <cstdint>
#include <numbers>
#include <vector>

#include "pachinko-sim/src/DataTypes/Coordinate.hpp"
#include "pachinko-sim/src/DataTypes/Velocity.hpp"
#include "pachinko-sim/src/Environment/WorldModel.hpp"

namespace pachinko_sim
{

/**
 * @brief Per-ball stall tracking. Counters are never negative.
 */
struct StabilityState
{
  int stallFrames{0};
  int cornerFrames{0};
  int jitterCount{0};
  Coordinate lastPosition{0.0, 0.0};
  Velocity lastVelocity{0.0, 0.0};

  uint32_t dropSeed{0};
  int64_t dropNonce{0};

  int nudgeCount{0};  // Nudges applied during this drop

  // Progress window
  int windowTicks{0};
  Coordinate windowStart{0.0, 0.0};
  int dislodgeCount{0};
  double pendingLateral{0.0};  // Sideways kick applied at the top of a hop
};

enum class CorrectionKind : uint8_t
{
  Jitter,
  Nudge,
  CornerEscape,
  BoundaryClamp,
  OverlapPush,
  Dislodge,
  LateralKick
};

[[nodiscard]] const char* toString(CorrectionKind kind);

/**
 * @brief One corrective intervention, recorded for replay comparison
 */
struct CorrectionRecord
{
  uint64_t tick{0};
  CorrectionKind kind{CorrectionKind::Nudge};
  Coordinate position;  // Ball position after the correction
  Velocity velocityBefore;
  Velocity velocityAfter;
};

/**
 * @brief Detects stalled, jittering, wedged or escaping balls and applies
 * small corrective perturbations.
 *
 * Detection uses only observable state (position, velocity, previous tick).
 * Every random choice comes from seeded_random keyed by the drop seed, so a
 * replayed drop makes the same corrections in the same order.
 *
 * Per tick, before the world step (preStep):
 * 1. Progress: ball that moved less than progressDistance over the last
 *    progressWindowTicks; seeded upward hop (Dislodge). Next to a side wall
 *    the hop is vertical and the inward kick waits for the top of the hop.
 * 2. Jitter: slow ball whose velocity flips sign; damp and force downward
 * 3. Stall: slow ball; seeded nudge with a downward bias
 * 4. Corner: slow ball whose edge is next to a side wall; fixed escape away
 *    from the wall
 * 5. Peg trap: ball that barely moved; accelerates stall detection
 * 6. Boundary clamp
 *
 * Detectors 1-5 are skipped, with counters reset, inside the bottom margin.
 *
 * After the world step the engine runs resolveOverlaps() on active peg
 * contacts and clampToBoundary() once more.
 *
 * @ticket 0008_stability_controller
 */
class StabilityController
{
public:
  struct Config
  {
    // Stall
    double stallVelocityThreshold{0.4};  // [px/tick]
    int stallFramesThreshold{40};
    int stallRecovery{2};  // Decay per fast tick

    // Nudge
    double nudgeStrengthMin{0.8};
    double nudgeStrengthMax{1.5};
    double nudgeDownwardBias{0.6};
    double nudgeAngleSpread{0.6 * std::numbers::pi};

    // Progress window
    int progressWindowTicks{45};
    double progressDistance{6.0};  // [px] net travel expected per window
    double dislodgeLift{8.5};      // [px/tick] upward speed of the hop
    double dislodgeLateralMin{2.5};
    double dislodgeLateralMax{3.5};

    // Jitter
    double jitterVelocityThreshold{0.2};
    double jitterNearZero{0.01};
    int jitterFramesThreshold{8};
    double jitterDamping{0.85};
    double jitterMinDownwardVelocity{0.8};

    // Corner, measured from the ball edge
    double wallMargin{15.0};
    double cornerSpeedFactor{1.5};
    int cornerFramesThreshold{60};
    double escapeVelocity{2.0};
    double collisionOffset{0.5};

    // Peg trap
    double pegTrapDisplacement{0.5};
    int pegTrapPenalty{2};

    // Boundary and overlap
    double boundaryPadding{2.0};
    double overlapCorrection{1.2};
    double overlapBoost{0.3};
    double overlapDownwardBoost{0.2};

    // Detectors are off once the ball centre is below height - bottomMargin
    double bottomMargin{70.0};

    // Correction log capacity per drop; later corrections still apply
    std::size_t maxCorrections{4096};
  };

  StabilityController();
  explicit StabilityController(const Config& config);

  /**
   * @brief Start tracking a new ball; clears counters and the correction log
   */
  void beginDrop(uint32_t seed,
                 int64_t nonce,
                 const Coordinate& position,
                 const Velocity& velocity);

  /**
   * @brief Zero the counters (ball removed or session not dropping)
   *
   * The correction log is kept until the next beginDrop().
   */
  void resetCounters();

  /**
   * @brief Run the detectors and the boundary clamp before a world step
   *
   * @param world World holding the ball
   * @param ballId Ball body (dynamic circle)
   * @param boardWidth Play area width [px]
   * @param boardHeight Play area height [px]
   * @param tick Engine tick used to stamp corrections
   */
  void preStep(WorldModel& world,
               BodyId ballId,
               double boardWidth,
               double boardHeight,
               uint64_t tick);

  /**
   * @brief Push the ball out of every peg it still overlaps
   *
   * Only circle bodies are considered; walls, deflectors and dividers are
   * left to the solver. Penetration is radius sum minus centre distance.
   * The push is overlap * overlapCorrection along the contact normal; a slow
   * ball also gets a small velocity boost along the normal plus a downward
   * bias.
   *
   * @param active Pairs that kept touching this tick
   */
  void resolveOverlaps(WorldModel& world,
                       BodyId ballId,
                       const std::vector<ContactPair>& active,
                       uint64_t tick);

  /**
   * @brief Keep the ball inside [r + padding, width - r - padding] and below
   * the top edge.
   *
   * The velocity component pointing out of the board is zeroed.
   * @return true if the position was changed
   */
  bool clampToBoundary(WorldModel& world,
                       BodyId ballId,
                       double boardWidth,
                       uint64_t tick);

  [[nodiscard]] const StabilityState& getState() const
  {
    return state_;
  }

  [[nodiscard]] const std::vector<CorrectionRecord>& getCorrections() const
  {
    return corrections_;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

private:
  void applyJitterCorrection(WorldModel& world, BodyId ballId, uint64_t tick);
  void applyNudge(WorldModel& world, BodyId ballId, uint64_t tick);
  void applyDislodge(WorldModel& world,
                     BodyId ballId,
                     double boardWidth,
                     uint64_t tick);
  void applyPendingLateral(WorldModel& world, BodyId ballId, uint64_t tick);
  void applyCornerEscape(WorldModel& world,
                         BodyId ballId,
                         bool nearLeftWall,
                         uint64_t tick);

  void record(uint64_t tick,
              CorrectionKind kind,
              const Coordinate& position,
              const Velocity& before,
              const Velocity& after);

  Config config_;
  StabilityState state_;
  std::vector<CorrectionRecord> corrections_;
  bool correctionLogFull_{false};
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_STABILITY_CONTROLLER_HPP
