// Ticket: 0008_stability_controller
// Ticket: 0011_reproducible_stall_corrections

#include "pachinko-sim/src/Game/StabilityController.hpp"

#include <algorithm>
#include <cmath>
#include <variant>

#include "pachinko-sim/src/Logging.hpp"
#include "pachinko-sim/src/Utils/SeededRandom.hpp"

namespace pachinko_sim
{

const char* toString(CorrectionKind kind)
{
  switch (kind)
  {
    case CorrectionKind::Jitter:
      return "Jitter";
    case CorrectionKind::Nudge:
      return "Nudge";
    case CorrectionKind::CornerEscape:
      return "CornerEscape";
    case CorrectionKind::BoundaryClamp:
      return "BoundaryClamp";
    case CorrectionKind::OverlapPush:
      return "OverlapPush";
    case CorrectionKind::Dislodge:
      return "Dislodge";
    case CorrectionKind::LateralKick:
      return "LateralKick";
  }
  return "Unknown";
}

StabilityController::StabilityController() : StabilityController{Config{}}
{
}

StabilityController::StabilityController(const Config& config)
  : config_{config}
{
}

void StabilityController::beginDrop(uint32_t seed,
                                    int64_t nonce,
                                    const Coordinate& position,
                                    const Velocity& velocity)
{
  state_ = StabilityState{};
  state_.dropSeed = seed;
  state_.dropNonce = nonce;
  state_.lastPosition = position;
  state_.lastVelocity = velocity;
  state_.windowStart = position;
  corrections_.clear();
  correctionLogFull_ = false;
}

void StabilityController::resetCounters()
{
  state_.stallFrames = 0;
  state_.cornerFrames = 0;
  state_.jitterCount = 0;
  state_.windowTicks = 0;
  state_.pendingLateral = 0.0;
}

void StabilityController::preStep(WorldModel& world,
                                  BodyId ballId,
                                  double boardWidth,
                                  double boardHeight,
                                  uint64_t tick)
{
  Coordinate const position = world.getPosition(ballId);

  // Settling into a bucket: never perturbed
  if (position.y() > boardHeight - config_.bottomMargin)
  {
    resetCounters();
    state_.windowStart = position;
    clampToBoundary(world, ballId, boardWidth, tick);
    return;
  }

  // Deferred inward kick once the hop stops rising
  if (state_.pendingLateral != 0.0 && world.getVelocity(ballId).y() >= 0.0)
  {
    applyPendingLateral(world, ballId, tick);
  }

  // ===== 1. Progress window =====
  ++state_.windowTicks;
  if (state_.windowTicks >= config_.progressWindowTicks)
  {
    if ((position - state_.windowStart).norm() < config_.progressDistance)
    {
      applyDislodge(world, ballId, boardWidth, tick);
    }
    state_.windowTicks = 0;
    state_.windowStart = position;
  }

  Velocity const velocity = world.getVelocity(ballId);
  double const speed = velocity.norm();

  // ===== 2. Jitter =====
  bool const jitterBand =
    speed < config_.jitterVelocityThreshold && speed > config_.jitterNearZero;
  bool const signFlip = velocity.x() * state_.lastVelocity.x() < 0.0 ||
                        velocity.y() * state_.lastVelocity.y() < 0.0;
  if (jitterBand && signFlip)
  {
    ++state_.jitterCount;
    if (state_.jitterCount > config_.jitterFramesThreshold)
    {
      applyJitterCorrection(world, ballId, tick);
      state_.jitterCount = 0;
    }
  }
  else
  {
    state_.jitterCount = std::max(0, state_.jitterCount - 1);
  }

  // ===== 3. General stall =====
  if (speed < config_.stallVelocityThreshold)
  {
    ++state_.stallFrames;
    if (state_.stallFrames > config_.stallFramesThreshold)
    {
      applyNudge(world, ballId, tick);
      state_.stallFrames = 0;
    }
  }
  else
  {
    state_.stallFrames =
      std::max(0, state_.stallFrames - config_.stallRecovery);
  }

  // ===== 4. Corner wedge =====
  double const radius = world.getBody(ballId).getCircleRadius();
  bool const nearLeftWall = position.x() - radius < config_.wallMargin;
  bool const nearRightWall =
    position.x() + radius > boardWidth - config_.wallMargin;
  bool const slowForCorner =
    speed < config_.stallVelocityThreshold * config_.cornerSpeedFactor;
  if ((nearLeftWall || nearRightWall) && slowForCorner)
  {
    ++state_.cornerFrames;
    if (state_.cornerFrames > config_.cornerFramesThreshold)
    {
      applyCornerEscape(world, ballId, nearLeftWall, tick);
      state_.cornerFrames = 0;
    }
  }
  else
  {
    state_.cornerFrames = std::max(0, state_.cornerFrames - 1);
  }

  // ===== 5. Peg trap =====
  double const displacement = (position - state_.lastPosition).norm();
  if (displacement < config_.pegTrapDisplacement &&
      speed < config_.stallVelocityThreshold)
  {
    state_.stallFrames += config_.pegTrapPenalty;
  }

  // ===== 6. Boundary =====
  clampToBoundary(world, ballId, boardWidth, tick);

  state_.lastPosition = world.getPosition(ballId);
  state_.lastVelocity = world.getVelocity(ballId);
}

void StabilityController::resolveOverlaps(WorldModel& world,
                                          BodyId ballId,
                                          const std::vector<ContactPair>& active,
                                          uint64_t tick)
{
  for (const auto& pair : active)
  {
    if (pair.bodyA != ballId && pair.bodyB != ballId)
    {
      continue;
    }
    BodyId const otherId = pair.bodyA == ballId ? pair.bodyB : pair.bodyA;
    const Body& other = world.getBody(otherId);
    if (other.isSensor() ||
        std::get_if<CircleShape>(&other.getShape()) == nullptr)
    {
      continue;
    }

    auto const contact = world.computeContact(ballId, otherId);
    if (!contact)
    {
      continue;
    }

    // Normal points from the ball into the other body
    Coordinate const separation{-contact->normal};
    Coordinate const pushed{world.getPosition(ballId) +
                            separation * (contact->penetrationDepth *
                                          config_.overlapCorrection)};
    world.setPosition(ballId, pushed);

    Velocity const before = world.getVelocity(ballId);
    Velocity after = before;
    if (before.norm() < config_.escapeVelocity)
    {
      after = Velocity{before + separation * config_.overlapBoost +
                       Coordinate{0.0, config_.overlapDownwardBoost}};
      world.setVelocity(ballId, after);
    }

    record(tick, CorrectionKind::OverlapPush, pushed, before, after);
  }
}

bool StabilityController::clampToBoundary(WorldModel& world,
                                          BodyId ballId,
                                          double boardWidth,
                                          uint64_t tick)
{
  const Body& ball = world.getBody(ballId);
  Coordinate const position = ball.getPosition();
  double const margin = ball.getCircleRadius() + config_.boundaryPadding;

  Coordinate clamped = position;
  bool corrected = false;
  if (position.x() < margin)
  {
    clamped.x() = margin + config_.collisionOffset;
    corrected = true;
  }
  if (position.x() > boardWidth - margin)
  {
    clamped.x() = boardWidth - margin - config_.collisionOffset;
    corrected = true;
  }
  if (position.y() < margin)
  {
    clamped.y() = margin + config_.collisionOffset;
    corrected = true;
  }

  if (!corrected)
  {
    return false;
  }

  world.setPosition(ballId, clamped);

  // Drop the outward component so the next step does not push back out
  Velocity const before = world.getVelocity(ballId);
  Velocity after = before;
  if (position.x() < margin)
  {
    after.x() = std::max(after.x(), 0.0);
  }
  if (position.x() > boardWidth - margin)
  {
    after.x() = std::min(after.x(), 0.0);
  }
  if (position.y() < margin)
  {
    after.y() = std::max(after.y(), 0.0);
  }
  world.setVelocity(ballId, after);

  record(tick, CorrectionKind::BoundaryClamp, clamped, before, after);
  return true;
}

void StabilityController::applyJitterCorrection(WorldModel& world,
                                                BodyId ballId,
                                                uint64_t tick)
{
  Velocity const before = world.getVelocity(ballId);
  Velocity const after{
    before.x() * config_.jitterDamping,
    std::max(before.y() * config_.jitterDamping,
             config_.jitterMinDownwardVelocity)};
  world.setVelocity(ballId, after);

  record(tick, CorrectionKind::Jitter, world.getPosition(ballId), before, after);
}

void StabilityController::applyNudge(WorldModel& world,
                                     BodyId ballId,
                                     uint64_t tick)
{
  Coordinate const position = world.getPosition(ballId);

  double const strength =
    seeded_random::uniformRange(state_.dropSeed,
                                state_.stallFrames + state_.nudgeCount,
                                config_.nudgeStrengthMin,
                                config_.nudgeStrengthMax);
  double const angle =
    (seeded_random::uniform(state_.dropSeed,
                            state_.dropNonce + state_.nudgeCount) -
     0.5) *
    config_.nudgeAngleSpread;

  Coordinate const impulse{
    std::sin(angle) * strength,
    std::cos(angle) * strength * config_.nudgeDownwardBias +
      config_.nudgeDownwardBias};

  Velocity const before = world.getVelocity(ballId);
  Velocity const after{before + impulse};
  world.setVelocity(ballId, after);
  ++state_.nudgeCount;

  record(tick, CorrectionKind::Nudge, position, before, after);
}

void StabilityController::applyDislodge(WorldModel& world,
                                        BodyId ballId,
                                        double boardWidth,
                                        uint64_t tick)
{
  // Offsets keep these draws apart from the nudge sequence
  constexpr int64_t kSideOffset = 7919;
  constexpr int64_t kLateralOffset = 104729;

  Coordinate const position = world.getPosition(ballId);
  double const radius = world.getBody(ballId).getCircleRadius();

  double side =
    seeded_random::uniform(state_.dropSeed,
                           state_.dropNonce + kSideOffset +
                             state_.dislodgeCount) < 0.5
      ? 1.0
      : -1.0;
  double const lateral =
    seeded_random::uniformRange(state_.dropSeed,
                                state_.dropNonce + kLateralOffset +
                                  state_.dislodgeCount,
                                config_.dislodgeLateralMin,
                                config_.dislodgeLateralMax);

  bool const nearLeftWall = position.x() - radius < config_.wallMargin;
  bool const nearRightWall =
    position.x() + radius > boardWidth - config_.wallMargin;
  if (nearLeftWall)
  {
    side = 1.0;
  }
  else if (nearRightWall)
  {
    side = -1.0;
  }

  Velocity const before = world.getVelocity(ballId);
  Velocity after{side * lateral, -config_.dislodgeLift};
  if (nearLeftWall || nearRightWall)
  {
    // Rise along the wall first; a diagonal hop lands on the nearest peg
    after.x() = 0.0;
    state_.pendingLateral = side * lateral;
  }
  else
  {
    state_.pendingLateral = 0.0;
  }
  world.setVelocity(ballId, after);
  ++state_.dislodgeCount;

  record(tick, CorrectionKind::Dislodge, position, before, after);
}

void StabilityController::applyPendingLateral(WorldModel& world,
                                              BodyId ballId,
                                              uint64_t tick)
{
  Velocity const before = world.getVelocity(ballId);
  Velocity const after{state_.pendingLateral, before.y()};
  world.setVelocity(ballId, after);
  state_.pendingLateral = 0.0;

  record(tick,
         CorrectionKind::LateralKick,
         world.getPosition(ballId),
         before,
         after);
}

void StabilityController::applyCornerEscape(WorldModel& world,
                                            BodyId ballId,
                                            bool nearLeftWall,
                                            uint64_t tick)
{
  double const direction = nearLeftWall ? 1.0 : -1.0;

  Velocity const before = world.getVelocity(ballId);
  Velocity const after{direction * config_.escapeVelocity,
                       config_.escapeVelocity * 0.5};
  world.setVelocity(ballId, after);

  Coordinate const moved{
    world.getPosition(ballId) +
    Coordinate{direction * config_.collisionOffset * 2.0, 0.0}};
  world.setPosition(ballId, moved);

  record(tick, CorrectionKind::CornerEscape, moved, before, after);
}

void StabilityController::record(uint64_t tick,
                                 CorrectionKind kind,
                                 const Coordinate& position,
                                 const Velocity& before,
                                 const Velocity& after)
{
  if (corrections_.size() < config_.maxCorrections)
  {
    corrections_.push_back(
      CorrectionRecord{tick, kind, position, before, after});
  }
  else if (!correctionLogFull_)
  {
    correctionLogFull_ = true;
    getLogger()->debug("tick {} correction log full at {} entries",
                       tick,
                       config_.maxCorrections);
  }

  getLogger()->debug(
    "tick {} {} at ({:.2f}, {:.2f}) v ({:.3f}, {:.3f}) -> ({:.3f}, {:.3f})",
    tick,
    toString(kind),
    position.x(),
    position.y(),
    before.x(),
    before.y(),
    after.x(),
    after.y());
}

}  // namespace pachinko_sim
