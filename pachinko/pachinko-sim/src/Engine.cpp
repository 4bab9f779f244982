// Ticket: 0007_drop_session_events
// Ticket: 0009_deferred_class_switch

#include "pachinko-sim/src/Engine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "pachinko-sim/src/Logging.hpp"
#include "pachinko-sim/src/Physics/RigidBody/Body.hpp"
#include "pachinko-sim/src/Utils/SeededRandom.hpp"

namespace pachinko_sim
{

namespace
{

/// Marks the engine as stepping for the lifetime of the guard
class StepGuard
{
public:
  explicit StepGuard(bool& flag) : flag_{flag}
  {
    flag_ = true;
  }

  ~StepGuard()
  {
    flag_ = false;
  }

  StepGuard(const StepGuard&) = delete;
  StepGuard& operator=(const StepGuard&) = delete;
  StepGuard(StepGuard&&) = delete;
  StepGuard& operator=(StepGuard&&) = delete;

private:
  bool& flag_;
};

int64_t nowMillis()
{
  return std::chrono::duration_cast<std::chrono::milliseconds>(
           std::chrono::system_clock::now().time_since_epoch())
    .count();
}

constexpr int64_t kSeedModulus = 100000;
constexpr int64_t kNonceModulus = 1000;

}  // namespace

Engine::Engine(BoardConfig board,
               BallClassTable classes,
               const std::string& classId,
               EngineCallbacks callbacks)
  : Engine{std::move(board),
           std::move(classes),
           classId,
           std::move(callbacks),
           Config{}}
{
}

Engine::Engine(BoardConfig board,
               BallClassTable classes,
               const std::string& classId,
               EngineCallbacks callbacks,
               const Config& config)
  : board_{std::move(board)},
    classes_{std::move(classes)},
    callbacks_{std::move(callbacks)},
    config_{config},
    world_{config.world},
    stability_{config.stability}
{
  layout_ = buildWorld(board_, world_);
  applyClass(classId);
}

bool Engine::drop(double x)
{
  if (!std::isfinite(x))
  {
    getLogger()->debug("drop ignored: x is not finite");
    return false;
  }
  double const clampedX =
    std::clamp(x, board_.dropMargin, board_.width - board_.dropMargin);
  int64_t const now = nowMillis();
  auto const seed = static_cast<uint32_t>(
    (static_cast<int64_t>(clampedX * 1000.0) + now) % kSeedModulus);
  return launch(clampedX, seed, now % kNonceModulus);
}

bool Engine::drop(double x, uint32_t seed)
{
  if (!std::isfinite(x))
  {
    getLogger()->debug("drop ignored: x is not finite");
    return false;
  }
  double const clampedX =
    std::clamp(x, board_.dropMargin, board_.width - board_.dropMargin);
  return launch(clampedX, seed, static_cast<int64_t>(seed) % kNonceModulus);
}

bool Engine::launch(double x, uint32_t seed, int64_t nonce)
{
  if (destroyed_)
  {
    getLogger()->debug("drop ignored: engine destroyed");
    return false;
  }
  if (state_ != SessionState::Idle || ballId_)
  {
    getLogger()->debug("drop ignored: session is {}", toString(state_));
    return false;
  }

  const BallClassConfig& ballClass = classes_.lookup(activeClassId_);

  Coordinate const position{x, board_.dropY};
  BodyId const id =
    world_.addBody(Body::createDynamic(CircleShape{ballClass.radius()},
                                       position,
                                       ballClass.bodyMass(),
                                       ballClass.material(),
                                       BallTag{}));

  // Seeded horizontal spread, class-scaled downward launch
  Velocity const velocity{
    (seeded_random::uniform(seed, 0) - 0.5) * config_.launchSpread,
    config_.launchSpeed * ballClass.speedMultiplier};
  world_.setVelocity(id, velocity);

  ballId_ = id;
  state_ = SessionState::Dropping;
  pegHitCount_ = 0;
  lastLanding_.reset();
  stability_.beginDrop(seed, nonce, position, velocity);

  getLogger()->info(
    "Ball dropped at x={:.1f} seed={} class={}", x, seed, activeClassId_);

  std::vector<GameEvent> events;
  events.emplace_back(
    BallDroppedEvent{tickCount_, position, velocity, seed, activeClassId_});
  dispatch(events);
  return true;
}

void Engine::reset()
{
  removeBall();
  state_ = SessionState::Idle;
  pegHitCount_ = 0;

  if (pendingClassId_)
  {
    std::string const classId = std::move(*pendingClassId_);
    pendingClassId_.reset();
    applyClass(classId);
  }
}

void Engine::setClass(const std::string& classId)
{
  if (state_ == SessionState::Idle && !ballId_)
  {
    pendingClassId_.reset();
    applyClass(classId);
    return;
  }

  if (!classes_.contains(classId))
  {
    getLogger()->warn("Unknown ball class '{}', using '{}'",
                      classId,
                      BallClassTable::kDefaultClassId);
  }
  pendingClassId_ = classes_.resolveId(classId);
  getLogger()->debug("Class change to '{}' deferred until reset",
                     *pendingClassId_);
}

void Engine::destroy()
{
  world_.clear();
  ballId_.reset();
  layout_ = BoardLayout{};
  state_ = SessionState::Idle;
  pegHitCount_ = 0;
  stability_.resetCounters();
  destroyed_ = true;
  getLogger()->info("Engine destroyed");
}

void Engine::rebuild()
{
  world_.clear();
  ballId_.reset();
  state_ = SessionState::Idle;
  pegHitCount_ = 0;
  stability_.resetCounters();
  layout_ = buildWorld(board_, world_);
  destroyed_ = false;

  if (pendingClassId_)
  {
    std::string const classId = std::move(*pendingClassId_);
    pendingClassId_.reset();
    applyClass(classId);
  }
}

void Engine::step(double dtMillis)
{
  if (stepping_)
  {
    throw std::logic_error("Engine::step called from inside an engine callback");
  }
  if (!std::isfinite(dtMillis) || dtMillis <= 0.0)
  {
    throw std::invalid_argument("Step duration must be positive, got: " +
                                std::to_string(dtMillis));
  }
  StepGuard const guard{stepping_};

  if (destroyed_)
  {
    return;
  }

  ++tickCount_;
  pendingEvents_.clear();

  bool const dropping = ballId_ && state_ == SessionState::Dropping;
  if (dropping)
  {
    stability_.preStep(
      world_, *ballId_, board_.width, board_.height, tickCount_);
  }
  else
  {
    stability_.resetCounters();
  }

  StepEvents const events = world_.step(dtMillis);

  if (ballId_ && state_ == SessionState::Dropping)
  {
    ClassifierOutcome const outcome =
      classifier_.classify(events.began, *ballId_, world_, true);

    for (const auto& peg : outcome.pegHits)
    {
      ++pegHitCount_;
      pendingEvents_.emplace_back(PegHitEvent{tickCount_, peg, pegHitCount_});
    }

    if (outcome.landedBucket)
    {
      land(*outcome.landedBucket);
    }
  }

  if (ballId_ && state_ == SessionState::Dropping)
  {
    stability_.resolveOverlaps(world_, *ballId_, events.active, tickCount_);
    stability_.clampToBoundary(world_, *ballId_, board_.width, tickCount_);
  }

  // Dispatch from a copy: callbacks may drop or reset
  std::vector<GameEvent> const tickEvents = std::move(pendingEvents_);
  pendingEvents_.clear();
  dispatch(tickEvents);
}

void Engine::tick()
{
  step(config_.tickMillis);
}

std::vector<GameEvent> Engine::drainEvents()
{
  std::vector<GameEvent> drained;
  drained.swap(eventQueue_);
  return drained;
}

std::optional<BallSnapshot> Engine::getBall() const
{
  if (!ballId_)
  {
    return std::nullopt;
  }
  const Body& ball = world_.getBody(*ballId_);
  return BallSnapshot{
    *ballId_, ball.getPosition(), ball.getVelocity(), ball.getCircleRadius()};
}

void Engine::applyClass(const std::string& classId)
{
  const BallClassConfig& ballClass = classes_.lookup(classId);
  activeClassId_ = classes_.resolveId(classId);
  world_.setGravityScale(config_.baseGravityScale * ballClass.speedMultiplier);

  if (2.0 * ballClass.radius() >= board_.pegGap())
  {
    getLogger()->warn(
      "Ball class '{}' is {:.1f} px wide but the peg gap is {:.1f} px; drops "
      "may never reach a bucket",
      activeClassId_,
      2.0 * ballClass.radius(),
      board_.pegGap());
  }

  getLogger()->info("Ball class set to '{}' ({}, speed x{})",
                    activeClassId_,
                    ballClass.label,
                    ballClass.speedMultiplier);
}

void Engine::removeBall()
{
  if (ballId_)
  {
    world_.removeBody(*ballId_);
    ballId_.reset();
  }
  stability_.resetCounters();
}

void Engine::land(std::size_t bucketIndex)
{
  const BucketSpec& bucket = board_.buckets.at(bucketIndex);
  const BallClassConfig& ballClass = classes_.lookup(activeClassId_);

  LandingResult const result{bucketIndex,
                             bucket,
                             pegHitCount_,
                             bucket.multiplier * ballClass.yieldMultiplier};

  removeBall();
  state_ = SessionState::Landed;
  lastLanding_ = result;

  getLogger()->info("Landed in {} ({}x) after {} peg hits, payout x{}",
                    bucket.label,
                    bucket.multiplier,
                    pegHitCount_,
                    result.payoutMultiplier);

  pendingEvents_.emplace_back(BucketLandEvent{tickCount_, result});
}

void Engine::dispatch(const std::vector<GameEvent>& events)
{
  for (const auto& event : events)
  {
    if (config_.queueEvents)
    {
      eventQueue_.push_back(event);
    }

    if (std::holds_alternative<BallDroppedEvent>(event))
    {
      if (callbacks_.onBallDropped)
      {
        callbacks_.onBallDropped();
      }
    }
    else if (const auto* hit = std::get_if<PegHitEvent>(&event))
    {
      if (callbacks_.onPegHit)
      {
        callbacks_.onPegHit(hit->peg, hit->hitCount);
      }
    }
    else if (const auto* landed = std::get_if<BucketLandEvent>(&event))
    {
      if (callbacks_.onBucketLand)
      {
        callbacks_.onBucketLand(landed->result.bucket,
                                landed->result.totalPegHits);
      }
    }
  }
}

}  // namespace pachinko_sim
