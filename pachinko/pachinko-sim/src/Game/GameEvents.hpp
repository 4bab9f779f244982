// Ticket: 0007_drop_session_events

#ifndef PACHINKO_SIM_GAME_EVENTS_HPP
#define PACHINKO_SIM_GAME_EVENTS_HPP

#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

#include "pachinko-sim/src/Board/BoardConfig.hpp"
#include "pachinko-sim/src/DataTypes/Coordinate.hpp"
#include "pachinko-sim/src/DataTypes/Velocity.hpp"
#include "pachinko-sim/src/Physics/RigidBody/BodyTag.hpp"

namespace pachinko_sim
{

/**
 * @brief Drop lifecycle: Idle -> Dropping -> Landed -> Idle (on reset)
 */
enum class SessionState : uint8_t
{
  Idle,
  Dropping,
  Landed
};

[[nodiscard]] inline const char* toString(SessionState state)
{
  switch (state)
  {
    case SessionState::Idle:
      return "Idle";
    case SessionState::Dropping:
      return "Dropping";
    case SessionState::Landed:
      return "Landed";
  }
  return "Unknown";
}

/**
 * @brief Terminal outcome of one drop
 */
struct LandingResult
{
  std::size_t bucketIndex{0};
  BucketSpec bucket;
  int totalPegHits{0};
  double payoutMultiplier{0.0};  // bucket.multiplier * class yieldMultiplier
};

struct BallDroppedEvent
{
  uint64_t tick{0};
  Coordinate position;
  Velocity velocity;
  uint32_t seed{0};
  std::string classId;
};

struct PegHitEvent
{
  uint64_t tick{0};
  PegId peg;
  int hitCount{0};  // Hits so far in this drop, including this one
};

struct BucketLandEvent
{
  uint64_t tick{0};
  LandingResult result;
};

/**
 * @brief Event queued by the Engine for drainEvents()
 */
using GameEvent = std::variant<BallDroppedEvent, PegHitEvent, BucketLandEvent>;

/**
 * @brief Host callbacks, owned by the Engine that receives them.
 *
 * Invoked synchronously after the world step of the tick that produced the
 * event has finished. Empty callbacks are skipped. A callback must not call
 * Engine::step().
 */
struct EngineCallbacks
{
  std::function<void(const PegId& peg, int hitCount)> onPegHit;
  std::function<void(const BucketSpec& bucket, int totalHits)> onBucketLand;
  std::function<void()> onBallDropped;
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_GAME_EVENTS_HPP
