// Ticket: 0007_drop_session_events

#ifndef PACHINKO_SIM_COLLISION_CLASSIFIER_HPP
#define PACHINKO_SIM_COLLISION_CLASSIFIER_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "pachinko-sim/src/Environment/WorldModel.hpp"
#include "pachinko-sim/src/Physics/RigidBody/BodyTag.hpp"

namespace pachinko_sim
{

/**
 * @brief Result of classifying one tick's new contacts
 */
struct ClassifierOutcome
{
  std::vector<PegId> pegHits;               // In contact order
  std::optional<std::size_t> landedBucket;  // First bucket sensor touched
};

/**
 * @brief Dispatches new ball contacts to peg-hit or bucket-land handling.
 *
 * Pure dispatch: never moves bodies and keeps no state between ticks.
 */
class CollisionClassifier
{
public:
  CollisionClassifier() = default;

  /**
   * @brief Classify the contacts that began this tick.
   *
   * Contacts not involving @p ballId are ignored. Contacts after the first
   * bucket sensor are ignored, since the ball leaves the world on landing.
   *
   * @param began Pairs that started touching this tick, in detection order
   * @param ballId Id of the ball body
   * @param world World holding both bodies of every pair
   * @param acceptLanding If false, bucket contacts are ignored
   */
  [[nodiscard]] ClassifierOutcome classify(const std::vector<ContactPair>& began,
                                           BodyId ballId,
                                           const WorldModel& world,
                                           bool acceptLanding) const;
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_COLLISION_CLASSIFIER_HPP
