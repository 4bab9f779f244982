// Ticket: 0007_drop_session_events

#include "pachinko-sim/src/Game/CollisionClassifier.hpp"

#include <variant>

namespace pachinko_sim
{

ClassifierOutcome CollisionClassifier::classify(
  const std::vector<ContactPair>& began,
  BodyId ballId,
  const WorldModel& world,
  bool acceptLanding) const
{
  ClassifierOutcome outcome;

  for (const auto& pair : began)
  {
    if (pair.bodyA != ballId && pair.bodyB != ballId)
    {
      continue;
    }

    BodyId const otherId = pair.bodyA == ballId ? pair.bodyB : pair.bodyA;
    const BodyTag& tag = world.getBody(otherId).getTag();

    if (const auto* peg = std::get_if<PegTag>(&tag))
    {
      outcome.pegHits.push_back(peg->id);
      continue;
    }

    const auto* bucket = std::get_if<BucketTag>(&tag);
    if (bucket != nullptr && acceptLanding)
    {
      outcome.landedBucket = bucket->index;
      break;
    }
  }

  return outcome;
}

}  // namespace pachinko_sim
