// Ticket: 0005_contact_lifecycle_events

#include "pachinko-sim/src/Physics/Constraints/ContactCache.hpp"

#include <algorithm>

namespace pachinko_sim
{

void ContactCache::beginTick()
{
  for (auto& [key, entry] : cache_)
  {
    entry.touchedThisTick = false;
  }
  beganThisTick_.clear();
}

void ContactCache::touch(uint32_t bodyA,
                         uint32_t bodyB,
                         const Coordinate& normal)
{
  auto const key = makeKey(bodyA, bodyB);
  auto it = cache_.find(key);

  if (it == cache_.end())
  {
    CachedContact entry{bodyA, bodyB, normal, 0, true};
    cache_.emplace(key, entry);
    beganThisTick_.push_back(key);
    return;
  }

  it->second.normal = normal;
  it->second.touchedThisTick = true;
}

ContactCache::Transitions ContactCache::endTick()
{
  Transitions transitions;
  transitions.began = beganThisTick_;

  for (auto it = cache_.begin(); it != cache_.end();)
  {
    CachedContact& entry = it->second;
    if (!entry.touchedThisTick)
    {
      transitions.ended.push_back(it->first);
      it = cache_.erase(it);
      continue;
    }

    // Pairs created this tick have age 0 and are reported as began only
    if (entry.age > 0 ||
        std::find(beganThisTick_.begin(), beganThisTick_.end(), it->first) ==
          beganThisTick_.end())
    {
      transitions.active.push_back(it->first);
    }
    ++entry.age;
    ++it;
  }

  std::sort(transitions.active.begin(), transitions.active.end());
  std::sort(transitions.ended.begin(), transitions.ended.end());
  beganThisTick_.clear();
  return transitions;
}

bool ContactCache::hasEntry(uint32_t bodyA, uint32_t bodyB) const
{
  return cache_.contains(makeKey(bodyA, bodyB));
}

void ContactCache::removeBody(uint32_t bodyId)
{
  std::erase_if(cache_,
                [bodyId](const auto& item)
                {
                  return item.first.first == bodyId ||
                         item.first.second == bodyId;
                });
  std::erase_if(beganThisTick_,
                [bodyId](const BodyPairKey& key)
                { return key.first == bodyId || key.second == bodyId; });
}

void ContactCache::clear()
{
  cache_.clear();
  beganThisTick_.clear();
}

size_t ContactCache::size() const
{
  return cache_.size();
}

ContactCache::BodyPairKey ContactCache::makeKey(uint32_t a, uint32_t b)
{
  return a < b ? BodyPairKey{a, b} : BodyPairKey{b, a};
}

}  // namespace pachinko_sim
