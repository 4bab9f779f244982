// Ticket: 0005_contact_lifecycle_events

#ifndef PACHINKO_SIM_PHYSICS_CONTACT_CACHE_HPP
#define PACHINKO_SIM_PHYSICS_CONTACT_CACHE_HPP

#include <cstdint>
#include <functional>
#include <unordered_map>
#include <utility>
#include <vector>

#include "pachinko-sim/src/DataTypes/Coordinate.hpp"

namespace pachinko_sim
{

/**
 * @brief Cached contact data for a single body pair
 */
struct CachedContact
{
  uint32_t bodyA_id;
  uint32_t bodyB_id;
  Coordinate normal;       // Most recent contact normal (A->B)
  uint32_t age{0};         // Ticks the pair has been continuously touching
  bool touchedThisTick{false};
};

/**
 * @brief Tracks which body pairs are touching across ticks.
 *
 * Each tick the stepper calls beginTick(), reports every overlapping pair
 * with touch(), and closes the tick with endTick(), which classifies pairs
 * into those that began touching this tick, those still touching from the
 * previous tick, and those that separated.
 *
 * Cache keying uses a symmetric body pair key: (min(id_A, id_B), max(id_A,
 * id_B)) to ensure body order independence.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 */
class ContactCache
{
public:
  using BodyPairKey = std::pair<uint32_t, uint32_t>;

  /**
   * @brief Pair transitions produced by endTick()
   *
   * `began` preserves first-touch order within the tick; `active` and
   * `ended` are sorted by key so replays are reproducible.
   */
  struct Transitions
  {
    std::vector<BodyPairKey> began;
    std::vector<BodyPairKey> active;
    std::vector<BodyPairKey> ended;
  };

  ContactCache() = default;

  /**
   * @brief Start a new tick; clears the touched flags.
   */
  void beginTick();

  /**
   * @brief Record that a pair overlaps during the current tick.
   *
   * May be called several times per tick for the same pair (sub-steps).
   */
  void touch(uint32_t bodyA, uint32_t bodyB, const Coordinate& normal);

  /**
   * @brief Close the tick and classify every pair.
   *
   * Pairs not touched during the tick are removed from the cache.
   */
  [[nodiscard]] Transitions endTick();

  /**
   * @brief Check if the cache holds a pair (touching at the last endTick()).
   */
  [[nodiscard]] bool hasEntry(uint32_t bodyA, uint32_t bodyB) const;

  /**
   * @brief Drop every pair involving @p bodyId without reporting it as ended.
   */
  void removeBody(uint32_t bodyId);

  /**
   * @brief Clear all cached data
   */
  void clear();

  /**
   * @brief Number of cached body pair entries
   */
  [[nodiscard]] size_t size() const;

  // Rule of Five
  ContactCache(const ContactCache&) = default;
  ContactCache& operator=(const ContactCache&) = default;
  ContactCache(ContactCache&&) noexcept = default;
  ContactCache& operator=(ContactCache&&) noexcept = default;
  ~ContactCache() = default;

private:
  /**
   * @brief Create symmetric key from body pair
   * @return (min(a,b), max(a,b))
   */
  [[nodiscard]] static BodyPairKey makeKey(uint32_t a, uint32_t b);

  struct PairHash
  {
    size_t operator()(const BodyPairKey& p) const
    {
      size_t seed = std::hash<uint32_t>{}(p.first);
      // Golden ratio hash_combine (Boost pattern) for better distribution
      seed ^= std::hash<uint32_t>{}(p.second) + 0x9e3779b9 + (seed << 6) +
              (seed >> 2);
      return seed;
    }
  };

  std::unordered_map<BodyPairKey, CachedContact, PairHash> cache_;
  std::vector<BodyPairKey> beganThisTick_;
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_CONTACT_CACHE_HPP
