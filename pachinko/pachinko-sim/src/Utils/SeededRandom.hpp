// Ticket: 0011_reproducible_stall_corrections

#ifndef PACHINKO_SIM_SEEDED_RANDOM_HPP
#define PACHINKO_SIM_SEEDED_RANDOM_HPP

#include <cstdint>

namespace pachinko_sim::seeded_random
{

/**
 * @brief Counter-based pseudo-random value in [0, 1)
 *
 * Pure function of (seed, offset): the same pair always yields the same
 * value on every platform. There is no hidden generator state, so replaying
 * a drop with the same seed reproduces every corrective decision.
 *
 * @param seed Per-drop seed
 * @param offset Varying offset (stall frame count, drop nonce, ...)
 * @return Uniform value in [0, 1)
 */
[[nodiscard]] double uniform(uint32_t seed, int64_t offset);

/**
 * @brief Uniform value in [lo, hi)
 */
[[nodiscard]] double uniformRange(uint32_t seed,
                                  int64_t offset,
                                  double lo,
                                  double hi);

/**
 * @brief SplitMix64 finalizer
 */
[[nodiscard]] constexpr uint64_t mix64(uint64_t z)
{
  z += 0x9e3779b97f4a7c15ULL;
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

}  // namespace pachinko_sim::seeded_random

#endif  // PACHINKO_SIM_SEEDED_RANDOM_HPP
