// Ticket: 0011_reproducible_stall_corrections

#include "pachinko-sim/src/Utils/SeededRandom.hpp"

namespace pachinko_sim::seeded_random
{

double uniform(uint32_t seed, int64_t offset)
{
  uint64_t const h =
    mix64(mix64(static_cast<uint64_t>(seed)) ^ static_cast<uint64_t>(offset));
  // Top 53 bits map exactly onto the double mantissa
  return static_cast<double>(h >> 11) * 0x1.0p-53;
}

double uniformRange(uint32_t seed, int64_t offset, double lo, double hi)
{
  return lo + uniform(seed, offset) * (hi - lo);
}

}  // namespace pachinko_sim::seeded_random
