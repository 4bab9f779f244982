// Ticket: 0008_stability_controller
//
// Headless batch runner: drops balls of every class across the drop zone
// and logs landing statistics.
//
// Usage: pachinko-run [seedsPerPosition] [--verbose]

#include <cstdint>
#include <cstdlib>
#include <exception>
#include <map>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "pachinko-sim/src/Engine.hpp"
#include "pachinko-sim/src/Logging.hpp"

using namespace pachinko_sim;

namespace
{

constexpr int kMaxTicks = 2000;

struct ClassStats
{
  int drops{0};
  int landed{0};
  int corrections{0};
  uint64_t ticks{0};
  int pegHits{0};
  double payout{0.0};
  std::map<std::string, int> bucketCounts;
};

ClassStats runClass(const std::string& classId, uint32_t seedsPerPosition)
{
  Engine engine{BoardConfig::standard(),
                BallClassTable::standard(),
                classId,
                EngineCallbacks{}};
  const BoardConfig& board = engine.getBoard();

  std::vector<double> const positions{board.dropMargin,
                                      board.width * 0.3,
                                      board.width * 0.5,
                                      board.width * 0.7,
                                      board.width - board.dropMargin};

  ClassStats stats;
  for (double const x : positions)
  {
    for (uint32_t seed = 1; seed <= seedsPerPosition; ++seed)
    {
      engine.reset();
      if (!engine.drop(x, seed))
      {
        continue;
      }
      ++stats.drops;

      int ticks = 0;
      while (engine.getState() == SessionState::Dropping && ticks < kMaxTicks)
      {
        engine.tick();
        ++ticks;
      }
      stats.ticks += static_cast<uint64_t>(ticks);
      stats.corrections += static_cast<int>(engine.getCorrections().size());

      if (const auto& landing = engine.getLastLanding())
      {
        ++stats.landed;
        stats.pegHits += landing->totalPegHits;
        stats.payout += landing->payoutMultiplier;
        ++stats.bucketCounts[landing->bucket.label];
      }
      else
      {
        spdlog::warn("{}: drop at x={:.0f} seed={} did not land in {} ticks",
                     classId,
                     x,
                     seed,
                     kMaxTicks);
      }
    }
  }
  return stats;
}

}  // namespace

int main(int argc, char** argv)
{
  uint32_t seedsPerPosition = 8;
  bool verbose = false;

  for (int i = 1; i < argc; ++i)
  {
    std::string const arg{argv[i]};
    if (arg == "--verbose")
    {
      verbose = true;
      continue;
    }
    try
    {
      seedsPerPosition = static_cast<uint32_t>(std::stoul(arg));
    }
    catch (const std::exception& e)
    {
      spdlog::error("Invalid seed count '{}': {}", arg, e.what());
      return EXIT_FAILURE;
    }
  }

  getLogger()->set_level(verbose ? spdlog::level::debug
                                 : spdlog::level::warn);

  try
  {
    for (const auto& classId : BallClassTable::standard().getClassIds())
    {
      ClassStats const stats = runClass(classId, seedsPerPosition);
      if (stats.drops == 0)
      {
        continue;
      }

      spdlog::info("{}: {}/{} landed, {:.1f} ticks/drop, {:.2f} corrections/drop",
                   classId,
                   stats.landed,
                   stats.drops,
                   static_cast<double>(stats.ticks) / stats.drops,
                   static_cast<double>(stats.corrections) / stats.drops);
      if (stats.landed > 0)
      {
        spdlog::info("{}: {:.1f} peg hits/drop, mean payout x{:.3f}",
                     classId,
                     static_cast<double>(stats.pegHits) / stats.landed,
                     stats.payout / stats.landed);
      }
      for (const auto& [label, count] : stats.bucketCounts)
      {
        spdlog::info("{}:   {:<6} {}", classId, label, count);
      }
    }
  }
  catch (const std::exception& e)
  {
    spdlog::error("Simulation failed: {}", e.what());
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
