// Ticket: 0008_stability_controller
//
// Benchmarks for a single engine tick and a full drop on the standard board.

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

#include "pachinko-sim/src/Engine.hpp"

using namespace pachinko_sim;

// ============================================================================
// Helpers
// ============================================================================

namespace
{

constexpr double kCentreX = 250.0;  // Drop above the middle bucket
constexpr int kMaxTicks = 2000;     // Landing budget per drop

const std::string& classForIndex(int64_t index)
{
  static const std::string kClasses[] = {"default", "degen", "whale"};
  return kClasses[index];
}

}  // namespace

// ============================================================================
// Benchmarks
// ============================================================================

/**
 * @brief One tick with the ball falling through the peg field.
 *
 * The drop restarts whenever it lands, so every iteration steps a live ball.
 */
static void BM_Engine_Tick(benchmark::State& state)
{
  Engine engine{BoardConfig::standard(),
                BallClassTable::standard(),
                classForIndex(state.range(0)),
                EngineCallbacks{}};
  uint32_t seed = 1;
  engine.drop(kCentreX, seed);

  for (auto _ : state)
  {
    if (engine.getState() != SessionState::Dropping)
    {
      state.PauseTiming();
      engine.reset();
      engine.drop(kCentreX, ++seed);
      state.ResumeTiming();
    }
    engine.tick();
    benchmark::DoNotOptimize(engine.getTickCount());
  }
}
BENCHMARK(BM_Engine_Tick)->DenseRange(0, 2);

/**
 * @brief Drop to landing, including stability corrections.
 */
static void BM_Engine_FullDrop(benchmark::State& state)
{
  Engine engine{BoardConfig::standard(),
                BallClassTable::standard(),
                classForIndex(state.range(0)),
                EngineCallbacks{}};
  uint32_t seed = 1;
  int64_t ticks = 0;

  for (auto _ : state)
  {
    engine.reset();
    engine.drop(kCentreX, seed++);
    for (int i = 0; i < kMaxTicks && engine.getState() == SessionState::Dropping;
         ++i)
    {
      engine.tick();
      ++ticks;
    }
    benchmark::DoNotOptimize(engine.getLastLanding());
  }

  state.counters["ticks_per_drop"] = benchmark::Counter(
    static_cast<double>(ticks), benchmark::Counter::kAvgIterations);
}
BENCHMARK(BM_Engine_FullDrop)->DenseRange(0, 2)->Unit(benchmark::kMillisecond);

/**
 * @brief Building the 126 static bodies of the standard board.
 */
static void BM_WorldBuilder_StandardBoard(benchmark::State& state)
{
  BoardConfig const board = BoardConfig::standard();

  for (auto _ : state)
  {
    WorldModel world;
    BoardLayout layout = buildWorld(board, world);
    benchmark::DoNotOptimize(layout);
  }
}
BENCHMARK(BM_WorldBuilder_StandardBoard);
