// Ticket: 0008_stability_controller
// Ticket: 0011_reproducible_stall_corrections
// Test: Full drops on the standard board: termination, single landing,
// reproducibility and containment

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include "pachinko-sim/test/Helpers/DropScenario.hpp"

using namespace pachinko_sim;
using pachinko_sim::test::DropOutcome;
using pachinko_sim::test::DropScenario;

namespace
{

const std::vector<std::string> kClasses{"whale", "degen", "default"};
const std::vector<double> kDropXs{60.0, 150.0, 250.0, 350.0, 440.0};
const std::vector<uint32_t> kSeeds{
  1, 42, 777, 1234, 9001, 31337, 54321, 99999};

}  // namespace

// ============================================================================
// Termination
// ============================================================================

TEST(EngineScenario, Termination_AtLeast99PercentLandWithin2000Ticks)
{
  int trials = 0;
  int landed = 0;

  for (const auto& classId : kClasses)
  {
    DropScenario scenario{classId};
    for (double const x : kDropXs)
    {
      for (uint32_t const seed : kSeeds)
      {
        DropOutcome const outcome = scenario.runDrop(x, seed, 2000);
        ++trials;
        if (outcome.landed)
        {
          ++landed;
        }
        else
        {
          ADD_FAILURE() << "No landing: class " << classId << " x " << x
                        << " seed " << seed;
        }
      }
    }
  }

  // Individual misses are reported above; the contract is statistical
  EXPECT_GE(static_cast<double>(landed), 0.99 * trials)
    << landed << " of " << trials << " drops landed";
}

// ============================================================================
// Single landing
// ============================================================================

TEST(EngineScenario, SingleLanding_OneBucketEventPerDrop)
{
  DropScenario scenario{"default"};

  for (uint32_t const seed : kSeeds)
  {
    DropOutcome const outcome = scenario.runDrop(250.0, seed);
    ASSERT_TRUE(outcome.landed) << "seed " << seed;
    EXPECT_EQ(outcome.bucketLandEvents, 1) << "seed " << seed;
    EXPECT_EQ(outcome.ballDroppedEvents, 1) << "seed " << seed;

    // Keep ticking the landed session; nothing more may land
    for (int i = 0; i < 120; ++i)
    {
      scenario.engine().tick();
    }
    for (const auto& event : scenario.engine().drainEvents())
    {
      EXPECT_FALSE(std::holds_alternative<BucketLandEvent>(event));
    }
  }
}

// ============================================================================
// Reproducibility
// ============================================================================

TEST(EngineScenario, SameSeed_SameCorrectionSequence)
{
  for (const auto& classId : kClasses)
  {
    DropScenario first{classId};
    DropScenario second{classId};

    DropOutcome const a = first.runDrop(60.0, 4242);
    DropOutcome const b = second.runDrop(60.0, 4242);

    ASSERT_EQ(a.corrections.size(), b.corrections.size()) << classId;
    for (size_t i = 0; i < a.corrections.size(); ++i)
    {
      const auto& ca = a.corrections[i];
      const auto& cb = b.corrections[i];
      EXPECT_EQ(ca.tick, cb.tick) << classId << " #" << i;
      EXPECT_EQ(ca.kind, cb.kind) << classId << " #" << i;
      EXPECT_DOUBLE_EQ(ca.position.x(), cb.position.x());
      EXPECT_DOUBLE_EQ(ca.position.y(), cb.position.y());
      EXPECT_DOUBLE_EQ(ca.velocityAfter.x(), cb.velocityAfter.x());
      EXPECT_DOUBLE_EQ(ca.velocityAfter.y(), cb.velocityAfter.y());
    }

    EXPECT_EQ(a.ticks, b.ticks) << classId;
    EXPECT_EQ(a.pegHitEvents, b.pegHitEvents) << classId;
    ASSERT_EQ(a.landing.has_value(), b.landing.has_value());
    if (a.landing)
    {
      EXPECT_EQ(a.landing->bucketIndex, b.landing->bucketIndex) << classId;
    }
  }
}

TEST(EngineScenario, SameSeed_ReusedEngine_SameOutcome)
{
  DropScenario scenario{"default"};

  DropOutcome const a = scenario.runDrop(180.0, 777);
  DropOutcome const b = scenario.runDrop(180.0, 777);

  // Engine tick stamps differ between drops; the physics must not
  EXPECT_EQ(a.ticks, b.ticks);
  EXPECT_EQ(a.pegHitEvents, b.pegHitEvents);
  ASSERT_EQ(a.corrections.size(), b.corrections.size());
  for (size_t i = 0; i < a.corrections.size(); ++i)
  {
    EXPECT_EQ(a.corrections[i].kind, b.corrections[i].kind);
    EXPECT_EQ(a.corrections[i].tick - a.corrections.front().tick,
              b.corrections[i].tick - b.corrections.front().tick);
  }
}

// ============================================================================
// Containment and counters
// ============================================================================

TEST(EngineScenario, BoundaryContainment_EveryTick)
{
  for (const auto& classId : kClasses)
  {
    DropScenario scenario{classId};
    for (double const x : kDropXs)
    {
      DropOutcome const outcome = scenario.runDrop(x, 2718);
      EXPECT_GE(outcome.minSideClearance, 0.0)
        << classId << " x " << x;
      EXPECT_GE(outcome.minTopClearance, 0.0) << classId << " x " << x;
    }
  }
}

TEST(EngineScenario, ExtremeLeftDrops_NeverNegativeX)
{
  DropScenario scenario{"default"};

  for (uint32_t seed = 1; seed <= 20; ++seed)
  {
    DropOutcome const outcome = scenario.runDrop(-1000.0, seed);
    EXPECT_GT(outcome.minX, 0.0) << "seed " << seed;
  }
}

TEST(EngineScenario, Counters_NeverNegativeDuringDrop)
{
  DropScenario scenario{"whale"};
  Engine& engine = scenario.engine();
  ASSERT_TRUE(engine.drop(440.0, 161803));

  for (int i = 0; i < 2000 && engine.getState() == SessionState::Dropping; ++i)
  {
    engine.tick();
    const auto& state = engine.getStabilityState();
    ASSERT_GE(state.stallFrames, 0);
    ASSERT_GE(state.cornerFrames, 0);
    ASSERT_GE(state.jitterCount, 0);
  }
}

// ============================================================================
// Reference board
// ============================================================================

TEST(EngineScenario, CentreDrop_StandardBoard_LandsInConfiguredBucket)
{
  DropScenario scenario{"default"};

  DropOutcome const outcome = scenario.runDrop(250.0, 20240601);

  ASSERT_TRUE(outcome.landed);
  ASSERT_TRUE(outcome.landing.has_value());
  EXPECT_GE(outcome.landing->totalPegHits, 0);
  EXPECT_EQ(outcome.landing->totalPegHits, outcome.pegHitEvents);

  std::vector<double> const multipliers{1.0, 2.0, 1.5, 5.0, 1.0};
  EXPECT_NE(std::find(multipliers.begin(),
                      multipliers.end(),
                      outcome.landing->bucket.multiplier),
            multipliers.end());
  EXPECT_LT(outcome.landing->bucketIndex, 5u);
}
