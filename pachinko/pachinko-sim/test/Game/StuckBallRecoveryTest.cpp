// Ticket: 0012_progress_window
// Test: Balls resting in known pockets of the standard board get free

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "pachinko-sim/src/Board/BallClass.hpp"
#include "pachinko-sim/src/Board/BoardConfig.hpp"
#include "pachinko-sim/src/Board/WorldBuilder.hpp"
#include "pachinko-sim/src/Game/StabilityController.hpp"

using namespace pachinko_sim;

namespace
{

constexpr int kEscapeBudget = 600;

size_t countDislodges(const StabilityController& controller)
{
  size_t count = 0;
  for (const auto& record : controller.getCorrections())
  {
    count += record.kind == CorrectionKind::Dislodge ? 1 : 0;
  }
  return count;
}

/**
 * @brief Standard board with one ball placed at rest; ticks the way the
 * engine does (preStep, world step, overlap pass, clamp)
 */
struct RestingBall
{
  RestingBall(const std::string& classId,
              const Coordinate& position,
              uint32_t seed)
    : board{BoardConfig::standard()}, classes{BallClassTable::standard()}
  {
    const BallClassConfig& ballClass = classes.lookup(classId);
    world.setGravityScale(0.002 * ballClass.speedMultiplier);
    buildWorld(board, world);

    ball = world.addBody(Body::createDynamic(CircleShape{ballClass.radius()},
                                             position,
                                             ballClass.bodyMass(),
                                             ballClass.material(),
                                             BallTag{}));
    controller.beginDrop(
      seed, seed % 1000, world.getPosition(ball), world.getVelocity(ball));
  }

  // Bucket index once the ball enters a sensor within maxTicks
  std::optional<std::size_t> runUntilLanded(int maxTicks)
  {
    for (uint64_t tick = 1; tick <= static_cast<uint64_t>(maxTicks); ++tick)
    {
      controller.preStep(world, ball, board.width, board.height, tick);
      StepEvents const events = world.step(1000.0 / 60.0);

      for (const auto& pair : events.began)
      {
        if (pair.bodyA != ball && pair.bodyB != ball)
        {
          continue;
        }
        BodyId const other = pair.bodyA == ball ? pair.bodyB : pair.bodyA;
        if (const auto* bucket =
              std::get_if<BucketTag>(&world.getBody(other).getTag()))
        {
          return bucket->index;
        }
      }

      controller.resolveOverlaps(world, ball, events.active, tick);
      controller.clampToBoundary(world, ball, board.width, tick);
    }
    return std::nullopt;
  }

  BoardConfig board;
  BallClassTable classes;
  WorldModel world;
  StabilityController controller;
  BodyId ball{0};
};

}  // namespace

// ============================================================================
// Divider tops
// ============================================================================

TEST(StuckBallRecovery, DefaultOnLeftDividerTop_Lands)
{
  for (uint32_t const seed : {1u, 42u, 1234u, 99999u})
  {
    RestingBall scene{"default", Coordinate{201.0, 608.0}, seed};

    auto const bucket = scene.runUntilLanded(kEscapeBudget);

    ASSERT_TRUE(bucket.has_value()) << "seed " << seed;
    EXPECT_GE(countDislodges(scene.controller), 1u) << "seed " << seed;
  }
}

TEST(StuckBallRecovery, DefaultOnRightDividerTop_Lands)
{
  for (uint32_t const seed : {1u, 42u, 1234u, 99999u})
  {
    RestingBall scene{"default", Coordinate{298.0, 608.0}, seed};

    EXPECT_TRUE(scene.runUntilLanded(kEscapeBudget).has_value())
      << "seed " << seed;
  }
}

// ============================================================================
// Wall pockets
// ============================================================================

TEST(StuckBallRecovery, DegenAboveRightDeflector_Lands)
{
  // Between the wall, the deflector apex at (485, 498) and the last peg of
  // row 8; the only exit is straight up along the wall
  for (uint32_t const seed : {1u, 42u, 1234u, 99999u})
  {
    RestingBall scene{"degen", Coordinate{489.1, 491.0}, seed};

    EXPECT_TRUE(scene.runUntilLanded(kEscapeBudget).has_value())
      << "seed " << seed;

    bool kicked = false;
    for (const auto& record : scene.controller.getCorrections())
    {
      if (record.kind == CorrectionKind::LateralKick)
      {
        kicked = true;
        EXPECT_LT(record.velocityAfter.x(), 0.0) << "seed " << seed;
      }
    }
    EXPECT_TRUE(kicked) << "seed " << seed;
  }
}

TEST(StuckBallRecovery, DefaultBesideLeftDeflector_Lands)
{
  for (uint32_t const seed : {1u, 42u, 1234u, 99999u})
  {
    RestingBall scene{"default", Coordinate{36.0, 418.6}, seed};

    EXPECT_TRUE(scene.runUntilLanded(kEscapeBudget).has_value())
      << "seed " << seed;
  }
}
