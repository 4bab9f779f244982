// Ticket: 0008_stability_controller
// Ticket: 0011_reproducible_stall_corrections
// Ticket: 0012_progress_window
// Test: StabilityController detectors and corrections

#include <gtest/gtest.h>

#include <cmath>
#include <vector>

#include "pachinko-sim/src/Game/StabilityController.hpp"

using namespace pachinko_sim;

namespace
{

constexpr double kBoardWidth = 500.0;
constexpr double kBoardHeight = 700.0;

WorldModel::Config zeroGravity()
{
  WorldModel::Config config;
  config.gravityScale = 0.0;
  return config;
}

size_t countKind(const std::vector<CorrectionRecord>& records,
                 CorrectionKind kind)
{
  size_t count = 0;
  for (const auto& record : records)
  {
    count += record.kind == kind ? 1 : 0;
  }
  return count;
}

}  // namespace

/**
 * @brief Single ball in an otherwise empty world; the world is never
 * stepped, so only the controller changes the ball state
 */
class StabilityControllerTest : public ::testing::Test
{
protected:
  BodyId addBall(const Coordinate& position, double radius = 12.0)
  {
    return world_.addBody(Body::createDynamic(
      CircleShape{radius}, position, 1.0, MaterialProperties{}, BallTag{}));
  }

  // Only the corner detector can fire
  static StabilityController::Config cornerOnly()
  {
    StabilityController::Config config;
    config.stallFramesThreshold = 100000;
    config.progressWindowTicks = 100000;
    return config;
  }

  void begin(StabilityController& controller, BodyId ball, uint32_t seed)
  {
    controller.beginDrop(
      seed, 7, world_.getPosition(ball), world_.getVelocity(ball));
  }

  WorldModel world_{zeroGravity()};
};

// ============================================================================
// Stall nudge
// ============================================================================

TEST_F(StabilityControllerTest, StalledBall_ReceivesDownwardNudge)
{
  BodyId const ball = addBall(Coordinate{250.0, 300.0});
  StabilityController controller;
  begin(controller, ball, 42);

  uint64_t tick = 0;
  while (controller.getCorrections().empty() && tick < 100)
  {
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, ++tick);
  }

  ASSERT_EQ(controller.getCorrections().size(), 1u);
  const auto& nudge = controller.getCorrections().front();
  EXPECT_EQ(nudge.kind, CorrectionKind::Nudge);
  EXPECT_GT(nudge.velocityAfter.y(), 0.0);
  EXPECT_LE(nudge.velocityAfter.norm(), 1.5 + 0.6 + 1e-9);
  EXPECT_EQ(controller.getState().nudgeCount, 1);
  // Peg-trap penalty accelerates detection past one stall frame per tick
  EXPECT_LT(tick, 41u);
}

TEST_F(StabilityControllerTest, RepeatedNudges_StayWithinFixedRange)
{
  BodyId const ball = addBall(Coordinate{250.0, 300.0});
  StabilityController::Config config;
  config.progressWindowTicks = 100000;
  StabilityController controller{config};
  begin(controller, ball, 9);

  for (uint64_t tick = 1; tick <= 600; ++tick)
  {
    // Held in place: every nudge is absorbed
    world_.setVelocity(ball, Velocity{0.0, 0.0});
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
  }

  const auto& corrections = controller.getCorrections();
  ASSERT_GE(corrections.size(), 10u);
  for (const auto& nudge : corrections)
  {
    ASSERT_EQ(nudge.kind, CorrectionKind::Nudge);
    // Strength in [0.8, 1.5], angle within +-0.3 pi of straight down
    EXPECT_LE(nudge.velocityAfter.norm(), 1.5 + 0.6 + 1e-9);
    EXPECT_GT(nudge.velocityAfter.y(), 0.6);
    EXPECT_LE(std::abs(nudge.velocityAfter.x()), 1.5);
  }
}

TEST_F(StabilityControllerTest, SameSeed_SameCorrections)
{
  auto run = [](uint32_t seed)
  {
    WorldModel world{zeroGravity()};
    BodyId const ball = world.addBody(Body::createDynamic(CircleShape{12.0},
                                                          Coordinate{250.0, 300.0},
                                                          1.0,
                                                          MaterialProperties{},
                                                          BallTag{}));
    StabilityController controller;
    controller.beginDrop(seed, 3, world.getPosition(ball), world.getVelocity(ball));
    for (uint64_t tick = 1; tick <= 200; ++tick)
    {
      world.setVelocity(ball, Velocity{0.0, 0.0});
      controller.preStep(world, ball, 500.0, 700.0, tick);
    }
    return controller.getCorrections();
  };

  auto const first = run(1234);
  auto const second = run(1234);
  auto const other = run(4321);

  ASSERT_FALSE(first.empty());
  ASSERT_EQ(first.size(), second.size());
  for (size_t i = 0; i < first.size(); ++i)
  {
    EXPECT_EQ(first[i].tick, second[i].tick);
    EXPECT_EQ(first[i].kind, second[i].kind);
    EXPECT_DOUBLE_EQ(first[i].velocityAfter.x(), second[i].velocityAfter.x());
    EXPECT_DOUBLE_EQ(first[i].velocityAfter.y(), second[i].velocityAfter.y());
  }

  ASSERT_FALSE(other.empty());
  EXPECT_NE(first.front().velocityAfter.x(), other.front().velocityAfter.x());
}

// ============================================================================
// Jitter
// ============================================================================

TEST_F(StabilityControllerTest, OscillatingBall_DampedAndPushedDown)
{
  BodyId const ball = addBall(Coordinate{250.0, 300.0});
  world_.setVelocity(ball, Velocity{-0.1, 0.0});
  StabilityController controller;
  begin(controller, ball, 5);

  double sign = 1.0;
  for (uint64_t tick = 1; tick <= 9; ++tick)
  {
    world_.setVelocity(ball, Velocity{0.1 * sign, 0.0});
    sign = -sign;
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
  }

  ASSERT_EQ(controller.getCorrections().size(), 1u);
  const auto& jitter = controller.getCorrections().front();
  EXPECT_EQ(jitter.kind, CorrectionKind::Jitter);
  EXPECT_EQ(jitter.tick, 9u);
  EXPECT_NEAR(jitter.velocityAfter.x(), 0.85 * jitter.velocityBefore.x(), 1e-12);
  EXPECT_DOUBLE_EQ(jitter.velocityAfter.y(), 0.8);
  EXPECT_EQ(controller.getState().jitterCount, 0);
}

// ============================================================================
// Corner escape
// ============================================================================

TEST_F(StabilityControllerTest, WedgedAtLeftWall_EscapesRight)
{
  // Where the boundary clamp leaves a default ball: 12 + 2 + 0.5
  BodyId const ball = addBall(Coordinate{14.5, 300.0});
  StabilityController controller{cornerOnly()};
  begin(controller, ball, 1);

  for (uint64_t tick = 1; tick <= 80; ++tick)
  {
    world_.setVelocity(ball, Velocity{0.0, 0.0});
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
  }

  const auto& corrections = controller.getCorrections();
  ASSERT_EQ(corrections.size(), 1u);
  const auto& escape = corrections.front();
  EXPECT_EQ(escape.kind, CorrectionKind::CornerEscape);
  EXPECT_EQ(escape.tick, 61u);
  EXPECT_DOUBLE_EQ(escape.velocityAfter.x(), 2.0);
  EXPECT_DOUBLE_EQ(escape.velocityAfter.y(), 1.0);
  EXPECT_NEAR(escape.position.x(), 15.5, 1e-12);
}

TEST_F(StabilityControllerTest, WedgedAtRightWall_EscapesLeft)
{
  // Resting against the right wall face
  BodyId const ball = addBall(Coordinate{488.0, 300.0});
  StabilityController controller{cornerOnly()};
  begin(controller, ball, 1);

  for (uint64_t tick = 1; tick <= 80; ++tick)
  {
    world_.setVelocity(ball, Velocity{0.0, 0.0});
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
  }

  const auto& corrections = controller.getCorrections();
  EXPECT_EQ(countKind(corrections, CorrectionKind::BoundaryClamp), 1u);
  ASSERT_EQ(countKind(corrections, CorrectionKind::CornerEscape), 1u);
  EXPECT_DOUBLE_EQ(corrections.back().velocityAfter.x(), -2.0);
  // Clamped to 485.5, then moved 1 px away from the wall
  EXPECT_NEAR(world_.getPosition(ball).x(), 484.5, 1e-12);
}

TEST_F(StabilityControllerTest, WhaleAgainstLeftWall_EscapesRight)
{
  double const radius = 13.2;
  BodyId const ball = addBall(Coordinate{radius + 0.1, 300.0}, radius);
  StabilityController controller{cornerOnly()};
  begin(controller, ball, 1);

  for (uint64_t tick = 1; tick <= 1000; ++tick)
  {
    world_.setVelocity(ball, Velocity{0.0, 0.0});
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
  }

  const auto& corrections = controller.getCorrections();
  ASSERT_GE(corrections.size(), 2u);
  EXPECT_EQ(corrections[0].kind, CorrectionKind::BoundaryClamp);
  EXPECT_EQ(corrections[1].kind, CorrectionKind::CornerEscape);
  EXPECT_EQ(corrections[1].tick, 61u);
  EXPECT_GE(countKind(corrections, CorrectionKind::CornerEscape), 10u);
  EXPECT_GT(world_.getPosition(ball).x(), radius + 2.5);
}

TEST_F(StabilityControllerTest, AwayFromWalls_NoCornerEscape)
{
  BodyId const ball = addBall(Coordinate{40.0, 300.0});
  StabilityController controller{cornerOnly()};
  begin(controller, ball, 1);

  for (uint64_t tick = 1; tick <= 200; ++tick)
  {
    world_.setVelocity(ball, Velocity{0.0, 0.0});
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
  }

  EXPECT_TRUE(controller.getCorrections().empty());
  EXPECT_EQ(controller.getState().cornerFrames, 0);
}

// ============================================================================
// Progress window
// ============================================================================

TEST_F(StabilityControllerTest, NoProgress_HopsUpward)
{
  BodyId const ball = addBall(Coordinate{250.0, 300.0});
  StabilityController::Config config;
  config.stallFramesThreshold = 100000;
  StabilityController controller{config};
  begin(controller, ball, 21);

  for (uint64_t tick = 1; tick <= 45; ++tick)
  {
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
  }

  const auto& corrections = controller.getCorrections();
  ASSERT_EQ(corrections.size(), 1u);
  const auto& hop = corrections.front();
  EXPECT_EQ(hop.kind, CorrectionKind::Dislodge);
  EXPECT_EQ(hop.tick, 45u);
  EXPECT_DOUBLE_EQ(hop.velocityAfter.y(), -8.5);
  EXPECT_GE(std::abs(hop.velocityAfter.x()), 2.5);
  EXPECT_LT(std::abs(hop.velocityAfter.x()), 3.5);
  EXPECT_EQ(controller.getState().dislodgeCount, 1);
  EXPECT_DOUBLE_EQ(controller.getState().pendingLateral, 0.0);
}

TEST_F(StabilityControllerTest, SteadyProgress_NoHop)
{
  BodyId const ball = addBall(Coordinate{250.0, 100.0});
  world_.setVelocity(ball, Velocity{0.0, 0.2});
  StabilityController::Config config;
  config.stallFramesThreshold = 100000;
  StabilityController controller{config};
  begin(controller, ball, 21);

  for (uint64_t tick = 1; tick <= 300; ++tick)
  {
    // Slow but steady: 0.2 px per tick
    world_.setPosition(ball, world_.getPosition(ball) + Coordinate{0.0, 0.2});
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
  }

  EXPECT_EQ(countKind(controller.getCorrections(), CorrectionKind::Dislodge),
            0u);
}

TEST_F(StabilityControllerTest, NoProgressAtWall_RisesThenKicksInward)
{
  BodyId const ball = addBall(Coordinate{485.5, 300.0});
  StabilityController::Config config = cornerOnly();
  config.progressWindowTicks = 45;
  config.cornerFramesThreshold = 100000;
  StabilityController controller{config};
  begin(controller, ball, 3);

  for (uint64_t tick = 1; tick <= 45; ++tick)
  {
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
  }

  ASSERT_EQ(controller.getCorrections().size(), 1u);
  const auto& hop = controller.getCorrections().front();
  EXPECT_EQ(hop.kind, CorrectionKind::Dislodge);
  EXPECT_DOUBLE_EQ(hop.velocityAfter.x(), 0.0);
  EXPECT_DOUBLE_EQ(hop.velocityAfter.y(), -8.5);
  double const pending = controller.getState().pendingLateral;
  EXPECT_LE(pending, -2.5);
  EXPECT_GT(pending, -3.5);

  // Still rising: kick held back
  world_.setVelocity(ball, Velocity{0.0, -1.0});
  controller.preStep(world_, ball, kBoardWidth, kBoardHeight, 46);
  EXPECT_EQ(controller.getCorrections().size(), 1u);

  // Top of the hop
  world_.setVelocity(ball, Velocity{0.0, 0.1});
  controller.preStep(world_, ball, kBoardWidth, kBoardHeight, 47);

  ASSERT_EQ(controller.getCorrections().size(), 2u);
  const auto& kick = controller.getCorrections().back();
  EXPECT_EQ(kick.kind, CorrectionKind::LateralKick);
  EXPECT_DOUBLE_EQ(kick.velocityAfter.x(), pending);
  EXPECT_DOUBLE_EQ(kick.velocityAfter.y(), 0.1);
  EXPECT_DOUBLE_EQ(controller.getState().pendingLateral, 0.0);
}

// ============================================================================
// Bottom margin
// ============================================================================

TEST_F(StabilityControllerTest, InsideBottomMargin_NoPerturbation)
{
  BodyId const ball = addBall(Coordinate{250.0, 650.0});
  StabilityController controller;
  begin(controller, ball, 11);

  for (uint64_t tick = 1; tick <= 300; ++tick)
  {
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
  }

  EXPECT_TRUE(controller.getCorrections().empty());
  EXPECT_EQ(controller.getState().stallFrames, 0);
  EXPECT_EQ(controller.getState().cornerFrames, 0);
  EXPECT_EQ(controller.getState().jitterCount, 0);
}

TEST_F(StabilityControllerTest, FastBall_CountersStayAtZero)
{
  BodyId const ball = addBall(Coordinate{250.0, 300.0});
  world_.setVelocity(ball, Velocity{0.0, 3.0});
  StabilityController controller;
  begin(controller, ball, 11);

  for (uint64_t tick = 1; tick <= 50; ++tick)
  {
    controller.preStep(world_, ball, kBoardWidth, kBoardHeight, tick);
    EXPECT_GE(controller.getState().stallFrames, 0);
    EXPECT_GE(controller.getState().cornerFrames, 0);
    EXPECT_GE(controller.getState().jitterCount, 0);
  }
  EXPECT_EQ(controller.getState().stallFrames, 0);
}

// ============================================================================
// Boundary clamp
// ============================================================================

TEST_F(StabilityControllerTest, ClampToBoundary_LeftRightTop)
{
  StabilityController controller;
  BodyId const left = addBall(Coordinate{5.0, 300.0});
  BodyId const right = addBall(Coordinate{495.0, 300.0});
  BodyId const top = addBall(Coordinate{250.0, -10.0});
  BodyId const inside = addBall(Coordinate{250.0, 300.0});
  world_.setVelocity(left, Velocity{-3.0, 1.0});
  world_.setVelocity(right, Velocity{2.0, -1.0});
  world_.setVelocity(top, Velocity{1.0, -4.0});
  world_.setVelocity(inside, Velocity{-3.0, -3.0});

  EXPECT_TRUE(controller.clampToBoundary(world_, left, kBoardWidth, 1));
  EXPECT_TRUE(controller.clampToBoundary(world_, right, kBoardWidth, 1));
  EXPECT_TRUE(controller.clampToBoundary(world_, top, kBoardWidth, 1));
  EXPECT_FALSE(controller.clampToBoundary(world_, inside, kBoardWidth, 1));

  // radius 12 + padding 2 + offset 0.5
  EXPECT_DOUBLE_EQ(world_.getPosition(left).x(), 14.5);
  EXPECT_DOUBLE_EQ(world_.getPosition(right).x(), 485.5);
  EXPECT_DOUBLE_EQ(world_.getPosition(top).y(), 14.5);
  EXPECT_EQ(countKind(controller.getCorrections(), CorrectionKind::BoundaryClamp),
            3u);

  // Outward components dropped, the rest kept
  EXPECT_DOUBLE_EQ(world_.getVelocity(left).x(), 0.0);
  EXPECT_DOUBLE_EQ(world_.getVelocity(left).y(), 1.0);
  EXPECT_DOUBLE_EQ(world_.getVelocity(right).x(), 0.0);
  EXPECT_DOUBLE_EQ(world_.getVelocity(right).y(), -1.0);
  EXPECT_DOUBLE_EQ(world_.getVelocity(top).x(), 1.0);
  EXPECT_DOUBLE_EQ(world_.getVelocity(top).y(), 0.0);
  EXPECT_DOUBLE_EQ(world_.getVelocity(inside).x(), -3.0);
}

TEST_F(StabilityControllerTest, ClampToBoundary_InwardVelocityKept)
{
  StabilityController controller;
  BodyId const left = addBall(Coordinate{5.0, 300.0});
  world_.setVelocity(left, Velocity{2.0, 0.5});

  EXPECT_TRUE(controller.clampToBoundary(world_, left, kBoardWidth, 1));

  EXPECT_DOUBLE_EQ(world_.getVelocity(left).x(), 2.0);
  EXPECT_DOUBLE_EQ(world_.getVelocity(left).y(), 0.5);
}

TEST_F(StabilityControllerTest, CorrectionLog_CappedButCorrectionsApplied)
{
  StabilityController::Config config;
  config.maxCorrections = 3;
  StabilityController controller{config};
  BodyId const ball = addBall(Coordinate{5.0, 300.0});
  begin(controller, ball, 1);

  for (uint64_t tick = 1; tick <= 5; ++tick)
  {
    world_.setPosition(ball, Coordinate{5.0, 300.0});
    EXPECT_TRUE(controller.clampToBoundary(world_, ball, kBoardWidth, tick));
    EXPECT_DOUBLE_EQ(world_.getPosition(ball).x(), 14.5);
  }

  ASSERT_EQ(controller.getCorrections().size(), 3u);
  EXPECT_EQ(controller.getCorrections().back().tick, 3u);

  begin(controller, ball, 2);
  world_.setPosition(ball, Coordinate{5.0, 300.0});
  EXPECT_TRUE(controller.clampToBoundary(world_, ball, kBoardWidth, 6));
  EXPECT_EQ(controller.getCorrections().size(), 1u);
}

// ============================================================================
// Overlap resolution
// ============================================================================

class OverlapResolutionTest : public StabilityControllerTest
{
protected:
  void SetUp() override
  {
    peg_ = world_.addBody(Body::createStatic(CircleShape{8.0},
                                             Coordinate{100.0, 100.0},
                                             MaterialProperties{},
                                             PegTag{PegId{0, 0}}));
    sensor_ = world_.addBody(
      Body::createStatic(PolygonShape::rectangle(90.0, 30.0),
                         Coordinate{100.0, 80.0},
                         MaterialProperties{},
                         BucketTag{0},
                         true));
    // 5 px into the peg, directly above it
    ball_ = addBall(Coordinate{100.0, 85.0});
  }

  BodyId peg_{0};
  BodyId sensor_{0};
  BodyId ball_{0};
};

TEST_F(OverlapResolutionTest, SlowBall_PushedOutAndBoosted)
{
  StabilityController controller;

  controller.resolveOverlaps(world_, ball_, {{peg_, ball_}}, 3);

  EXPECT_NEAR(world_.getPosition(ball_).x(), 100.0, 1e-12);
  EXPECT_NEAR(world_.getPosition(ball_).y(), 85.0 - 5.0 * 1.2, 1e-12);
  EXPECT_NEAR(world_.getVelocity(ball_).y(), -0.3 + 0.2, 1e-12);
  ASSERT_EQ(controller.getCorrections().size(), 1u);
  EXPECT_EQ(controller.getCorrections()[0].kind, CorrectionKind::OverlapPush);
  EXPECT_EQ(controller.getCorrections()[0].tick, 3u);
}

TEST_F(OverlapResolutionTest, FastBall_PushedWithoutBoost)
{
  world_.setVelocity(ball_, Velocity{3.0, 0.0});
  StabilityController controller;

  controller.resolveOverlaps(world_, ball_, {{peg_, ball_}}, 3);

  EXPECT_NEAR(world_.getPosition(ball_).y(), 79.0, 1e-12);
  EXPECT_DOUBLE_EQ(world_.getVelocity(ball_).x(), 3.0);
  EXPECT_DOUBLE_EQ(world_.getVelocity(ball_).y(), 0.0);
}

TEST_F(OverlapResolutionTest, SensorAndForeignPairs_Ignored)
{
  StabilityController controller;

  controller.resolveOverlaps(
    world_, ball_, {{peg_, sensor_}, {sensor_, ball_}}, 3);

  EXPECT_DOUBLE_EQ(world_.getPosition(ball_).y(), 85.0);
  EXPECT_TRUE(controller.getCorrections().empty());
}

TEST_F(OverlapResolutionTest, PolygonContacts_LeftToSolver)
{
  BodyId const divider =
    world_.addBody(Body::createStatic(PolygonShape::rectangle(8.0, 80.0),
                                      Coordinate{100.0, 130.0},
                                      MaterialProperties{},
                                      DividerTag{0}));
  world_.setPosition(ball_, Coordinate{100.0, 82.0});
  StabilityController controller;

  controller.resolveOverlaps(world_, ball_, {{divider, ball_}}, 3);

  EXPECT_DOUBLE_EQ(world_.getPosition(ball_).y(), 82.0);
  EXPECT_DOUBLE_EQ(world_.getVelocity(ball_).y(), 0.0);
  EXPECT_TRUE(controller.getCorrections().empty());
}

TEST_F(OverlapResolutionTest, SeparatedPair_NoCorrection)
{
  world_.setPosition(ball_, Coordinate{100.0, 50.0});
  StabilityController controller;

  controller.resolveOverlaps(world_, ball_, {{peg_, ball_}}, 3);

  EXPECT_TRUE(controller.getCorrections().empty());
}

TEST_F(StabilityControllerTest, BeginDrop_ClearsLogAndState)
{
  BodyId const ball = addBall(Coordinate{5.0, 300.0});
  StabilityController controller;
  begin(controller, ball, 1);
  EXPECT_TRUE(controller.clampToBoundary(world_, ball, kBoardWidth, 1));

  begin(controller, ball, 2);

  EXPECT_TRUE(controller.getCorrections().empty());
  EXPECT_EQ(controller.getState().dropSeed, 2u);
  EXPECT_EQ(controller.getState().nudgeCount, 0);
  EXPECT_EQ(controller.getState().dislodgeCount, 0);
  EXPECT_EQ(controller.getState().windowTicks, 0);
}
