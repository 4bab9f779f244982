// Ticket: 0003_rigid_body_stepper
// Test: SemiImplicitEulerIntegrator

#include <gtest/gtest.h>

#include "pachinko-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"

using namespace pachinko_sim;

namespace
{

Body makeBall(double airFriction)
{
  MaterialProperties material;
  material.setAirFriction(airFriction);
  return Body::createDynamic(
    CircleShape{12.0}, Coordinate{0.0, 0.0}, 1.0, material, BallTag{});
}

}  // namespace

TEST(SemiImplicitEulerIntegrator, PositionUsesUpdatedVelocity)
{
  Body ball = makeBall(0.0);
  SemiImplicitEulerIntegrator integrator;

  integrator.step(ball, Coordinate{0.0, 0.5}, 1.0);

  EXPECT_DOUBLE_EQ(ball.getVelocity().y(), 0.5);
  EXPECT_DOUBLE_EQ(ball.getPosition().y(), 0.5);

  integrator.step(ball, Coordinate{0.0, 0.5}, 1.0);

  EXPECT_DOUBLE_EQ(ball.getVelocity().y(), 1.0);
  EXPECT_DOUBLE_EQ(ball.getPosition().y(), 1.5);
}

TEST(SemiImplicitEulerIntegrator, AirFriction_DampsVelocity)
{
  Body ball = makeBall(0.01);
  ball.setVelocity(Velocity{10.0, 0.0});
  SemiImplicitEulerIntegrator integrator;

  integrator.step(ball, Coordinate{0.0, 0.0}, 1.0);

  EXPECT_NEAR(ball.getVelocity().x(), 9.9, 1e-12);
  EXPECT_NEAR(ball.getPosition().x(), 9.9, 1e-12);
}

TEST(SemiImplicitEulerIntegrator, HalfStep_HalvesDisplacement)
{
  Body ball = makeBall(0.0);
  ball.setVelocity(Velocity{4.0, 0.0});
  SemiImplicitEulerIntegrator integrator;

  integrator.step(ball, Coordinate{0.0, 0.0}, 0.5);

  EXPECT_DOUBLE_EQ(ball.getPosition().x(), 2.0);
}

TEST(SemiImplicitEulerIntegrator, StaticBody_Ignored)
{
  Body peg = Body::createStatic(CircleShape{8.0},
                                Coordinate{5.0, 5.0},
                                MaterialProperties{},
                                PegTag{PegId{0, 0}});
  SemiImplicitEulerIntegrator integrator;

  integrator.step(peg, Coordinate{0.0, 0.5}, 1.0);

  EXPECT_DOUBLE_EQ(peg.getPosition().x(), 5.0);
  EXPECT_DOUBLE_EQ(peg.getPosition().y(), 5.0);
}
