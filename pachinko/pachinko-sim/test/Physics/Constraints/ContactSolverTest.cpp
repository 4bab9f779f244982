// Ticket: 0003_rigid_body_stepper
// Test: sequential impulse solver and position correction

#include <gtest/gtest.h>

#include <vector>

#include "pachinko-sim/src/Physics/Collision/CollisionHandler.hpp"
#include "pachinko-sim/src/Physics/Constraints/ContactConstraint.hpp"
#include "pachinko-sim/src/Physics/Constraints/ContactSolver.hpp"
#include "pachinko-sim/src/Physics/Constraints/PositionCorrector.hpp"

using namespace pachinko_sim;

namespace
{

MaterialProperties bouncy(double e)
{
  MaterialProperties material;
  material.setCoefficientOfRestitution(e);
  return material;
}

Body makeBall(const Coordinate& position,
              const Velocity& velocity,
              const MaterialProperties& material = MaterialProperties{})
{
  Body ball = Body::createDynamic(
    CircleShape{12.0}, position, 1.0, material, BallTag{});
  ball.setVelocity(velocity);
  return ball;
}

// Top face at y = 90
Body makeFloor()
{
  return Body::createStatic(PolygonShape::rectangle(100.0, 20.0),
                            Coordinate{0.0, 100.0},
                            MaterialProperties{},
                            FloorTag{});
}

std::vector<ContactConstraint> contactsFor(Body& a,
                                           Body& b,
                                           double restingThreshold = 1.0)
{
  CollisionHandler const handler;
  auto const result = handler.checkCollision(a, b);
  std::vector<ContactConstraint> contacts;
  if (result)
  {
    contacts.push_back(contact_constraint_factory::createFromCollision(
      a, b, *result, restingThreshold));
  }
  return contacts;
}

}  // namespace

// ============================================================================
// Factory
// ============================================================================

TEST(ContactConstraintFactory, CombinesMaterials_MaxRestitutionMinFriction)
{
  MaterialProperties ballMaterial;
  ballMaterial.setCoefficientOfRestitution(0.4);
  ballMaterial.setFrictionCoefficient(0.005);
  ballMaterial.setSlop(0.02);

  Body ball = makeBall(Coordinate{0.0, 79.0}, Velocity{0.0, 5.0}, ballMaterial);
  Body floor = makeFloor();

  auto const contacts = contactsFor(ball, floor);
  ASSERT_EQ(contacts.size(), 1u);
  EXPECT_DOUBLE_EQ(contacts[0].restitution, 0.4);
  EXPECT_DOUBLE_EQ(contacts[0].friction, 0.005);
  EXPECT_DOUBLE_EQ(contacts[0].slop, 0.05);
}

TEST(ContactConstraintFactory, RelativeNormalVelocity_NegativeWhenApproaching)
{
  Body ball = makeBall(Coordinate{0.0, 79.0}, Velocity{0.0, 5.0});
  Body const floor = makeFloor();

  EXPECT_DOUBLE_EQ(contact_constraint_factory::computeRelativeNormalVelocity(
                     ball, floor, Coordinate{0.0, 1.0}),
                   -5.0);
}

// ============================================================================
// ContactSolver
// ============================================================================

TEST(ContactSolver, Impact_BouncesWithRestitution)
{
  Body ball = makeBall(Coordinate{0.0, 79.0}, Velocity{0.0, 5.0}, bouncy(0.5));
  Body floor = makeFloor();
  auto contacts = contactsFor(ball, floor);
  ASSERT_EQ(contacts.size(), 1u);

  ContactSolver const solver;
  solver.solve(contacts);

  EXPECT_NEAR(ball.getVelocity().x(), 0.0, 1e-12);
  EXPECT_NEAR(ball.getVelocity().y(), -2.5, 1e-12);
}

TEST(ContactSolver, SlowApproach_BelowRestingThreshold_Stops)
{
  Body ball = makeBall(Coordinate{0.0, 79.0}, Velocity{0.0, 0.5}, bouncy(0.9));
  Body floor = makeFloor();
  auto contacts = contactsFor(ball, floor);
  ASSERT_EQ(contacts.size(), 1u);

  ContactSolver const solver;
  solver.solve(contacts);

  EXPECT_NEAR(ball.getVelocity().y(), 0.0, 1e-12);
}

TEST(ContactSolver, Separating_NoImpulse)
{
  Body ball = makeBall(Coordinate{0.0, 79.0}, Velocity{1.0, -3.0});
  Body floor = makeFloor();
  auto contacts = contactsFor(ball, floor);
  ASSERT_EQ(contacts.size(), 1u);

  ContactSolver const solver;
  solver.solve(contacts);

  EXPECT_NEAR(ball.getVelocity().x(), 1.0, 1e-12);
  EXPECT_NEAR(ball.getVelocity().y(), -3.0, 1e-12);
  EXPECT_DOUBLE_EQ(contacts[0].normalImpulse, 0.0);
}

TEST(ContactSolver, Friction_BoundedByCoulombCone)
{
  // Default materials: friction 0.1, restitution 0
  Body ball = makeBall(Coordinate{0.0, 79.0}, Velocity{4.0, 5.0});
  Body floor = makeFloor();
  auto contacts = contactsFor(ball, floor);
  ASSERT_EQ(contacts.size(), 1u);

  ContactSolver const solver;
  solver.solve(contacts);

  // Normal impulse 5 (unit mass), friction removes at most 0.1 * 5
  EXPECT_NEAR(ball.getVelocity().y(), 0.0, 1e-12);
  EXPECT_NEAR(ball.getVelocity().x(), 3.5, 1e-12);
  EXPECT_NEAR(contacts[0].normalImpulse, 5.0, 1e-12);
}

TEST(ContactSolver, StaticBody_NeverMoves)
{
  Body ball = makeBall(Coordinate{0.0, 79.0}, Velocity{0.0, 5.0});
  Body floor = makeFloor();
  auto contacts = contactsFor(ball, floor);

  ContactSolver const solver;
  solver.solve(contacts);

  EXPECT_DOUBLE_EQ(floor.getVelocity().norm(), 0.0);
  EXPECT_DOUBLE_EQ(floor.getPosition().y(), 100.0);
}

// ============================================================================
// PositionCorrector
// ============================================================================

TEST(PositionCorrector, Penetration_ReducedToSlop)
{
  // Ball bottom at y = 95, 5 px into the floor
  Body ball = makeBall(Coordinate{0.0, 83.0}, Velocity{0.0, 0.0});
  Body floor = makeFloor();
  auto contacts = contactsFor(ball, floor);
  ASSERT_EQ(contacts.size(), 1u);

  CollisionHandler const handler;
  PositionCorrector const corrector;
  corrector.correctPositions(contacts, handler);

  auto const after = handler.checkCollision(ball, floor);
  ASSERT_TRUE(after.has_value());
  EXPECT_NEAR(after->penetrationDepth, 0.05, 1e-3);
  EXPECT_DOUBLE_EQ(floor.getPosition().y(), 100.0);
  EXPECT_DOUBLE_EQ(ball.getPosition().x(), 0.0);
  // Velocity untouched by position correction
  EXPECT_DOUBLE_EQ(ball.getVelocity().norm(), 0.0);
}

TEST(PositionCorrector, TwoDynamicBodies_SplitByInverseMass)
{
  Body a = makeBall(Coordinate{0.0, 0.0}, Velocity{0.0, 0.0});
  Body b = makeBall(Coordinate{20.0, 0.0}, Velocity{0.0, 0.0});
  auto contacts = contactsFor(a, b);
  ASSERT_EQ(contacts.size(), 1u);

  CollisionHandler const handler;
  PositionCorrector const corrector;
  corrector.correctPositions(contacts, handler);

  // Equal masses: centre of the pair stays put
  EXPECT_NEAR(a.getPosition().x() + b.getPosition().x(), 20.0, 1e-9);
  EXPECT_LT(a.getPosition().x(), 0.0);
  EXPECT_GT(b.getPosition().x(), 20.0);
}

TEST(PositionCorrector, WithinSlop_NothingMoves)
{
  // 0.01 px overlap, below the 0.05 px slop
  Body ball = makeBall(Coordinate{0.0, 78.01}, Velocity{0.0, 0.0});
  Body floor = makeFloor();
  auto contacts = contactsFor(ball, floor);
  ASSERT_EQ(contacts.size(), 1u);

  CollisionHandler const handler;
  PositionCorrector const corrector;
  corrector.correctPositions(contacts, handler);

  EXPECT_DOUBLE_EQ(ball.getPosition().y(), 78.01);
}
