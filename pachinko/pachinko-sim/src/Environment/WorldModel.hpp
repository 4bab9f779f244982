// Ticket: 0003_rigid_body_stepper
// Ticket: 0005_contact_lifecycle_events

#ifndef PACHINKO_SIM_WORLD_MODEL_HPP
#define PACHINKO_SIM_WORLD_MODEL_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <vector>

#include "pachinko-sim/src/DataTypes/Coordinate.hpp"
#include "pachinko-sim/src/DataTypes/Velocity.hpp"
#include "pachinko-sim/src/Physics/Collision/CollisionHandler.hpp"
#include "pachinko-sim/src/Physics/Constraints/ContactCache.hpp"
#include "pachinko-sim/src/Physics/Constraints/ContactSolver.hpp"
#include "pachinko-sim/src/Physics/Constraints/PositionCorrector.hpp"
#include "pachinko-sim/src/Physics/Integration/SemiImplicitEulerIntegrator.hpp"
#include "pachinko-sim/src/Physics/RigidBody/Body.hpp"

namespace pachinko_sim
{

/**
 * @brief Unordered body pair reported by a step; bodyA < bodyB
 */
struct ContactPair
{
  BodyId bodyA;
  BodyId bodyB;

  auto operator<=>(const ContactPair&) const = default;
};

/**
 * @brief Contact transitions produced by one WorldModel::step()
 *
 * The three lists are disjoint. `began` is in detection order.
 */
struct StepEvents
{
  std::vector<ContactPair> began;
  std::vector<ContactPair> active;
  std::vector<ContactPair> ended;
};

/**
 * @brief Owns every body and advances them at a fixed tick.
 *
 * Per tick:
 * 1. Choose a sub-step count so the fastest dynamic circle moves at most
 *    half its radius per sub-step (capped at Config::maxSubSteps)
 * 2. Per sub-step: integrate dynamic bodies, detect overlaps against every
 *    other body, solve velocities, correct positions
 * 3. Classify touching pairs into began / active / ended
 *
 * Velocities are expressed in px per base tick. A step of dtMillis advances
 * dtMillis / baseDeltaMillis base ticks.
 *
 * The model has no game logic; contact events are returned from step() and
 * never dispatched from inside it.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 */
class WorldModel
{
public:
  struct Config
  {
    Coordinate gravity{0.0, 1.0};         // Gravity direction
    double gravityScale{0.002};           // [px/ms^2]
    int positionIterations{8};
    int velocityIterations{6};
    double baseDeltaMillis{1000.0 / 60.0};
    double restingThreshold{1.0};         // No bounce below [px/tick]
    double positionCorrectionBeta{0.8};
    int maxSubSteps{8};
  };

  /**
   * @brief Construct with default configuration
   */
  WorldModel();

  /**
   * @brief Construct with custom configuration
   * @throws std::invalid_argument if iterations, base tick or sub-step cap
   *         are not positive, or gravity scale is negative
   */
  explicit WorldModel(const Config& config);

  /**
   * @brief Advance the world by @p dtMillis
   * @return Contact transitions of this tick
   * @throws std::invalid_argument if dtMillis is not positive and finite
   */
  StepEvents step(double dtMillis);

  /**
   * @brief Add a body and assign its id (ids start at 1, never reused)
   */
  BodyId addBody(Body body);

  /**
   * @brief Remove a body. Its cached contacts are dropped without producing
   * an ended event.
   * @throws std::out_of_range if id is unknown
   */
  void removeBody(BodyId id);

  [[nodiscard]] bool hasBody(BodyId id) const;

  /**
   * @throws std::out_of_range if id is unknown
   */
  [[nodiscard]] const Body& getBody(BodyId id) const;

  /**
   * @throws std::out_of_range if id is unknown
   */
  [[nodiscard]] const Coordinate& getPosition(BodyId id) const;

  /**
   * @throws std::out_of_range if id is unknown
   */
  [[nodiscard]] const Velocity& getVelocity(BodyId id) const;

  /**
   * @throws std::out_of_range if id is unknown
   */
  void setPosition(BodyId id, const Coordinate& position);

  /**
   * @throws std::out_of_range if id is unknown
   * @throws std::logic_error if the body is static
   */
  void setVelocity(BodyId id, const Velocity& velocity);

  [[nodiscard]] const std::map<BodyId, Body>& getBodies() const
  {
    return bodies_;
  }

  [[nodiscard]] size_t getBodyCount() const
  {
    return bodies_.size();
  }

  /**
   * @brief Set the world-wide gravity scale
   * @throws std::invalid_argument if scale is negative or not finite
   */
  void setGravityScale(double scale);

  [[nodiscard]] double getGravityScale() const
  {
    return config_.gravityScale;
  }

  /**
   * @brief Gravity acceleration per base tick squared [px/tick^2]
   */
  [[nodiscard]] Coordinate getGravityAcceleration() const;

  /**
   * @brief Remove every dynamic body
   */
  void clearDynamicBodies();

  /**
   * @brief Remove every body; tick count and id sequence are kept
   */
  void clear();

  /**
   * @brief Overlap between two bodies at their current positions
   * @return Contact with normal A->B, std::nullopt if not overlapping
   * @throws std::out_of_range if either id is unknown
   */
  [[nodiscard]] std::optional<CollisionResult> computeContact(BodyId a,
                                                              BodyId b) const;

  [[nodiscard]] uint64_t getTickCount() const
  {
    return tickCount_;
  }

  [[nodiscard]] double getTimeMillis() const
  {
    return timeMillis_;
  }

  [[nodiscard]] const Config& getConfig() const
  {
    return config_;
  }

  WorldModel(const WorldModel&) = delete;
  WorldModel& operator=(const WorldModel&) = delete;
  WorldModel(WorldModel&&) noexcept = default;
  WorldModel& operator=(WorldModel&&) noexcept = default;
  ~WorldModel() = default;

private:
  [[nodiscard]] Body& getMutableBody(BodyId id);

  [[nodiscard]] int computeSubSteps(double timeScale) const;

  void subStep(double h);

  Config config_;
  std::map<BodyId, Body> bodies_;
  std::vector<BodyId> dynamicIds_;
  BodyId nextId_{1};

  CollisionHandler collisionHandler_;
  ContactCache contactCache_;
  ContactSolver contactSolver_;
  PositionCorrector positionCorrector_;
  SemiImplicitEulerIntegrator integrator_;

  std::vector<ContactConstraint> contacts_;  // Sub-step workspace

  uint64_t tickCount_{0};
  double timeMillis_{0.0};
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_WORLD_MODEL_HPP
