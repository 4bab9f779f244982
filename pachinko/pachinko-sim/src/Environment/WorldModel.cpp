// Ticket: 0003_rigid_body_stepper
// Ticket: 0005_contact_lifecycle_events

#include "pachinko-sim/src/Environment/WorldModel.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

#include "pachinko-sim/src/Logging.hpp"

namespace pachinko_sim
{

namespace
{

ContactPair toContactPair(const ContactCache::BodyPairKey& key)
{
  return ContactPair{key.first, key.second};
}

std::vector<ContactPair> toContactPairs(
  const std::vector<ContactCache::BodyPairKey>& keys)
{
  std::vector<ContactPair> pairs;
  pairs.reserve(keys.size());
  std::transform(
    keys.begin(), keys.end(), std::back_inserter(pairs), toContactPair);
  return pairs;
}

}  // namespace

WorldModel::WorldModel() : WorldModel{Config{}}
{
}

WorldModel::WorldModel(const Config& config) : config_{config}
{
  if (config_.positionIterations <= 0 || config_.velocityIterations <= 0)
  {
    throw std::invalid_argument("Solver iterations must be positive");
  }
  if (!(config_.baseDeltaMillis > 0.0))
  {
    throw std::invalid_argument("Base tick must be positive, got: " +
                                std::to_string(config_.baseDeltaMillis));
  }
  if (config_.maxSubSteps <= 0)
  {
    throw std::invalid_argument("Maximum sub-step count must be positive");
  }
  setGravityScale(config_.gravityScale);
}

StepEvents WorldModel::step(double dtMillis)
{
  if (!std::isfinite(dtMillis) || dtMillis <= 0.0)
  {
    throw std::invalid_argument("Step duration must be positive, got: " +
                                std::to_string(dtMillis));
  }

  double const timeScale = dtMillis / config_.baseDeltaMillis;
  int const subSteps = computeSubSteps(timeScale);
  double const h = timeScale / static_cast<double>(subSteps);

  contactCache_.beginTick();
  for (int i = 0; i < subSteps; ++i)
  {
    subStep(h);
  }
  auto const transitions = contactCache_.endTick();

  ++tickCount_;
  timeMillis_ += dtMillis;

  return StepEvents{toContactPairs(transitions.began),
                    toContactPairs(transitions.active),
                    toContactPairs(transitions.ended)};
}

BodyId WorldModel::addBody(Body body)
{
  BodyId const id = nextId_++;
  body.id_ = id;
  bool const dynamic = !body.isStatic();
  bodies_.emplace(id, std::move(body));
  if (dynamic)
  {
    dynamicIds_.push_back(id);
  }
  return id;
}

void WorldModel::removeBody(BodyId id)
{
  if (bodies_.erase(id) == 0)
  {
    throw std::out_of_range("Unknown body id: " + std::to_string(id));
  }
  std::erase(dynamicIds_, id);
  contactCache_.removeBody(id);
}

bool WorldModel::hasBody(BodyId id) const
{
  return bodies_.contains(id);
}

const Body& WorldModel::getBody(BodyId id) const
{
  auto it = bodies_.find(id);
  if (it == bodies_.end())
  {
    throw std::out_of_range("Unknown body id: " + std::to_string(id));
  }
  return it->second;
}

Body& WorldModel::getMutableBody(BodyId id)
{
  auto it = bodies_.find(id);
  if (it == bodies_.end())
  {
    throw std::out_of_range("Unknown body id: " + std::to_string(id));
  }
  return it->second;
}

const Coordinate& WorldModel::getPosition(BodyId id) const
{
  return getBody(id).getPosition();
}

const Velocity& WorldModel::getVelocity(BodyId id) const
{
  return getBody(id).getVelocity();
}

void WorldModel::setPosition(BodyId id, const Coordinate& position)
{
  getMutableBody(id).setPosition(position);
}

void WorldModel::setVelocity(BodyId id, const Velocity& velocity)
{
  getMutableBody(id).setVelocity(velocity);
}

void WorldModel::setGravityScale(double scale)
{
  if (!std::isfinite(scale) || scale < 0.0)
  {
    throw std::invalid_argument("Gravity scale must be non-negative, got: " +
                                std::to_string(scale));
  }
  config_.gravityScale = scale;
}

Coordinate WorldModel::getGravityAcceleration() const
{
  return Coordinate{config_.gravity * config_.gravityScale *
                    config_.baseDeltaMillis * config_.baseDeltaMillis};
}

void WorldModel::clearDynamicBodies()
{
  for (BodyId const id : dynamicIds_)
  {
    bodies_.erase(id);
    contactCache_.removeBody(id);
  }
  dynamicIds_.clear();
}

void WorldModel::clear()
{
  bodies_.clear();
  dynamicIds_.clear();
  contactCache_.clear();
  contacts_.clear();
}

std::optional<CollisionResult> WorldModel::computeContact(BodyId a,
                                                          BodyId b) const
{
  return collisionHandler_.checkCollision(getBody(a), getBody(b));
}

int WorldModel::computeSubSteps(double timeScale) const
{
  double required = 1.0;
  for (BodyId const id : dynamicIds_)
  {
    const Body& body = bodies_.at(id);
    double const radius = body.getCircleRadius();
    if (radius <= 0.0)
    {
      continue;
    }
    double const travel = body.getVelocity().norm() * timeScale;
    required = std::max(required, std::ceil(travel / (0.5 * radius)));
  }

  if (required > static_cast<double>(config_.maxSubSteps))
  {
    getLogger()->debug(
      "Sub-step count {} capped at {}", required, config_.maxSubSteps);
    return config_.maxSubSteps;
  }
  return static_cast<int>(required);
}

void WorldModel::subStep(double h)
{
  Coordinate const gravity = getGravityAcceleration();

  // ===== Integration =====
  for (BodyId const id : dynamicIds_)
  {
    integrator_.step(bodies_.at(id), gravity, h);
  }

  // ===== Detection =====
  contacts_.clear();
  for (BodyId const id : dynamicIds_)
  {
    Body& dynamicBody = bodies_.at(id);

    for (auto& [otherId, other] : bodies_)
    {
      // Dynamic pairs are visited once, from the lower id
      if (otherId == id || (!other.isStatic() && otherId < id))
      {
        continue;
      }
      if (!dynamicBody.getAabb().overlaps(other.getAabb()))
      {
        continue;
      }

      auto const result = collisionHandler_.checkCollision(dynamicBody, other);
      if (!result)
      {
        continue;
      }

      contactCache_.touch(id, otherId, result->normal);

      if (dynamicBody.isSensor() || other.isSensor())
      {
        continue;
      }
      contacts_.push_back(contact_constraint_factory::createFromCollision(
        dynamicBody, other, *result, config_.restingThreshold));
    }
  }

  if (contacts_.empty())
  {
    return;
  }

  // ===== Velocity solve =====
  ContactSolver::Config const solverConfig{config_.velocityIterations};
  contactSolver_.solve(contacts_, solverConfig);

  // ===== Position correction =====
  PositionCorrector::Config const correctorConfig{
    config_.positionCorrectionBeta, config_.positionIterations};
  positionCorrector_.correctPositions(
    contacts_, collisionHandler_, correctorConfig);

  contacts_.clear();
}

}  // namespace pachinko_sim
