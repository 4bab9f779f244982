// Ticket: 0006_ball_class_table

#include "pachinko-sim/src/Board/BallClass.hpp"

#include <cmath>
#include <numbers>
#include <stdexcept>
#include <utility>

#include "pachinko-sim/src/Logging.hpp"

namespace pachinko_sim
{

double BallClassConfig::bodyMass() const
{
  double const r = radius();
  return kBaseDensity * mass * std::numbers::pi * r * r;
}

MaterialProperties BallClassConfig::material() const
{
  MaterialProperties material;
  material.setCoefficientOfRestitution(restitution);
  material.setFrictionCoefficient(friction);
  material.setStaticFrictionCoefficient(frictionStatic);
  material.setAirFriction(frictionAir);
  material.setSlop(slop);
  return material;
}

void BallClassConfig::validate() const
{
  if (!(scale > 0.0) || !std::isfinite(scale))
  {
    throw std::invalid_argument("Ball class '" + label +
                                "' scale must be positive, got: " +
                                std::to_string(scale));
  }
  if (!(mass > 0.0) || !std::isfinite(mass))
  {
    throw std::invalid_argument("Ball class '" + label +
                                "' mass must be positive, got: " +
                                std::to_string(mass));
  }
  if (!(speedMultiplier > 0.0) || !std::isfinite(speedMultiplier))
  {
    throw std::invalid_argument("Ball class '" + label +
                                "' speed multiplier must be positive, got: " +
                                std::to_string(speedMultiplier));
  }
  if (!(yieldMultiplier >= 0.0) || !std::isfinite(yieldMultiplier))
  {
    throw std::invalid_argument("Ball class '" + label +
                                "' yield multiplier must be non-negative, got: " +
                                std::to_string(yieldMultiplier));
  }
  // Coefficient ranges are checked by the MaterialProperties setters
  (void)material();
}

BallClassTable::BallClassTable(std::map<std::string, BallClassConfig> classes)
  : classes_{std::move(classes)}
{
  if (!classes_.contains(kDefaultClassId))
  {
    throw std::invalid_argument(
      "Ball class table must contain a 'default' entry");
  }
  for (const auto& [id, config] : classes_)
  {
    config.validate();
  }
}

const BallClassConfig& BallClassTable::lookup(const std::string& classId) const
{
  auto it = classes_.find(classId);
  if (it != classes_.end())
  {
    return it->second;
  }

  getLogger()->warn("Unknown ball class '{}', using '{}'", classId,
                    kDefaultClassId);
  return classes_.at(kDefaultClassId);
}

std::string BallClassTable::resolveId(const std::string& classId) const
{
  return classes_.contains(classId) ? classId : std::string{kDefaultClassId};
}

bool BallClassTable::contains(const std::string& classId) const
{
  return classes_.contains(classId);
}

std::vector<std::string> BallClassTable::getClassIds() const
{
  std::vector<std::string> ids;
  ids.reserve(classes_.size());
  for (const auto& [id, config] : classes_)
  {
    ids.push_back(id);
  }
  return ids;
}

BallClassTable BallClassTable::standard()
{
  std::map<std::string, BallClassConfig> classes;

  // Scale 1.1 keeps the whale narrower than the 29 px gap of the standard
  // lattice
  classes.emplace(
    "whale",
    BallClassConfig{
      "Whale", 1.1, 3.0, 0.4, 0.006, 0.008, 0.015, 0.02, 1.0, 1.0});
  classes.emplace(
    "degen",
    BallClassConfig{
      "Degen", 0.7, 1.0, 0.45, 0.004, 0.006, 0.01, 0.02, 2.0, 1.2});
  classes.emplace(
    kDefaultClassId,
    BallClassConfig{
      "Standard", 1.0, 1.0, 0.42, 0.005, 0.008, 0.012, 0.02, 1.0, 1.0});

  return BallClassTable{std::move(classes)};
}

}  // namespace pachinko_sim
