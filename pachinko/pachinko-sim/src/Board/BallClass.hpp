// Ticket: 0006_ball_class_table

#ifndef PACHINKO_SIM_BALL_CLASS_HPP
#define PACHINKO_SIM_BALL_CLASS_HPP

#include <map>
#include <string>
#include <vector>

#include "pachinko-sim/src/Physics/RigidBody/MaterialProperties.hpp"

namespace pachinko_sim
{

/**
 * @brief Physical and payout tuning for one class of ball.
 *
 * @ticket 0006_ball_class_table
 */
struct BallClassConfig
{
  std::string label;
  double scale{1.0};           // Radius = kBaseBallRadius * scale
  double mass{1.0};            // Density multiplier
  double restitution{0.42};
  double friction{0.005};
  double frictionAir{0.008};
  double frictionStatic{0.012};
  double slop{0.02};
  double yieldMultiplier{1.0};
  double speedMultiplier{1.0};  // Scales gravity and launch speed

  static constexpr double kBaseBallRadius = 12.0;  // [px]
  static constexpr double kBaseDensity = 0.001;    // [mass/px^2]

  [[nodiscard]] double radius() const
  {
    return kBaseBallRadius * scale;
  }

  /// @brief kBaseDensity * mass * disc area
  [[nodiscard]] double bodyMass() const;

  /**
   * @brief Surface material of the ball body
   * @throws std::invalid_argument if a coefficient is out of range
   */
  [[nodiscard]] MaterialProperties material() const;

  /**
   * @throws std::invalid_argument if scale, mass or speedMultiplier are not
   *         positive, yieldMultiplier is negative, or a coefficient is out of
   *         range
   */
  void validate() const;
};

/**
 * @brief Class id -> BallClassConfig mapping supplied by the host.
 *
 * Must contain a "default" entry. Lookups of unknown ids fall back to it and
 * log a warning.
 *
 * @ticket 0006_ball_class_table
 */
class BallClassTable
{
public:
  static constexpr const char* kDefaultClassId = "default";

  /**
   * @throws std::invalid_argument if there is no "default" entry or any entry
   *         fails BallClassConfig::validate()
   */
  explicit BallClassTable(std::map<std::string, BallClassConfig> classes);

  /**
   * @brief Config for @p classId, or the default class if unknown
   */
  [[nodiscard]] const BallClassConfig& lookup(const std::string& classId) const;

  /**
   * @brief @p classId if known, kDefaultClassId otherwise
   */
  [[nodiscard]] std::string resolveId(const std::string& classId) const;

  [[nodiscard]] bool contains(const std::string& classId) const;

  [[nodiscard]] std::vector<std::string> getClassIds() const;

  /**
   * @brief The whale / degen / default classes
   */
  [[nodiscard]] static BallClassTable standard();

private:
  std::map<std::string, BallClassConfig> classes_;
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_BALL_CLASS_HPP
