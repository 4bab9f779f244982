// Ticket: 0003_rigid_body_stepper

#ifndef PACHINKO_SIM_PHYSICS_MATERIAL_PROPERTIES_HPP
#define PACHINKO_SIM_PHYSICS_MATERIAL_PROPERTIES_HPP

#include <algorithm>
#include <stdexcept>
#include <string>

namespace pachinko_sim
{

/**
 * @brief Surface material properties shared by static and dynamic bodies.
 *
 * Defaults match an unconfigured static body (dividers, floor). Pair
 * coefficients are combined with restitution = max, friction = min and
 * slop = max.
 */
struct MaterialProperties
{
  double coefficientOfRestitution{0.0};
  double frictionCoefficient{0.1};
  double staticFrictionCoefficient{0.5};
  double airFriction{0.01};  // Per-tick velocity damping [1/tick]
  double slop{0.05};         // Penetration tolerance [px]

  /**
   * @brief Set the coefficient of restitution.
   *
   * @param e Coefficient of restitution [0, 1]
   * @throws std::invalid_argument if e not in [0, 1]
   */
  void setCoefficientOfRestitution(double e)
  {
    if (e < 0.0 || e > 1.0)
    {
      throw std::invalid_argument(
        "Coefficient of restitution must be in [0, 1], got: " +
        std::to_string(e));
    }
    coefficientOfRestitution = e;
  }

  /**
   * @brief Set the friction coefficient.
   *
   * @param mu Friction coefficient [0, inf)
   * @throws std::invalid_argument if mu < 0
   */
  void setFrictionCoefficient(double mu)
  {
    if (mu < 0.0)
    {
      throw std::invalid_argument(
        "Friction coefficient must be non-negative, got: " +
        std::to_string(mu));
    }
    frictionCoefficient = mu;
  }

  /**
   * @throws std::invalid_argument if mu < 0
   */
  void setStaticFrictionCoefficient(double mu)
  {
    if (mu < 0.0)
    {
      throw std::invalid_argument(
        "Static friction coefficient must be non-negative, got: " +
        std::to_string(mu));
    }
    staticFrictionCoefficient = mu;
  }

  /**
   * @brief Set the air friction (velocity damping per tick).
   *
   * @param k Air friction [0, 1)
   * @throws std::invalid_argument if k not in [0, 1)
   */
  void setAirFriction(double k)
  {
    if (k < 0.0 || k >= 1.0)
    {
      throw std::invalid_argument("Air friction must be in [0, 1), got: " +
                                  std::to_string(k));
    }
    airFriction = k;
  }

  /**
   * @throws std::invalid_argument if s < 0
   */
  void setSlop(double s)
  {
    if (s < 0.0)
    {
      throw std::invalid_argument("Slop must be non-negative, got: " +
                                  std::to_string(s));
    }
    slop = s;
  }

  [[nodiscard]] static double combineRestitution(const MaterialProperties& a,
                                                 const MaterialProperties& b)
  {
    return std::max(a.coefficientOfRestitution, b.coefficientOfRestitution);
  }

  [[nodiscard]] static double combineFriction(const MaterialProperties& a,
                                              const MaterialProperties& b)
  {
    return std::min(a.frictionCoefficient, b.frictionCoefficient);
  }

  [[nodiscard]] static double combineSlop(const MaterialProperties& a,
                                          const MaterialProperties& b)
  {
    return std::max(a.slop, b.slop);
  }
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_MATERIAL_PROPERTIES_HPP
