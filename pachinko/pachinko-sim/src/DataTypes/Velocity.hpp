#ifndef PACHINKO_SIM_VELOCITY_HPP
#define PACHINKO_SIM_VELOCITY_HPP

#include "pachinko-sim/src/DataTypes/Vec2DBase.hpp"

namespace pachinko_sim
{

/**
 * @brief 2D velocity vector [px/tick]
 *
 * Velocities are expressed as displacement per base tick (1/60 s), which is
 * the unit every stability threshold is tuned in.
 */
struct Velocity final : detail::Vec2DBase<Velocity>
{
  using Vec2DBase::Vec2DBase;
  using Vec2DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Velocity(const Eigen::MatrixBase<OtherDerived>& other) : Vec2DBase{other}
  {
  }
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_VELOCITY_HPP
