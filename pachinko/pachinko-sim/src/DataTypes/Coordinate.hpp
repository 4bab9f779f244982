#ifndef PACHINKO_SIM_COORDINATE_HPP
#define PACHINKO_SIM_COORDINATE_HPP

#include "pachinko-sim/src/DataTypes/Vec2DBase.hpp"

namespace pachinko_sim
{

/**
 * @brief 2D board position [px]
 *
 * Thin wrapper around Vec2DBase providing full Eigen matrix operation
 * compatibility. Also used for unit normals and offsets.
 *
 * Memory footprint: 16 bytes (same as Eigen::Vector2d)
 */
struct Coordinate final : detail::Vec2DBase<Coordinate>
{
  using Vec2DBase::Vec2DBase;
  using Vec2DBase::operator=;

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Coordinate(const Eigen::MatrixBase<OtherDerived>& other) : Vec2DBase{other}
  {
  }
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_COORDINATE_HPP
