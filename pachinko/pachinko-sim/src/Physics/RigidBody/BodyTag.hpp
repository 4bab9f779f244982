// Ticket: 0004_board_world_builder

#ifndef PACHINKO_SIM_PHYSICS_BODY_TAG_HPP
#define PACHINKO_SIM_PHYSICS_BODY_TAG_HPP

#include <compare>
#include <cstddef>
#include <string>
#include <variant>

namespace pachinko_sim
{

/**
 * @brief Lattice identity of a peg, used only for event labeling.
 */
struct PegId
{
  int row{0};
  int col{0};

  auto operator<=>(const PegId&) const = default;

  /// @brief "peg-<row>-<col>"
  [[nodiscard]] std::string label() const
  {
    return "peg-" + std::to_string(row) + "-" + std::to_string(col);
  }
};

struct BallTag
{
  auto operator<=>(const BallTag&) const = default;
};

struct WallTag
{
  auto operator<=>(const WallTag&) const = default;
};

/// Anti-wedge deflector placed along a side wall
struct DeflectorTag
{
  std::size_t index{0};
  auto operator<=>(const DeflectorTag&) const = default;
};

struct PegTag
{
  PegId id;
  auto operator<=>(const PegTag&) const = default;
};

struct DividerTag
{
  std::size_t index{0};
  auto operator<=>(const DividerTag&) const = default;
};

/// Bucket sensor; index into BoardConfig::buckets
struct BucketTag
{
  std::size_t index{0};
  auto operator<=>(const BucketTag&) const = default;
};

struct FloorTag
{
  auto operator<=>(const FloorTag&) const = default;
};

/**
 * @brief Identity of a body in the board scene.
 *
 * The stepper never inspects the tag; it is carried for the collision
 * classifier and for diagnostics.
 */
using BodyTag = std::variant<BallTag,
                             WallTag,
                             DeflectorTag,
                             PegTag,
                             DividerTag,
                             BucketTag,
                             FloorTag>;

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_BODY_TAG_HPP
