// Ticket: 0004_board_world_builder

#ifndef PACHINKO_SIM_WORLD_BUILDER_HPP
#define PACHINKO_SIM_WORLD_BUILDER_HPP

#include <cstddef>
#include <vector>

#include "pachinko-sim/src/Board/BoardConfig.hpp"
#include "pachinko-sim/src/Environment/WorldModel.hpp"
#include "pachinko-sim/src/Physics/RigidBody/BodyTag.hpp"
#include "pachinko-sim/src/Physics/RigidBody/MaterialProperties.hpp"

namespace pachinko_sim
{

/**
 * @brief Body ids of the static scene created by buildWorld()
 */
struct BoardLayout
{
  std::vector<BodyId> walls;       // Left, right, left funnel, right funnel
  std::vector<BodyId> deflectors;  // All left-wall deflectors, then right
  std::vector<BodyId> pegs;        // Row-major
  std::vector<PegId> pegIds;       // Parallel to pegs
  std::vector<BodyId> dividers;
  std::vector<BodyId> buckets;     // Indexed like BoardConfig::buckets
  BodyId floor{0};
  std::size_t staticBodyCount{0};
};

/**
 * @brief Deterministic per-peg perturbation in [0, 0.099]
 *
 * ((row * 7 + col * 13) mod 100) / 1000. Breaks the mirror symmetry of the
 * lattice without any hidden random state.
 */
[[nodiscard]] double pegVariation(const PegId& id);

/**
 * @brief Surface material of the peg at @p id
 *
 * restitution = 0.5 + v / 2, friction = 0.003 + v / 3, static friction
 * 0.008, slop 0.01, where v = pegVariation(id).
 */
[[nodiscard]] MaterialProperties pegMaterial(const PegId& id);

/**
 * @brief Populate @p world with the static board scene.
 *
 * Bodies are added in this order: side walls and funnel walls, deflector
 * triangles (second pass along both side walls), peg lattice, bucket
 * dividers, bucket sensors, floor.
 *
 * @param config Board layout
 * @param world Destination world (existing bodies are kept)
 * @return Ids of the created bodies
 * @throws std::invalid_argument if config fails BoardConfig::validate();
 *         nothing is added in that case
 *
 * @ticket 0004_board_world_builder
 */
BoardLayout buildWorld(const BoardConfig& config, WorldModel& world);

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_WORLD_BUILDER_HPP
