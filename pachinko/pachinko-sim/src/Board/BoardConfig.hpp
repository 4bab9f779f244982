// Ticket: 0004_board_world_builder

#ifndef PACHINKO_SIM_BOARD_CONFIG_HPP
#define PACHINKO_SIM_BOARD_CONFIG_HPP

#include <numbers>
#include <string>
#include <vector>

namespace pachinko_sim
{

/**
 * @brief Scoring bucket at the bottom of the board
 */
struct BucketSpec
{
  std::string label;
  double multiplier{1.0};  // Payout multiplier (>= 0)
};

/**
 * @brief Board geometry and layout. Immutable once an Engine is built.
 *
 * All lengths are in px, board origin at the top-left corner, +y down.
 *
 * @ticket 0004_board_world_builder
 */
struct BoardConfig
{
  double width{500.0};
  double height{700.0};

  // Side walls sit just outside [0, width] and extend wallOverhang past the
  // top and bottom edges
  double wallThickness{50.0};
  double wallOverhang{50.0};
  double wallRestitution{0.6};
  double wallFriction{0.0};

  // Angled funnel walls at the drop-zone entrance
  double funnelLength{120.0};
  double funnelThickness{10.0};
  double funnelInset{50.0};  // Centre distance from the side edge
  double funnelY{60.0};
  double funnelAngle{0.15 * std::numbers::pi};

  // Peg lattice: row r holds r + pegsInFirstRow pegs, centred horizontally
  int rows{12};
  int pegsInFirstRow{3};
  double spacingX{45.0};
  double spacingY{45.0};
  double startY{120.0};
  double pegRadius{8.0};

  // Anti-wedge deflector triangles along both side walls
  double deflectorStartY{150.0};
  double deflectorSpacing{90.0};
  double deflectorRadius{12.0};
  double deflectorInset{15.0};
  double deflectorBottomClearance{100.0};
  double deflectorAngle{std::numbers::pi / 6.0};
  double deflectorRestitution{0.8};

  // Buckets
  double bucketHeight{80.0};
  double dividerWidth{8.0};
  double sensorHeight{30.0};
  double sensorInset{10.0};  // Sensor width = bucket width - sensorInset
  double sensorBottomOffset{20.0};
  double floorThickness{40.0};

  // Drop zone
  double dropMargin{60.0};
  double dropY{20.0};

  std::vector<BucketSpec> buckets{{"Aave", 1.0},
                                  {"GHO", 2.0},
                                  {"Uniswap", 1.5},
                                  {"Degen", 5.0},
                                  {"Safe", 1.0}};

  /**
   * @brief Check every parameter.
   *
   * @throws std::invalid_argument on non-positive dimensions, negative peg
   *         counts, an empty bucket list, a negative multiplier, or a drop
   *         zone that does not fit the board
   */
  void validate() const;

  /// @brief Width of one bucket column
  [[nodiscard]] double bucketWidth() const
  {
    return width / static_cast<double>(buckets.size());
  }

  /// @brief Clear horizontal gap between neighbouring pegs of a row
  [[nodiscard]] double pegGap() const
  {
    return spacingX - 2.0 * pegRadius;
  }

  /// @brief Number of pegs in @p row
  [[nodiscard]] int pegsInRow(int row) const
  {
    return row + pegsInFirstRow;
  }

  /// @brief Total peg count of the lattice
  [[nodiscard]] int pegCount() const;

  /**
   * @brief The 500 x 700 board with 12 rows and the five DeFi buckets
   */
  [[nodiscard]] static BoardConfig standard();
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_BOARD_CONFIG_HPP
