// Ticket: 0004_board_world_builder

#include "pachinko-sim/src/Board/BoardConfig.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

namespace pachinko_sim
{

namespace
{

void requirePositive(double value, const char* name)
{
  if (!std::isfinite(value) || value <= 0.0)
  {
    throw std::invalid_argument(std::string{name} +
                                " must be positive, got: " +
                                std::to_string(value));
  }
}

void requireNonNegative(double value, const char* name)
{
  if (!std::isfinite(value) || value < 0.0)
  {
    throw std::invalid_argument(std::string{name} +
                                " must be non-negative, got: " +
                                std::to_string(value));
  }
}

}  // namespace

void BoardConfig::validate() const
{
  requirePositive(width, "Board width");
  requirePositive(height, "Board height");
  requirePositive(wallThickness, "Wall thickness");
  requireNonNegative(wallOverhang, "Wall overhang");
  requirePositive(funnelLength, "Funnel length");
  requirePositive(funnelThickness, "Funnel thickness");
  requirePositive(spacingX, "Peg spacing x");
  requirePositive(spacingY, "Peg spacing y");
  requirePositive(pegRadius, "Peg radius");
  requirePositive(deflectorSpacing, "Deflector spacing");
  requirePositive(deflectorRadius, "Deflector radius");
  requirePositive(bucketHeight, "Bucket height");
  requirePositive(dividerWidth, "Divider width");
  requirePositive(sensorHeight, "Sensor height");
  requirePositive(floorThickness, "Floor thickness");
  requireNonNegative(sensorInset, "Sensor inset");

  if (rows < 0)
  {
    throw std::invalid_argument("Peg row count must be non-negative, got: " +
                                std::to_string(rows));
  }
  if (pegsInFirstRow < 0)
  {
    throw std::invalid_argument(
      "Pegs per row must be non-negative, got: " +
      std::to_string(pegsInFirstRow));
  }
  if (buckets.empty())
  {
    throw std::invalid_argument("Board needs at least one bucket");
  }
  for (const auto& bucket : buckets)
  {
    if (!std::isfinite(bucket.multiplier) || bucket.multiplier < 0.0)
    {
      throw std::invalid_argument("Bucket '" + bucket.label +
                                  "' multiplier must be non-negative, got: " +
                                  std::to_string(bucket.multiplier));
    }
  }
  if (bucketWidth() <= sensorInset)
  {
    throw std::invalid_argument("Buckets too narrow for the sensor inset");
  }
  if (2.0 * dropMargin > width)
  {
    throw std::invalid_argument("Drop margin " + std::to_string(dropMargin) +
                                " leaves no drop zone on a board of width " +
                                std::to_string(width));
  }
}

int BoardConfig::pegCount() const
{
  int count = 0;
  for (int row = 0; row < rows; ++row)
  {
    count += pegsInRow(row);
  }
  return count;
}

BoardConfig BoardConfig::standard()
{
  return BoardConfig{};
}

}  // namespace pachinko_sim
