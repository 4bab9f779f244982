// Ticket: 0004_board_world_builder

#include "pachinko-sim/src/Board/WorldBuilder.hpp"

#include <initializer_list>
#include <utility>

#include "pachinko-sim/src/Logging.hpp"
#include "pachinko-sim/src/Physics/RigidBody/Body.hpp"
#include "pachinko-sim/src/Physics/RigidBody/Shape.hpp"

namespace pachinko_sim
{

namespace
{

MaterialProperties wallMaterial(double restitution, double friction)
{
  MaterialProperties material;
  material.setCoefficientOfRestitution(restitution);
  material.setFrictionCoefficient(friction);
  return material;
}

BodyId addStaticPolygon(WorldModel& world,
                        PolygonShape polygon,
                        const Coordinate& position,
                        const MaterialProperties& material,
                        BodyTag tag,
                        bool isSensor = false)
{
  return world.addBody(Body::createStatic(
    Shape{std::move(polygon)}, position, material, tag, isSensor));
}

void addWalls(const BoardConfig& config, WorldModel& world, BoardLayout& layout)
{
  MaterialProperties const material =
    wallMaterial(config.wallRestitution, config.wallFriction);

  double const wallHeight = config.height + 2.0 * config.wallOverhang;
  double const halfThickness = config.wallThickness / 2.0;

  layout.walls.push_back(addStaticPolygon(
    world,
    PolygonShape::rectangle(config.wallThickness, wallHeight),
    Coordinate{-halfThickness, config.height / 2.0},
    material,
    WallTag{}));
  layout.walls.push_back(addStaticPolygon(
    world,
    PolygonShape::rectangle(config.wallThickness, wallHeight),
    Coordinate{config.width + halfThickness, config.height / 2.0},
    material,
    WallTag{}));

  PolygonShape const funnel =
    PolygonShape::rectangle(config.funnelLength, config.funnelThickness);
  layout.walls.push_back(
    addStaticPolygon(world,
                     funnel.rotated(config.funnelAngle),
                     Coordinate{config.funnelInset, config.funnelY},
                     material,
                     WallTag{}));
  layout.walls.push_back(addStaticPolygon(
    world,
    funnel.rotated(-config.funnelAngle),
    Coordinate{config.width - config.funnelInset, config.funnelY},
    material,
    WallTag{}));
}

// Second pass after the primary walls: triangles at the wall / peg junction
// so a ball cannot wedge into the acute corner between them
void addDeflectors(const BoardConfig& config,
                   WorldModel& world,
                   BoardLayout& layout)
{
  MaterialProperties const material =
    wallMaterial(config.deflectorRestitution, config.wallFriction);
  PolygonShape const triangle = PolygonShape::regular(3, config.deflectorRadius);
  double const lastY = config.height - config.deflectorBottomClearance;

  std::size_t index = 0;
  for (double const sign : {1.0, -1.0})
  {
    double const x =
      sign > 0.0 ? config.deflectorInset : config.width - config.deflectorInset;
    PolygonShape const oriented = triangle.rotated(sign * config.deflectorAngle);

    for (double y = config.deflectorStartY; y < lastY;
         y += config.deflectorSpacing)
    {
      layout.deflectors.push_back(addStaticPolygon(
        world, oriented, Coordinate{x, y}, material, DeflectorTag{index++}));
    }
  }
}

void addPegs(const BoardConfig& config, WorldModel& world, BoardLayout& layout)
{
  for (int row = 0; row < config.rows; ++row)
  {
    int const count = config.pegsInRow(row);
    double const rowWidth = static_cast<double>(count - 1) * config.spacingX;
    double const startX = (config.width - rowWidth) / 2.0;
    double const y = config.startY + static_cast<double>(row) * config.spacingY;

    for (int col = 0; col < count; ++col)
    {
      PegId const id{row, col};
      double const x = startX + static_cast<double>(col) * config.spacingX;

      layout.pegs.push_back(
        world.addBody(Body::createStatic(CircleShape{config.pegRadius},
                                         Coordinate{x, y},
                                         pegMaterial(id),
                                         PegTag{id})));
      layout.pegIds.push_back(id);
    }
  }
}

void addBuckets(const BoardConfig& config,
                WorldModel& world,
                BoardLayout& layout)
{
  MaterialProperties const defaultMaterial{};
  double const bucketWidth = config.bucketWidth();
  std::size_t const bucketCount = config.buckets.size();

  for (std::size_t i = 1; i < bucketCount; ++i)
  {
    layout.dividers.push_back(addStaticPolygon(
      world,
      PolygonShape::rectangle(config.dividerWidth, config.bucketHeight),
      Coordinate{static_cast<double>(i) * bucketWidth,
                 config.height - config.bucketHeight / 2.0},
      defaultMaterial,
      DividerTag{i - 1}));
  }

  for (std::size_t i = 0; i < bucketCount; ++i)
  {
    layout.buckets.push_back(addStaticPolygon(
      world,
      PolygonShape::rectangle(bucketWidth - config.sensorInset,
                              config.sensorHeight),
      Coordinate{bucketWidth / 2.0 + static_cast<double>(i) * bucketWidth,
                 config.height - config.sensorBottomOffset},
      defaultMaterial,
      BucketTag{i},
      true));
  }

  layout.floor = addStaticPolygon(
    world,
    PolygonShape::rectangle(config.width, config.floorThickness),
    Coordinate{config.width / 2.0, config.height + config.floorThickness / 2.0},
    defaultMaterial,
    FloorTag{});
}

}  // namespace

double pegVariation(const PegId& id)
{
  return static_cast<double>((id.row * 7 + id.col * 13) % 100) / 1000.0;
}

MaterialProperties pegMaterial(const PegId& id)
{
  double const v = pegVariation(id);

  MaterialProperties material;
  material.setCoefficientOfRestitution(0.5 + v * 0.5);
  material.setFrictionCoefficient(0.003 + v / 3.0);
  material.setStaticFrictionCoefficient(0.008);
  material.setSlop(0.01);
  return material;
}

BoardLayout buildWorld(const BoardConfig& config, WorldModel& world)
{
  config.validate();

  std::size_t const bodiesBefore = world.getBodyCount();

  BoardLayout layout;
  addWalls(config, world, layout);
  addDeflectors(config, world, layout);
  addPegs(config, world, layout);
  addBuckets(config, world, layout);

  layout.staticBodyCount = world.getBodyCount() - bodiesBefore;

  getLogger()->debug(
    "Board {}x{} built: {} pegs, {} deflectors, {} buckets",
    config.width,
    config.height,
    layout.pegs.size(),
    layout.deflectors.size(),
    layout.buckets.size());

  return layout;
}

}  // namespace pachinko_sim
