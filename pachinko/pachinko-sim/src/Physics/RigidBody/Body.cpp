// Ticket: 0003_rigid_body_stepper

#include "pachinko-sim/src/Physics/RigidBody/Body.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace pachinko_sim
{

Body::Body(BodyType type,
           Shape shape,
           const Coordinate& position,
           double mass,
           const MaterialProperties& material,
           BodyTag tag,
           bool isSensor)
  : type_{type},
    shape_{std::move(shape)},
    position_{position},
    mass_{mass},
    inverseMass_{type == BodyType::Dynamic ? 1.0 / mass : 0.0},
    material_{material},
    tag_{tag},
    isSensor_{isSensor},
    aabb_{computeAabb(shape_, position_)}
{
}

Body Body::createStatic(Shape shape,
                        const Coordinate& position,
                        const MaterialProperties& material,
                        BodyTag tag,
                        bool isSensor)
{
  return Body{BodyType::Static,
              std::move(shape),
              position,
              0.0,
              material,
              tag,
              isSensor};
}

Body Body::createDynamic(Shape shape,
                         const Coordinate& position,
                         double mass,
                         const MaterialProperties& material,
                         BodyTag tag)
{
  if (mass <= 0.0)
  {
    throw std::invalid_argument("Dynamic body mass must be positive, got: " +
                                std::to_string(mass));
  }
  return Body{
    BodyType::Dynamic, std::move(shape), position, mass, material, tag, false};
}

double Body::getCircleRadius() const
{
  if (const auto* circle = std::get_if<CircleShape>(&shape_))
  {
    return circle->radius;
  }
  return 0.0;
}

void Body::setPosition(const Coordinate& position)
{
  position_ = position;
  aabb_ = computeAabb(shape_, position_);
}

void Body::setVelocity(const Velocity& velocity)
{
  if (isStatic())
  {
    throw std::logic_error("Cannot set velocity of static body " +
                           std::to_string(id_));
  }
  velocity_ = velocity;
}

}  // namespace pachinko_sim
