// Ticket: 0003_rigid_body_stepper

#ifndef PACHINKO_SIM_PHYSICS_BODY_HPP
#define PACHINKO_SIM_PHYSICS_BODY_HPP

#include <cstdint>

#include "pachinko-sim/src/DataTypes/Coordinate.hpp"
#include "pachinko-sim/src/DataTypes/Velocity.hpp"
#include "pachinko-sim/src/Physics/RigidBody/BodyTag.hpp"
#include "pachinko-sim/src/Physics/RigidBody/MaterialProperties.hpp"
#include "pachinko-sim/src/Physics/RigidBody/Shape.hpp"

namespace pachinko_sim
{

using BodyId = uint32_t;

enum class BodyType : uint8_t
{
  Static,
  Dynamic
};

/**
 * @brief Planar rigid body: shape, pose, velocity and surface material.
 *
 * Static bodies have zero inverse mass and never move during a step.
 * Sensor bodies take part in contact detection but receive no contact
 * response. Rotation is not simulated; polygon shapes are stored with
 * their orientation baked into the vertices.
 *
 * Bodies are created through the factory methods and receive their id when
 * added to a WorldModel.
 */
class Body
{
public:
  /**
   * @brief Create an immovable body.
   *
   * @param shape Collision shape (local frame)
   * @param position World position of the shape origin [px]
   * @param material Surface material
   * @param tag Scene identity
   * @param isSensor If true, overlap is reported but never resolved
   */
  static Body createStatic(Shape shape,
                           const Coordinate& position,
                           const MaterialProperties& material,
                           BodyTag tag,
                           bool isSensor = false);

  /**
   * @brief Create a body integrated under gravity.
   *
   * @param shape Collision shape (local frame)
   * @param position Initial world position [px]
   * @param mass Body mass (must be positive)
   * @param material Surface material
   * @param tag Scene identity
   * @throws std::invalid_argument if mass <= 0
   */
  static Body createDynamic(Shape shape,
                            const Coordinate& position,
                            double mass,
                            const MaterialProperties& material,
                            BodyTag tag);

  [[nodiscard]] BodyId getId() const
  {
    return id_;
  }

  [[nodiscard]] BodyType getType() const
  {
    return type_;
  }

  [[nodiscard]] bool isStatic() const
  {
    return type_ == BodyType::Static;
  }

  [[nodiscard]] bool isSensor() const
  {
    return isSensor_;
  }

  [[nodiscard]] const Shape& getShape() const
  {
    return shape_;
  }

  [[nodiscard]] const Coordinate& getPosition() const
  {
    return position_;
  }

  [[nodiscard]] const Velocity& getVelocity() const
  {
    return velocity_;
  }

  [[nodiscard]] double getMass() const
  {
    return mass_;
  }

  /// @brief 0 for static bodies
  [[nodiscard]] double getInverseMass() const
  {
    return inverseMass_;
  }

  [[nodiscard]] const MaterialProperties& getMaterial() const
  {
    return material_;
  }

  [[nodiscard]] const BodyTag& getTag() const
  {
    return tag_;
  }

  /// @brief World-space bounding box at the current position
  [[nodiscard]] const Aabb& getAabb() const
  {
    return aabb_;
  }

  /// @brief Radius for circles, 0 for polygons
  [[nodiscard]] double getCircleRadius() const;

  void setPosition(const Coordinate& position);

  /**
   * @brief Set the body velocity.
   * @throws std::logic_error if the body is static
   */
  void setVelocity(const Velocity& velocity);

  Body(const Body&) = default;
  Body(Body&&) noexcept = default;
  Body& operator=(const Body&) = default;
  Body& operator=(Body&&) noexcept = default;
  ~Body() = default;

private:
  friend class WorldModel;

  Body(BodyType type,
       Shape shape,
       const Coordinate& position,
       double mass,
       const MaterialProperties& material,
       BodyTag tag,
       bool isSensor);

  BodyId id_{0};
  BodyType type_;
  Shape shape_;
  Coordinate position_;
  Velocity velocity_{0.0, 0.0};
  double mass_{0.0};
  double inverseMass_{0.0};
  MaterialProperties material_;
  BodyTag tag_;
  bool isSensor_{false};
  Aabb aabb_;
};

}  // namespace pachinko_sim

#endif  // PACHINKO_SIM_PHYSICS_BODY_HPP
