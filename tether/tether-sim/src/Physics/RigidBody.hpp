// Ticket: 0002_physics_abstraction

#ifndef TETHER_SIM_PHYSICS_RIGID_BODY_HPP
#define TETHER_SIM_PHYSICS_RIGID_BODY_HPP

#include <vector>

#include "tether-sim/src/DataTypes/AngularVelocity.hpp"
#include "tether-sim/src/DataTypes/Coordinate.hpp"
#include "tether-sim/src/DataTypes/Vector3D.hpp"
#include "tether-sim/src/Physics/PhysicsTypes.hpp"
#include "tether-sim/src/Physics/Pose.hpp"

namespace tether_sim
{

/**
 * @brief Abstract handle to a rigid body owned by a physics engine
 *
 * This is the surface the hold subsystem reads and writes. It covers the
 * body's kinematic state, the tuning properties the hold session overrides
 * (gravity, damping, collision detection, interpolation, constraints) and
 * force/torque application. Damping is exposed as an opaque capability so
 * callers never depend on how a particular engine names those fields.
 *
 * Lifetime: owned by the PhysicsWorld that created it. Holders keep a
 * BodyId and re-resolve through PhysicsWorld::findBody() when the body may
 * have been destroyed.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 */
class RigidBody
{
public:
  virtual ~RigidBody() = default;

  [[nodiscard]] virtual BodyId getId() const = 0;

  /// Mass [kg]
  [[nodiscard]] virtual double getMass() const = 0;

  [[nodiscard]] virtual Pose getPose() const = 0;

  /// Centre of mass in world coordinates [m]
  [[nodiscard]] virtual Coordinate getWorldCenterOfMass() const = 0;

  [[nodiscard]] virtual Vector3D getLinearVelocity() const = 0;
  virtual void setLinearVelocity(const Vector3D& velocity) = 0;

  [[nodiscard]] virtual AngularVelocity getAngularVelocity() const = 0;
  virtual void setAngularVelocity(const AngularVelocity& omega) = 0;

  /// Colliders attached directly to this body
  [[nodiscard]] virtual std::vector<ColliderId> getColliders() const = 0;

  [[nodiscard]] virtual bool isKinematic() const = 0;

  [[nodiscard]] virtual BodyConstraints getConstraints() const = 0;
  virtual void setConstraints(BodyConstraints constraints) = 0;

  [[nodiscard]] virtual bool getUseGravity() const = 0;
  virtual void setUseGravity(bool useGravity) = 0;

  [[nodiscard]] virtual double getLinearDamping() const = 0;
  virtual void setLinearDamping(double damping) = 0;

  [[nodiscard]] virtual double getAngularDamping() const = 0;
  virtual void setAngularDamping(double damping) = 0;

  [[nodiscard]] virtual CollisionDetectionMode getCollisionDetectionMode()
    const = 0;
  virtual void setCollisionDetectionMode(CollisionDetectionMode mode) = 0;

  [[nodiscard]] virtual InterpolationMode getInterpolationMode() const = 0;
  virtual void setInterpolationMode(InterpolationMode mode) = 0;

  /**
   * @brief Apply a force through the centre of mass
   * @param force Force vector, interpreted according to mode
   * @param mode Continuous modes last for the next step only
   */
  virtual void addForce(const Vector3D& force, ForceMode mode) = 0;

  /**
   * @brief Apply a torque about the centre of mass
   * @param torque Torque vector, interpreted according to mode
   * @param mode Continuous modes last for the next step only
   */
  virtual void addTorque(const Vector3D& torque, ForceMode mode) = 0;

  /**
   * @brief Move a kinematic body toward a target pose during the next step
   *
   * The engine derives the body's velocity from the displacement so
   * interpolation and contacts see continuous motion rather than a teleport.
   * Has no effect on non-kinematic bodies.
   */
  virtual void movePose(const Pose& target) = 0;

protected:
  RigidBody() = default;
  RigidBody(const RigidBody&) = default;
  RigidBody& operator=(const RigidBody&) = default;
  RigidBody(RigidBody&&) noexcept = default;
  RigidBody& operator=(RigidBody&&) noexcept = default;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_PHYSICS_RIGID_BODY_HPP
