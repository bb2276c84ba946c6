// Ticket: 0003_reference_backend

#ifndef TETHER_SIM_PHYSICS_SIM_SIM_BODY_HPP
#define TETHER_SIM_PHYSICS_SIM_SIM_BODY_HPP

#include <Eigen/Dense>
#include <optional>
#include <vector>

#include "tether-sim/src/DataTypes/ForceVector.hpp"
#include "tether-sim/src/DataTypes/TorqueVector.hpp"
#include "tether-sim/src/Physics/RigidBody.hpp"
#include "tether-sim/src/Physics/Sim/InertialState.hpp"

namespace tether_sim
{

/**
 * @brief Rigid body simulated by PhysicsWorldSim
 *
 * Dynamic bodies accumulate forces and torques between steps; impulse modes
 * change velocity immediately. Kinematic bodies ignore every force mode and
 * only move through movePose().
 *
 * Inertia is modelled as a solid sphere, I = (2/5) m r², using the largest
 * attached collider radius (0.5 m until a collider is attached).
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 */
class SimBody final : public RigidBody
{
public:
  /**
   * @brief Construct a body
   * @param id Identifier assigned by the owning world
   * @param mass Mass [kg], must be > 0 for dynamic bodies
   * @param pose Initial pose
   * @param kinematic True for a kinematic body
   * @param parent Body this one is parented beneath, if any
   * @throws std::invalid_argument if a dynamic body has mass <= 0
   */
  SimBody(BodyId id,
          double mass,
          const Pose& pose,
          bool kinematic,
          std::optional<BodyId> parent);

  // ===== RigidBody =====

  [[nodiscard]] BodyId getId() const override;
  [[nodiscard]] double getMass() const override;
  [[nodiscard]] Pose getPose() const override;
  [[nodiscard]] Coordinate getWorldCenterOfMass() const override;

  [[nodiscard]] Vector3D getLinearVelocity() const override;
  void setLinearVelocity(const Vector3D& velocity) override;

  [[nodiscard]] AngularVelocity getAngularVelocity() const override;
  void setAngularVelocity(const AngularVelocity& omega) override;

  [[nodiscard]] std::vector<ColliderId> getColliders() const override;
  [[nodiscard]] bool isKinematic() const override;

  [[nodiscard]] BodyConstraints getConstraints() const override;
  void setConstraints(BodyConstraints constraints) override;

  [[nodiscard]] bool getUseGravity() const override;
  void setUseGravity(bool useGravity) override;

  [[nodiscard]] double getLinearDamping() const override;
  void setLinearDamping(double damping) override;

  [[nodiscard]] double getAngularDamping() const override;
  void setAngularDamping(double damping) override;

  [[nodiscard]] CollisionDetectionMode getCollisionDetectionMode()
    const override;
  void setCollisionDetectionMode(CollisionDetectionMode mode) override;

  [[nodiscard]] InterpolationMode getInterpolationMode() const override;
  void setInterpolationMode(InterpolationMode mode) override;

  void addForce(const Vector3D& force, ForceMode mode) override;
  void addTorque(const Vector3D& torque, ForceMode mode) override;
  void movePose(const Pose& target) override;

  // ===== Simulation access =====

  [[nodiscard]] std::optional<BodyId> getParent() const;

  /// Sum of continuous forces since the last clearForces() [N]
  [[nodiscard]] const ForceVector& getAccumulatedForce() const;

  /// Sum of continuous torques since the last clearForces() [N·m]
  [[nodiscard]] const TorqueVector& getAccumulatedTorque() const;

  void clearForces();

  [[nodiscard]] const Eigen::Matrix3d& getInverseInertiaTensor() const;

  [[nodiscard]] InertialState& getInertialState();
  [[nodiscard]] const InertialState& getInertialState() const;

  /// Target recorded by movePose() and not yet consumed by a step
  [[nodiscard]] const std::optional<Pose>& getPendingPose() const;
  void clearPendingPose();

  /// Register an attached collider and grow the inertia radius if needed
  void attachCollider(ColliderId collider, double radius);

  /// Inverse mass, zero for kinematic bodies
  [[nodiscard]] double getInverseMass() const;

private:
  void updateInertia();

  BodyId id_;
  double mass_;
  bool kinematic_;
  std::optional<BodyId> parent_;

  InertialState state_;
  std::optional<Pose> pendingPose_;

  std::vector<ColliderId> colliders_;
  double inertiaRadius_{0.5};
  Eigen::Matrix3d inverseInertia_{Eigen::Matrix3d::Identity()};

  bool useGravity_{true};
  double linearDamping_{0.0};
  double angularDamping_{0.05};
  CollisionDetectionMode collisionDetectionMode_{
    CollisionDetectionMode::Discrete};
  InterpolationMode interpolationMode_{InterpolationMode::None};
  BodyConstraints constraints_{BodyConstraints::None};

  ForceVector accumulatedForce_;
  TorqueVector accumulatedTorque_;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_PHYSICS_SIM_SIM_BODY_HPP
