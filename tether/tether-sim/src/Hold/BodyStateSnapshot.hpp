// Ticket: 0010_body_state

#ifndef TETHER_SIM_HOLD_BODY_STATE_SNAPSHOT_HPP
#define TETHER_SIM_HOLD_BODY_STATE_SNAPSHOT_HPP

#include "tether-sim/src/Physics/RigidBody.hpp"

namespace tether_sim
{

/**
 * @brief Immutable copy of the body properties a hold overrides
 *
 * Captured once at pickup and written back wholesale at release. Fields
 * covered: gravity flag, linear and angular damping, interpolation mode,
 * collision-detection mode and constraint flags.
 */
class BodyStateSnapshot
{
public:
  [[nodiscard]] static BodyStateSnapshot capture(const RigidBody& body);

  /// Write every captured field back to body
  void restore(RigidBody& body) const;

  [[nodiscard]] bool getUseGravity() const
  {
    return useGravity_;
  }
  [[nodiscard]] double getLinearDamping() const
  {
    return linearDamping_;
  }
  [[nodiscard]] double getAngularDamping() const
  {
    return angularDamping_;
  }
  [[nodiscard]] InterpolationMode getInterpolationMode() const
  {
    return interpolationMode_;
  }
  [[nodiscard]] CollisionDetectionMode getCollisionDetectionMode() const
  {
    return collisionDetectionMode_;
  }
  [[nodiscard]] BodyConstraints getConstraints() const
  {
    return constraints_;
  }

  bool operator==(const BodyStateSnapshot&) const = default;

private:
  BodyStateSnapshot(bool useGravity,
                    double linearDamping,
                    double angularDamping,
                    InterpolationMode interpolationMode,
                    CollisionDetectionMode collisionDetectionMode,
                    BodyConstraints constraints);

  bool useGravity_;
  double linearDamping_;
  double angularDamping_;
  InterpolationMode interpolationMode_;
  CollisionDetectionMode collisionDetectionMode_;
  BodyConstraints constraints_;
};

/**
 * @brief Property overrides applied to a body for the duration of a hold
 *
 * Gravity off and high damping keep the PD loop stable; continuous collision
 * detection and interpolation stop a fast, close body from tunnelling or
 * jittering.
 */
struct HeldBodyTuning
{
  double linearDamping{10.0};
  double angularDamping{5.0};
  CollisionDetectionMode collisionDetectionMode{
    CollisionDetectionMode::ContinuousDynamic};
  InterpolationMode interpolationMode{InterpolationMode::Interpolate};

  void applyTo(RigidBody& body) const;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_BODY_STATE_SNAPSHOT_HPP
