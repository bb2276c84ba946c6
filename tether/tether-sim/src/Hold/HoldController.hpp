// Ticket: 0007_hold_controller

#ifndef TETHER_SIM_HOLD_HOLD_CONTROLLER_HPP
#define TETHER_SIM_HOLD_HOLD_CONTROLLER_HPP

#include <spdlog/spdlog.h>

#include <Eigen/Geometry>
#include <memory>

#include "tether-sim/src/DataTypes/AngularVelocity.hpp"
#include "tether-sim/src/DataTypes/ForceVector.hpp"
#include "tether-sim/src/DataTypes/TorqueVector.hpp"
#include "tether-sim/src/Physics/RigidBody.hpp"

namespace tether_sim
{

/**
 * @brief Force and torque produced by one controller evaluation
 */
struct Wrench
{
  ForceVector force;    // [N]
  TorqueVector torque;  // [N·m]
};

/**
 * @brief PD controller steering a held body toward the anchor
 *
 * Position channel:
 *   F = Kp * (x_anchor - x_com) + Kd * (v_anchor - v_body), |F| <= maxForce
 *
 * Rotation channel:
 *   e = wrappedAngleAxis(q_desired * q_body^-1)
 *   τ = Kp_rot * e - Kd_rot * ω_body, |τ| <= maxTorque
 *
 * Both clamps rescale the vector to exactly the limit, preserving direction.
 * The desired orientation is the anchor orientation, or an upright
 * look-rotation along the anchor's flattened forward when keepUpright is set.
 */
class HoldController
{
public:
  struct Gains
  {
    double positionSpring{900.0};   // Kp [N/m]
    double positionDamping{120.0};  // Kd [N·s/m]
    double maxForce{6000.0};        // [N]
    double rotationSpring{250.0};   // Kp_rot [N·m/rad]
    double rotationDamping{30.0};   // Kd_rot [N·m·s/rad]
    double maxTorque{800.0};        // [N·m]
    bool keepUpright{false};
  };

  HoldController(const Gains& gains, std::shared_ptr<spdlog::logger> logger);

  [[nodiscard]] ForceVector computeForce(const Coordinate& anchorPosition,
                                         const Vector3D& anchorVelocity,
                                         const Coordinate& bodyCenterOfMass,
                                         const Vector3D& bodyVelocity) const;

  [[nodiscard]] TorqueVector computeTorque(
    const Eigen::Quaterniond& desired,
    const Eigen::Quaterniond& bodyOrientation,
    const AngularVelocity& bodyAngularVelocity) const;

  /**
   * @brief Orientation the rotation channel drives toward
   * @param anchorPose Current anchor pose
   * @param fallbackForward Used by keepUpright when the anchor looks
   * straight up or down
   */
  [[nodiscard]] Eigen::Quaterniond desiredOrientation(
    const Pose& anchorPose,
    const Vector3D& fallbackForward) const;

  /**
   * @brief Evaluate both channels and apply them as continuous force/torque
   *
   * Call at most once per fixed tick, after the anchor has advanced.
   *
   * @return The wrench that was applied
   */
  Wrench apply(RigidBody& body,
               const Pose& anchorPose,
               const Vector3D& anchorVelocity,
               const Vector3D& fallbackForward) const;

private:
  Gains gains_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_HOLD_CONTROLLER_HPP
