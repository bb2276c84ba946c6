// Ticket: 0007_hold_controller

#ifndef TETHER_SIM_HOLD_HOLD_MATH_HPP
#define TETHER_SIM_HOLD_HOLD_MATH_HPP

#include <Eigen/Geometry>

#include "tether-sim/src/DataTypes/Vector3D.hpp"

namespace tether_sim
{

/**
 * @brief Rescale v to exactly maxMagnitude if it is longer, keeping direction
 */
[[nodiscard]] Vector3D clampMagnitude(const Vector3D& v, double maxMagnitude);

/**
 * @brief Wrap an angle into (-pi, pi]
 * @param angle Angle [rad]
 */
[[nodiscard]] double wrapAngle(double angle);

/**
 * @brief Convert a rotation error into an angular error vector
 *
 * The quaternion is decomposed into an angle in [0, 2pi] and an axis, the
 * angle is wrapped into (-pi, pi], and the result is axis * angle. A 270
 * degree error about +Y therefore becomes -90 degrees about +Y. Both
 * quaternions of a double cover map to the same vector.
 *
 * @param error Rotation error (normalized internally)
 * @return Angular error [rad], zero when the rotation is (near) identity
 */
[[nodiscard]] Vector3D toWrappedAngleAxis(const Eigen::Quaterniond& error);

/**
 * @brief Orientation whose +Z points along forward and +Y leans toward up
 *
 * Falls back to the shortest rotation from +Z when forward is parallel to
 * up. A zero forward yields identity.
 */
[[nodiscard]] Eigen::Quaterniond lookRotation(const Vector3D& forward,
                                              const Vector3D& up);

/**
 * @brief Upright orientation facing forward flattened onto the horizontal
 * plane
 *
 * When the flattened forward is near zero (looking straight up or down)
 * fallbackForward is flattened instead, then world forward (+Z).
 */
[[nodiscard]] Eigen::Quaterniond uprightOrientation(
  const Vector3D& forward,
  const Vector3D& fallbackForward);

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_HOLD_MATH_HPP
