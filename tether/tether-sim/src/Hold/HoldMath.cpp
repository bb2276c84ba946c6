// Ticket: 0007_hold_controller

#include <algorithm>
#include <cmath>
#include <numbers>

#include "tether-sim/src/Hold/HoldMath.hpp"
#include "tether-sim/src/Physics/Pose.hpp"

namespace tether_sim
{

namespace
{

constexpr double kDegenerateLength = 1e-6;
constexpr double kMinHalfAngleSine = 1e-9;

Vector3D flatten(const Vector3D& v)
{
  return v.withoutComponentAlong(worldUp());
}

}  // namespace

Vector3D clampMagnitude(const Vector3D& v, double maxMagnitude)
{
  return v.clampedTo(maxMagnitude);
}

double wrapAngle(double angle)
{
  double wrapped = std::remainder(angle, 2.0 * std::numbers::pi);
  if (wrapped <= -std::numbers::pi)
  {
    wrapped = std::numbers::pi;
  }
  return wrapped;
}

Vector3D toWrappedAngleAxis(const Eigen::Quaterniond& error)
{
  Eigen::Quaterniond const q = error.normalized();

  // Angle in [0, 2pi]; the sign of w picks the long or short way round
  double const angle = 2.0 * std::acos(std::clamp(q.w(), -1.0, 1.0));
  double const halfSine = std::sin(angle / 2.0);
  if (std::abs(halfSine) < kMinHalfAngleSine)
  {
    return Vector3D{0.0, 0.0, 0.0};
  }

  Eigen::Vector3d const axis = q.vec() / halfSine;
  return Vector3D{axis * wrapAngle(angle)};
}

Eigen::Quaterniond lookRotation(const Vector3D& forward, const Vector3D& up)
{
  double const length = forward.norm();
  if (length < kDegenerateLength)
  {
    return Eigen::Quaterniond::Identity();
  }
  Eigen::Vector3d const f = forward / length;

  Eigen::Vector3d right = up.cross(f);
  if (right.norm() < kDegenerateLength)
  {
    return Eigen::Quaterniond::FromTwoVectors(Eigen::Vector3d::UnitZ(), f);
  }
  right.normalize();
  Eigen::Vector3d const trueUp = f.cross(right);

  Eigen::Matrix3d basis;
  basis.col(0) = right;
  basis.col(1) = trueUp;
  basis.col(2) = f;
  return Eigen::Quaterniond{basis}.normalized();
}

Eigen::Quaterniond uprightOrientation(const Vector3D& forward,
                                      const Vector3D& fallbackForward)
{
  Vector3D flat = flatten(forward);
  if (flat.norm() < kDegenerateLength)
  {
    flat = flatten(fallbackForward);
  }
  if (flat.norm() < kDegenerateLength)
  {
    flat = Vector3D{0.0, 0.0, 1.0};
  }
  return lookRotation(flat, worldUp());
}

}  // namespace tether_sim
