// Ticket: 0002_physics_abstraction

#ifndef TETHER_SIM_PHYSICS_POSE_HPP
#define TETHER_SIM_PHYSICS_POSE_HPP

#include <Eigen/Geometry>

#include "tether-sim/src/DataTypes/Coordinate.hpp"
#include "tether-sim/src/DataTypes/Vector3D.hpp"

namespace tether_sim
{

/**
 * @brief Rigid transform: world position plus orientation
 *
 * Axis convention: local +Z is forward, local +Y is up, local +X is right.
 * World up is +Y.
 */
struct Pose
{
  Coordinate position{0.0, 0.0, 0.0};
  Eigen::Quaterniond orientation{Eigen::Quaterniond::Identity()};

  [[nodiscard]] Vector3D forward() const
  {
    return Vector3D{orientation * Eigen::Vector3d::UnitZ()};
  }

  [[nodiscard]] Vector3D up() const
  {
    return Vector3D{orientation * Eigen::Vector3d::UnitY()};
  }

  [[nodiscard]] Vector3D right() const
  {
    return Vector3D{orientation * Eigen::Vector3d::UnitX()};
  }

  /// Transform a point from this local frame to the world frame
  [[nodiscard]] Coordinate localToGlobal(const Coordinate& localPoint) const
  {
    return Coordinate{position + orientation * localPoint};
  }
};

/// World up direction
inline Vector3D worldUp()
{
  return Vector3D{0.0, 1.0, 0.0};
}

}  // namespace tether_sim

#endif  // TETHER_SIM_PHYSICS_POSE_HPP
