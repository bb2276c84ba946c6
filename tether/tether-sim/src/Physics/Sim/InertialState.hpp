// Ticket: 0003_reference_backend

#ifndef TETHER_SIM_PHYSICS_SIM_INERTIAL_STATE_HPP
#define TETHER_SIM_PHYSICS_SIM_INERTIAL_STATE_HPP

#include <Eigen/Geometry>

#include "tether-sim/src/DataTypes/AngularVelocity.hpp"
#include "tether-sim/src/DataTypes/Coordinate.hpp"
#include "tether-sim/src/DataTypes/Vector3D.hpp"

namespace tether_sim
{

/**
 * @brief Kinematic state of a simulated rigid body
 *
 * Linear state is stored as position/velocity. Angular state is stored as a
 * unit quaternion plus world-frame angular velocity; the quaternion rate is
 * derived on demand.
 *
 * Conversion formula (world-frame ω):
 * - ω → Q̇: Q̇ = ½ * [0, ω] ⊗ Q
 */
struct InertialState
{
  Coordinate position;
  Vector3D velocity;

  Eigen::Quaterniond orientation{Eigen::Quaterniond::Identity()};
  AngularVelocity angularVelocity;

  /**
   * @brief Convert angular velocity to quaternion rate
   * @param omega Angular velocity in world frame [rad/s]
   * @param Q Current orientation
   * @return Q̇ in Eigen coefficient order (x, y, z, w)
   */
  static Eigen::Vector4d omegaToQuaternionRate(const AngularVelocity& omega,
                                               const Eigen::Quaterniond& Q);
};

}  // namespace tether_sim

#endif  // TETHER_SIM_PHYSICS_SIM_INERTIAL_STATE_HPP
