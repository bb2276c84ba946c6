// Ticket: 0003_reference_backend

#include "tether-sim/src/Physics/Sim/InertialState.hpp"

namespace tether_sim
{

Eigen::Vector4d InertialState::omegaToQuaternionRate(
  const AngularVelocity& omega,
  const Eigen::Quaterniond& Q)
{
  // Q̇ = ½ * [0, ω] ⊗ Q
  //
  // For [0, ω] = (0, ωx, ωy, ωz) on the left:
  // [0, ω] ⊗ Q = ( -ωx*x - ωy*y - ωz*z,       [w component]
  //                 ωx*w + ωy*z - ωz*y,        [x component]
  //                 ωy*w - ωx*z + ωz*x,        [y component]
  //                 ωz*w + ωx*y - ωy*x )       [z component]
  //
  // Eigen stores quaternion coeffs as (x, y, z, w).

  double const qw = Q.w();
  double const qx = Q.x();
  double const qy = Q.y();
  double const qz = Q.z();

  double const wx = omega.x();
  double const wy = omega.y();
  double const wz = omega.z();

  Eigen::Vector4d qdot;
  qdot(0) = 0.5 * (wx * qw + wy * qz - wz * qy);   // x component
  qdot(1) = 0.5 * (wy * qw - wx * qz + wz * qx);   // y component
  qdot(2) = 0.5 * (wz * qw + wx * qy - wy * qx);   // z component
  qdot(3) = 0.5 * (-wx * qx - wy * qy - wz * qz);  // w component

  return qdot;
}

}  // namespace tether_sim
