// Ticket: 0003_reference_backend

#include "tether-sim/src/Physics/Sim/SemiImplicitEulerIntegrator.hpp"

namespace tether_sim
{

namespace
{

// Zero each velocity component whose axis is frozen
void freezeAxes(Eigen::Vector3d& v,
                BodyConstraints constraints,
                BodyConstraints xFlag,
                BodyConstraints yFlag,
                BodyConstraints zFlag)
{
  if (any(constraints, xFlag))
  {
    v.x() = 0.0;
  }
  if (any(constraints, yFlag))
  {
    v.y() = 0.0;
  }
  if (any(constraints, zFlag))
  {
    v.z() = 0.0;
  }
}

}  // namespace

void SemiImplicitEulerIntegrator::step(InertialState& state,
                                       const ForceVector& force,
                                       const TorqueVector& torque,
                                       const BodyParameters& body,
                                       double dt) const
{
  // ===== Compute Accelerations =====

  Eigen::Vector3d const linearAccel = force / body.mass;
  Eigen::Vector3d const angularAccel = body.inverseInertia * torque;

  // ===== Semi-Implicit Euler Integration =====

  // Update velocity: v_new = v_old + a * dt
  state.velocity += linearAccel * dt;
  state.angularVelocity += angularAccel * dt;

  state.velocity *= 1.0 / (1.0 + dt * body.linearDamping);
  state.angularVelocity *= 1.0 / (1.0 + dt * body.angularDamping);

  freezeAxes(state.velocity,
             body.constraints,
             BodyConstraints::FreezePositionX,
             BodyConstraints::FreezePositionY,
             BodyConstraints::FreezePositionZ);
  freezeAxes(state.angularVelocity,
             body.constraints,
             BodyConstraints::FreezeRotationX,
             BodyConstraints::FreezeRotationY,
             BodyConstraints::FreezeRotationZ);

  // Update position using NEW velocity: x_new = x_old + v_new * dt
  state.position += state.velocity * dt;

  // Integrate quaternion: Q_new = Q_old + Q̇ * dt
  Eigen::Vector4d qVec = state.orientation.coeffs();
  qVec += InertialState::omegaToQuaternionRate(state.angularVelocity,
                                               state.orientation) *
          dt;
  state.orientation.coeffs() = qVec;

  // Normalize quaternion to maintain |Q|=1 within machine precision
  state.orientation.normalize();
}

}  // namespace tether_sim
