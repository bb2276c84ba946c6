// Ticket: 0003_reference_backend

#ifndef TETHER_SIM_PHYSICS_SIM_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
#define TETHER_SIM_PHYSICS_SIM_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP

#include <Eigen/Dense>

#include "tether-sim/src/DataTypes/ForceVector.hpp"
#include "tether-sim/src/DataTypes/TorqueVector.hpp"
#include "tether-sim/src/Physics/PhysicsTypes.hpp"
#include "tether-sim/src/Physics/Sim/InertialState.hpp"

namespace tether_sim
{

/**
 * @brief Semi-implicit Euler integrator (symplectic) with damping and
 * per-axis freezes
 *
 * Integration order:
 * 1. Compute accelerations: a = F / m, α = I^-1 * τ
 * 2. Update velocities: v_new = v_old + a * dt, ω_new = ω_old + α * dt
 * 3. Apply damping: v *= 1 / (1 + dt * c)
 * 4. Zero frozen velocity components
 * 5. Update positions: x_new = x_old + v_new * dt (uses NEW velocity)
 * 6. Integrate quaternion: Q_new = Q_old + Q̇ * dt
 * 7. Normalize quaternion
 */
class SemiImplicitEulerIntegrator
{
public:
  /**
   * @brief Mass properties and tuning of the body being stepped
   */
  struct BodyParameters
  {
    double mass{1.0};
    Eigen::Matrix3d inverseInertia{Eigen::Matrix3d::Identity()};
    double linearDamping{0.0};
    double angularDamping{0.0};
    BodyConstraints constraints{BodyConstraints::None};
  };

  SemiImplicitEulerIntegrator() = default;

  void step(InertialState& state,
            const ForceVector& force,
            const TorqueVector& torque,
            const BodyParameters& body,
            double dt) const;

  // Rule of Five
  SemiImplicitEulerIntegrator(const SemiImplicitEulerIntegrator&) = default;
  SemiImplicitEulerIntegrator& operator=(const SemiImplicitEulerIntegrator&) =
    default;
  SemiImplicitEulerIntegrator(SemiImplicitEulerIntegrator&&) noexcept = default;
  SemiImplicitEulerIntegrator& operator=(
    SemiImplicitEulerIntegrator&&) noexcept = default;
  ~SemiImplicitEulerIntegrator() = default;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_PHYSICS_SIM_SEMI_IMPLICIT_EULER_INTEGRATOR_HPP
