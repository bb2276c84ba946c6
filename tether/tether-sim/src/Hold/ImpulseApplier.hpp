// Ticket: 0012_throw_punt

#ifndef TETHER_SIM_HOLD_IMPULSE_APPLIER_HPP
#define TETHER_SIM_HOLD_IMPULSE_APPLIER_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>

#include "tether-sim/src/Physics/PhysicsWorld.hpp"

namespace tether_sim
{

/**
 * @brief One-shot velocity-change impulses for throw and punt
 *
 * Neither operation touches hold state; GrabSystem performs the release
 * after a throw.
 */
class ImpulseApplier
{
public:
  ImpulseApplier(PhysicsWorld& world, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Zero the body's velocities, then add direction * magnitude as a
   * velocity change
   */
  void throwBody(RigidBody& body,
                 const Vector3D& direction,
                 double magnitude) const;

  /**
   * @brief Ray-probe along the view forward and kick the first body hit
   *
   * Kinematic bodies and static colliders are not kicked.
   *
   * @return The body that received the impulse
   */
  std::optional<BodyId> punt(const Pose& view,
                             double range,
                             double magnitude) const;

  /**
   * @brief Throw magnitude scaled down for heavier bodies
   *
   * magnitude * (0.3 + 0.7 * clamp01(1 - mass / maxMass)); the lightest
   * bodies get the full magnitude, a body at maxMass gets 30%.
   */
  [[nodiscard]] static double massScaledMagnitude(double magnitude,
                                                  double mass,
                                                  double maxMass);

private:
  PhysicsWorld& world_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_IMPULSE_APPLIER_HPP
