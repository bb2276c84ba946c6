// Ticket: 0012_throw_punt

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "tether-sim/src/Hold/ImpulseApplier.hpp"

namespace tether_sim
{

ImpulseApplier::ImpulseApplier(PhysicsWorld& world,
                               std::shared_ptr<spdlog::logger> logger)
  : world_{world}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("ImpulseApplier requires a logger");
  }
}

void ImpulseApplier::throwBody(RigidBody& body,
                               const Vector3D& direction,
                               double magnitude) const
{
  // Erase whatever motion the hold controller left behind
  body.setLinearVelocity(Vector3D{0.0, 0.0, 0.0});
  body.setAngularVelocity(AngularVelocity{0.0, 0.0, 0.0});

  body.addForce(Vector3D{direction.normalized() * magnitude},
                ForceMode::VelocityChange);
}

std::optional<BodyId> ImpulseApplier::punt(const Pose& view,
                                           double range,
                                           double magnitude) const
{
  Vector3D const forward{view.forward().normalized()};
  std::optional<ProbeHit> const hit =
    world_.raycast(view.position, forward, range);
  if (!hit || !hit->body)
  {
    logger_->debug("Punt: nothing within {} m", range);
    return std::nullopt;
  }

  RigidBody* body = world_.findBody(*hit->body);
  if (body == nullptr || body->isKinematic())
  {
    logger_->debug("Punt: body {} cannot be kicked", *hit->body);
    return std::nullopt;
  }

  body->addForce(Vector3D{forward * magnitude}, ForceMode::VelocityChange);
  logger_->info(
    "Punted body {} at {:.2f} m ({} m/s)", *hit->body, hit->distance, magnitude);
  return *hit->body;
}

double ImpulseApplier::massScaledMagnitude(double magnitude,
                                           double mass,
                                           double maxMass)
{
  double const lightness = std::clamp(1.0 - mass / maxMass, 0.0, 1.0);
  return magnitude * (0.3 + 0.7 * lightness);
}

}  // namespace tether_sim
