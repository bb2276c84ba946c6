// Ticket: 0009_anchor_tracking

#include <algorithm>
#include <stdexcept>
#include <string>

#include "tether-sim/src/Hold/AnchorTracker.hpp"

namespace tether_sim
{

namespace
{

double validatedTick(double minTickDuration)
{
  if (!(minTickDuration > 0.0))
  {
    throw std::invalid_argument("Minimum tick duration must be positive, got: " +
                                std::to_string(minTickDuration));
  }
  return minTickDuration;
}

}  // namespace

AnchorTracker::AnchorTracker(PhysicsWorld& world,
                             const Pose& initialPose,
                             double minTickDuration)
  : world_{world},
    bodyId_{0},
    minTickDuration_{validatedTick(minTickDuration)},
    pose_{initialPose}
{
  bodyId_ = world_.createKinematicBody(initialPose);
}

AnchorTracker::~AnchorTracker()
{
  world_.destroyBody(bodyId_);
}

Pose AnchorTracker::targetFor(const Pose& view, double holdDistance)
{
  return Pose{Coordinate{view.position + view.forward() * holdDistance},
              view.orientation};
}

void AnchorTracker::advance(const Pose& view, double holdDistance, double dt)
{
  Pose const target = targetFor(view, holdDistance);

  // std::max(floor, dt) also maps a NaN dt to the floor
  double const tick = std::max(minTickDuration_, dt);
  velocity_ = (target.position - pose_.position) / tick;

  if (RigidBody* anchor = world_.findBody(bodyId_))
  {
    anchor->movePose(target);
  }

  pose_ = target;
}

void AnchorTracker::reseed(const Pose& view, double holdDistance)
{
  pose_ = targetFor(view, holdDistance);
  velocity_ = Vector3D{0.0, 0.0, 0.0};
}

const Pose& AnchorTracker::getPose() const
{
  return pose_;
}

const Vector3D& AnchorTracker::getVelocity() const
{
  return velocity_;
}

BodyId AnchorTracker::getBodyId() const
{
  return bodyId_;
}

}  // namespace tether_sim
