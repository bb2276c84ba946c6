// Ticket: 0010_body_state

#include "tether-sim/src/Hold/BodyStateSnapshot.hpp"

namespace tether_sim
{

BodyStateSnapshot::BodyStateSnapshot(
  bool useGravity,
  double linearDamping,
  double angularDamping,
  InterpolationMode interpolationMode,
  CollisionDetectionMode collisionDetectionMode,
  BodyConstraints constraints)
  : useGravity_{useGravity},
    linearDamping_{linearDamping},
    angularDamping_{angularDamping},
    interpolationMode_{interpolationMode},
    collisionDetectionMode_{collisionDetectionMode},
    constraints_{constraints}
{
}

BodyStateSnapshot BodyStateSnapshot::capture(const RigidBody& body)
{
  return BodyStateSnapshot{body.getUseGravity(),
                           body.getLinearDamping(),
                           body.getAngularDamping(),
                           body.getInterpolationMode(),
                           body.getCollisionDetectionMode(),
                           body.getConstraints()};
}

void BodyStateSnapshot::restore(RigidBody& body) const
{
  body.setUseGravity(useGravity_);
  body.setLinearDamping(linearDamping_);
  body.setAngularDamping(angularDamping_);
  body.setInterpolationMode(interpolationMode_);
  body.setCollisionDetectionMode(collisionDetectionMode_);
  body.setConstraints(constraints_);
}

void HeldBodyTuning::applyTo(RigidBody& body) const
{
  body.setUseGravity(false);
  body.setLinearDamping(linearDamping);
  body.setAngularDamping(angularDamping);
  body.setCollisionDetectionMode(collisionDetectionMode);
  body.setInterpolationMode(interpolationMode);
}

}  // namespace tether_sim
