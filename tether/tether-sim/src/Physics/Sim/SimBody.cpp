// Ticket: 0003_reference_backend

#include <algorithm>
#include <stdexcept>
#include <string>

#include "tether-sim/src/Physics/Sim/SimBody.hpp"

namespace tether_sim
{

SimBody::SimBody(BodyId id,
                 double mass,
                 const Pose& pose,
                 bool kinematic,
                 std::optional<BodyId> parent)
  : id_{id}, mass_{mass}, kinematic_{kinematic}, parent_{parent}
{
  if (!kinematic && mass <= 0.0)
  {
    throw std::invalid_argument("Mass must be positive, got: " +
                                std::to_string(mass));
  }

  state_.position = pose.position;
  state_.orientation = pose.orientation.normalized();

  if (kinematic)
  {
    useGravity_ = false;
  }

  updateInertia();
}

BodyId SimBody::getId() const
{
  return id_;
}

double SimBody::getMass() const
{
  return mass_;
}

Pose SimBody::getPose() const
{
  return Pose{state_.position, state_.orientation};
}

Coordinate SimBody::getWorldCenterOfMass() const
{
  return state_.position;
}

Vector3D SimBody::getLinearVelocity() const
{
  return state_.velocity;
}

void SimBody::setLinearVelocity(const Vector3D& velocity)
{
  state_.velocity = velocity;
}

AngularVelocity SimBody::getAngularVelocity() const
{
  return state_.angularVelocity;
}

void SimBody::setAngularVelocity(const AngularVelocity& omega)
{
  state_.angularVelocity = omega;
}

std::vector<ColliderId> SimBody::getColliders() const
{
  return colliders_;
}

bool SimBody::isKinematic() const
{
  return kinematic_;
}

BodyConstraints SimBody::getConstraints() const
{
  return constraints_;
}

void SimBody::setConstraints(BodyConstraints constraints)
{
  constraints_ = constraints;
}

bool SimBody::getUseGravity() const
{
  return useGravity_;
}

void SimBody::setUseGravity(bool useGravity)
{
  useGravity_ = useGravity;
}

double SimBody::getLinearDamping() const
{
  return linearDamping_;
}

void SimBody::setLinearDamping(double damping)
{
  linearDamping_ = damping;
}

double SimBody::getAngularDamping() const
{
  return angularDamping_;
}

void SimBody::setAngularDamping(double damping)
{
  angularDamping_ = damping;
}

CollisionDetectionMode SimBody::getCollisionDetectionMode() const
{
  return collisionDetectionMode_;
}

void SimBody::setCollisionDetectionMode(CollisionDetectionMode mode)
{
  collisionDetectionMode_ = mode;
}

InterpolationMode SimBody::getInterpolationMode() const
{
  return interpolationMode_;
}

void SimBody::setInterpolationMode(InterpolationMode mode)
{
  interpolationMode_ = mode;
}

void SimBody::addForce(const Vector3D& force, ForceMode mode)
{
  if (kinematic_)
  {
    return;
  }

  switch (mode)
  {
    case ForceMode::Force:
      accumulatedForce_ += force;
      break;
    case ForceMode::Acceleration:
      accumulatedForce_ += force * mass_;
      break;
    case ForceMode::Impulse:
      state_.velocity += force / mass_;
      break;
    case ForceMode::VelocityChange:
      state_.velocity += force;
      break;
  }
}

void SimBody::addTorque(const Vector3D& torque, ForceMode mode)
{
  if (kinematic_)
  {
    return;
  }

  switch (mode)
  {
    case ForceMode::Force:
      accumulatedTorque_ += torque;
      break;
    case ForceMode::Acceleration:
      // Angular acceleration α becomes τ = I α
      accumulatedTorque_ += inverseInertia_.inverse() * torque;
      break;
    case ForceMode::Impulse:
      state_.angularVelocity += inverseInertia_ * torque;
      break;
    case ForceMode::VelocityChange:
      state_.angularVelocity += torque;
      break;
  }
}

void SimBody::movePose(const Pose& target)
{
  if (!kinematic_)
  {
    return;
  }
  pendingPose_ = target;
}

std::optional<BodyId> SimBody::getParent() const
{
  return parent_;
}

const ForceVector& SimBody::getAccumulatedForce() const
{
  return accumulatedForce_;
}

const TorqueVector& SimBody::getAccumulatedTorque() const
{
  return accumulatedTorque_;
}

void SimBody::clearForces()
{
  accumulatedForce_ = ForceVector{0.0, 0.0, 0.0};
  accumulatedTorque_ = TorqueVector{0.0, 0.0, 0.0};
}

const Eigen::Matrix3d& SimBody::getInverseInertiaTensor() const
{
  return inverseInertia_;
}

InertialState& SimBody::getInertialState()
{
  return state_;
}

const InertialState& SimBody::getInertialState() const
{
  return state_;
}

const std::optional<Pose>& SimBody::getPendingPose() const
{
  return pendingPose_;
}

void SimBody::clearPendingPose()
{
  pendingPose_.reset();
}

void SimBody::attachCollider(ColliderId collider, double radius)
{
  if (colliders_.empty())
  {
    inertiaRadius_ = radius;
  }
  else
  {
    inertiaRadius_ = std::max(inertiaRadius_, radius);
  }
  colliders_.push_back(collider);
  updateInertia();
}

double SimBody::getInverseMass() const
{
  return kinematic_ ? 0.0 : 1.0 / mass_;
}

void SimBody::updateInertia()
{
  if (kinematic_)
  {
    inverseInertia_ = Eigen::Matrix3d::Zero();
    return;
  }

  // Solid sphere: I = (2/5) m r²
  double const inertia = 0.4 * mass_ * inertiaRadius_ * inertiaRadius_;
  inverseInertia_ = Eigen::Matrix3d::Identity() * (1.0 / inertia);
}

}  // namespace tether_sim
