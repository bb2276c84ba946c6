// Ticket: 0007_hold_controller

#include <format>
#include <stdexcept>
#include <utility>

#include "tether-sim/src/Hold/HoldController.hpp"
#include "tether-sim/src/Hold/HoldMath.hpp"

namespace tether_sim
{

HoldController::HoldController(const Gains& gains,
                               std::shared_ptr<spdlog::logger> logger)
  : gains_{gains}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("HoldController requires a logger");
  }
}

ForceVector HoldController::computeForce(const Coordinate& anchorPosition,
                                         const Vector3D& anchorVelocity,
                                         const Coordinate& bodyCenterOfMass,
                                         const Vector3D& bodyVelocity) const
{
  Vector3D const error{anchorPosition - bodyCenterOfMass};
  Vector3D const relativeVelocity{anchorVelocity - bodyVelocity};

  Vector3D const force{gains_.positionSpring * error +
                       gains_.positionDamping * relativeVelocity};
  return ForceVector{clampMagnitude(force, gains_.maxForce)};
}

TorqueVector HoldController::computeTorque(
  const Eigen::Quaterniond& desired,
  const Eigen::Quaterniond& bodyOrientation,
  const AngularVelocity& bodyAngularVelocity) const
{
  Vector3D const angularError =
    toWrappedAngleAxis(desired * bodyOrientation.inverse());

  // Target angular velocity is zero
  Vector3D const angularVelocityError{-bodyAngularVelocity};

  Vector3D const torque{gains_.rotationSpring * angularError +
                        gains_.rotationDamping * angularVelocityError};
  return TorqueVector{clampMagnitude(torque, gains_.maxTorque)};
}

Eigen::Quaterniond HoldController::desiredOrientation(
  const Pose& anchorPose,
  const Vector3D& fallbackForward) const
{
  if (!gains_.keepUpright)
  {
    return anchorPose.orientation;
  }
  return uprightOrientation(anchorPose.forward(), fallbackForward);
}

Wrench HoldController::apply(RigidBody& body,
                             const Pose& anchorPose,
                             const Vector3D& anchorVelocity,
                             const Vector3D& fallbackForward) const
{
  Pose const bodyPose = body.getPose();

  Wrench const wrench{
    computeForce(anchorPose.position,
                 anchorVelocity,
                 body.getWorldCenterOfMass(),
                 body.getLinearVelocity()),
    computeTorque(desiredOrientation(anchorPose, fallbackForward),
                  bodyPose.orientation,
                  body.getAngularVelocity())};

  body.addForce(wrench.force, ForceMode::Force);
  body.addTorque(wrench.torque, ForceMode::Force);

  logger_->trace("Hold wrench on body {}: force {} torque {}",
                 body.getId(),
                 std::format("{}", wrench.force),
                 std::format("{}", wrench.torque));
  return wrench;
}

}  // namespace tether_sim
