// Ticket: 0007_hold_controller

#include <gtest/gtest.h>

#include <Eigen/Geometry>
#include <numbers>
#include <stdexcept>

#include "tether-sim/src/Hold/HoldController.hpp"
#include "tether-sim/src/Physics/Sim/SimBody.hpp"
#include "tether-sim/test/Helpers/GrabScenario.hpp"

using namespace tether_sim;
using tether_sim::test::makeNullLogger;

namespace
{

constexpr double kPi = std::numbers::pi;

HoldController makeController(bool keepUpright = false)
{
  HoldController::Gains gains;
  gains.keepUpright = keepUpright;
  return HoldController{gains, makeNullLogger()};
}

Eigen::Quaterniond aboutAxis(double angle, const Eigen::Vector3d& axis)
{
  return Eigen::Quaterniond{Eigen::AngleAxisd{angle, axis}};
}

}  // anonymous namespace

TEST(HoldControllerTest, Constructor_NullLogger_Throws)
{
  EXPECT_THROW((HoldController{HoldController::Gains{}, nullptr}),
               std::invalid_argument);
}

// ============================================================================
// Position Channel
// ============================================================================

TEST(HoldControllerTest, computeForce_SpringTerm)
{
  HoldController const controller = makeController();

  ForceVector const force = controller.computeForce(Coordinate{0.0, 0.0, 1.0},
                                                    Vector3D{0.0, 0.0, 0.0},
                                                    Coordinate{0.0, 0.0, 0.0},
                                                    Vector3D{0.0, 0.0, 0.0});

  EXPECT_TRUE(force.isApprox(ForceVector{0.0, 0.0, 900.0}));
}

TEST(HoldControllerTest, computeForce_DampsRelativeVelocity)
{
  HoldController const controller = makeController();

  ForceVector const force = controller.computeForce(Coordinate{0.0, 0.0, 0.0},
                                                    Vector3D{0.0, 0.0, 0.5},
                                                    Coordinate{0.0, 0.0, 0.0},
                                                    Vector3D{1.0, 0.0, 0.0});

  EXPECT_TRUE(force.isApprox(ForceVector{-120.0, 0.0, 60.0}));
}

TEST(HoldControllerTest, computeForce_LargeError_ClampedToMaxForce)
{
  HoldController const controller = makeController();

  ForceVector const force = controller.computeForce(Coordinate{0.0, 100.0, 0.0},
                                                    Vector3D{0.0, 0.0, 0.0},
                                                    Coordinate{0.0, 0.0, 0.0},
                                                    Vector3D{0.0, 0.0, 0.0});

  EXPECT_NEAR(6000.0, force.norm(), 1e-9);
  EXPECT_TRUE(force.normalized().isApprox(Vector3D{0.0, 1.0, 0.0}));
}

TEST(HoldControllerTest, computeForce_NeverExceedsMaxForce)
{
  HoldController const controller = makeController();

  for (int i = -5; i <= 5; ++i)
  {
    for (int j = -5; j <= 5; ++j)
    {
      ForceVector const force =
        controller.computeForce(Coordinate{i * 3.0, j * 1.7, 2.0},
                                Vector3D{j * 20.0, 0.0, i * 11.0},
                                Coordinate{0.0, 0.0, 0.0},
                                Vector3D{-i * 4.0, j * 9.0, 1.0});
      EXPECT_LE(force.norm(), 6000.0 * (1.0 + 1e-12));
    }
  }
}

// ============================================================================
// Rotation Channel
// ============================================================================

TEST(HoldControllerTest, computeTorque_270DegreeError_TurnsShortWay)
{
  HoldController const controller = makeController();

  TorqueVector const torque =
    controller.computeTorque(aboutAxis(3.0 * kPi / 2.0, Eigen::Vector3d::UnitY()),
                             Eigen::Quaterniond::Identity(),
                             AngularVelocity{0.0, 0.0, 0.0});

  EXPECT_NEAR(0.0, torque.x(), 1e-9);
  EXPECT_NEAR(-250.0 * kPi / 2.0, torque.y(), 1e-9);
  EXPECT_NEAR(0.0, torque.z(), 1e-9);
}

TEST(HoldControllerTest, computeTorque_ErrorRelativeToBody)
{
  HoldController const controller = makeController();
  Eigen::Quaterniond const body = aboutAxis(0.5, Eigen::Vector3d::UnitX());
  Eigen::Quaterniond const desired = aboutAxis(0.8, Eigen::Vector3d::UnitX());

  TorqueVector const torque = controller.computeTorque(
    desired, body, AngularVelocity{0.0, 0.0, 0.0});

  EXPECT_TRUE(torque.isApprox(TorqueVector{250.0 * 0.3, 0.0, 0.0}, 1e-9));
}

TEST(HoldControllerTest, computeTorque_DampsAngularVelocity)
{
  HoldController const controller = makeController();

  TorqueVector const torque =
    controller.computeTorque(Eigen::Quaterniond::Identity(),
                             Eigen::Quaterniond::Identity(),
                             AngularVelocity{0.0, 0.0, 2.0});

  EXPECT_TRUE(torque.isApprox(TorqueVector{0.0, 0.0, -60.0}));
}

TEST(HoldControllerTest, computeTorque_ClampedToMaxTorque)
{
  HoldController const controller = makeController();

  TorqueVector const torque =
    controller.computeTorque(Eigen::Quaterniond::Identity(),
                             Eigen::Quaterniond::Identity(),
                             AngularVelocity{100.0, 0.0, 0.0});

  EXPECT_NEAR(800.0, torque.norm(), 1e-9);
  EXPECT_LT(torque.x(), 0.0);
}

// ============================================================================
// Desired Orientation
// ============================================================================

TEST(HoldControllerTest, desiredOrientation_FollowsAnchor)
{
  HoldController const controller = makeController();
  Pose const anchor{Coordinate{0.0, 0.0, 3.0},
                    aboutAxis(0.7, Eigen::Vector3d::UnitX())};

  Eigen::Quaterniond const desired =
    controller.desiredOrientation(anchor, Vector3D{0.0, 0.0, 1.0});

  EXPECT_NEAR(0.0, desired.angularDistance(anchor.orientation), 1e-12);
}

TEST(HoldControllerTest, desiredOrientation_KeepUpright_DropsPitch)
{
  HoldController const controller = makeController(true);
  Pose const pitchedDown{Coordinate{0.0, 0.0, 3.0},
                         aboutAxis(kPi / 4.0, Eigen::Vector3d::UnitX())};

  Eigen::Quaterniond const desired =
    controller.desiredOrientation(pitchedDown, Vector3D{0.0, 0.0, 1.0});

  EXPECT_TRUE((desired * Eigen::Vector3d::UnitY()).isApprox(
    Eigen::Vector3d::UnitY(), 1e-12));
  EXPECT_TRUE((desired * Eigen::Vector3d::UnitZ()).isApprox(
    Eigen::Vector3d::UnitZ(), 1e-12));
}

TEST(HoldControllerTest, desiredOrientation_KeepUprightLookingDown_UsesFallback)
{
  HoldController const controller = makeController(true);
  Pose const straightDown{Coordinate{0.0, 0.0, 0.0},
                          aboutAxis(kPi / 2.0, Eigen::Vector3d::UnitX())};

  Eigen::Quaterniond const desired =
    controller.desiredOrientation(straightDown, Vector3D{1.0, 0.0, 0.0});

  EXPECT_TRUE((desired * Eigen::Vector3d::UnitZ()).isApprox(
    Eigen::Vector3d::UnitX(), 1e-12));
}

// ============================================================================
// Apply
// ============================================================================

TEST(HoldControllerTest, apply_AddsReturnedWrenchOnce)
{
  HoldController const controller = makeController();
  SimBody body{1, 40.0, Pose{Coordinate{0.0, 0.0, 3.0}}, false, std::nullopt};
  Pose const anchor{Coordinate{0.0, 0.5, 2.0},
                    aboutAxis(0.4, Eigen::Vector3d::UnitY())};

  Wrench const wrench = controller.apply(
    body, anchor, Vector3D{0.0, 0.0, 0.0}, Vector3D{0.0, 0.0, 1.0});

  EXPECT_TRUE(wrench.force.isApprox(ForceVector{0.0, 450.0, -900.0}));
  EXPECT_TRUE(body.getAccumulatedForce().isApprox(wrench.force));
  EXPECT_TRUE(body.getAccumulatedTorque().isApprox(wrench.torque));
  EXPECT_NEAR(250.0 * 0.4, wrench.torque.y(), 1e-9);
}
