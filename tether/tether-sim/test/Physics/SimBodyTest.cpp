// Ticket: 0003_reference_backend

#include <gtest/gtest.h>

#include <stdexcept>

#include "tether-sim/src/Physics/Sim/SimBody.hpp"

using namespace tether_sim;

namespace
{

SimBody makeDynamic(double mass)
{
  return SimBody{1, mass, Pose{}, false, std::nullopt};
}

}  // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TEST(SimBodyTest, Constructor_NonPositiveMass_Throws)
{
  EXPECT_THROW(makeDynamic(0.0), std::invalid_argument);
  EXPECT_THROW(makeDynamic(-3.0), std::invalid_argument);
}

TEST(SimBodyTest, Constructor_KinematicAcceptsZeroMass)
{
  SimBody const body{2, 0.0, Pose{}, true, std::nullopt};

  EXPECT_TRUE(body.isKinematic());
  EXPECT_FALSE(body.getUseGravity());
  EXPECT_DOUBLE_EQ(0.0, body.getInverseMass());
}

TEST(SimBodyTest, Constructor_DynamicDefaults)
{
  SimBody const body = makeDynamic(5.0);

  EXPECT_FALSE(body.isKinematic());
  EXPECT_TRUE(body.getUseGravity());
  EXPECT_EQ(CollisionDetectionMode::Discrete, body.getCollisionDetectionMode());
  EXPECT_EQ(InterpolationMode::None, body.getInterpolationMode());
  EXPECT_EQ(BodyConstraints::None, body.getConstraints());
}

// ============================================================================
// Force Modes
// ============================================================================

TEST(SimBodyTest, addForce_Force_Accumulates)
{
  SimBody body = makeDynamic(2.0);

  body.addForce(Vector3D{1.0, 0.0, 0.0}, ForceMode::Force);
  body.addForce(Vector3D{2.0, 0.0, 0.0}, ForceMode::Force);

  EXPECT_DOUBLE_EQ(3.0, body.getAccumulatedForce().x());
  EXPECT_TRUE(body.getLinearVelocity().isZero());
}

TEST(SimBodyTest, addForce_Acceleration_ScalesByMass)
{
  SimBody body = makeDynamic(2.0);

  body.addForce(Vector3D{0.0, 3.0, 0.0}, ForceMode::Acceleration);

  EXPECT_DOUBLE_EQ(6.0, body.getAccumulatedForce().y());
}

TEST(SimBodyTest, addForce_Impulse_ChangesVelocityImmediately)
{
  SimBody body = makeDynamic(4.0);

  body.addForce(Vector3D{8.0, 0.0, 0.0}, ForceMode::Impulse);

  EXPECT_DOUBLE_EQ(2.0, body.getLinearVelocity().x());
  EXPECT_TRUE(body.getAccumulatedForce().isZero());
}

TEST(SimBodyTest, addForce_VelocityChange_IgnoresMass)
{
  SimBody body = makeDynamic(40.0);

  body.addForce(Vector3D{0.0, 0.0, 15.0}, ForceMode::VelocityChange);

  EXPECT_DOUBLE_EQ(15.0, body.getLinearVelocity().z());
}

TEST(SimBodyTest, addTorque_Impulse_UsesSphereInertia)
{
  SimBody body = makeDynamic(10.0);
  // I = 0.4 * 10 * 0.5^2 = 1
  body.attachCollider(7, 0.5);

  body.addTorque(Vector3D{0.0, 2.0, 0.0}, ForceMode::Impulse);

  EXPECT_NEAR(2.0, body.getAngularVelocity().y(), 1e-12);
}

TEST(SimBodyTest, addForce_Kinematic_Ignored)
{
  SimBody body{3, 0.0, Pose{}, true, std::nullopt};

  body.addForce(Vector3D{1.0, 1.0, 1.0}, ForceMode::Force);
  body.addForce(Vector3D{1.0, 1.0, 1.0}, ForceMode::VelocityChange);
  body.addTorque(Vector3D{1.0, 1.0, 1.0}, ForceMode::Force);

  EXPECT_TRUE(body.getAccumulatedForce().isZero());
  EXPECT_TRUE(body.getAccumulatedTorque().isZero());
  EXPECT_TRUE(body.getLinearVelocity().isZero());
}

TEST(SimBodyTest, clearForces_ZeroesAccumulators)
{
  SimBody body = makeDynamic(1.0);
  body.addForce(Vector3D{1.0, 2.0, 3.0}, ForceMode::Force);
  body.addTorque(Vector3D{1.0, 2.0, 3.0}, ForceMode::Force);

  body.clearForces();

  EXPECT_TRUE(body.getAccumulatedForce().isZero());
  EXPECT_TRUE(body.getAccumulatedTorque().isZero());
}

// ============================================================================
// Kinematic Motion
// ============================================================================

TEST(SimBodyTest, movePose_DynamicBody_Ignored)
{
  SimBody body = makeDynamic(1.0);

  body.movePose(Pose{Coordinate{1.0, 0.0, 0.0}});

  EXPECT_FALSE(body.getPendingPose().has_value());
}

TEST(SimBodyTest, movePose_KinematicBody_RecordsTarget)
{
  SimBody body{3, 0.0, Pose{}, true, std::nullopt};

  body.movePose(Pose{Coordinate{1.0, 0.0, 0.0}});

  ASSERT_TRUE(body.getPendingPose().has_value());
  EXPECT_DOUBLE_EQ(1.0, body.getPendingPose()->position.x());
  // Not applied until the world steps
  EXPECT_DOUBLE_EQ(0.0, body.getPose().position.x());
}
