// Ticket: 0012_throw_punt

#include <gtest/gtest.h>

#include <stdexcept>

#include "tether-sim/src/Hold/ImpulseApplier.hpp"
#include "tether-sim/src/Physics/Sim/PhysicsWorldSim.hpp"
#include "tether-sim/test/Helpers/GrabScenario.hpp"

using namespace tether_sim;
using tether_sim::test::makeNullLogger;

namespace
{

class ImpulseApplierTest : public ::testing::Test
{
protected:
  BodyId addBody(double mass, const Coordinate& position)
  {
    BodyId const id = world.addDynamicBody(mass, Pose{position});
    world.addSphereCollider(id, 0.5);
    return id;
  }

  PhysicsWorldSim world{PhysicsWorldSim::Config{}, makeNullLogger()};
  ImpulseApplier impulses{world, makeNullLogger()};
  Pose view{};
};

}  // anonymous namespace

// ============================================================================
// Throw
// ============================================================================

TEST_F(ImpulseApplierTest, throwBody_ReplacesPriorMotion)
{
  SimBody& body = world.getBody(addBody(10.0, Coordinate{0.0, 0.0, 2.0}));
  body.setLinearVelocity(Vector3D{1.0, 2.0, 3.0});
  body.setAngularVelocity(AngularVelocity{1.0, 1.0, 1.0});

  impulses.throwBody(body, Vector3D{0.0, 0.0, 2.0}, 15.0);

  EXPECT_TRUE(body.getLinearVelocity().isApprox(Vector3D{0.0, 0.0, 15.0}));
  EXPECT_TRUE(body.getAngularVelocity().isZero());
}

TEST_F(ImpulseApplierTest, throwBody_IndependentOfMass)
{
  SimBody& light = world.getBody(addBody(1.0, Coordinate{0.0, 0.0, 2.0}));
  SimBody& heavy = world.getBody(addBody(100.0, Coordinate{3.0, 0.0, 2.0}));

  impulses.throwBody(light, Vector3D{1.0, 0.0, 0.0}, 8.0);
  impulses.throwBody(heavy, Vector3D{1.0, 0.0, 0.0}, 8.0);

  EXPECT_TRUE(light.getLinearVelocity().isApprox(heavy.getLinearVelocity()));
}

TEST(ImpulseApplierScaleTest, massScaledMagnitude)
{
  EXPECT_DOUBLE_EQ(15.0, ImpulseApplier::massScaledMagnitude(15.0, 0.0, 120.0));
  EXPECT_DOUBLE_EQ(4.5, ImpulseApplier::massScaledMagnitude(15.0, 120.0, 120.0));
  EXPECT_DOUBLE_EQ(4.5, ImpulseApplier::massScaledMagnitude(15.0, 500.0, 120.0));
  EXPECT_NEAR(15.0 * 0.65,
              ImpulseApplier::massScaledMagnitude(15.0, 60.0, 120.0),
              1e-12);
}

// ============================================================================
// Punt
// ============================================================================

TEST_F(ImpulseApplierTest, punt_KicksFirstBodyAlongView)
{
  BodyId const boulder = addBody(200.0, Coordinate{0.0, 0.0, 5.0});
  addBody(10.0, Coordinate{0.0, 0.0, 8.0});

  auto const kicked = impulses.punt(view, 20.0, 12.0);

  ASSERT_TRUE(kicked.has_value());
  EXPECT_EQ(boulder, *kicked);
  EXPECT_TRUE(world.getBody(boulder).getLinearVelocity().isApprox(
    Vector3D{0.0, 0.0, 12.0}));
}

TEST_F(ImpulseApplierTest, punt_AddsToExistingVelocity)
{
  SimBody& body = world.getBody(addBody(5.0, Coordinate{0.0, 0.0, 5.0}));
  body.setLinearVelocity(Vector3D{1.0, 0.0, 0.0});

  impulses.punt(view, 20.0, 12.0);

  EXPECT_TRUE(body.getLinearVelocity().isApprox(Vector3D{1.0, 0.0, 12.0}));
}

TEST_F(ImpulseApplierTest, punt_NothingInRange_NoOp)
{
  BodyId const far = addBody(5.0, Coordinate{0.0, 0.0, 30.0});

  EXPECT_FALSE(impulses.punt(view, 20.0, 12.0).has_value());
  EXPECT_TRUE(world.getBody(far).getLinearVelocity().isZero());
}

TEST_F(ImpulseApplierTest, punt_KinematicOrStatic_NoOp)
{
  BodyId const platform = world.addKinematicBody(Pose{Coordinate{0.0, 0.0, 3.0}});
  world.addSphereCollider(platform, 0.5);

  EXPECT_FALSE(impulses.punt(view, 20.0, 12.0).has_value());

  world.destroyBody(platform);
  world.addStaticSphere(Coordinate{0.0, 0.0, 3.0}, 0.5);

  EXPECT_FALSE(impulses.punt(view, 20.0, 12.0).has_value());
}
