// Ticket: 0007_hold_controller

#include <gtest/gtest.h>

#include <Eigen/Geometry>
#include <cmath>
#include <numbers>

#include "tether-sim/src/Hold/HoldMath.hpp"

using namespace tether_sim;

namespace
{

constexpr double kPi = std::numbers::pi;

Eigen::Quaterniond aboutY(double angle)
{
  return Eigen::Quaterniond{Eigen::AngleAxisd{angle, Eigen::Vector3d::UnitY()}};
}

}  // anonymous namespace

// ============================================================================
// clampMagnitude
// ============================================================================

TEST(HoldMathTest, clampMagnitude_NeverExceedsLimit)
{
  double const limit = 6000.0;
  for (int i = -20; i <= 20; ++i)
  {
    for (int j = -20; j <= 20; j += 5)
    {
      Vector3D const v{i * 731.0, j * 1234.5, (i - j) * 97.0};
      Vector3D const clamped = clampMagnitude(v, limit);

      EXPECT_LE(clamped.norm(), limit * (1.0 + 1e-12));
      if (v.norm() > limit)
      {
        EXPECT_NEAR(limit, clamped.norm(), 1e-6);
        EXPECT_NEAR(1.0, clamped.normalized().dot(v.normalized()), 1e-12);
      }
      else
      {
        EXPECT_TRUE(clamped.isApprox(v) || v.isZero());
      }
    }
  }
}

// ============================================================================
// wrapAngle
// ============================================================================

TEST(HoldMathTest, wrapAngle_IntoHalfOpenRange)
{
  EXPECT_NEAR(-kPi / 2.0, wrapAngle(3.0 * kPi / 2.0), 1e-12);
  EXPECT_NEAR(kPi / 2.0, wrapAngle(-3.0 * kPi / 2.0), 1e-12);
  EXPECT_NEAR(0.0, wrapAngle(2.0 * kPi), 1e-12);
  EXPECT_DOUBLE_EQ(0.0, wrapAngle(0.0));
}

TEST(HoldMathTest, wrapAngle_BoundaryMapsToPositivePi)
{
  EXPECT_DOUBLE_EQ(kPi, wrapAngle(kPi));
  EXPECT_DOUBLE_EQ(kPi, wrapAngle(-kPi));
  EXPECT_NEAR(kPi, wrapAngle(3.0 * kPi), 1e-12);
}

// ============================================================================
// toWrappedAngleAxis
// ============================================================================

TEST(HoldMathTest, toWrappedAngleAxis_270Degrees_BecomesMinus90)
{
  Vector3D const error = toWrappedAngleAxis(aboutY(3.0 * kPi / 2.0));

  EXPECT_NEAR(0.0, error.x(), 1e-12);
  EXPECT_NEAR(-kPi / 2.0, error.y(), 1e-12);
  EXPECT_NEAR(0.0, error.z(), 1e-12);
}

TEST(HoldMathTest, toWrappedAngleAxis_DoubleCover_SameError)
{
  Eigen::Quaterniond const q = aboutY(3.0 * kPi / 2.0);
  Eigen::Quaterniond const negated{-q.w(), -q.x(), -q.y(), -q.z()};

  EXPECT_TRUE(toWrappedAngleAxis(q).isApprox(toWrappedAngleAxis(negated),
                                             1e-12));
}

TEST(HoldMathTest, toWrappedAngleAxis_QuarterTurnAboutX)
{
  Eigen::Quaterniond const q{
    Eigen::AngleAxisd{kPi / 2.0, Eigen::Vector3d::UnitX()}};

  Vector3D const error = toWrappedAngleAxis(q);

  EXPECT_NEAR(kPi / 2.0, error.x(), 1e-12);
  EXPECT_NEAR(0.0, error.y(), 1e-12);
  EXPECT_NEAR(0.0, error.z(), 1e-12);
}

TEST(HoldMathTest, toWrappedAngleAxis_Identity_IsZero)
{
  EXPECT_TRUE(toWrappedAngleAxis(Eigen::Quaterniond::Identity()).isZero());
  EXPECT_TRUE(toWrappedAngleAxis(aboutY(2.0 * kPi)).isZero(1e-9));
}

// ============================================================================
// lookRotation / uprightOrientation
// ============================================================================

TEST(HoldMathTest, lookRotation_AlongZ_IsIdentity)
{
  Eigen::Quaterniond const q =
    lookRotation(Vector3D{0.0, 0.0, 5.0}, Vector3D{0.0, 1.0, 0.0});

  EXPECT_NEAR(0.0, q.angularDistance(Eigen::Quaterniond::Identity()), 1e-12);
}

TEST(HoldMathTest, lookRotation_AlongX_KeepsUp)
{
  Eigen::Quaterniond const q =
    lookRotation(Vector3D{1.0, 0.0, 0.0}, Vector3D{0.0, 1.0, 0.0});

  EXPECT_TRUE((q * Eigen::Vector3d::UnitZ()).isApprox(Eigen::Vector3d::UnitX(),
                                                      1e-12));
  EXPECT_TRUE((q * Eigen::Vector3d::UnitY()).isApprox(Eigen::Vector3d::UnitY(),
                                                      1e-12));
}

TEST(HoldMathTest, lookRotation_ParallelToUp_StillFacesForward)
{
  Eigen::Quaterniond const q =
    lookRotation(Vector3D{0.0, 2.0, 0.0}, Vector3D{0.0, 1.0, 0.0});

  EXPECT_TRUE((q * Eigen::Vector3d::UnitZ()).isApprox(Eigen::Vector3d::UnitY(),
                                                      1e-12));
}

TEST(HoldMathTest, uprightOrientation_PitchedForward_Flattened)
{
  Eigen::Quaterniond const q = uprightOrientation(
    Vector3D{1.0, -1.0, 0.0}, Vector3D{0.0, 0.0, 1.0});

  EXPECT_TRUE((q * Eigen::Vector3d::UnitZ()).isApprox(Eigen::Vector3d::UnitX(),
                                                      1e-12));
  EXPECT_TRUE((q * Eigen::Vector3d::UnitY()).isApprox(Eigen::Vector3d::UnitY(),
                                                      1e-12));
}

TEST(HoldMathTest, uprightOrientation_LookingStraightUp_UsesFallback)
{
  Eigen::Quaterniond const q = uprightOrientation(
    Vector3D{0.0, 1.0, 0.0}, Vector3D{0.0, 0.0, -1.0});

  EXPECT_TRUE((q * Eigen::Vector3d::UnitZ()).isApprox(-Eigen::Vector3d::UnitZ(),
                                                      1e-12));
  EXPECT_TRUE((q * Eigen::Vector3d::UnitY()).isApprox(Eigen::Vector3d::UnitY(),
                                                      1e-12));
}

TEST(HoldMathTest, uprightOrientation_BothDegenerate_FacesWorldForward)
{
  Eigen::Quaterniond const q = uprightOrientation(
    Vector3D{0.0, -1.0, 0.0}, Vector3D{0.0, 1.0, 0.0});

  EXPECT_TRUE((q * Eigen::Vector3d::UnitZ()).isApprox(Eigen::Vector3d::UnitZ(),
                                                      1e-12));
}
