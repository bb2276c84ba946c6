// Ticket: 0001_tether_datatypes

#ifndef TETHER_SIM_DATATYPES_VEC3D_BASE_HPP
#define TETHER_SIM_DATATYPES_VEC3D_BASE_HPP

// NOLINTBEGIN(bugprone-crtp-constructor-accessibility)

#include <Eigen/Dense>

namespace tether_sim::detail
{

/**
 * @brief CRTP base for the semantic 3-vectors
 *
 * Each quantity (position, force, torque, ...) is its own type so signatures
 * say what they carry, while every Eigen expression still converts back
 * implicitly:
 *
 *   struct ForceVector final : Vec3DBase<ForceVector> { ... };
 *   ForceVector f = kp * error + kd * relativeVelocity;
 *
 * The helpers return the derived type, so a clamped force is still a force.
 */
template <typename Derived>
class Vec3DBase : public Eigen::Vector3d
{
public:
  Vec3DBase() : Eigen::Vector3d{Eigen::Vector3d::Zero()}
  {
  }

  Vec3DBase(double x, double y, double z) : Eigen::Vector3d{x, y, z}
  {
  }

  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::Vector3d& vec) : Eigen::Vector3d{vec}
  {
  }

  template <typename OtherDerived>
  // NOLINTNEXTLINE(google-explicit-constructor)
  Vec3DBase(const Eigen::MatrixBase<OtherDerived>& other)
    : Eigen::Vector3d{other}
  {
  }

  template <typename OtherDerived>
  Derived& operator=(const Eigen::MatrixBase<OtherDerived>& other)
  {
    Eigen::Vector3d::operator=(other);
    return static_cast<Derived&>(*this);
  }

  /**
   * @brief Rescale to exactly maxMagnitude if longer, keeping direction
   *
   * Vectors within the limit, including the zero vector, come back unchanged.
   */
  [[nodiscard]] Derived clampedTo(double maxMagnitude) const
  {
    double const magnitude = norm();
    if (magnitude <= maxMagnitude || magnitude == 0.0)
    {
      return Derived{vector()};
    }
    return Derived{vector() * (maxMagnitude / magnitude)};
  }

  /**
   * @brief Remove the component along a unit axis
   *
   * With the world up axis this projects onto the horizontal plane.
   */
  [[nodiscard]] Derived withoutComponentAlong(const Eigen::Vector3d& axis) const
  {
    return Derived{vector() - axis * vector().dot(axis)};
  }

  Vec3DBase(const Vec3DBase&) = default;
  Vec3DBase(Vec3DBase&&) noexcept = default;
  Vec3DBase& operator=(const Vec3DBase&) = default;
  Vec3DBase& operator=(Vec3DBase&&) noexcept = default;
  ~Vec3DBase() = default;

private:
  [[nodiscard]] const Eigen::Vector3d& vector() const
  {
    return *this;
  }
};

}  // namespace tether_sim::detail

// NOLINTEND(bugprone-crtp-constructor-accessibility)

#endif  // TETHER_SIM_DATATYPES_VEC3D_BASE_HPP
