// Ticket: 0001_tether_datatypes

#ifndef TETHER_SIM_DATATYPES_VECTOR3D_HPP
#define TETHER_SIM_DATATYPES_VECTOR3D_HPP

#include "tether-sim/src/DataTypes/Vec3Formatter.hpp"

namespace tether_sim
{

/**
 * @brief Direction, displacement or linear velocity
 *
 * The catch-all type where no narrower quantity applies. Linear velocities
 * [m/s] use it too.
 */
struct Vector3D final : detail::Vec3DBase<Vector3D>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_DATATYPES_VECTOR3D_HPP
