// Ticket: 0001_tether_datatypes

#ifndef TETHER_SIM_DATATYPES_ANGULAR_VELOCITY_HPP
#define TETHER_SIM_DATATYPES_ANGULAR_VELOCITY_HPP

#include "tether-sim/src/DataTypes/Vec3Formatter.hpp"

namespace tether_sim
{

/**
 * @brief World-frame angular velocity [rad/s]
 *
 * Axis times rate. Rates above 2pi rad/s are legal and never wrapped.
 */
struct AngularVelocity final : detail::Vec3DBase<AngularVelocity>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_DATATYPES_ANGULAR_VELOCITY_HPP
