// Ticket: 0001_tether_datatypes

#ifndef TETHER_SIM_DATATYPES_TORQUE_VECTOR_HPP
#define TETHER_SIM_DATATYPES_TORQUE_VECTOR_HPP

#include "tether-sim/src/DataTypes/Vec3Formatter.hpp"

namespace tether_sim
{

/// Torque [N*m]
struct TorqueVector final : detail::Vec3DBase<TorqueVector>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_DATATYPES_TORQUE_VECTOR_HPP
