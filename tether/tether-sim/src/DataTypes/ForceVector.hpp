// Ticket: 0001_tether_datatypes

#ifndef TETHER_SIM_DATATYPES_FORCE_VECTOR_HPP
#define TETHER_SIM_DATATYPES_FORCE_VECTOR_HPP

#include "tether-sim/src/DataTypes/Vec3Formatter.hpp"

namespace tether_sim
{

/// Force [N]; position-channel output of the hold controller
struct ForceVector final : detail::Vec3DBase<ForceVector>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_DATATYPES_FORCE_VECTOR_HPP
