// Ticket: 0001_tether_datatypes

#ifndef TETHER_SIM_DATATYPES_COORDINATE_HPP
#define TETHER_SIM_DATATYPES_COORDINATE_HPP

#include "tether-sim/src/DataTypes/Vec3Formatter.hpp"

namespace tether_sim
{

/**
 * @brief World-space position [m]
 *
 * Body positions, anchor targets, probe origins and hit points.
 */
struct Coordinate final : detail::Vec3DBase<Coordinate>
{
  using Vec3DBase::Vec3DBase;
  using Vec3DBase::operator=;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_DATATYPES_COORDINATE_HPP
