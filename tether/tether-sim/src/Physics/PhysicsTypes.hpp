// Ticket: 0002_physics_abstraction

#ifndef TETHER_SIM_PHYSICS_PHYSICS_TYPES_HPP
#define TETHER_SIM_PHYSICS_PHYSICS_TYPES_HPP

#include <cstdint>
#include <string_view>

namespace tether_sim
{

using BodyId = uint32_t;
using ColliderId = uint32_t;

/**
 * @brief How a vector passed to RigidBody::addForce/addTorque is interpreted
 *
 * - Force: continuous, mass-dependent, integrated over the next step
 * - Acceleration: continuous, mass-independent
 * - Impulse: instantaneous, mass-dependent
 * - VelocityChange: instantaneous, mass-independent
 */
enum class ForceMode : uint8_t
{
  Force,
  Acceleration,
  Impulse,
  VelocityChange
};

enum class CollisionDetectionMode : uint8_t
{
  Discrete,
  Continuous,
  ContinuousDynamic,
  ContinuousSpeculative
};

enum class InterpolationMode : uint8_t
{
  None,
  Interpolate,
  Extrapolate
};

/**
 * @brief Per-axis freeze flags of a rigid body
 */
enum class BodyConstraints : uint8_t
{
  None = 0,
  FreezePositionX = 1U << 0U,
  FreezePositionY = 1U << 1U,
  FreezePositionZ = 1U << 2U,
  FreezeRotationX = 1U << 3U,
  FreezeRotationY = 1U << 4U,
  FreezeRotationZ = 1U << 5U,
  FreezePosition = FreezePositionX | FreezePositionY | FreezePositionZ,
  FreezeRotation = FreezeRotationX | FreezeRotationY | FreezeRotationZ,
  FreezeAll = FreezePosition | FreezeRotation
};

constexpr BodyConstraints operator|(BodyConstraints lhs, BodyConstraints rhs)
{
  return static_cast<BodyConstraints>(static_cast<uint8_t>(lhs) |
                                      static_cast<uint8_t>(rhs));
}

constexpr BodyConstraints operator&(BodyConstraints lhs, BodyConstraints rhs)
{
  return static_cast<BodyConstraints>(static_cast<uint8_t>(lhs) &
                                      static_cast<uint8_t>(rhs));
}

/// True if any flag of mask is set in flags
constexpr bool any(BodyConstraints flags, BodyConstraints mask)
{
  return (flags & mask) != BodyConstraints::None;
}

constexpr std::string_view toString(CollisionDetectionMode mode)
{
  switch (mode)
  {
    case CollisionDetectionMode::Discrete:
      return "Discrete";
    case CollisionDetectionMode::Continuous:
      return "Continuous";
    case CollisionDetectionMode::ContinuousDynamic:
      return "ContinuousDynamic";
    case CollisionDetectionMode::ContinuousSpeculative:
      return "ContinuousSpeculative";
  }
  return "Unknown";
}

constexpr std::string_view toString(InterpolationMode mode)
{
  switch (mode)
  {
    case InterpolationMode::None:
      return "None";
    case InterpolationMode::Interpolate:
      return "Interpolate";
    case InterpolationMode::Extrapolate:
      return "Extrapolate";
  }
  return "Unknown";
}

}  // namespace tether_sim

#endif  // TETHER_SIM_PHYSICS_PHYSICS_TYPES_HPP
