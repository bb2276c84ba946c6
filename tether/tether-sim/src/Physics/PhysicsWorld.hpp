// Ticket: 0002_physics_abstraction

#ifndef TETHER_SIM_PHYSICS_PHYSICS_WORLD_HPP
#define TETHER_SIM_PHYSICS_PHYSICS_WORLD_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "tether-sim/src/DataTypes/Coordinate.hpp"
#include "tether-sim/src/DataTypes/Vector3D.hpp"
#include "tether-sim/src/Physics/PhysicsTypes.hpp"
#include "tether-sim/src/Physics/Pose.hpp"
#include "tether-sim/src/Physics/RigidBody.hpp"

namespace tether_sim
{

/**
 * @brief A single intersection reported by a scene query
 */
struct ProbeHit
{
  ColliderId collider{0};
  std::optional<BodyId> body;  // nullopt for colliders without a rigid body
  Coordinate point;            // World-space contact point [m]
  double distance{0.0};        // Distance along the query direction [m]
};

/**
 * @brief Abstract interface to the external physics engine
 *
 * Exposes only what the hold subsystem consumes: scene queries, body lookup,
 * collider enumeration, pairwise collision exclusion and creation of the
 * kinematic anchor body.
 *
 * Thread safety: Implementations are not required to be thread-safe
 */
class PhysicsWorld
{
public:
  virtual ~PhysicsWorld() = default;

  /**
   * @brief Sweep a sphere along a ray and collect intersections
   * @param origin Start of the sweep [m]
   * @param direction Sweep direction (normalized by the implementation)
   * @param radius Sphere radius [m]
   * @param maxDistance Sweep length [m]
   * @param maxHits Upper bound on returned hits
   * @return At most maxHits hits, in an order that is fixed for a given scene
   */
  [[nodiscard]] virtual std::vector<ProbeHit> sphereCast(
    const Coordinate& origin,
    const Vector3D& direction,
    double radius,
    double maxDistance,
    std::size_t maxHits) const = 0;

  /**
   * @brief Cast a ray and return the nearest hit
   * @return Nearest hit within maxDistance, or nullopt
   */
  [[nodiscard]] virtual std::optional<ProbeHit> raycast(
    const Coordinate& origin,
    const Vector3D& direction,
    double maxDistance) const = 0;

  /// @return The body with this id, or nullptr if it does not exist
  [[nodiscard]] virtual RigidBody* findBody(BodyId id) = 0;

  /**
   * @brief Enumerate every collider under a body hierarchy
   * @param root Root body of the hierarchy
   * @return Colliders of root and of all bodies parented beneath it
   */
  [[nodiscard]] virtual std::vector<ColliderId> collidersUnder(
    BodyId root) const = 0;

  /**
   * @brief Enable or disable contact generation between two colliders
   *
   * Symmetric: (a, b) and (b, a) name the same pair.
   */
  virtual void setCollisionIgnored(ColliderId a,
                                   ColliderId b,
                                   bool ignored) = 0;

  [[nodiscard]] virtual bool isCollisionIgnored(ColliderId a,
                                                ColliderId b) const = 0;

  /// Create a collider-less kinematic body at the given pose
  virtual BodyId createKinematicBody(const Pose& pose) = 0;

  virtual void destroyBody(BodyId id) = 0;

protected:
  PhysicsWorld() = default;
  PhysicsWorld(const PhysicsWorld&) = default;
  PhysicsWorld& operator=(const PhysicsWorld&) = default;
  PhysicsWorld(PhysicsWorld&&) noexcept = default;
  PhysicsWorld& operator=(PhysicsWorld&&) noexcept = default;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_PHYSICS_PHYSICS_WORLD_HPP
