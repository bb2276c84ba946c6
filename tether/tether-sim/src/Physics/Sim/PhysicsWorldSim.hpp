// Ticket: 0003_reference_backend

#ifndef TETHER_SIM_PHYSICS_SIM_PHYSICS_WORLD_SIM_HPP
#define TETHER_SIM_PHYSICS_SIM_PHYSICS_WORLD_SIM_HPP

#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "tether-sim/src/Physics/PhysicsWorld.hpp"
#include "tether-sim/src/Physics/Sim/SemiImplicitEulerIntegrator.hpp"
#include "tether-sim/src/Physics/Sim/SimBody.hpp"

namespace tether_sim
{

/**
 * @brief Minimal sphere-collider physics world
 *
 * Implements PhysicsWorld for closed-loop testing of the hold subsystem.
 * Colliders are spheres fixed to a body (or static when no body owns them).
 * There is no broadphase; every collider pair is tested each step and
 * overlapping pairs are separated with a single restitution impulse along
 * the centre line.
 *
 * Bodies and colliders are kept in id order, which is also creation order,
 * so scene queries report hits in a stable order.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 */
class PhysicsWorldSim final : public PhysicsWorld
{
public:
  struct Config
  {
    Vector3D gravity{0.0, -9.81, 0.0};  // [m/s²]
    double restitution{0.2};            // [0, 1]

    /**
     * @throws std::invalid_argument if gravity is not finite or restitution
     * is outside [0, 1]
     */
    void validate() const;
  };

  struct SphereCollider
  {
    ColliderId id{0};
    std::optional<BodyId> body;  // nullopt for static colliders
    Coordinate localCenter;      // Body frame, or world frame when static
    double radius{0.5};          // [m]
  };

  /**
   * @throws std::invalid_argument if config fails validation
   */
  PhysicsWorldSim(const Config& config, std::shared_ptr<spdlog::logger> logger);

  ~PhysicsWorldSim() override = default;

  PhysicsWorldSim(const PhysicsWorldSim&) = delete;
  PhysicsWorldSim& operator=(const PhysicsWorldSim&) = delete;
  PhysicsWorldSim(PhysicsWorldSim&&) = delete;
  PhysicsWorldSim& operator=(PhysicsWorldSim&&) = delete;

  // ===== Scene construction =====

  /**
   * @brief Add a dynamic body
   * @throws std::invalid_argument if mass <= 0
   * @throws std::out_of_range if parent does not exist
   */
  BodyId addDynamicBody(double mass,
                        const Pose& pose,
                        std::optional<BodyId> parent = std::nullopt);

  /**
   * @brief Add a kinematic body
   * @throws std::out_of_range if parent does not exist
   */
  BodyId addKinematicBody(const Pose& pose,
                          std::optional<BodyId> parent = std::nullopt);

  /**
   * @brief Attach a sphere collider to a body
   * @param body Owning body
   * @param radius Sphere radius [m], must be > 0
   * @param localCenter Centre in the body frame [m]
   * @throws std::out_of_range if body does not exist
   * @throws std::invalid_argument if radius <= 0
   */
  ColliderId addSphereCollider(BodyId body,
                               double radius,
                               const Coordinate& localCenter = Coordinate{});

  /**
   * @brief Add a collider with no rigid body
   * @throws std::invalid_argument if radius <= 0
   */
  ColliderId addStaticSphere(const Coordinate& center, double radius);

  /**
   * @brief Advance the simulation by dt
   * @throws std::invalid_argument if dt <= 0
   */
  void step(double dt);

  /**
   * @brief Typed lookup
   * @throws std::out_of_range if the body does not exist
   */
  [[nodiscard]] SimBody& getBody(BodyId id);
  [[nodiscard]] const SimBody& getBody(BodyId id) const;

  [[nodiscard]] const SphereCollider& getCollider(ColliderId id) const;

  /// World-space centre of a collider
  [[nodiscard]] Coordinate colliderCenter(const SphereCollider& collider) const;

  [[nodiscard]] std::size_t getIgnoredPairCount() const;

  // ===== PhysicsWorld =====

  /**
   * @throws std::invalid_argument if radius or maxDistance is negative
   */
  [[nodiscard]] std::vector<ProbeHit> sphereCast(
    const Coordinate& origin,
    const Vector3D& direction,
    double radius,
    double maxDistance,
    std::size_t maxHits) const override;

  [[nodiscard]] std::optional<ProbeHit> raycast(
    const Coordinate& origin,
    const Vector3D& direction,
    double maxDistance) const override;

  [[nodiscard]] RigidBody* findBody(BodyId id) override;

  [[nodiscard]] std::vector<ColliderId> collidersUnder(
    BodyId root) const override;

  void setCollisionIgnored(ColliderId a, ColliderId b, bool ignored) override;

  [[nodiscard]] bool isCollisionIgnored(ColliderId a,
                                        ColliderId b) const override;

  BodyId createKinematicBody(const Pose& pose) override;

  /// Destroys the body, its child bodies and their colliders. Unknown ids
  /// are ignored.
  void destroyBody(BodyId id) override;

private:
  using ColliderPair = std::pair<ColliderId, ColliderId>;

  static ColliderPair makePair(ColliderId a, ColliderId b);

  BodyId addBody(double mass,
                 const Pose& pose,
                 bool kinematic,
                 std::optional<BodyId> parent);

  /// Ray parameter of first contact with an inflated sphere, if any
  static std::optional<double> intersect(const Coordinate& origin,
                                         const Eigen::Vector3d& direction,
                                         const Coordinate& center,
                                         double radius);

  void advanceKinematic(SimBody& body, double dt);
  void resolveContacts();
  [[nodiscard]] double inverseMassOf(const SphereCollider& collider) const;

  Config config_;
  std::shared_ptr<spdlog::logger> logger_;
  SemiImplicitEulerIntegrator integrator_;

  std::map<BodyId, SimBody> bodies_;
  std::map<ColliderId, SphereCollider> colliders_;
  std::set<ColliderPair> ignoredPairs_;

  BodyId nextBodyId_{1};
  ColliderId nextColliderId_{1};
};

}  // namespace tether_sim

#endif  // TETHER_SIM_PHYSICS_SIM_PHYSICS_WORLD_SIM_HPP
