// Ticket: 0013_grab_system

#ifndef TETHER_SIM_HOLD_GRAB_SYSTEM_HPP
#define TETHER_SIM_HOLD_GRAB_SYSTEM_HPP

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>

#include "tether-sim/src/Agent/GrabInput.hpp"
#include "tether-sim/src/Agent/ViewSource.hpp"
#include "tether-sim/src/Hold/AnchorTracker.hpp"
#include "tether-sim/src/Hold/BodyStateSnapshot.hpp"
#include "tether-sim/src/Hold/CollisionExclusionSet.hpp"
#include "tether-sim/src/Hold/HighlightTracker.hpp"
#include "tether-sim/src/Hold/HoldController.hpp"
#include "tether-sim/src/Hold/HoldDistance.hpp"
#include "tether-sim/src/Hold/ImpulseApplier.hpp"
#include "tether-sim/src/Hold/Presentation.hpp"
#include "tether-sim/src/Hold/TargetSelector.hpp"

namespace tether_sim
{

/**
 * @brief Grab, hold, throw and punt rigid bodies with a PD-controlled tether
 *
 * Driven by two callbacks:
 * - update(): once per rendered frame. Routes input edges and scroll, then
 *   refreshes the highlight and beam.
 * - fixedUpdate(): once per physics tick. Advances the anchor, then applies
 *   the hold wrench if a body is held.
 *
 * At most one body is held. While held the body keeps simulating: gravity is
 * switched off, damping and collision settings are overridden, and contacts
 * between it and the holder are disabled. Release (drop, throw,
 * deactivation or destruction) restores all of that exactly.
 *
 * Thread safety: Not thread-safe (single-threaded simulation)
 */
class GrabSystem
{
public:
  struct Config
  {
    // Targeting
    double pickupRange{12.0};     // [m]
    double highlightRange{12.0};  // [m]
    double puntRange{20.0};       // [m]
    double probeRadius{0.35};     // [m]
    std::size_t maxProbeHits{16};
    double maxPickupMass{120.0};  // [kg]
    double alignmentWeight{3.0};

    // Hold distance
    double minHoldDistance{1.5};   // [m]
    double maxHoldDistance{8.0};   // [m]
    double holdDistanceStep{0.5};  // [m per scroll unit]

    // PD gains
    double positionSpring{900.0};
    double positionDamping{120.0};
    double maxForce{6000.0};  // [N]
    double rotationSpring{250.0};
    double rotationDamping{30.0};
    double maxTorque{800.0};  // [N·m]
    bool keepUpright{false};

    // Impulses (velocity change) [m/s]
    double throwImpulse{15.0};
    double puntImpulse{12.0};
    bool scaleThrowByMass{false};

    // Held-body overrides
    double heldLinearDamping{10.0};
    double heldAngularDamping{5.0};

    double minTickDuration{1e-4};  // [s]

    /**
     * @brief Check every field
     * @throws std::invalid_argument on the first invalid field
     */
    void validate(spdlog::logger& logger) const;
  };

  /**
   * @param world Physics engine
   * @param holderRoot Root body of the holding agent
   * @param viewSource Controller transform, must outlive this object
   * @param config Tunables, validated here
   * @param logger Destination for subsystem logs
   * @param presentation Optional rendering hooks
   * @throws std::invalid_argument if config is invalid or logger is null
   * @throws std::out_of_range if holderRoot does not exist
   */
  GrabSystem(PhysicsWorld& world,
             BodyId holderRoot,
             const ViewSource& viewSource,
             const Config& config,
             std::shared_ptr<spdlog::logger> logger,
             Presentation presentation = {});

  /// Releases any held body
  ~GrabSystem();

  GrabSystem(const GrabSystem&) = delete;
  GrabSystem& operator=(const GrabSystem&) = delete;
  GrabSystem(GrabSystem&&) = delete;
  GrabSystem& operator=(GrabSystem&&) = delete;

  /**
   * @brief Variable-rate callback
   *
   * Nothing in input is processed while input.interactionSuppressed is set.
   * Edges are routed by whether a body was held at the start of the call:
   * primary throws or punts, secondary drops or picks up.
   */
  void update(const GrabInput& input);

  /**
   * @brief Fixed-rate callback: advance the anchor, then at most one PD
   * evaluation
   */
  void fixedUpdate(double dt);

  /// @return true if a body was picked up
  bool tryPickup();

  /// Release without impulse. @return false if nothing was held
  bool drop();

  /// Zero velocity, kick forward, release. @return false if nothing was held
  bool throwHeld();

  /// Kick the body ahead without holding it. @return true if one was kicked
  bool punt();

  /**
   * @brief Enable or disable the subsystem
   *
   * Deactivating releases any held body before returning. While inactive,
   * update(), fixedUpdate() and the actions do nothing.
   */
  void setActive(bool active);

  [[nodiscard]] bool isActive() const;
  [[nodiscard]] bool isHolding() const;
  [[nodiscard]] std::optional<BodyId> getHeldBodyId() const;
  [[nodiscard]] double getHoldDistance() const;

  /// Beam from muzzle (or controller) to the held body, only while holding
  [[nodiscard]] const std::optional<BeamSegment>& getBeamSegment() const;

  /// Wrench applied on the last fixed tick of the current hold
  [[nodiscard]] const std::optional<Wrench>& getLastWrench() const;

  [[nodiscard]] std::size_t getExclusionCount() const;

  /// Pre-grab properties of the held body
  [[nodiscard]] std::optional<BodyStateSnapshot> getSnapshot() const;

  [[nodiscard]] std::optional<BodyId> getHighlightedBodyId() const;
  [[nodiscard]] const AnchorTracker& getAnchor() const;

private:
  struct HoldSession
  {
    BodyId body;
    BodyStateSnapshot snapshot;
  };

  static std::shared_ptr<spdlog::logger> requireLogger(
    std::shared_ptr<spdlog::logger> logger);
  static Config validated(const Config& config, spdlog::logger& logger);

  [[nodiscard]] TargetSelector::Criteria criteria(double range) const;
  [[nodiscard]] Vector3D fallbackForward();
  [[nodiscard]] RigidBody* heldBody();

  /// Restore the snapshot and the exclusions, then end the session
  void release();

  void refreshHighlight();
  void refreshBeam();

  PhysicsWorld& world_;
  BodyId holderRoot_;
  const ViewSource& viewSource_;
  std::shared_ptr<spdlog::logger> logger_;
  Config config_;

  TargetSelector selector_;
  HighlightTracker highlight_;
  HoldDistance holdDistance_;
  AnchorTracker anchor_;
  HoldController controller_;
  HeldBodyTuning tuning_;
  CollisionExclusionSet exclusions_;
  ImpulseApplier impulses_;

  std::optional<HoldSession> session_;
  std::optional<BeamSegment> beam_;
  std::optional<Wrench> lastWrench_;
  bool active_{true};
};

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_GRAB_SYSTEM_HPP
