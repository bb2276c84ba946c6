// Ticket: 0009_anchor_tracking

#ifndef TETHER_SIM_HOLD_ANCHOR_TRACKER_HPP
#define TETHER_SIM_HOLD_ANCHOR_TRACKER_HPP

#include "tether-sim/src/Physics/PhysicsWorld.hpp"

namespace tether_sim
{

/**
 * @brief Owns the kinematic anchor the held body is steered toward
 *
 * The anchor body is created in the constructor and destroyed in the
 * destructor; it lives exactly as long as the tracker. Every fixed tick the
 * anchor target becomes
 *
 *   position    = view origin + view forward * holdDistance
 *   orientation = view orientation
 *
 * and its velocity is derived from the previous target, with the tick
 * duration floored to minTickDuration. The anchor body is moved with an
 * interpolated kinematic update, never a teleport. The new target is kept as
 * "previous" whether or not anything is held.
 */
class AnchorTracker
{
public:
  /**
   * @param world World that owns the anchor body
   * @param initialPose Starting target, also the first "previous" pose
   * @param minTickDuration Floor for the velocity denominator [s]
   * @throws std::invalid_argument if minTickDuration <= 0
   */
  AnchorTracker(PhysicsWorld& world,
                const Pose& initialPose,
                double minTickDuration);

  ~AnchorTracker();

  AnchorTracker(const AnchorTracker&) = delete;
  AnchorTracker& operator=(const AnchorTracker&) = delete;
  AnchorTracker(AnchorTracker&&) = delete;
  AnchorTracker& operator=(AnchorTracker&&) = delete;

  /**
   * @brief Advance the anchor by one fixed tick
   * @param view Controller pose
   * @param holdDistance Distance along the view forward [m]
   * @param dt Tick duration [s]
   */
  void advance(const Pose& view, double holdDistance, double dt);

  /**
   * @brief Replace the previous target without producing velocity
   *
   * Used when the hold distance jumps outside of view or scroll motion, so
   * the next advance() only measures motion that happens after the jump.
   */
  void reseed(const Pose& view, double holdDistance);

  /// Target pose of the last tick
  [[nodiscard]] const Pose& getPose() const;

  /// Velocity derived on the last tick [m/s]
  [[nodiscard]] const Vector3D& getVelocity() const;

  [[nodiscard]] BodyId getBodyId() const;

  /// Target pose for a view and hold distance
  [[nodiscard]] static Pose targetFor(const Pose& view, double holdDistance);

private:
  PhysicsWorld& world_;
  BodyId bodyId_;
  double minTickDuration_;
  Pose pose_;
  Vector3D velocity_;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_ANCHOR_TRACKER_HPP
