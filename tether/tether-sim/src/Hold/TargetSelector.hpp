// Ticket: 0008_target_selection

#ifndef TETHER_SIM_HOLD_TARGET_SELECTOR_HPP
#define TETHER_SIM_HOLD_TARGET_SELECTOR_HPP

#include <spdlog/spdlog.h>

#include <cstddef>
#include <memory>
#include <optional>

#include "tether-sim/src/Physics/PhysicsWorld.hpp"

namespace tether_sim
{

/**
 * @brief One scored probe hit, valid for a single selection pass
 */
struct TargetCandidate
{
  BodyId body{0};
  ColliderId collider{0};
  Coordinate point;
  double distance{0.0};
  double score{0.0};
};

/**
 * @brief Picks the best grabbable body along the view ray
 *
 * A sphere cast collects up to maxHits intersections. Candidates must belong
 * to a non-kinematic body no heavier than maxMass. Each is scored as
 *
 *   score = -distance + alignmentWeight * cos(angle)
 *
 * where angle is between the view direction and the direction from the view
 * origin to the hit point. The first maximum in probe order wins.
 */
class TargetSelector
{
public:
  struct Criteria
  {
    double range{12.0};             // [m]
    double probeRadius{0.35};       // [m]
    std::size_t maxHits{16};
    double maxMass{120.0};          // [kg]
    double alignmentWeight{3.0};
  };

  TargetSelector(PhysicsWorld& world, std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Probe from the view pose and return the best eligible candidate
   * @return nullopt when nothing eligible was hit
   */
  [[nodiscard]] std::optional<TargetCandidate> selectBest(
    const Pose& view,
    const Criteria& criteria) const;

  /**
   * @brief Selection score of a hit
   * @param distance Distance along the probe [m]
   * @param viewDirection Unit view direction
   * @param toHit Vector from the view origin to the hit point
   * @param alignmentWeight Weight of the alignment term
   */
  [[nodiscard]] static double score(double distance,
                                    const Vector3D& viewDirection,
                                    const Vector3D& toHit,
                                    double alignmentWeight);

  /// Non-kinematic and mass <= maxMass
  [[nodiscard]] static bool isEligible(const RigidBody& body, double maxMass);

private:
  PhysicsWorld& world_;
  std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_TARGET_SELECTOR_HPP
