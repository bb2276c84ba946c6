// Ticket: 0008_target_selection

#include <stdexcept>
#include <utility>
#include <vector>

#include "tether-sim/src/Hold/TargetSelector.hpp"

namespace tether_sim
{

TargetSelector::TargetSelector(PhysicsWorld& world,
                               std::shared_ptr<spdlog::logger> logger)
  : world_{world}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("TargetSelector requires a logger");
  }
}

double TargetSelector::score(double distance,
                             const Vector3D& viewDirection,
                             const Vector3D& toHit,
                             double alignmentWeight)
{
  double const length = toHit.norm();
  // A hit at the view origin is treated as perfectly aligned
  double const alignment =
    length > 0.0 ? viewDirection.dot(toHit) / length : 1.0;
  return -distance + alignmentWeight * alignment;
}

bool TargetSelector::isEligible(const RigidBody& body, double maxMass)
{
  return !body.isKinematic() && body.getMass() <= maxMass;
}

std::optional<TargetCandidate> TargetSelector::selectBest(
  const Pose& view,
  const Criteria& criteria) const
{
  Vector3D const viewDirection = view.forward().normalized();
  std::vector<ProbeHit> const hits = world_.sphereCast(view.position,
                                                       viewDirection,
                                                       criteria.probeRadius,
                                                       criteria.range,
                                                       criteria.maxHits);

  std::optional<TargetCandidate> best;
  for (const ProbeHit& hit : hits)
  {
    if (!hit.body)
    {
      continue;
    }

    RigidBody* body = world_.findBody(*hit.body);
    if (body == nullptr || !isEligible(*body, criteria.maxMass))
    {
      continue;
    }

    double const candidateScore =
      score(hit.distance,
            viewDirection,
            Vector3D{hit.point - view.position},
            criteria.alignmentWeight);

    // Strict comparison keeps the first maximum in probe order
    if (!best || candidateScore > best->score)
    {
      best = TargetCandidate{
        *hit.body, hit.collider, hit.point, hit.distance, candidateScore};
    }
  }

  if (best)
  {
    logger_->trace("Selected body {} (score {:.3f}) from {} hits",
                   best->body,
                   best->score,
                   hits.size());
  }
  return best;
}

}  // namespace tether_sim
