// Ticket: 0011_collision_exclusion

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "tether-sim/src/Hold/CollisionExclusionSet.hpp"

namespace tether_sim
{

ColliderPairKey ColliderPairKey::make(ColliderId a, ColliderId b)
{
  return ColliderPairKey{std::min(a, b), std::max(a, b)};
}

CollisionExclusionSet::CollisionExclusionSet(
  PhysicsWorld& world,
  std::shared_ptr<spdlog::logger> logger)
  : world_{world}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("CollisionExclusionSet requires a logger");
  }
}

std::size_t CollisionExclusionSet::exclude(
  const std::vector<ColliderId>& holderColliders,
  const std::vector<ColliderId>& heldColliders)
{
  std::size_t added = 0;
  for (ColliderId const holder : holderColliders)
  {
    for (ColliderId const held : heldColliders)
    {
      if (holder == held)
      {
        continue;
      }

      ColliderPairKey const key = ColliderPairKey::make(holder, held);
      if (pairs_.count(key) != 0 || world_.isCollisionIgnored(holder, held))
      {
        continue;
      }

      world_.setCollisionIgnored(holder, held, true);
      pairs_.insert(key);
      ++added;
    }
  }

  logger_->debug("Excluded {} collider pairs ({} recorded)", added, size());
  return added;
}

std::size_t CollisionExclusionSet::restore()
{
  std::size_t const restored = pairs_.size();
  for (const ColliderPairKey& key : pairs_)
  {
    world_.setCollisionIgnored(key.low, key.high, false);
  }
  pairs_.clear();

  logger_->debug("Restored {} collider pairs", restored);
  return restored;
}

bool CollisionExclusionSet::contains(ColliderId a, ColliderId b) const
{
  return pairs_.count(ColliderPairKey::make(a, b)) != 0;
}

std::size_t CollisionExclusionSet::size() const
{
  return pairs_.size();
}

bool CollisionExclusionSet::empty() const
{
  return pairs_.empty();
}

}  // namespace tether_sim
