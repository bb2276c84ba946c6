// Ticket: 0011_collision_exclusion

#ifndef TETHER_SIM_HOLD_COLLISION_EXCLUSION_SET_HPP
#define TETHER_SIM_HOLD_COLLISION_EXCLUSION_SET_HPP

#include <spdlog/spdlog.h>

#include <cstddef>
#include <functional>
#include <memory>
#include <unordered_set>
#include <vector>

#include "tether-sim/src/Physics/PhysicsWorld.hpp"

namespace tether_sim
{

/**
 * @brief Order-independent identifier of a collider pair
 *
 * make(a, b) and make(b, a) produce equal keys.
 */
struct ColliderPairKey
{
  ColliderId low{0};
  ColliderId high{0};

  [[nodiscard]] static ColliderPairKey make(ColliderId a, ColliderId b);

  bool operator==(const ColliderPairKey&) const = default;

  struct Hash
  {
    size_t operator()(const ColliderPairKey& key) const
    {
      size_t seed = std::hash<ColliderId>{}(key.low);
      // Golden ratio hash_combine (Boost pattern)
      seed ^= std::hash<ColliderId>{}(key.high) + 0x9e3779b9 + (seed << 6) +
              (seed >> 2);
      return seed;
    }
  };
};

/**
 * @brief Collider pairs this subsystem has marked non-colliding
 *
 * Only pairs that were colliding before exclude() are recorded, so restore()
 * re-enables exactly what this set disabled and leaves exclusions owned by
 * someone else untouched. Adding or removing the same pair twice has no
 * further effect.
 */
class CollisionExclusionSet
{
public:
  CollisionExclusionSet(PhysicsWorld& world,
                        std::shared_ptr<spdlog::logger> logger);

  /**
   * @brief Mark every holder x held pair non-colliding
   * @return Number of pairs newly recorded
   */
  std::size_t exclude(const std::vector<ColliderId>& holderColliders,
                      const std::vector<ColliderId>& heldColliders);

  /**
   * @brief Re-enable every recorded pair and clear the record
   * @return Number of pairs restored
   */
  std::size_t restore();

  [[nodiscard]] bool contains(ColliderId a, ColliderId b) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool empty() const;

private:
  PhysicsWorld& world_;
  std::shared_ptr<spdlog::logger> logger_;
  std::unordered_set<ColliderPairKey, ColliderPairKey::Hash> pairs_;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_COLLISION_EXCLUSION_SET_HPP
