// Ticket: 0008_target_selection

#ifndef TETHER_SIM_HOLD_HIGHLIGHT_TRACKER_HPP
#define TETHER_SIM_HOLD_HIGHLIGHT_TRACKER_HPP

#include <optional>

#include "tether-sim/src/Hold/Presentation.hpp"

namespace tether_sim
{

/**
 * @brief Enter/exit state machine for the selection highlight
 *
 * Only transitions touch the presentation layer: the previous body is
 * un-highlighted when the best candidate changes, and the new one is
 * highlighted. An unchanged candidate produces no calls.
 */
class HighlightTracker
{
public:
  explicit HighlightTracker(HighlightLookup lookup);

  /**
   * @brief Move the highlight to candidate
   * @return true if a transition happened
   */
  bool update(std::optional<BodyId> candidate);

  /// Exit the current highlight, if any
  void clear();

  [[nodiscard]] std::optional<BodyId> getCurrent() const;

private:
  void setHighlighted(BodyId body, bool highlighted) const;

  HighlightLookup lookup_;
  std::optional<BodyId> current_;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_HIGHLIGHT_TRACKER_HPP
