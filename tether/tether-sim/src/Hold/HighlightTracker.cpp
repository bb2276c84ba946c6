// Ticket: 0008_target_selection

#include <utility>

#include "tether-sim/src/Hold/HighlightTracker.hpp"

namespace tether_sim
{

HighlightTracker::HighlightTracker(HighlightLookup lookup)
  : lookup_{std::move(lookup)}
{
}

bool HighlightTracker::update(std::optional<BodyId> candidate)
{
  if (candidate == current_)
  {
    return false;
  }

  if (current_)
  {
    setHighlighted(*current_, false);
  }
  if (candidate)
  {
    setHighlighted(*candidate, true);
  }
  current_ = candidate;
  return true;
}

void HighlightTracker::clear()
{
  update(std::nullopt);
}

std::optional<BodyId> HighlightTracker::getCurrent() const
{
  return current_;
}

void HighlightTracker::setHighlighted(BodyId body, bool highlighted) const
{
  if (!lookup_)
  {
    return;
  }
  if (Highlightable* component = lookup_(body))
  {
    component->setHighlighted(highlighted);
  }
}

}  // namespace tether_sim
