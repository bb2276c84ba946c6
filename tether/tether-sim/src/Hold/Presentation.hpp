// Ticket: 0006_hold_presentation

#ifndef TETHER_SIM_HOLD_PRESENTATION_HPP
#define TETHER_SIM_HOLD_PRESENTATION_HPP

#include <functional>

#include "tether-sim/src/DataTypes/Coordinate.hpp"
#include "tether-sim/src/Physics/PhysicsTypes.hpp"

namespace tether_sim
{

/**
 * @brief Presentation component that can show a selection highlight
 *
 * Implemented by a rendering collaborator. The hold subsystem only toggles it.
 */
class Highlightable
{
public:
  virtual ~Highlightable() = default;

  virtual void setHighlighted(bool highlighted) = 0;

protected:
  Highlightable() = default;
  Highlightable(const Highlightable&) = default;
  Highlightable& operator=(const Highlightable&) = default;
  Highlightable(Highlightable&&) noexcept = default;
  Highlightable& operator=(Highlightable&&) noexcept = default;
};

/// Resolves a body's highlight component; nullptr when it has none
using HighlightLookup = std::function<Highlightable*(BodyId)>;

/**
 * @brief Two-point line from the holder to the held body, for rendering
 */
struct BeamSegment
{
  Coordinate start;  // Muzzle, or controller origin without one
  Coordinate end;    // Held body's centre of mass
};

/**
 * @brief Rendering collaborators the grab system talks to
 */
struct Presentation
{
  HighlightLookup highlightLookup;
};

}  // namespace tether_sim

#endif  // TETHER_SIM_HOLD_PRESENTATION_HPP
