// Ticket: 0005_grab_input

#ifndef TETHER_SIM_AGENT_GRAB_INPUT_HPP
#define TETHER_SIM_AGENT_GRAB_INPUT_HPP

namespace tether_sim
{

/**
 * @brief Per-frame input consumed by GrabSystem::update()
 *
 * The pressed flags are edges: true only on the frame the action fired.
 * Produced by an external input collaborator.
 */
struct GrabInput
{
  bool primaryPressed{false};    // Throw when holding, punt otherwise
  bool secondaryPressed{false};  // Drop when holding, pick up otherwise
  double scrollDelta{0.0};       // Hold distance change, in scroll units
  bool interactionSuppressed{false};  // e.g. a menu is open

  void reset()
  {
    primaryPressed = false;
    secondaryPressed = false;
    scrollDelta = 0.0;
    interactionSuppressed = false;
  }
};

}  // namespace tether_sim

#endif  // TETHER_SIM_AGENT_GRAB_INPUT_HPP
