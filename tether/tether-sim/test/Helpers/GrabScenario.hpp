// Ticket: 0013_grab_system

#ifndef TETHER_SIM_TEST_HELPERS_GRAB_SCENARIO_HPP
#define TETHER_SIM_TEST_HELPERS_GRAB_SCENARIO_HPP

#include <spdlog/spdlog.h>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "tether-sim/src/Agent/ViewSource.hpp"
#include "tether-sim/src/Hold/GrabSystem.hpp"
#include "tether-sim/src/Hold/Presentation.hpp"
#include "tether-sim/src/Physics/Sim/PhysicsWorldSim.hpp"

namespace tether_sim::test
{

/// Logger that discards everything
std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name = "test");

/**
 * @brief Highlightable that records every toggle it receives
 */
class RecordingHighlight final : public Highlightable
{
public:
  void setHighlighted(bool highlighted) override
  {
    events.push_back(highlighted);
    this->highlighted = highlighted;
  }

  std::vector<bool> events;
  bool highlighted{false};
};

/**
 * @brief A small world with a holder agent looking down +Z from the origin
 *
 * Scene:
 * - holder: kinematic root at (0, -0.8, 0) with a 0.4 m collider
 * - hand: kinematic child of holder at (0.3, -0.3, 0.2) with a 0.1 m collider
 * - view: origin, identity orientation (forward +Z)
 *
 * Owns the world, so GrabSystems built from it must be destroyed first.
 *
 * Thread safety: Not thread-safe; single-threaded test use only.
 */
class GrabScenario
{
public:
  explicit GrabScenario(
    const PhysicsWorldSim::Config& worldConfig = PhysicsWorldSim::Config{});

  GrabScenario(const GrabScenario&) = delete;
  GrabScenario& operator=(const GrabScenario&) = delete;
  GrabScenario(GrabScenario&&) = delete;
  GrabScenario& operator=(GrabScenario&&) = delete;
  ~GrabScenario() = default;

  // ===== Spawn helpers =====

  /// Dynamic sphere body with one collider
  BodyId addCrate(double mass, const Coordinate& position, double radius = 0.5);

  /// Kinematic sphere body with one collider
  BodyId addKinematicCrate(const Coordinate& position, double radius = 0.5);

  [[nodiscard]] std::unique_ptr<GrabSystem> makeGrabSystem(
    const GrabSystem::Config& config = GrabSystem::Config{});

  // ===== Simulation =====

  /// fixedUpdate then world step, ticks times
  void run(GrabSystem& grab, int ticks, double dt = 0.02);

  // ===== Access =====

  [[nodiscard]] PhysicsWorldSim& world();
  [[nodiscard]] FixedViewSource& view();
  [[nodiscard]] BodyId holder() const;
  [[nodiscard]] BodyId hand() const;
  [[nodiscard]] std::shared_ptr<spdlog::logger> logger() const;

  /// Highlight component of body, created on first use
  [[nodiscard]] RecordingHighlight& highlightFor(BodyId body);

  /// Presentation whose lookup resolves bodies registered via highlightFor()
  [[nodiscard]] Presentation presentation();

private:
  std::shared_ptr<spdlog::logger> logger_;
  std::unique_ptr<PhysicsWorldSim> world_;
  FixedViewSource view_;
  BodyId holder_;
  BodyId hand_;
  std::map<BodyId, std::unique_ptr<RecordingHighlight>> highlights_;
};

}  // namespace tether_sim::test

#endif  // TETHER_SIM_TEST_HELPERS_GRAB_SCENARIO_HPP
