// Ticket: 0013_grab_system

#include <spdlog/sinks/null_sink.h>

#include "tether-sim/test/Helpers/GrabScenario.hpp"

namespace tether_sim::test
{

std::shared_ptr<spdlog::logger> makeNullLogger(const std::string& name)
{
  auto nullSink = std::make_shared<spdlog::sinks::null_sink_mt>();
  auto logger = std::make_shared<spdlog::logger>(name, nullSink);
  logger->set_level(spdlog::level::trace);
  return logger;
}

GrabScenario::GrabScenario(const PhysicsWorldSim::Config& worldConfig)
  : logger_{makeNullLogger("grab-scenario")},
    world_{std::make_unique<PhysicsWorldSim>(worldConfig, logger_)},
    view_{Pose{}},
    holder_{world_->addKinematicBody(Pose{Coordinate{0.0, -0.8, 0.0}})},
    hand_{world_->addKinematicBody(Pose{Coordinate{0.3, -0.3, 0.2}}, holder_)}
{
  world_->addSphereCollider(holder_, 0.4);
  world_->addSphereCollider(hand_, 0.1);
}

BodyId GrabScenario::addCrate(double mass,
                              const Coordinate& position,
                              double radius)
{
  BodyId const id = world_->addDynamicBody(mass, Pose{position});
  world_->addSphereCollider(id, radius);
  return id;
}

BodyId GrabScenario::addKinematicCrate(const Coordinate& position,
                                       double radius)
{
  BodyId const id = world_->addKinematicBody(Pose{position});
  world_->addSphereCollider(id, radius);
  return id;
}

std::unique_ptr<GrabSystem> GrabScenario::makeGrabSystem(
  const GrabSystem::Config& config)
{
  return std::make_unique<GrabSystem>(
    *world_, holder_, view_, config, logger_, presentation());
}

void GrabScenario::run(GrabSystem& grab, int ticks, double dt)
{
  for (int i = 0; i < ticks; ++i)
  {
    grab.fixedUpdate(dt);
    world_->step(dt);
  }
}

PhysicsWorldSim& GrabScenario::world()
{
  return *world_;
}

FixedViewSource& GrabScenario::view()
{
  return view_;
}

BodyId GrabScenario::holder() const
{
  return holder_;
}

BodyId GrabScenario::hand() const
{
  return hand_;
}

std::shared_ptr<spdlog::logger> GrabScenario::logger() const
{
  return logger_;
}

RecordingHighlight& GrabScenario::highlightFor(BodyId body)
{
  auto& slot = highlights_[body];
  if (!slot)
  {
    slot = std::make_unique<RecordingHighlight>();
  }
  return *slot;
}

Presentation GrabScenario::presentation()
{
  Presentation result;
  result.highlightLookup = [this](BodyId body) -> Highlightable*
  {
    auto it = highlights_.find(body);
    return it == highlights_.end() ? nullptr : it->second.get();
  };
  return result;
}

}  // namespace tether_sim::test
