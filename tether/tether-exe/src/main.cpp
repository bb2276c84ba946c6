// Ticket: 0014_demo

#include <spdlog/spdlog.h>

#include <Eigen/Geometry>
#include <cmath>
#include <exception>
#include <format>
#include <map>
#include <memory>
#include <numbers>
#include <string>
#include <utility>

#include "tether-sim/src/Agent/GrabInput.hpp"
#include "tether-sim/src/Agent/ViewSource.hpp"
#include "tether-sim/src/Hold/GrabSystem.hpp"
#include "tether-sim/src/Hold/HoldMath.hpp"
#include "tether-sim/src/Physics/Sim/PhysicsWorldSim.hpp"
#include "tether-sim/src/Utils/Logging.hpp"

namespace
{

using namespace tether_sim;

constexpr double kFixedStep = 1.0 / 50.0;
constexpr double kFrameStep = 1.0 / 60.0;
constexpr double kDuration = 4.0;

// Logs highlight transitions in place of a renderer
class LoggedHighlight final : public Highlightable
{
public:
  LoggedHighlight(std::string name, std::shared_ptr<spdlog::logger> logger)
    : name_{std::move(name)}, logger_{std::move(logger)}
  {
  }

  void setHighlighted(bool highlighted) override
  {
    logger_->info("[render] {} highlight {}", name_, highlighted ? "on" : "off");
  }

private:
  std::string name_;
  std::shared_ptr<spdlog::logger> logger_;
};

Pose lookAt(const Coordinate& eye, const Coordinate& target)
{
  return Pose{eye, lookRotation(Vector3D{target - eye}, worldUp())};
}

void logBody(spdlog::logger& logger, const char* name, const RigidBody& body)
{
  logger.info("{}: position {} velocity {} gravity {}",
              name,
              std::format("{}", body.getPose().position),
              std::format("{}", body.getLinearVelocity()),
              body.getUseGravity());
}

int run()
{
  auto logger = logging::getLogger("tether");
  logger->set_level(spdlog::level::info);

  PhysicsWorldSim world{PhysicsWorldSim::Config{}, logger};

  // Ground: a very large static sphere whose top sits at y = 0
  world.addStaticSphere(Coordinate{0.0, -500.0, 0.0}, 500.0);

  Coordinate const eye{0.0, 1.7, 0.0};
  BodyId const holder = world.addKinematicBody(Pose{Coordinate{0.0, 1.0, 0.0}});
  world.addSphereCollider(holder, 0.4);
  BodyId const hand = world.addKinematicBody(
    Pose{Coordinate{0.3, 1.4, 0.4}}, holder);
  world.addSphereCollider(hand, 0.15);

  BodyId const crate = world.addDynamicBody(40.0, Pose{Coordinate{0.0, 0.5, 4.0}});
  world.addSphereCollider(crate, 0.5);

  BodyId const boulder =
    world.addDynamicBody(200.0, Pose{Coordinate{4.0, 0.8, 6.0}});
  world.addSphereCollider(boulder, 0.8);

  FixedViewSource view{lookAt(eye, world.getBody(crate).getPose().position)};
  view.setMuzzlePosition(Coordinate{0.3, 1.4, 0.6});

  std::map<BodyId, std::unique_ptr<LoggedHighlight>> highlights;
  highlights.emplace(crate, std::make_unique<LoggedHighlight>("crate", logger));
  highlights.emplace(boulder,
                     std::make_unique<LoggedHighlight>("boulder", logger));

  Presentation presentation;
  presentation.highlightLookup = [&highlights](BodyId id) -> Highlightable*
  {
    auto it = highlights.find(id);
    return it == highlights.end() ? nullptr : it->second.get();
  };

  GrabSystem grab{world, holder, view, GrabSystem::Config{}, logger,
                  presentation};

  Eigen::Quaterniond const crateView = view.getViewPose().orientation;
  bool picked = false;
  bool thrown = false;
  bool triedBoulder = false;
  bool punted = false;

  double accumulator = 0.0;
  for (double t = 0.0; t < kDuration; t += kFrameStep)
  {
    accumulator += kFrameStep;
    while (accumulator >= kFixedStep)
    {
      grab.fixedUpdate(kFixedStep);
      world.step(kFixedStep);
      accumulator -= kFixedStep;
    }

    GrabInput input;
    if (!picked && t >= 0.1)
    {
      input.secondaryPressed = true;
      picked = true;
    }
    if (t >= 0.5 && t < 0.8)
    {
      input.scrollDelta = 1.0;
    }
    if (t >= 1.0 && t < 2.0)
    {
      // Sweep the view 90 degrees to the left over one second
      double const yaw = (t - 1.0) * std::numbers::pi / 2.0;
      view.setViewPose(Pose{
        eye,
        Eigen::Quaterniond{Eigen::AngleAxisd{-yaw, Eigen::Vector3d::UnitY()}} *
          crateView});
    }
    if (!thrown && t >= 2.2)
    {
      input.primaryPressed = true;
      thrown = true;
    }
    if (t >= 2.5 && !triedBoulder)
    {
      view.setViewPose(lookAt(eye, world.getBody(boulder).getPose().position));
      input.secondaryPressed = true;
      triedBoulder = true;
    }
    if (!punted && t >= 3.0)
    {
      view.setViewPose(lookAt(eye, world.getBody(boulder).getPose().position));
      input.primaryPressed = true;
      punted = true;
    }

    grab.update(input);

    if (const auto& beam = grab.getBeamSegment(); beam && input.scrollDelta != 0.0)
    {
      logger->info("[render] beam {} -> {} (hold distance {:.2f} m)",
                   std::format("{}", beam->start),
                   std::format("{}", beam->end),
                   grab.getHoldDistance());
    }
  }

  logBody(*logger, "crate", world.getBody(crate));
  logBody(*logger, "boulder", world.getBody(boulder));
  logger->info("Ignored collider pairs left in world: {}",
               world.getIgnoredPairCount());
  return 0;
}

}  // namespace

int main()
{
  try
  {
    return run();
  }
  catch (const std::exception& e)
  {
    spdlog::error("tether demo failed: {}", e.what());
    return 1;
  }
}
