// Ticket: 0013_grab_system

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "tether-sim/src/Hold/GrabSystem.hpp"

namespace tether_sim
{

namespace
{

void requireFinite(double value, const char* name)
{
  if (!std::isfinite(value))
  {
    throw std::invalid_argument(std::string{name} + " must be finite");
  }
}

void requirePositive(double value, const char* name)
{
  requireFinite(value, name);
  if (value <= 0.0)
  {
    throw std::invalid_argument(std::string{name} +
                                " must be positive, got: " +
                                std::to_string(value));
  }
}

void requireNonNegative(double value, const char* name)
{
  requireFinite(value, name);
  if (value < 0.0)
  {
    throw std::invalid_argument(std::string{name} +
                                " must be non-negative, got: " +
                                std::to_string(value));
  }
}

}  // namespace

// ===== Config =====

void GrabSystem::Config::validate(spdlog::logger& logger) const
{
  requirePositive(pickupRange, "pickupRange");
  requirePositive(highlightRange, "highlightRange");
  requirePositive(puntRange, "puntRange");
  requireNonNegative(probeRadius, "probeRadius");
  if (maxProbeHits < 1)
  {
    throw std::invalid_argument("maxProbeHits must be at least 1");
  }
  requirePositive(maxPickupMass, "maxPickupMass");
  requireNonNegative(alignmentWeight, "alignmentWeight");

  requirePositive(minHoldDistance, "minHoldDistance");
  requirePositive(maxHoldDistance, "maxHoldDistance");
  if (minHoldDistance > maxHoldDistance)
  {
    throw std::invalid_argument(
      "minHoldDistance must not exceed maxHoldDistance, got: [" +
      std::to_string(minHoldDistance) + ", " +
      std::to_string(maxHoldDistance) + "]");
  }
  requirePositive(holdDistanceStep, "holdDistanceStep");

  requireNonNegative(positionSpring, "positionSpring");
  requireNonNegative(positionDamping, "positionDamping");
  requirePositive(maxForce, "maxForce");
  requireNonNegative(rotationSpring, "rotationSpring");
  requireNonNegative(rotationDamping, "rotationDamping");
  requirePositive(maxTorque, "maxTorque");

  requireNonNegative(throwImpulse, "throwImpulse");
  requireNonNegative(puntImpulse, "puntImpulse");
  requireNonNegative(heldLinearDamping, "heldLinearDamping");
  requireNonNegative(heldAngularDamping, "heldAngularDamping");
  requirePositive(minTickDuration, "minTickDuration");

  if (puntRange < pickupRange)
  {
    logger.warn("puntRange ({} m) is shorter than pickupRange ({} m)",
                puntRange,
                pickupRange);
  }
}

// ===== Construction =====

std::shared_ptr<spdlog::logger> GrabSystem::requireLogger(
  std::shared_ptr<spdlog::logger> logger)
{
  if (!logger)
  {
    throw std::invalid_argument("GrabSystem requires a logger");
  }
  return logger;
}

GrabSystem::Config GrabSystem::validated(const Config& config,
                                         spdlog::logger& logger)
{
  config.validate(logger);
  return config;
}

GrabSystem::GrabSystem(PhysicsWorld& world,
                       BodyId holderRoot,
                       const ViewSource& viewSource,
                       const Config& config,
                       std::shared_ptr<spdlog::logger> logger,
                       Presentation presentation)
  : world_{world},
    holderRoot_{holderRoot},
    viewSource_{viewSource},
    logger_{requireLogger(std::move(logger))},
    config_{validated(config, *logger_)},
    selector_{world, logger_},
    highlight_{std::move(presentation.highlightLookup)},
    holdDistance_{config_.minHoldDistance, config_.maxHoldDistance},
    anchor_{world,
            AnchorTracker::targetFor(viewSource.getViewPose(),
                                     holdDistance_.get()),
            config_.minTickDuration},
    controller_{HoldController::Gains{config_.positionSpring,
                                      config_.positionDamping,
                                      config_.maxForce,
                                      config_.rotationSpring,
                                      config_.rotationDamping,
                                      config_.maxTorque,
                                      config_.keepUpright},
                logger_},
    tuning_{config_.heldLinearDamping, config_.heldAngularDamping},
    exclusions_{world, logger_},
    impulses_{world, logger_}
{
  if (world_.findBody(holderRoot_) == nullptr)
  {
    throw std::out_of_range("Holder body " + std::to_string(holderRoot_) +
                            " does not exist");
  }

  logger_->info("GrabSystem ready: holder {}, anchor {}, max mass {} kg",
                holderRoot_,
                anchor_.getBodyId(),
                config_.maxPickupMass);
}

GrabSystem::~GrabSystem()
{
  release();
  highlight_.clear();
}

// ===== Callbacks =====

void GrabSystem::update(const GrabInput& input)
{
  if (!active_)
  {
    return;
  }

  if (input.interactionSuppressed)
  {
    logger_->trace("Input suppressed this frame");
  }
  else
  {
    bool const wasHolding = isHolding();

    if (input.primaryPressed)
    {
      if (wasHolding)
      {
        throwHeld();
      }
      else
      {
        punt();
      }
    }
    if (input.secondaryPressed)
    {
      if (wasHolding)
      {
        drop();
      }
      else
      {
        tryPickup();
      }
    }
    if (isHolding() && input.scrollDelta != 0.0)
    {
      double const distance =
        holdDistance_.adjust(input.scrollDelta, config_.holdDistanceStep);
      logger_->debug("Hold distance now {:.2f} m", distance);
    }
  }

  refreshHighlight();
  refreshBeam();
}

void GrabSystem::fixedUpdate(double dt)
{
  if (!active_)
  {
    return;
  }

  // The anchor always advances first so the controller reads this tick's pose
  anchor_.advance(viewSource_.getViewPose(), holdDistance_.get(), dt);

  if (!session_)
  {
    return;
  }

  RigidBody* body = heldBody();
  if (body == nullptr)
  {
    release();
    return;
  }

  lastWrench_ = controller_.apply(
    *body, anchor_.getPose(), anchor_.getVelocity(), fallbackForward());
}

// ===== Actions =====

bool GrabSystem::tryPickup()
{
  if (!active_)
  {
    return false;
  }
  if (session_)
  {
    logger_->debug("Pickup rejected: already holding body {}", session_->body);
    return false;
  }

  Pose const view = viewSource_.getViewPose();
  std::optional<TargetCandidate> const candidate =
    selector_.selectBest(view, criteria(config_.pickupRange));
  if (!candidate)
  {
    logger_->debug("Pickup: no eligible body within {} m", config_.pickupRange);
    return false;
  }

  RigidBody* body = world_.findBody(candidate->body);
  if (body == nullptr)
  {
    return false;
  }

  // Either lookup throws for a destroyed body; resolve both before mutating state
  std::vector<ColliderId> const holderColliders =
    world_.collidersUnder(holderRoot_);
  std::vector<ColliderId> const heldColliders =
    world_.collidersUnder(candidate->body);

  highlight_.clear();

  session_.emplace(
    HoldSession{candidate->body, BodyStateSnapshot::capture(*body)});
  tuning_.applyTo(*body);
  exclusions_.exclude(holderColliders, heldColliders);
  holdDistance_.set(candidate->distance);
  anchor_.reseed(view, holdDistance_.get());

  logger_->info("Picked up body {} ({} kg) at {:.2f} m",
                candidate->body,
                body->getMass(),
                holdDistance_.get());
  logger_->debug(
    "Snapshot: gravity {}, damping {}/{}, detection {}, interpolation {}",
    session_->snapshot.getUseGravity(),
    session_->snapshot.getLinearDamping(),
    session_->snapshot.getAngularDamping(),
    toString(session_->snapshot.getCollisionDetectionMode()),
    toString(session_->snapshot.getInterpolationMode()));

  refreshBeam();
  return true;
}

bool GrabSystem::drop()
{
  if (!active_ || !session_)
  {
    logger_->debug("Drop ignored: nothing held");
    return false;
  }

  BodyId const body = session_->body;
  release();
  logger_->info("Dropped body {}", body);
  return true;
}

bool GrabSystem::throwHeld()
{
  if (!active_ || !session_)
  {
    logger_->debug("Throw ignored: nothing held");
    return false;
  }

  BodyId const id = session_->body;
  if (RigidBody* body = heldBody())
  {
    double const magnitude =
      config_.scaleThrowByMass
        ? ImpulseApplier::massScaledMagnitude(
            config_.throwImpulse, body->getMass(), config_.maxPickupMass)
        : config_.throwImpulse;
    impulses_.throwBody(*body, viewSource_.getViewPose().forward(), magnitude);
    logger_->info("Threw body {} at {:.2f} m/s", id, magnitude);
  }

  release();
  return true;
}

bool GrabSystem::punt()
{
  if (!active_)
  {
    return false;
  }
  if (session_)
  {
    logger_->debug("Punt ignored while holding body {}", session_->body);
    return false;
  }

  return impulses_
    .punt(viewSource_.getViewPose(), config_.puntRange, config_.puntImpulse)
    .has_value();
}

void GrabSystem::setActive(bool active)
{
  if (active == active_)
  {
    return;
  }

  if (!active)
  {
    release();
    highlight_.clear();
    beam_.reset();
  }
  active_ = active;
  logger_->info("GrabSystem {}", active ? "activated" : "deactivated");
}

// ===== Queries =====

bool GrabSystem::isActive() const
{
  return active_;
}

bool GrabSystem::isHolding() const
{
  return session_.has_value();
}

std::optional<BodyId> GrabSystem::getHeldBodyId() const
{
  if (!session_)
  {
    return std::nullopt;
  }
  return session_->body;
}

double GrabSystem::getHoldDistance() const
{
  return holdDistance_.get();
}

const std::optional<BeamSegment>& GrabSystem::getBeamSegment() const
{
  return beam_;
}

const std::optional<Wrench>& GrabSystem::getLastWrench() const
{
  return lastWrench_;
}

std::size_t GrabSystem::getExclusionCount() const
{
  return exclusions_.size();
}

std::optional<BodyStateSnapshot> GrabSystem::getSnapshot() const
{
  if (!session_)
  {
    return std::nullopt;
  }
  return session_->snapshot;
}

std::optional<BodyId> GrabSystem::getHighlightedBodyId() const
{
  return highlight_.getCurrent();
}

const AnchorTracker& GrabSystem::getAnchor() const
{
  return anchor_;
}

// ===== Internals =====

TargetSelector::Criteria GrabSystem::criteria(double range) const
{
  return TargetSelector::Criteria{range,
                                  config_.probeRadius,
                                  config_.maxProbeHits,
                                  config_.maxPickupMass,
                                  config_.alignmentWeight};
}

Vector3D GrabSystem::fallbackForward()
{
  if (RigidBody* holder = world_.findBody(holderRoot_))
  {
    return holder->getPose().forward();
  }
  return viewSource_.getViewPose().forward();
}

RigidBody* GrabSystem::heldBody()
{
  return session_ ? world_.findBody(session_->body) : nullptr;
}

void GrabSystem::release()
{
  if (!session_)
  {
    return;
  }

  if (RigidBody* body = heldBody())
  {
    session_->snapshot.restore(*body);
  }
  else
  {
    logger_->warn("Held body {} vanished; no properties to restore",
                  session_->body);
  }

  exclusions_.restore();
  session_.reset();
  beam_.reset();
  lastWrench_.reset();
}

void GrabSystem::refreshHighlight()
{
  if (session_)
  {
    highlight_.clear();
    return;
  }

  std::optional<TargetCandidate> const candidate = selector_.selectBest(
    viewSource_.getViewPose(), criteria(config_.highlightRange));
  highlight_.update(candidate ? std::optional<BodyId>{candidate->body}
                              : std::nullopt);
}

void GrabSystem::refreshBeam()
{
  RigidBody* body = heldBody();
  if (body == nullptr)
  {
    beam_.reset();
    return;
  }

  Coordinate const start = viewSource_.getMuzzlePosition().value_or(
    viewSource_.getViewPose().position);
  beam_ = BeamSegment{start, body->getWorldCenterOfMass()};
}

}  // namespace tether_sim
