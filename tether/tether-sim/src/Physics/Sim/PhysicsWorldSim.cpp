// Ticket: 0003_reference_backend

#include <algorithm>
#include <cmath>
#include <format>
#include <stdexcept>
#include <string>
#include <tuple>

#include "tether-sim/src/Physics/Sim/PhysicsWorldSim.hpp"

namespace tether_sim
{

namespace
{

constexpr double kDirectionEpsilon = 1e-12;

}  // namespace

void PhysicsWorldSim::Config::validate() const
{
  if (!gravity.allFinite())
  {
    throw std::invalid_argument("Gravity must be finite");
  }
  if (!(restitution >= 0.0 && restitution <= 1.0))
  {
    throw std::invalid_argument(
      "Restitution must be in range [0, 1], got: " +
      std::to_string(restitution));
  }
}

PhysicsWorldSim::PhysicsWorldSim(const Config& config,
                                 std::shared_ptr<spdlog::logger> logger)
  : config_{config}, logger_{std::move(logger)}
{
  if (!logger_)
  {
    throw std::invalid_argument("PhysicsWorldSim requires a logger");
  }
  config_.validate();
  logger_->debug("PhysicsWorldSim created: gravity {}, restitution {}",
                 std::format("{}", config_.gravity),
                 config_.restitution);
}

// ===== Scene construction =====

BodyId PhysicsWorldSim::addBody(double mass,
                                const Pose& pose,
                                bool kinematic,
                                std::optional<BodyId> parent)
{
  if (parent && bodies_.find(*parent) == bodies_.end())
  {
    throw std::out_of_range("Parent body " + std::to_string(*parent) +
                            " does not exist");
  }

  BodyId const id = nextBodyId_;
  bodies_.emplace(std::piecewise_construct,
                  std::forward_as_tuple(id),
                  std::forward_as_tuple(id, mass, pose, kinematic, parent));
  ++nextBodyId_;

  logger_->debug("Body {} added ({}, mass {} kg) at {}",
                 id,
                 kinematic ? "kinematic" : "dynamic",
                 mass,
                 std::format("{}", pose.position));
  return id;
}

BodyId PhysicsWorldSim::addDynamicBody(double mass,
                                       const Pose& pose,
                                       std::optional<BodyId> parent)
{
  return addBody(mass, pose, false, parent);
}

BodyId PhysicsWorldSim::addKinematicBody(const Pose& pose,
                                         std::optional<BodyId> parent)
{
  return addBody(0.0, pose, true, parent);
}

ColliderId PhysicsWorldSim::addSphereCollider(BodyId body,
                                              double radius,
                                              const Coordinate& localCenter)
{
  SimBody& owner = getBody(body);
  if (radius <= 0.0)
  {
    throw std::invalid_argument("Collider radius must be positive, got: " +
                                std::to_string(radius));
  }

  ColliderId const id = nextColliderId_++;
  colliders_.emplace(id, SphereCollider{id, body, localCenter, radius});
  owner.attachCollider(id, radius);
  return id;
}

ColliderId PhysicsWorldSim::addStaticSphere(const Coordinate& center,
                                            double radius)
{
  if (radius <= 0.0)
  {
    throw std::invalid_argument("Collider radius must be positive, got: " +
                                std::to_string(radius));
  }

  ColliderId const id = nextColliderId_++;
  colliders_.emplace(id, SphereCollider{id, std::nullopt, center, radius});
  return id;
}

// ===== Simulation =====

void PhysicsWorldSim::step(double dt)
{
  if (dt <= 0.0)
  {
    throw std::invalid_argument("Time step must be positive, got: " +
                                std::to_string(dt));
  }

  for (auto& [id, body] : bodies_)
  {
    if (body.isKinematic())
    {
      advanceKinematic(body, dt);
      continue;
    }

    ForceVector force = body.getAccumulatedForce();
    if (body.getUseGravity())
    {
      force += config_.gravity * body.getMass();
    }

    SemiImplicitEulerIntegrator::BodyParameters const params{
      body.getMass(),
      body.getInverseInertiaTensor(),
      body.getLinearDamping(),
      body.getAngularDamping(),
      body.getConstraints()};

    integrator_.step(body.getInertialState(),
                     force,
                     body.getAccumulatedTorque(),
                     params,
                     dt);
  }

  resolveContacts();

  for (auto& [id, body] : bodies_)
  {
    body.clearForces();
  }
}

void PhysicsWorldSim::advanceKinematic(SimBody& body, double dt)
{
  InertialState& state = body.getInertialState();
  const std::optional<Pose>& target = body.getPendingPose();

  if (!target)
  {
    state.velocity = Vector3D{0.0, 0.0, 0.0};
    state.angularVelocity = AngularVelocity{0.0, 0.0, 0.0};
    return;
  }

  state.velocity = (target->position - state.position) / dt;

  Eigen::Quaterniond const targetOrientation =
    target->orientation.normalized();
  Eigen::AngleAxisd const delta{targetOrientation *
                                state.orientation.conjugate()};
  state.angularVelocity = delta.axis() * (delta.angle() / dt);

  state.position = target->position;
  state.orientation = targetOrientation;
  body.clearPendingPose();
}

double PhysicsWorldSim::inverseMassOf(const SphereCollider& collider) const
{
  if (!collider.body)
  {
    return 0.0;
  }
  return getBody(*collider.body).getInverseMass();
}

void PhysicsWorldSim::resolveContacts()
{
  for (auto itA = colliders_.begin(); itA != colliders_.end(); ++itA)
  {
    for (auto itB = std::next(itA); itB != colliders_.end(); ++itB)
    {
      const SphereCollider& a = itA->second;
      const SphereCollider& b = itB->second;

      if (a.body == b.body)
      {
        continue;
      }
      if (ignoredPairs_.count(makePair(a.id, b.id)) != 0)
      {
        continue;
      }

      double const invMassA = inverseMassOf(a);
      double const invMassB = inverseMassOf(b);
      double const invMassSum = invMassA + invMassB;
      if (invMassSum <= 0.0)
      {
        continue;
      }

      Eigen::Vector3d const delta = colliderCenter(b) - colliderCenter(a);
      double const distance = delta.norm();
      double const penetration = a.radius + b.radius - distance;
      if (penetration <= 0.0)
      {
        continue;
      }

      Eigen::Vector3d const normal = distance > kDirectionEpsilon
                                       ? Eigen::Vector3d{delta / distance}
                                       : Eigen::Vector3d::UnitY();

      Eigen::Vector3d velocityA = Eigen::Vector3d::Zero();
      Eigen::Vector3d velocityB = Eigen::Vector3d::Zero();
      if (a.body)
      {
        velocityA = getBody(*a.body).getInertialState().velocity;
      }
      if (b.body)
      {
        velocityB = getBody(*b.body).getInertialState().velocity;
      }

      // ===== Position Correction =====

      if (a.body && invMassA > 0.0)
      {
        getBody(*a.body).getInertialState().position -=
          normal * (penetration * invMassA / invMassSum);
      }
      if (b.body && invMassB > 0.0)
      {
        getBody(*b.body).getInertialState().position +=
          normal * (penetration * invMassB / invMassSum);
      }

      // ===== Restitution Impulse =====

      double const approachSpeed = (velocityB - velocityA).dot(normal);
      if (approachSpeed >= 0.0)
      {
        continue;
      }

      double const impulse =
        -(1.0 + config_.restitution) * approachSpeed / invMassSum;

      if (a.body && invMassA > 0.0)
      {
        getBody(*a.body).getInertialState().velocity -=
          normal * (impulse * invMassA);
      }
      if (b.body && invMassB > 0.0)
      {
        getBody(*b.body).getInertialState().velocity +=
          normal * (impulse * invMassB);
      }
    }
  }
}

// ===== Lookup =====

SimBody& PhysicsWorldSim::getBody(BodyId id)
{
  auto it = bodies_.find(id);
  if (it == bodies_.end())
  {
    throw std::out_of_range("Body " + std::to_string(id) + " does not exist");
  }
  return it->second;
}

const SimBody& PhysicsWorldSim::getBody(BodyId id) const
{
  auto it = bodies_.find(id);
  if (it == bodies_.end())
  {
    throw std::out_of_range("Body " + std::to_string(id) + " does not exist");
  }
  return it->second;
}

const PhysicsWorldSim::SphereCollider& PhysicsWorldSim::getCollider(
  ColliderId id) const
{
  auto it = colliders_.find(id);
  if (it == colliders_.end())
  {
    throw std::out_of_range("Collider " + std::to_string(id) +
                            " does not exist");
  }
  return it->second;
}

Coordinate PhysicsWorldSim::colliderCenter(const SphereCollider& collider) const
{
  if (!collider.body)
  {
    return collider.localCenter;
  }
  return getBody(*collider.body).getPose().localToGlobal(collider.localCenter);
}

std::size_t PhysicsWorldSim::getIgnoredPairCount() const
{
  return ignoredPairs_.size();
}

RigidBody* PhysicsWorldSim::findBody(BodyId id)
{
  auto it = bodies_.find(id);
  return it == bodies_.end() ? nullptr : &it->second;
}

// ===== Scene queries =====

std::optional<double> PhysicsWorldSim::intersect(
  const Coordinate& origin,
  const Eigen::Vector3d& direction,
  const Coordinate& center,
  double radius)
{
  Eigen::Vector3d const m = origin - center;
  double const c = m.squaredNorm() - radius * radius;
  if (c <= 0.0)
  {
    return 0.0;
  }

  double const b = m.dot(direction);
  if (b > 0.0)
  {
    return std::nullopt;
  }

  double const discriminant = b * b - c;
  if (discriminant < 0.0)
  {
    return std::nullopt;
  }
  return -b - std::sqrt(discriminant);
}

std::vector<ProbeHit> PhysicsWorldSim::sphereCast(const Coordinate& origin,
                                                  const Vector3D& direction,
                                                  double radius,
                                                  double maxDistance,
                                                  std::size_t maxHits) const
{
  if (radius < 0.0 || maxDistance < 0.0)
  {
    throw std::invalid_argument("Sphere cast radius and distance must be >= 0");
  }

  std::vector<ProbeHit> hits;
  double const length = direction.norm();
  if (length < kDirectionEpsilon || maxHits == 0)
  {
    return hits;
  }
  Eigen::Vector3d const dir = direction / length;

  for (const auto& [id, collider] : colliders_)
  {
    Coordinate const center = colliderCenter(collider);
    std::optional<double> const t =
      intersect(origin, dir, center, radius + collider.radius);
    if (!t || *t > maxDistance)
    {
      continue;
    }

    // Surface point of the collider facing the swept sphere
    Eigen::Vector3d const sweptCenter = origin + dir * (*t);
    Eigen::Vector3d const toSwept = sweptCenter - center;
    Coordinate const point =
      toSwept.norm() > kDirectionEpsilon
        ? Coordinate{center + toSwept.normalized() * collider.radius}
        : Coordinate{center - dir * collider.radius};

    hits.push_back(ProbeHit{id, collider.body, point, *t});
    if (hits.size() >= maxHits)
    {
      break;
    }
  }

  return hits;
}

std::optional<ProbeHit> PhysicsWorldSim::raycast(const Coordinate& origin,
                                                 const Vector3D& direction,
                                                 double maxDistance) const
{
  std::vector<ProbeHit> const hits = sphereCast(
    origin, direction, 0.0, maxDistance, colliders_.size());
  if (hits.empty())
  {
    return std::nullopt;
  }

  auto nearest = std::min_element(
    hits.begin(),
    hits.end(),
    [](const ProbeHit& lhs, const ProbeHit& rhs)
    { return lhs.distance < rhs.distance; });
  return *nearest;
}

std::vector<ColliderId> PhysicsWorldSim::collidersUnder(BodyId root) const
{
  const SimBody& rootBody = getBody(root);

  std::vector<ColliderId> result = rootBody.getColliders();
  for (const auto& [id, body] : bodies_)
  {
    if (body.getParent() == root)
    {
      std::vector<ColliderId> const nested = collidersUnder(id);
      result.insert(result.end(), nested.begin(), nested.end());
    }
  }
  return result;
}

// ===== Collision exclusion =====

PhysicsWorldSim::ColliderPair PhysicsWorldSim::makePair(ColliderId a,
                                                        ColliderId b)
{
  return {std::min(a, b), std::max(a, b)};
}

void PhysicsWorldSim::setCollisionIgnored(ColliderId a,
                                          ColliderId b,
                                          bool ignored)
{
  if (colliders_.count(a) == 0 || colliders_.count(b) == 0)
  {
    logger_->debug("Ignore toggle on missing collider pair ({}, {})", a, b);
    return;
  }

  if (ignored)
  {
    ignoredPairs_.insert(makePair(a, b));
  }
  else
  {
    ignoredPairs_.erase(makePair(a, b));
  }
}

bool PhysicsWorldSim::isCollisionIgnored(ColliderId a, ColliderId b) const
{
  return ignoredPairs_.count(makePair(a, b)) != 0;
}

// ===== Body lifetime =====

BodyId PhysicsWorldSim::createKinematicBody(const Pose& pose)
{
  return addKinematicBody(pose);
}

void PhysicsWorldSim::destroyBody(BodyId id)
{
  auto it = bodies_.find(id);
  if (it == bodies_.end())
  {
    logger_->debug("destroyBody: body {} does not exist", id);
    return;
  }

  std::vector<BodyId> children;
  for (const auto& [childId, body] : bodies_)
  {
    if (body.getParent() == id)
    {
      children.push_back(childId);
    }
  }
  for (BodyId const child : children)
  {
    destroyBody(child);
  }

  for (ColliderId const collider : it->second.getColliders())
  {
    colliders_.erase(collider);
    for (auto pairIt = ignoredPairs_.begin(); pairIt != ignoredPairs_.end();)
    {
      if (pairIt->first == collider || pairIt->second == collider)
      {
        pairIt = ignoredPairs_.erase(pairIt);
      }
      else
      {
        ++pairIt;
      }
    }
  }

  bodies_.erase(it);
  logger_->debug("Body {} destroyed", id);
}

}  // namespace tether_sim
