#include "sim/Physics.hpp"

#include <algorithm>
#include <cmath>

#include "core/Config.hpp"

std::optional<Contact> DetectCircleCollision(const Entity &a, const Entity &b) {
  const float dx = b.position.x - a.position.x;
  const float dy = b.position.y - a.position.y;
  const float distSq = dx * dx + dy * dy;
  const float minDist = a.radius + b.radius;

  if (!(distSq < minDist * minDist)) {
    return std::nullopt;
  }

  const float dist = std::sqrt(distSq);
  Contact contact{};
  contact.penetration = minDist - dist;
  contact.normal = (dist > cfg::kDegenerateDistance)
                       ? Vec2{dx / dist, dy / dist}
                       : Vec2{1.0f, 0.0f};
  return contact;
}

void ResolveCircleCollision(Entity &a, Entity &b, const Contact &contact,
                            const SimConfig &config) {
  const Vec2 &n = contact.normal;
  const float invMassA = InverseMass(a);
  const float invMassB = InverseMass(b);
  const float invMassSum = invMassA + invMassB;
  if (invMassSum <= 0.0f) {
    return;
  }

  // Partial correction: keeps contacts from sinking without jittering.
  if (contact.penetration > config.collisionSlop) {
    const float correction = config.correctionPercent * contact.penetration;
    const float correctionA = correction * (invMassA / invMassSum);
    const float correctionB = correction * (invMassB / invMassSum);
    a.position.x -= n.x * correctionA;
    a.position.y -= n.y * correctionA;
    b.position.x += n.x * correctionB;
    b.position.y += n.y * correctionB;
  }

  const Vec2 relativeVel = Vec2Sub(b.velocity, a.velocity);
  const float velAlongNormal = Vec2Dot(relativeVel, n);
  if (velAlongNormal > 0.0f) {
    return; // already separating
  }

  const float e = std::min(a.restitution, b.restitution);
  const float impulseScalar = -(1.0f + e) * velAlongNormal / invMassSum;
  const Vec2 impulse = Vec2Scale(n, impulseScalar);

  ApplyImpulse(a, Vec2Scale(impulse, -1.0f));
  ApplyImpulse(b, impulse);
}

std::optional<Contact> DetectWallCollision(const Entity &entity,
                                           const SimConfig &config) {
  const float goalTop = GoalTop(config);
  const float goalBottom = GoalBottom(config);
  const float wall = config.wallThickness;
  const Vec2 &p = entity.position;
  const float r = entity.radius;

  // The ball may enter the goal mouth; players may not.
  const bool blockedSideways =
      IsPlayer(entity) || p.y < goalTop || p.y > goalBottom;

  bool hit = false;
  Contact contact{};

  if (p.x - r < wall && blockedSideways) {
    hit = true;
    contact.normal = Vec2{1.0f, 0.0f};
    contact.penetration = wall - (p.x - r);
  }
  if (p.x + r > config.arenaWidth - wall && blockedSideways) {
    hit = true;
    contact.normal = Vec2{-1.0f, 0.0f};
    contact.penetration = (p.x + r) - (config.arenaWidth - wall);
  }
  if (p.y - r < wall) {
    hit = true;
    contact.normal = Vec2{0.0f, 1.0f};
    contact.penetration = wall - (p.y - r);
  }
  if (p.y + r > config.arenaHeight - wall) {
    hit = true;
    contact.normal = Vec2{0.0f, -1.0f};
    contact.penetration = (p.y + r) - (config.arenaHeight - wall);
  }

  if (hit && contact.penetration > 0.0f) {
    return contact;
  }
  return std::nullopt;
}

void ResolveWallCollision(Entity &entity, const Contact &contact,
                          const SimConfig &config) {
  const Vec2 &n = contact.normal;

  if (contact.penetration > config.collisionSlop) {
    const float correction = config.correctionPercent * contact.penetration;
    entity.position.x += n.x * correction;
    entity.position.y += n.y * correction;
  }

  const float velAlongNormal = Vec2Dot(entity.velocity, n);
  if (velAlongNormal < 0.0f) {
    const Vec2 reflected =
        Vec2Scale(n, -2.0f * velAlongNormal * entity.restitution);
    entity.velocity.x += reflected.x;
    entity.velocity.y += reflected.y;
  }
}

GoalOutcome CheckGoal(const Entity &ball, const SimConfig &config) {
  const float goalTop = GoalTop(config);
  const float goalBottom = GoalBottom(config);
  const Vec2 &p = ball.position;
  const bool inMouth = p.y >= goalTop && p.y <= goalBottom;
  if (!inMouth) {
    return GoalOutcome::None;
  }

  if (p.x - ball.radius < 0.0f) {
    return GoalOutcome::RightScored;
  }
  if (p.x + ball.radius > config.arenaWidth) {
    return GoalOutcome::LeftScored;
  }
  return GoalOutcome::None;
}

const char *GoalOutcomeName(const GoalOutcome outcome) {
  switch (outcome) {
  case GoalOutcome::None:
    return "none";
  case GoalOutcome::LeftScored:
    return "left";
  case GoalOutcome::RightScored:
    return "right";
  }
  return "unknown";
}
