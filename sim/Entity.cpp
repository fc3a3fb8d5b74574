#include "sim/Entity.hpp"

#include <cmath>

namespace {
Entity MakeBody(const EntityKind kind, const BodyParams &params,
                const Vec2 position) {
  Entity e{};
  e.kind = kind;
  e.position = position;
  e.velocity = Vec2{};
  e.radius = params.radius;
  e.mass = params.mass;
  e.restitution = params.restitution;
  e.maxSpeed = params.maxSpeed;
  e.damping = params.damping;
  return e;
}

void UpdatePlayer(Entity &player, const SimConfig &config, const float dt,
                  const float accelerationMultiplier) {
  const float accel = config.playerAcceleration * accelerationMultiplier;
  player.velocity.x += player.player.inputAcceleration.x * accel * dt;
  player.velocity.y += player.player.inputAcceleration.y * accel * dt;
  IntegrateMotion(player, dt);
}

void UpdateBall(Entity &ball, const float dt) {
  if (ball.ball.isFrozen) {
    ball.ball.freezeTime -= dt;
    if (ball.ball.freezeTime > 0.0f) {
      return;
    }
    // Expired this tick: integrate normally below.
    ball.ball.isFrozen = false;
    ball.ball.freezeTime = 0.0f;
  }
  IntegrateMotion(ball, dt);
}
} // namespace

Entity MakePlayer(const SimConfig &config, const Vec2 position,
                  const bool isHuman) {
  Entity e = MakeBody(EntityKind::Player, config.player, position);
  e.player.isHuman = isHuman;
  return e;
}

Entity MakeBall(const SimConfig &config, const Vec2 position) {
  return MakeBody(EntityKind::Ball, config.ball, position);
}

float InverseMass(const Entity &entity) {
  return (entity.mass > 0.0f) ? 1.0f / entity.mass : 0.0f;
}

void ApplyImpulse(Entity &entity, const Vec2 &impulse) {
  const float invMass = InverseMass(entity);
  entity.velocity.x += impulse.x * invMass;
  entity.velocity.y += impulse.y * invMass;
}

void IntegrateMotion(Entity &entity, const float dt) {
  entity.velocity.x *= entity.damping;
  entity.velocity.y *= entity.damping;

  const float speed = Vec2Length(entity.velocity);
  if (speed > entity.maxSpeed) {
    const float scale = entity.maxSpeed / speed;
    entity.velocity.x *= scale;
    entity.velocity.y *= scale;
  }

  entity.position.x += entity.velocity.x * dt;
  entity.position.y += entity.velocity.y * dt;
}

void UpdateEntity(Entity &entity, const SimConfig &config, const float dt,
                  const float accelerationMultiplier) {
  switch (entity.kind) {
  case EntityKind::Player:
    UpdatePlayer(entity, config, dt, accelerationMultiplier);
    break;
  case EntityKind::Ball:
    UpdateBall(entity, dt);
    break;
  }
}

void FreezeBall(Entity &ball, const float duration) {
  if (ball.kind != EntityKind::Ball) {
    return;
  }
  ball.ball.isFrozen = true;
  ball.ball.freezeTime = duration;
  ball.velocity = Vec2{};
}
