#pragma once

#include <cstdint>

#include "sim/SimConfig.hpp"
#include "sim/Vec2.hpp"

// Index of an entity inside World::entities.
using EntityId = int;
constexpr EntityId kInvalidEntity = -1;

enum class EntityKind : uint8_t {
  Player,
  Ball,
};

// Player-only state. inputAcceleration is written by the driver (keyboard or
// bot AI) every tick and consumed by UpdateEntity.
struct PlayerState {
  bool isHuman = false; // member of the human-controlled roster
  Vec2 inputAcceleration{};
};

// Ball-only state. While frozen the ball holds still and skips integration.
struct BallState {
  bool isFrozen = false;
  float freezeTime = 0.0f;
};

// A circular body. `kind` selects which of `player` / `ball` is meaningful.
struct Entity {
  EntityKind kind = EntityKind::Player;
  Vec2 position{};
  Vec2 velocity{};
  float radius = 0.0f;
  float mass = 1.0f;
  float restitution = 0.0f;
  float maxSpeed = 0.0f;
  float damping = 1.0f;

  PlayerState player{};
  BallState ball{};
};

Entity MakePlayer(const SimConfig &config, Vec2 position, bool isHuman);
Entity MakeBall(const SimConfig &config, Vec2 position);

// 0 for non-positive mass, which makes the body immovable.
float InverseMass(const Entity &entity);

void ApplyImpulse(Entity &entity, const Vec2 &impulse);

// Damping, speed clamp, then position += velocity * dt.
void IntegrateMotion(Entity &entity, float dt);

// Advances one tick. Players first add
// inputAcceleration * config.playerAcceleration * accelerationMultiplier * dt
// to their velocity; balls honour the freeze gate. The multiplier is ignored
// for balls.
void UpdateEntity(Entity &entity, const SimConfig &config, float dt,
                  float accelerationMultiplier = 1.0f);

void FreezeBall(Entity &ball, float duration);

inline bool IsPlayer(const Entity &entity) {
  return entity.kind == EntityKind::Player;
}

inline bool IsFrozenBall(const Entity &entity) {
  return entity.kind == EntityKind::Ball && entity.ball.isFrozen;
}
