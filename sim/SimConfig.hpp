#pragma once

#include <string>

#include "core/Config.hpp"

// Physical properties shared by every body of one kind.
struct BodyParams {
  float radius = 0.0f;
  float mass = 1.0f;
  float restitution = 0.0f;
  float maxSpeed = 0.0f;
  float damping = 1.0f; // velocity factor applied once per tick
};

// Tunables for one match session. Defaults come from cfg::; a World copies
// its SimConfig at construction and never changes it afterwards.
struct SimConfig {
  BodyParams player{cfg::kPlayerRadius, cfg::kPlayerMass,
                    cfg::kPlayerRestitution, cfg::kPlayerMaxSpeed,
                    cfg::kPlayerDamping};
  float playerAcceleration = cfg::kPlayerAcceleration;

  BodyParams ball{cfg::kBallRadius, cfg::kBallMass, cfg::kBallRestitution,
                  cfg::kBallMaxSpeed, cfg::kBallDamping};

  float kickRadius = cfg::kKickRadius;
  float kickForce = cfg::kKickForce;

  float arenaWidth = cfg::kArenaWidth;
  float arenaHeight = cfg::kArenaHeight;
  float goalHeight = cfg::kGoalHeight;
  float wallThickness = cfg::kWallThickness;

  float collisionSlop = cfg::kCollisionSlop;
  float correctionPercent = cfg::kPositionCorrectionPercent;

  float kickoffFreezeDuration = cfg::kKickoffFreezeDuration;
};

inline float ArenaCenterX(const SimConfig &config) {
  return config.arenaWidth * 0.5f;
}
inline float ArenaCenterY(const SimConfig &config) {
  return config.arenaHeight * 0.5f;
}
inline float GoalTop(const SimConfig &config) {
  return ArenaCenterY(config) - config.goalHeight * 0.5f;
}
inline float GoalBottom(const SimConfig &config) {
  return ArenaCenterY(config) + config.goalHeight * 0.5f;
}

// Overlays values from a JSON file onto `config`. Fields that are missing keep
// their current value; fields that fail validation are logged and skipped.
// Returns false (leaving `config` untouched) if the file cannot be read or
// parsed.
bool LoadSimConfig(const std::string &path, SimConfig &config);

// Checks cross-field constraints (goal mouth inside the arena, arena larger
// than the walls, every kickoff spot inside the walls and clear of the ball).
// Logs every violation.
bool ValidateSimConfig(const SimConfig &config);
