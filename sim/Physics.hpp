#pragma once

#include <optional>

#include "sim/Entity.hpp"
#include "sim/SimConfig.hpp"
#include "sim/Vec2.hpp"

// Overlap between two circles, or between a circle and a wall.
// For circle pairs the normal points from A to B; for walls it points from
// the wall into the arena.
struct Contact {
  Vec2 normal{1.0f, 0.0f};
  float penetration = 0.0f;
};

enum class GoalOutcome {
  None,
  LeftScored,  // ball entered the right goal
  RightScored, // ball entered the left goal
};

// Circle-circle test. Coincident centers report the (1, 0) normal.
std::optional<Contact> DetectCircleCollision(const Entity &a, const Entity &b);

// Positional correction followed by an impulse along the contact normal.
void ResolveCircleCollision(Entity &a, Entity &b, const Contact &contact,
                            const SimConfig &config);

// Tests the arena border. Players collide with the full left/right borders,
// the ball only outside the goal mouth. Left/right are tested before
// top/bottom and a later hit replaces an earlier one, so at most one contact
// is reported per entity.
std::optional<Contact> DetectWallCollision(const Entity &entity,
                                           const SimConfig &config);

void ResolveWallCollision(Entity &entity, const Contact &contact,
                          const SimConfig &config);

GoalOutcome CheckGoal(const Entity &ball, const SimConfig &config);

const char *GoalOutcomeName(GoalOutcome outcome);
