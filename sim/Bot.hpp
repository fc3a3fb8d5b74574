#pragma once

#include <cstdint>

#include "sim/Vec2.hpp"
#include "sim/World.hpp"

// Heuristic decision engine for every AI-driven player: bot-roster opponents
// and the human roster's wingers. No heap allocations, no raylib dependency.
// Uses its own RNG state so kick/pass draws are reproducible per seed.
struct Bot {
  uint32_t rng = 1u;
};

void InitBot(Bot &bot, uint32_t seed);

// How the agent relates to the keyboard player.
enum class Relation : uint8_t {
  Teammate, // human roster, attacks the right goal
  Opponent, // bot roster, attacks the left goal
};

enum class Possession : uint8_t {
  Agent, // the agent is within kick radius + control margin
  Human, // the keyboard player is on the ball
  Loose,
};

// Per-tick view of the world from one agent's position. Built once per
// decision and handed to the behavior functions.
struct BotContext {
  Bot *bot = nullptr;
  const World *world = nullptr;
  EntityId agentId = kInvalidEntity;
  const Entity *agent = nullptr;
  const Entity *ball = nullptr;
  const Entity *human = nullptr;
  Relation relation = Relation::Opponent;
  Possession possession = Possession::Loose;
  int role = 0; // roster index
  Vec2 predictedBall{};
  Vec2 attackGoal{};
  Vec2 defendGoal{};
  float centerX = 0.0f;
  float centerY = 0.0f;
};

using BehaviorFn = Vec2 (*)(BotContext &ctx);

// One row of the decision table. A row matches when the relation is equal,
// the mode and possession bits are set, and `role` is -1 or equal to the
// agent's roster index. Rows are tried top to bottom.
struct BehaviorRule {
  Relation relation;
  uint8_t modes;
  uint8_t possessions;
  int role;
  BehaviorFn target;
  const char *name;
};

constexpr uint8_t ModeBit(const GameMode mode) {
  return static_cast<uint8_t>(1u << static_cast<unsigned>(mode));
}
constexpr uint8_t PossessionBit(const Possession possession) {
  return static_cast<uint8_t>(1u << static_cast<unsigned>(possession));
}

// nullptr when no row matches.
const BehaviorRule *FindBehaviorRule(Relation relation, GameMode mode,
                                     Possession possession, int role);

Relation RelationOf(const World &world, EntityId agentId);

Possession ClassifyPossession(const World &world, EntityId agentId);

// Where the ball will be when the agent can reach it, kept within the arena
// inflated by cfg::kPredictionBoundsMargin.
Vec2 PredictBallPosition(const World &world, const Entity &agent);

// Normalized, proximity-weighted push away from every player within
// cfg::kSeparationRadius. Same-roster neighbours weigh more. Zero when
// nobody is in range.
Vec2 ComputeSeparation(const World &world, EntityId agentId);

// Steering target chosen by the decision table, before blending.
Vec2 ComputeTarget(Bot &bot, const World &world, EntityId agentId);

// Unit steering vector for the agent. Always finite.
Vec2 GetDesiredDirection(Bot &bot, const World &world, EntityId agentId);

// Randomized kick/pass trigger. False whenever the ball is frozen or out of
// reach.
bool ShouldKick(Bot &bot, const World &world, EntityId agentId,
                float difficulty);

// Writes steering into every AI agent (bot roster, then the human roster's
// wingers) and fires their kicks and passes.
void DriveBots(Bot &bot, World &world, float difficulty);

const char *RelationName(Relation relation);
const char *PossessionName(Possession possession);
