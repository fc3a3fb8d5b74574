#pragma once

#include <cstdint>

#include "sim/Bot.hpp"
#include "sim/World.hpp"

// Input for the keyboard player, written once per rendered frame.
struct HumanCommand {
  Vec2 move{};                // normalized or zero
  bool kickRequested = false; // edge-triggered; consumed by the next step
};

// Fixed-timestep driver shared by the windowed game and the headless runner.
struct Match {
  World world{};
  Bot bot{};
  uint32_t seed = 1u;

  float accumulator = 0.0f;
  uint64_t simTicks = 0;

  HumanCommand command{};
  float botDifficulty = cfg::kBotDifficulty;
  float botAccelerationMultiplier = cfg::kBotAccelerationMultiplier;
};

struct MatchFrameResult {
  int steps = 0;
  GoalOutcome goal = GoalOutcome::None; // last goal scored this frame
};

void InitMatch(Match &match, GameMode mode, const SimConfig &config,
               uint32_t seed);

// Rebuilds the world for `mode`, keeping score and pause state. Does nothing
// when the mode is already active.
void SetMatchMode(Match &match, GameMode mode);

void ResetMatch(Match &match);

void SetPaused(Match &match, bool paused);

// Runs up to cfg::kMaxSimStepsPerFrame fixed steps. Each step applies the
// human command, drives the bots, then advances the world.
MatchFrameResult StepMatch(Match &match, float frameTime);
