#include "sim/Match.hpp"

#include <cmath>

#include "core/Config.hpp"
#include "core/Log.hpp"

namespace {

uint32_t NormalizeSeed(const uint32_t seed) { return (seed == 0) ? 1u : seed; }

void ApplyHumanCommand(Match &match) {
  World &world = match.world;
  const EntityId humanId = GetHumanPlayer(world);
  Entity &human = world.entities[humanId];

  const Vec2 move = match.command.move;
  human.player.inputAcceleration =
      Vec2IsFinite(move) ? Vec2Normalize(move) : Vec2{};

  if (match.command.kickRequested) {
    // Prefer a pass to a teammate; kick when nobody is available.
    if (const auto receiver = TryPass(world, humanId)) {
      LOG_TRACE("Human passed to entity {}", *receiver);
    } else if (TryKick(world, humanId)) {
      LOG_TRACE("Human kicked");
    }
  }
}

} // namespace

void InitMatch(Match &match, const GameMode mode, const SimConfig &config,
               const uint32_t seed) {
  match = Match{};
  match.seed = NormalizeSeed(seed);
  InitWorld(match.world, mode, config);
  InitBot(match.bot, match.seed);
}

void SetMatchMode(Match &match, const GameMode mode) {
  if (match.world.mode == mode) {
    return;
  }

  const Score score = match.world.score;
  const bool paused = match.world.isPaused;
  const SimConfig config = match.world.config;

  InitWorld(match.world, mode, config);
  match.world.score = score;
  match.world.isPaused = paused;

  InitBot(match.bot, match.seed);
  match.accumulator = 0.0f;
  match.command = HumanCommand{};
  LOG_INFO("Switched to {} (score {} : {})", GameModeName(mode), score.human,
           score.bot);
}

void ResetMatch(Match &match) {
  ResetWorld(match.world);
  match.accumulator = 0.0f;
  match.command = HumanCommand{};
}

void SetPaused(Match &match, const bool paused) {
  if (match.world.isPaused == paused) {
    return;
  }
  match.world.isPaused = paused;
  LOG_INFO("{}", paused ? "Match paused" : "Match resumed");
}

MatchFrameResult StepMatch(Match &match, float frameTime) {
  MatchFrameResult result{};

  if (match.world.isPaused) {
    match.accumulator = 0.0f;
    match.command.kickRequested = false;
    return result;
  }

  if (!std::isfinite(frameTime) || frameTime <= 0.0f) {
    frameTime = cfg::kFixedDt;
  }
  if (frameTime > cfg::kMaxFrameTime) {
    frameTime = cfg::kMaxFrameTime;
  }
  match.accumulator += frameTime;

  // Decisions are made once per fixed step, so the number of AI draws does
  // not depend on the display rate. A kick request waits for the next step.
  while (match.accumulator >= cfg::kFixedDt &&
         result.steps < cfg::kMaxSimStepsPerFrame) {
    ApplyHumanCommand(match);
    match.command.kickRequested = false;
    DriveBots(match.bot, match.world, match.botDifficulty);

    const GoalOutcome goal = UpdateWorld(match.world, cfg::kFixedDt,
                                         match.botAccelerationMultiplier);
    if (goal != GoalOutcome::None) {
      result.goal = goal;
    }
    match.accumulator -= cfg::kFixedDt;
    ++match.simTicks;
    ++result.steps;
  }

  if (result.steps == cfg::kMaxSimStepsPerFrame) {
    match.accumulator = 0.0f;
  }
  return result;
}
