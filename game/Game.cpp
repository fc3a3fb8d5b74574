#include "game/Game.hpp"

#include <cmath>

#include <raylib.h>

#include "core/Log.hpp"

namespace cfg {
KeyConfig keys{};
} // namespace cfg

void InitGame(Game &game, const GameMode mode, const SimConfig &config,
              const uint32_t seed) {
  game = Game{};
  InitMatch(game.match, mode, config, seed);
  LOG_INFO("Game ready: {} seed {}", GameModeName(mode), game.match.seed);
}

void ReadInput(Game &game) {
  game.input.move = Vec2{};
  const auto &k = cfg::keys;

  if (IsKeyDown(k.left) || IsKeyDown(k.leftAlt))
    game.input.move.x -= 1.0f;
  if (IsKeyDown(k.right) || IsKeyDown(k.rightAlt))
    game.input.move.x += 1.0f;
  if (IsKeyDown(k.up) || IsKeyDown(k.upAlt))
    game.input.move.y -= 1.0f;
  if (IsKeyDown(k.down) || IsKeyDown(k.downAlt))
    game.input.move.y += 1.0f;

  // Diagonals are as fast as straight runs.
  game.input.move = Vec2Normalize(game.input.move);

  if (IsKeyPressed(k.kick))
    game.input.kickQueued = true;
  if (IsKeyPressed(k.pause))
    game.input.pauseToggleQueued = true;
  if (IsKeyPressed(k.reset))
    game.input.resetQueued = true;

  if (IsKeyPressed(k.mode1v1))
    game.input.modeQueued = GameMode::OneVsOne;
  else if (IsKeyPressed(k.mode2v2))
    game.input.modeQueued = GameMode::TwoVsTwo;
  else if (IsKeyPressed(k.mode3v3))
    game.input.modeQueued = GameMode::ThreeVsThree;

  if (IsKeyPressed(k.toggleVelocity))
    game.input.toggleVelocityQueued = true;
  if (IsKeyPressed(k.cyclePalette))
    game.input.cyclePaletteQueued = true;
  if (IsKeyPressed(k.back))
    game.wantsExit = true;
}

void ApplyMetaActions(Game &game) {
  Match &match = game.match;

  if (game.input.modeQueued) {
    SetMatchMode(match, *game.input.modeQueued);
    game.input.modeQueued.reset();
  }

  if (game.input.resetQueued) {
    ResetMatch(match);
    game.lastGoal = GoalOutcome::None;
    game.goalBannerTimer = 0.0f;
    game.input.resetQueued = false;
  }

  if (game.input.pauseToggleQueued) {
    SetPaused(match, !match.world.isPaused);
    game.input.pauseToggleQueued = false;
  }

  if (game.input.toggleVelocityQueued) {
    game.showVelocity = !game.showVelocity;
    game.input.toggleVelocityQueued = false;
  }

  if (game.input.cyclePaletteQueued) {
    game.paletteIndex = (game.paletteIndex + 1) % cfg::kPaletteCount;
    game.input.cyclePaletteQueued = false;
  }
}

void UpdateGame(Game &game, const float frameTime) {
  Match &match = game.match;
  match.command.move = game.input.move;
  if (game.input.kickQueued) {
    match.command.kickRequested = true;
    game.input.kickQueued = false;
  }

  const MatchFrameResult result = StepMatch(match, frameTime);
  if (result.goal != GoalOutcome::None) {
    game.lastGoal = result.goal;
    game.goalBannerTimer = cfg::kGoalBannerDuration;
  } else if (game.goalBannerTimer > 0.0f && !match.world.isPaused &&
             std::isfinite(frameTime)) {
    game.goalBannerTimer -= frameTime;
    if (game.goalBannerTimer < 0.0f) {
      game.goalBannerTimer = 0.0f;
    }
  }
}
