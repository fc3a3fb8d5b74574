#pragma once

#include <cstdint>
#include <optional>

#include "core/Config.hpp"
#include "sim/Match.hpp"

struct InputState {
    Vec2 move{};
    bool kickQueued = false;
    bool pauseToggleQueued = false;
    bool resetQueued = false;
    bool toggleVelocityQueued = false;
    bool cyclePaletteQueued = false;
    std::optional<GameMode> modeQueued{};
};

struct Game {
    Match match{};
    InputState input{};
    bool wantsExit = false;

    bool showVelocity = false;
    int paletteIndex = 0;

    // Last goal, shown as a banner until the timer runs out.
    GoalOutcome lastGoal = GoalOutcome::None;
    float goalBannerTimer = 0.0f;

    float updateMs = 0.0f;
    float renderMs = 0.0f;
};

void InitGame(Game& game, GameMode mode, const SimConfig& config, uint32_t seed);
void ReadInput(Game& game);
void ApplyMetaActions(Game& game);

// Runs the frame's fixed steps and updates the goal banner.
void UpdateGame(Game& game, float frameTime);
