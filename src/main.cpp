#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>

#include <raylib.h>

#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "game/Game.hpp"
#include "render/Render.hpp"
#include "sim/SimConfig.hpp"

namespace {
constexpr const char *kConfigPath = "data/sim_config.json";
} // namespace

int main() {
  Log::Init();
  CrashHandler::Init();
  LOG_INFO("MiniSoccer starting...");

  SimConfig config{};
  if (std::filesystem::exists(kConfigPath)) {
    if (!LoadSimConfig(kConfigPath, config)) {
      LOG_WARN("Using built-in physics defaults");
    }
  }

  const int width = static_cast<int>(config.arenaWidth);
  const int height = static_cast<int>(config.arenaHeight) + cfg::kHudHeight;

  SetConfigFlags(FLAG_MSAA_4X_HINT);
  InitWindow(width, height, "MiniSoccer");
  SetExitKey(0); // ESC is handled by ReadInput.
  SetTargetFPS(60);

  Game game{};
  InitGame(game, GameMode::OneVsOne, config,
           static_cast<uint32_t>(std::time(nullptr)));

  using Clock = std::chrono::steady_clock;

  while (!WindowShouldClose() && !game.wantsExit) {
    ReadInput(game);
    ApplyMetaActions(game);

    const auto updateStart = Clock::now();
    UpdateGame(game, GetFrameTime());
    const auto updateEnd = Clock::now();
    game.updateMs =
        std::chrono::duration<float, std::milli>(updateEnd - updateStart)
            .count();

#ifndef NDEBUG
    if (game.updateMs > 2.0f) {
      LOG_WARN("Update() took {:.3f} ms (> 2ms budget)", game.updateMs);
    }
#endif

    const auto renderStart = Clock::now();
    RenderFrame(game);
    const auto renderEnd = Clock::now();
    game.renderMs =
        std::chrono::duration<float, std::milli>(renderEnd - renderStart)
            .count();
  }

  LOG_INFO("MiniSoccer shutting down (final score {} : {})",
           game.match.world.score.human, game.match.world.score.bot);
  CloseWindow();
  Log::Shutdown();
  return EXIT_SUCCESS;
}
