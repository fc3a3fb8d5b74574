#include "render/HudWidgets.hpp"

#include <cstdio>

#include "core/Config.hpp"
#include "game/Game.hpp"
#include "render/Palette.hpp"
#include "render/RenderUtils.hpp"

namespace render {

namespace {

void DrawTeamChip(const int x, const int y, const Color color,
                  const Color outline) {
  DrawCircle(x, y, 9.0f, color);
  DrawCircleLines(x, y, 9.0f, outline);
}

} // namespace

void DrawScorePanel(const Game &game, const PitchPalette &pal,
                    const int width) {
  const World &world = game.match.world;
  const int height = cfg::kHudHeight;
  const int centerX = width / 2;

  DrawRectangle(0, 0, width, height, pal.uiPanel);
  DrawLine(0, height - 1, width, height - 1, WithAlpha(pal.lines, 80));

  char score[32];
  std::snprintf(score, sizeof(score), "%d : %d", world.score.human,
                world.score.bot);
  DrawTextCentered(score, centerX, 10, 32, pal.uiText);

  const int scoreWidth = MeasureText(score, 32);
  DrawTeamChip(centerX - scoreWidth / 2 - 24, 26, pal.humanTeam,
               pal.humanOutline);
  DrawTeamChip(centerX + scoreWidth / 2 + 24, 26, pal.botTeam, pal.botOutline);

  char mode[48];
  std::snprintf(mode, sizeof(mode), "%s  |  %s", GameModeName(world.mode),
                MatchStateName(GetMatchState(world)));
  DrawText(mode, 16, 12, 18, pal.uiAccent);
  DrawText("1/2/3 mode  P pause  R reset", 16, 36, 12,
           WithAlpha(pal.uiText, 160));

  const char *hint = "WASD move  SPACE pass/kick  F1 vectors  F2 colors";
  DrawText(hint, width - MeasureText(hint, 12) - 16, 36, 12,
           WithAlpha(pal.uiText, 160));
}

void DrawBanner(const char *title, const char *subtitle,
                const PitchPalette &pal, const Color accent, const int width,
                const int height) {
  const int boxH = (subtitle != nullptr) ? 96 : 64;
  const int boxY = cfg::kHudHeight + (height - cfg::kHudHeight - boxH) / 2;
  DrawRectangle(0, boxY, width, boxH, pal.uiPanel);
  DrawRectangle(0, boxY, width, 2, accent);
  DrawRectangle(0, boxY + boxH - 2, width, 2, accent);
  DrawTextCentered(title, width / 2, boxY + 14, 40, accent);
  if (subtitle != nullptr) {
    DrawTextCentered(subtitle, width / 2, boxY + 62, 18, pal.uiText);
  }
}

} // namespace render
