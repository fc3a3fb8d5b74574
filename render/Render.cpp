#include "render/Render.hpp"

#include <cstdio>

#include "core/Config.hpp"
#include "game/Game.hpp"
#include "render/HudWidgets.hpp"
#include "render/Palette.hpp"
#include "render/RenderUtils.hpp"

namespace {

using render::ToScreen;
using render::WithAlpha;

void DrawRing(const Vector2 center, const float radius, const Color color) {
  DrawCircleLines(static_cast<int>(center.x), static_cast<int>(center.y),
                  radius, color);
}

void DrawWorldRect(const float x, const float y, const float w, const float h,
                   const Color color) {
  const Vector2 origin = ToScreen(Vec2{x, y});
  DrawRectangleV(origin, Vector2{w, h}, color);
}

void DrawPitch(const SimConfig &c, const PitchPalette &pal) {
  const float wall = c.wallThickness;
  const float innerW = c.arenaWidth - 2.0f * wall;
  const float innerH = c.arenaHeight - 2.0f * wall;

  DrawWorldRect(wall, wall, innerW, innerH, pal.grass);
  constexpr int kStripes = 10;
  const float stripeW = innerW / kStripes;
  for (int i = 1; i < kStripes; i += 2) {
    DrawWorldRect(wall + stripeW * static_cast<float>(i), wall, stripeW,
                  innerH, pal.grassStripe);
  }

  const float cx = ArenaCenterX(c);
  const float cy = ArenaCenterY(c);
  DrawLineEx(ToScreen(Vec2{cx, wall}), ToScreen(Vec2{cx, c.arenaHeight - wall}),
             2.0f, pal.lines);
  const Vector2 center = ToScreen(Vec2{cx, cy});
  DrawRing(center, cfg::kCenterCircleRadius, pal.lines);
  DrawCircleV(center, 3.0f, pal.lines);
  DrawRectangleLinesEx(
      Rectangle{wall, wall + static_cast<float>(cfg::kHudHeight), innerW,
                innerH},
      2.0f, pal.lines);
}

void DrawWalls(const SimConfig &c, const PitchPalette &pal) {
  const float wall = c.wallThickness;
  const float goalTop = GoalTop(c);
  const float goalBottom = GoalBottom(c);
  const float rightX = c.arenaWidth - wall;

  DrawWorldRect(0.0f, 0.0f, c.arenaWidth, wall, pal.wall);
  DrawWorldRect(0.0f, c.arenaHeight - wall, c.arenaWidth, wall, pal.wall);

  // Side walls stop at the goal mouth.
  DrawWorldRect(0.0f, 0.0f, wall, goalTop, pal.wall);
  DrawWorldRect(0.0f, goalBottom, wall, c.arenaHeight - goalBottom, pal.wall);
  DrawWorldRect(rightX, 0.0f, wall, goalTop, pal.wall);
  DrawWorldRect(rightX, goalBottom, wall, c.arenaHeight - goalBottom,
                pal.wall);

  DrawWorldRect(0.0f, goalTop, wall, c.goalHeight,
                WithAlpha(pal.humanTeam, pal.goalMouth.a));
  DrawWorldRect(rightX, goalTop, wall, c.goalHeight,
                WithAlpha(pal.botTeam, pal.goalMouth.a));
}

void DrawVelocity(const Entity &e, const PitchPalette &pal) {
  const Vec2 tip = Vec2Add(
      e.position, Vec2Scale(e.velocity, cfg::kVelocityIndicatorScale));
  DrawLineEx(ToScreen(e.position), ToScreen(tip), 2.0f, pal.velocity);
}

void DrawRoster(const World &world, const Roster &roster, const Color fill,
                const Color outline, const bool showVelocity,
                const PitchPalette &pal) {
  for (int i = 0; i < roster.count; ++i) {
    const Entity &p = world.entities[roster.members[i]];
    const Vector2 pos = ToScreen(p.position);
    DrawCircleV(pos, p.radius, fill);
    DrawRing(pos, p.radius, outline);
    if (showVelocity) {
      DrawVelocity(p, pal);
    }
  }
}

void DrawKickRing(const World &world, const PitchPalette &pal) {
  const Entity &human = world.entities[GetHumanPlayer(world)];
  const Entity &ball = GetBall(world);
  const bool inRange = Vec2Distance(human.position, ball.position) <=
                           world.config.kickRadius &&
                       !ball.ball.isFrozen;
  DrawRing(ToScreen(human.position), world.config.kickRadius,
           inRange ? pal.kickInRange : pal.kickOutOfRange);
  // Marks the keyboard player.
  DrawCircleV(ToScreen(human.position), 4.0f, pal.humanOutline);
}

void DrawBall(const Entity &ball, const bool showVelocity,
              const PitchPalette &pal) {
  const Vector2 pos = ToScreen(ball.position);
  DrawCircleV(pos, ball.radius, pal.ball);
  DrawRing(pos, ball.radius, pal.background);
  if (IsFrozenBall(ball)) {
    DrawRing(pos, ball.radius + 4.0f, pal.frozenRing);
    DrawRing(pos, ball.radius + 5.0f, pal.frozenRing);
  }
  if (showVelocity) {
    DrawVelocity(ball, pal);
  }
}

} // namespace

void RenderFrame(const Game &game) {
  const PitchPalette &pal = GetPalette(game.paletteIndex);
  const World &world = game.match.world;
  const int width = GetScreenWidth();
  const int height = GetScreenHeight();

  BeginDrawing();
  ClearBackground(pal.background);

  DrawPitch(world.config, pal);
  DrawWalls(world.config, pal);
  DrawRoster(world, world.humanRoster, pal.humanTeam, pal.humanOutline,
             game.showVelocity, pal);
  DrawRoster(world, world.botRoster, pal.botTeam, pal.botOutline,
             game.showVelocity, pal);
  DrawKickRing(world, pal);
  DrawBall(GetBall(world), game.showVelocity, pal);

  render::DrawScorePanel(game, pal, width);

  if (world.isPaused) {
    render::DrawBanner("PAUSED", "press P to resume", pal, pal.uiAccent, width,
                       height);
  } else if (game.goalBannerTimer > 0.0f) {
    const bool humanScored = game.lastGoal == GoalOutcome::LeftScored;
    char subtitle[32];
    std::snprintf(subtitle, sizeof(subtitle), "%d : %d", world.score.human,
                  world.score.bot);
    render::DrawBanner("GOAL!", subtitle, pal,
                       humanScored ? pal.humanTeam : pal.botTeam, width,
                       height);
  }

  EndDrawing();
}
