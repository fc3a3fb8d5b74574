#pragma once

#include <raylib.h>

struct Game;
struct PitchPalette;

namespace render {

// Top strip: score, mode, match state and the control hint.
void DrawScorePanel(const Game &game, const PitchPalette &pal, int width);

// Large centered message over the pitch (pause, goal).
void DrawBanner(const char *title, const char *subtitle,
                const PitchPalette &pal, Color accent, int width, int height);

} // namespace render
