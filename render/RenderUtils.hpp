#pragma once

#include <raylib.h>

#include "core/Config.hpp"
#include "sim/Vec2.hpp"

namespace render {

// The pitch sits below the HUD strip; world y grows downward like the screen.
inline Vector2 ToScreen(const Vec2 &p) {
  return Vector2{p.x, p.y + static_cast<float>(cfg::kHudHeight)};
}

inline Color WithAlpha(const Color c, const unsigned char a) {
  return Color{c.r, c.g, c.b, a};
}

// Centers `text` horizontally on `centerX`.
inline void DrawTextCentered(const char *text, const int centerX, const int y,
                             const int fontSize, const Color color) {
  const int width = MeasureText(text, fontSize);
  DrawText(text, centerX - width / 2, y, fontSize, color);
}

} // namespace render
