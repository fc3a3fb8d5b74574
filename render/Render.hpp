#pragma once

struct Game;

// Draws the current authoritative state; nothing is interpolated.
void RenderFrame(const Game& game);
