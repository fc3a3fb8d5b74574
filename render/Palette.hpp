#pragma once

#include <raylib.h>

struct PitchPalette {
    Color background{};
    Color grass{};
    Color grassStripe{};
    Color lines{};
    Color wall{};
    Color goalMouth{};
    Color humanTeam{};
    Color humanOutline{};
    Color botTeam{};
    Color botOutline{};
    Color ball{};
    Color frozenRing{};
    Color kickInRange{};
    Color kickOutOfRange{};
    Color velocity{};
    Color uiPanel{};
    Color uiText{};
    Color uiAccent{};
};

const PitchPalette& GetPalette(int index);
