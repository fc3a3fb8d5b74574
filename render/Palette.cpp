#include "render/Palette.hpp"

#include "core/Config.hpp"

namespace {
constexpr PitchPalette kPalettes[cfg::kPaletteCount] = {
    // Matchday: bright grass, blue vs red.
    PitchPalette{
        /* background     */ Color{18, 24, 20, 255},
        /* grass          */ Color{46, 125, 50, 255},
        /* grassStripe    */ Color{56, 142, 60, 255},
        /* lines          */ Color{235, 245, 235, 255},
        /* wall           */ Color{60, 64, 72, 255},
        /* goalMouth      */ Color{240, 240, 240, 90},
        /* humanTeam      */ Color{74, 158, 255, 255},
        /* humanOutline   */ Color{200, 230, 255, 255},
        /* botTeam        */ Color{255, 107, 107, 255},
        /* botOutline     */ Color{255, 210, 210, 255},
        /* ball           */ Color{250, 250, 250, 255},
        /* frozenRing     */ Color{255, 214, 64, 255},
        /* kickInRange    */ Color{80, 255, 120, 200},
        /* kickOutOfRange */ Color{255, 255, 255, 70},
        /* velocity       */ Color{255, 240, 120, 255},
        /* uiPanel        */ Color{10, 14, 12, 200},
        /* uiText         */ Color{240, 248, 240, 255},
        /* uiAccent       */ Color{255, 214, 64, 255},
    },
    // Floodlights: dark turf, neon kits.
    PitchPalette{
        /* background     */ Color{6, 8, 16, 255},
        /* grass          */ Color{18, 48, 36, 255},
        /* grassStripe    */ Color{22, 58, 42, 255},
        /* lines          */ Color{150, 220, 255, 255},
        /* wall           */ Color{30, 36, 60, 255},
        /* goalMouth      */ Color{150, 220, 255, 70},
        /* humanTeam      */ Color{40, 200, 255, 255},
        /* humanOutline   */ Color{180, 240, 255, 255},
        /* botTeam        */ Color{255, 70, 190, 255},
        /* botOutline     */ Color{255, 190, 240, 255},
        /* ball           */ Color{255, 255, 220, 255},
        /* frozenRing     */ Color{255, 160, 40, 255},
        /* kickInRange    */ Color{90, 255, 160, 200},
        /* kickOutOfRange */ Color{150, 220, 255, 60},
        /* velocity       */ Color{255, 140, 40, 255},
        /* uiPanel        */ Color{8, 10, 24, 210},
        /* uiText         */ Color{230, 240, 255, 255},
        /* uiAccent       */ Color{252, 96, 255, 255},
    },
};
} // namespace

const PitchPalette &GetPalette(const int index) {
    const int i = (index >= 0 && index < cfg::kPaletteCount) ? index : 0;
    return kPalettes[i];
}
