#pragma once

#include <cstdint>

namespace core {
// Advances `state` and returns the next value. A zero state is remapped
// to a fixed non-zero seed so the generator never sticks at zero.
uint32_t NextU32(uint32_t& state);

// Uniform in [0, 1).
float NextFloat01(uint32_t& state);

// Uniform in [minValue, maxValue).
float NextRange(uint32_t& state, float minValue, float maxValue);

// True with probability `p` (clamped to [0, 1]).
bool Chance(uint32_t& state, float p);
}  // namespace core
