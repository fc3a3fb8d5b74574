#include "core/Rng.hpp"

namespace core {
namespace {
constexpr uint32_t kZeroStateReplacement = 0xA341316Cu;
constexpr float kInv2Pow24 = 1.0f / 16777216.0f;
}  // namespace

uint32_t NextU32(uint32_t& state) {
    uint32_t x = (state != 0u) ? state : kZeroStateReplacement;
    x ^= x << 13;
    x ^= x >> 17;
    x ^= x << 5;
    state = x;
    return x;
}

float NextFloat01(uint32_t& state) {
    // Top 24 bits fit a float mantissa exactly, so 1.0 is never produced.
    return static_cast<float>(NextU32(state) >> 8) * kInv2Pow24;
}

float NextRange(uint32_t& state, const float minValue, const float maxValue) {
    return minValue + (maxValue - minValue) * NextFloat01(state);
}

bool Chance(uint32_t& state, const float p) {
    if (!(p > 0.0f)) return false;
    if (p >= 1.0f) return true;
    return NextFloat01(state) < p;
}
}  // namespace core
