#pragma once

#include <cmath>

// Plain 2D vector in world pixels (x right, y down). Value semantics only.
struct Vec2 {
  float x = 0.0f;
  float y = 0.0f;
};

// Below this length a vector is treated as zero when normalizing.
constexpr float kVec2NormalizeEpsilon = 0.0001f;

inline Vec2 Vec2Add(const Vec2 &a, const Vec2 &b) {
  return Vec2{a.x + b.x, a.y + b.y};
}

inline Vec2 Vec2Sub(const Vec2 &a, const Vec2 &b) {
  return Vec2{a.x - b.x, a.y - b.y};
}

inline Vec2 Vec2Scale(const Vec2 &v, const float s) {
  return Vec2{v.x * s, v.y * s};
}

inline float Vec2Dot(const Vec2 &a, const Vec2 &b) {
  return a.x * b.x + a.y * b.y;
}

inline float Vec2LengthSq(const Vec2 &v) { return v.x * v.x + v.y * v.y; }

inline float Vec2Length(const Vec2 &v) { return std::sqrt(Vec2LengthSq(v)); }

// Returns the zero vector for inputs shorter than kVec2NormalizeEpsilon.
inline Vec2 Vec2Normalize(const Vec2 &v) {
  const float len = Vec2Length(v);
  if (!(len >= kVec2NormalizeEpsilon)) {
    return Vec2{};
  }
  return Vec2Scale(v, 1.0f / len);
}

inline float Vec2Distance(const Vec2 &a, const Vec2 &b) {
  return Vec2Length(Vec2Sub(a, b));
}

inline bool Vec2IsFinite(const Vec2 &v) {
  return std::isfinite(v.x) && std::isfinite(v.y);
}

inline float Clamp(const float value, const float minValue,
                   const float maxValue) {
  if (value < minValue) {
    return minValue;
  }
  if (value > maxValue) {
    return maxValue;
  }
  return value;
}

inline Vec2 Vec2Clamp(const Vec2 &v, const Vec2 &minCorner,
                      const Vec2 &maxCorner) {
  return Vec2{Clamp(v.x, minCorner.x, maxCorner.x),
              Clamp(v.y, minCorner.y, maxCorner.y)};
}

inline float Lerp(const float a, const float b, const float t) {
  return a + (b - a) * t;
}

inline Vec2 Vec2Lerp(const Vec2 &a, const Vec2 &b, const float t) {
  return Vec2{Lerp(a.x, b.x, t), Lerp(a.y, b.y, t)};
}
