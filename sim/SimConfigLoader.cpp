#include "sim/SimConfig.hpp"

#include "core/Log.hpp"
#include "sim/World.hpp"
#include <cmath>
#include <fstream>
#include <limits>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace {

using Predicate = bool (*)(float);

bool IsPositive(const float v) { return std::isfinite(v) && v > 0.0f; }
bool IsNonNegative(const float v) { return std::isfinite(v) && v >= 0.0f; }
bool IsUnitInterval(const float v) {
  return std::isfinite(v) && v >= 0.0f && v <= 1.0f;
}
bool IsDampingFactor(const float v) {
  return std::isfinite(v) && v > 0.0f && v <= 1.0f;
}

// Reads `key` from `section` into `out` if present, numeric and accepted by
// `valid`. Anything else keeps the current value.
void ReadFloat(const json &section, const char *sectionName, const char *key,
               Predicate valid, float &out) {
  if (!section.contains(key)) {
    return;
  }
  const auto &val = section[key];
  if (!val.is_number()) {
    LOG_WARN("Config {}.{}: expected a number, keeping {}", sectionName, key,
             out);
    return;
  }
  const double wide = val.get<double>();
  if (!std::isfinite(wide) ||
      std::fabs(wide) > std::numeric_limits<float>::max()) {
    LOG_WARN("Config {}.{}: value {} is out of range, keeping {}", sectionName,
             key, wide, out);
    return;
  }
  const float v = static_cast<float>(wide);
  if (!valid(v)) {
    LOG_WARN("Config {}.{}: rejected value {}, keeping {}", sectionName, key,
             v, out);
    return;
  }
  out = v;
}

void ReadBody(const json &data, const char *sectionName, BodyParams &body) {
  if (!data.contains(sectionName) || !data[sectionName].is_object()) {
    return;
  }
  const auto &s = data[sectionName];
  ReadFloat(s, sectionName, "radius", IsPositive, body.radius);
  ReadFloat(s, sectionName, "mass", IsPositive, body.mass);
  ReadFloat(s, sectionName, "restitution", IsUnitInterval, body.restitution);
  ReadFloat(s, sectionName, "maxSpeed", IsPositive, body.maxSpeed);
  ReadFloat(s, sectionName, "damping", IsDampingFactor, body.damping);
}

const json *Section(const json &data, const char *name) {
  if (!data.contains(name) || !data[name].is_object()) {
    return nullptr;
  }
  return &data[name];
}

// Kickoff spots are fixed pixel positions; every slot of every mode must sit
// inside the walls and clear of the ball's spot.
bool KickoffLayoutFits(const SimConfig &config) {
  const float r = config.player.radius;
  const float minX = config.wallThickness + r;
  const float maxX = config.arenaWidth - config.wallThickness - r;
  const float minY = config.wallThickness + r;
  const float maxY = config.arenaHeight - config.wallThickness - r;
  const Vec2 ballSpot = BallKickoffPosition(config);
  const float clearance = r + config.ball.radius;

  bool ok = true;
  for (const GameMode mode :
       {GameMode::OneVsOne, GameMode::TwoVsTwo, GameMode::ThreeVsThree}) {
    for (const Team team : {Team::Human, Team::Bot}) {
      for (int slot = 0; slot < RosterSize(mode); ++slot) {
        const Vec2 p = KickoffPosition(config, mode, team, slot);
        if (p.x < minX || p.x > maxX || p.y < minY || p.y > maxY) {
          LOG_WARN("Kickoff spot ({}, {}) for {} slot {} is outside a {}x{} "
                   "arena",
                   p.x, p.y, GameModeName(mode), slot, config.arenaWidth,
                   config.arenaHeight);
          ok = false;
        } else if (Vec2Distance(p, ballSpot) < clearance) {
          LOG_WARN("Kickoff spot ({}, {}) for {} slot {} overlaps the ball",
                   p.x, p.y, GameModeName(mode), slot);
          ok = false;
        }
      }
    }
  }
  return ok;
}

} // namespace

bool LoadSimConfig(const std::string &path, SimConfig &config) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("Could not open sim config: {}", path);
    return false;
  }

  try {
    const json data = json::parse(file);
    if (!data.is_object()) {
      LOG_ERROR("Sim config {} is not a JSON object", path);
      return false;
    }

    SimConfig loaded = config;
    ReadBody(data, "player", loaded.player);
    ReadBody(data, "ball", loaded.ball);

    if (const json *s = Section(data, "player")) {
      ReadFloat(*s, "player", "acceleration", IsPositive,
                loaded.playerAcceleration);
    }
    if (const json *s = Section(data, "kick")) {
      ReadFloat(*s, "kick", "radius", IsPositive, loaded.kickRadius);
      ReadFloat(*s, "kick", "force", IsPositive, loaded.kickForce);
    }
    if (const json *s = Section(data, "arena")) {
      ReadFloat(*s, "arena", "width", IsPositive, loaded.arenaWidth);
      ReadFloat(*s, "arena", "height", IsPositive, loaded.arenaHeight);
      ReadFloat(*s, "arena", "goalHeight", IsPositive, loaded.goalHeight);
      ReadFloat(*s, "arena", "wallThickness", IsNonNegative,
                loaded.wallThickness);
    }
    if (const json *s = Section(data, "physics")) {
      ReadFloat(*s, "physics", "collisionSlop", IsNonNegative,
                loaded.collisionSlop);
      ReadFloat(*s, "physics", "correctionPercent", IsUnitInterval,
                loaded.correctionPercent);
      ReadFloat(*s, "physics", "kickoffFreeze", IsNonNegative,
                loaded.kickoffFreezeDuration);
    }

    if (!ValidateSimConfig(loaded)) {
      LOG_ERROR("Sim config {} is inconsistent, keeping previous values", path);
      return false;
    }

    config = loaded;
    LOG_INFO("Loaded sim config from {}", path);
    return true;
  } catch (const json::exception &e) {
    LOG_ERROR("JSON error in {}: {}", path, e.what());
    return false;
  }
}

bool ValidateSimConfig(const SimConfig &config) {
  bool ok = true;
  if (config.goalHeight >= config.arenaHeight - 2.0f * config.wallThickness) {
    LOG_WARN("Goal height {} does not fit between the walls of a {} px arena",
             config.goalHeight, config.arenaHeight);
    ok = false;
  }
  if (config.arenaWidth <= 2.0f * config.wallThickness ||
      config.arenaHeight <= 2.0f * config.wallThickness) {
    LOG_WARN("Arena {}x{} is too small for {} px walls", config.arenaWidth,
             config.arenaHeight, config.wallThickness);
    ok = false;
  }
  if (!KickoffLayoutFits(config)) {
    ok = false;
  }
  if (config.kickRadius < config.player.radius + config.ball.radius) {
    LOG_WARN("Kick radius {} is smaller than player+ball contact distance {}",
             config.kickRadius, config.player.radius + config.ball.radius);
    ok = false;
  }
  return ok;
}
