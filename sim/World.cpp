#include "sim/World.hpp"

#include <cmath>
#include <cstring>
#include <limits>

#include "core/Config.hpp"
#include "core/Log.hpp"

namespace {

bool IsFinitePosition(const Entity &e) { return Vec2IsFinite(e.position); }

EntityId AddEntity(World &world, const Entity &entity) {
  const EntityId id = world.entityCount;
  world.entities[id] = entity;
  ++world.entityCount;
  return id;
}

void PlaceAtKickoff(World &world, const Team team) {
  Roster &roster =
      (team == Team::Human) ? world.humanRoster : world.botRoster;
  for (int slot = 0; slot < roster.count; ++slot) {
    Entity &p = world.entities[roster.members[slot]];
    p.position = KickoffPosition(world.config, world.mode, team, slot);
    p.velocity = Vec2{};
  }
}

// Target point `lead` pixels ahead of the receiver along its run, kept off
// the touchlines.
Vec2 LeadPassTarget(const World &world, const Entity &passer,
                    const Entity &receiver, const float leadFactor,
                    const float leadMax) {
  const float receiverSpeed = Vec2Length(receiver.velocity);
  const float lead = std::fmin(receiverSpeed * leadFactor, leadMax);
  const Vec2 direction =
      (receiverSpeed > cfg::kPassLeadSpeedThreshold)
          ? Vec2Normalize(receiver.velocity)
          : Vec2Normalize(Vec2Sub(receiver.position, passer.position));

  Vec2 target = receiver.position;
  if (Vec2IsFinite(direction)) {
    target = Vec2Add(receiver.position, Vec2Scale(direction, lead));
  }
  const SimConfig &c = world.config;
  return Vec2Clamp(target, Vec2{0.0f, cfg::kPassTargetMarginY},
                   Vec2{c.arenaWidth, c.arenaHeight - cfg::kPassTargetMarginY});
}

bool LaunchBall(World &world, const Vec2 &target, const float force) {
  Entity &ball = GetBall(world);
  const Vec2 direction = Vec2Normalize(Vec2Sub(target, ball.position));
  if (!Vec2IsFinite(direction) || Vec2LengthSq(direction) <= 0.0f) {
    return false;
  }
  ball.velocity = Vec2Scale(direction, force);
  return true;
}

// Common guards for kick and pass: finite positions, ball in reach, not
// frozen.
bool CanPlayBall(const World &world, const Entity &player) {
  const Entity &ball = GetBall(world);
  if (!IsFinitePosition(player) || !IsFinitePosition(ball)) {
    return false;
  }
  if (IsFrozenBall(ball)) {
    return false;
  }
  const float dist = Vec2Distance(player.position, ball.position);
  return std::isfinite(dist) && dist <= world.config.kickRadius;
}

bool IsValidPlayer(const World &world, const EntityId id) {
  return id >= 0 && id < world.entityCount &&
         IsPlayer(world.entities[id]);
}

} // namespace

void InitWorld(World &world, const GameMode mode, const SimConfig &config) {
  world = World{};
  world.config = config;
  world.mode = mode;

  // Human roster first, then bots, ball last; the collision pass walks the
  // arena in this order.
  const int perSide = RosterSize(mode);
  for (int slot = 0; slot < perSide; ++slot) {
    const Vec2 pos = KickoffPosition(config, mode, Team::Human, slot);
    world.humanRoster.members[slot] =
        AddEntity(world, MakePlayer(config, pos, true));
  }
  world.humanRoster.count = perSide;
  for (int slot = 0; slot < perSide; ++slot) {
    const Vec2 pos = KickoffPosition(config, mode, Team::Bot, slot);
    world.botRoster.members[slot] =
        AddEntity(world, MakePlayer(config, pos, false));
  }
  world.botRoster.count = perSide;
  world.ball = AddEntity(world, MakeBall(config, BallKickoffPosition(config)));

  LOG_INFO("World created for {} ({} entities)", GameModeName(mode),
           world.entityCount);
}

GoalOutcome UpdateWorld(World &world, const float dt,
                        const float botAccelerationMultiplier) {
  if (world.isPaused) {
    return GoalOutcome::None;
  }
  if (!std::isfinite(dt) || dt <= 0.0f) {
    LOG_WARN("UpdateWorld ignored invalid dt {}", dt);
    return GoalOutcome::None;
  }

  Entity &ball = GetBall(world);

  if (world.kickoffFreezeTime > 0.0f) {
    world.kickoffFreezeTime -= dt;
    if (world.kickoffFreezeTime <= 0.0f) {
      world.kickoffFreezeTime = 0.0f;
      if (ball.ball.isFrozen) {
        ball.ball.isFrozen = false;
        ball.ball.freezeTime = 0.0f;
      }
    }
  }

  const float botMultiplier = std::isfinite(botAccelerationMultiplier)
                                  ? botAccelerationMultiplier
                                  : 1.0f;
  for (int i = 0; i < world.humanRoster.count; ++i) {
    UpdateEntity(world.entities[world.humanRoster.members[i]], world.config,
                 dt, 1.0f);
  }
  for (int i = 0; i < world.botRoster.count; ++i) {
    UpdateEntity(world.entities[world.botRoster.members[i]], world.config, dt,
                 botMultiplier);
  }
  UpdateEntity(ball, world.config, dt);

  const GoalOutcome goal = CheckGoal(ball, world.config);
  if (goal != GoalOutcome::None) {
    if (goal == GoalOutcome::LeftScored) {
      ++world.score.human;
    } else {
      ++world.score.bot;
    }
    LOG_INFO("Goal ({} side scored) - human {} : {} bot",
             GoalOutcomeName(goal), world.score.human, world.score.bot);
    ResetKickoff(world);
    return goal;
  }

  // At most seven bodies: every pair is tested.
  for (int i = 0; i < world.entityCount; ++i) {
    for (int j = i + 1; j < world.entityCount; ++j) {
      Entity &a = world.entities[i];
      Entity &b = world.entities[j];
      if (const auto contact = DetectCircleCollision(a, b)) {
        ResolveCircleCollision(a, b, *contact, world.config);
      }
    }
  }
  for (int i = 0; i < world.entityCount; ++i) {
    Entity &e = world.entities[i];
    if (const auto contact = DetectWallCollision(e, world.config)) {
      ResolveWallCollision(e, *contact, world.config);
    }
  }

  return GoalOutcome::None;
}

void ResetKickoff(World &world) {
  PlaceAtKickoff(world, Team::Human);
  PlaceAtKickoff(world, Team::Bot);

  Entity &ball = GetBall(world);
  ball.position = BallKickoffPosition(world.config);
  FreezeBall(ball, world.config.kickoffFreezeDuration);
  world.kickoffFreezeTime = world.config.kickoffFreezeDuration;
  LOG_DEBUG("Kickoff reset, ball frozen for {:.2f}s",
            world.config.kickoffFreezeDuration);
}

void ResetWorld(World &world) {
  world.score = Score{};
  ResetKickoff(world);
  LOG_INFO("Match reset ({})", GameModeName(world.mode));
}

bool TryKick(World &world, const EntityId playerId) {
  if (!IsValidPlayer(world, playerId)) {
    return false;
  }
  const Entity &player = world.entities[playerId];
  if (!CanPlayBall(world, player)) {
    return false;
  }

  const Vec2 &input = player.player.inputAcceleration;
  Vec2 direction{};
  if (Vec2IsFinite(input) && Vec2Length(input) > cfg::kKickInputThreshold) {
    direction = Vec2Normalize(input);
  } else if (Vec2IsFinite(player.velocity) &&
             Vec2Length(player.velocity) > cfg::kKickVelocityThreshold) {
    direction = Vec2Normalize(player.velocity);
  } else {
    direction = Vec2{player.player.isHuman ? 1.0f : -1.0f, 0.0f};
  }

  if (!Vec2IsFinite(direction) || Vec2Length(direction) <= 0.1f) {
    return false;
  }
  GetBall(world).velocity = Vec2Scale(direction, world.config.kickForce);
  return true;
}

std::optional<EntityId> TryPass(World &world, const EntityId passerId) {
  if (!IsValidPlayer(world, passerId)) {
    return std::nullopt;
  }
  const Entity &passer = world.entities[passerId];
  if (!CanPlayBall(world, passer)) {
    return std::nullopt;
  }

  const std::optional<Team> team = FindTeam(world, passerId);
  if (!team) {
    return std::nullopt;
  }
  const Roster &roster = GetRoster(world, *team);
  const Entity &ball = GetBall(world);

  // A teammate feeding the keyboard player gets first refusal.
  const EntityId lead = roster.members[0];
  if (*team == Team::Human && lead != passerId) {
    const Entity &human = world.entities[lead];
    if (IsFinitePosition(human)) {
      const float dist = Vec2Distance(passer.position, human.position);
      const bool open =
          dist > cfg::kPassMinDistance && dist < cfg::kPassMaxDistance;
      const bool ahead = human.position.x > passer.position.x;
      const bool goodPosition = human.position.x >
                                ArenaCenterX(world.config) -
                                    cfg::kGoodPositionMargin;
      if (open && (ahead || goodPosition)) {
        const Vec2 target =
            LeadPassTarget(world, passer, human, cfg::kHumanPassLeadFactor,
                           cfg::kHumanPassLeadMax);
        if (LaunchBall(world, target,
                       world.config.kickForce * cfg::kHumanPassForceScale)) {
          return lead;
        }
      }
    }
  }

  EntityId best = kInvalidEntity;
  float bestScore = std::numeric_limits<float>::infinity();
  for (int slot = 0; slot < roster.count; ++slot) {
    const EntityId id = roster.members[slot];
    if (id == passerId) {
      continue;
    }
    const Entity &mate = world.entities[id];
    if (!IsFinitePosition(mate)) {
      continue;
    }
    const float dist = Vec2Distance(passer.position, mate.position);
    if (!std::isfinite(dist) || dist <= cfg::kPassMinDistance ||
        dist >= cfg::kPassMaxDistance) {
      continue;
    }

    const Vec2 passDir = Vec2Normalize(Vec2Sub(mate.position, passer.position));
    const Vec2 ballToMate = Vec2Normalize(Vec2Sub(mate.position, ball.position));
    const float ahead = Vec2Dot(ballToMate, passDir);
    if (!std::isfinite(ahead)) {
      continue;
    }
    const float score = dist + (ahead < 0.0f ? cfg::kPassBehindPenalty : 0.0f) -
                        ahead * cfg::kPassAheadBonus;
    if (std::isfinite(score) && score < bestScore) {
      bestScore = score;
      best = id;
    }
  }

  if (best == kInvalidEntity) {
    return std::nullopt;
  }
  const Vec2 target =
      LeadPassTarget(world, passer, world.entities[best],
                     cfg::kTeamPassLeadFactor, cfg::kTeamPassLeadMax);
  if (!LaunchBall(world, target,
                  world.config.kickForce * cfg::kTeamPassForceScale)) {
    return std::nullopt;
  }
  return best;
}

MatchState GetMatchState(const World &world) {
  if (world.isPaused) {
    return MatchState::Paused;
  }
  if (world.kickoffFreezeTime > 0.0f || GetBall(world).ball.isFrozen) {
    return MatchState::KickoffFreeze;
  }
  return MatchState::Playing;
}

Entity &GetBall(World &world) { return world.entities[world.ball]; }

const Entity &GetBall(const World &world) {
  return world.entities[world.ball];
}

EntityId GetHumanPlayer(const World &world) {
  return world.humanRoster.members[0];
}

const Roster &GetRoster(const World &world, const Team team) {
  return (team == Team::Human) ? world.humanRoster : world.botRoster;
}

std::optional<Team> FindTeam(const World &world, const EntityId id) {
  if (RosterIndexOf(world.humanRoster, id) >= 0) {
    return Team::Human;
  }
  if (RosterIndexOf(world.botRoster, id) >= 0) {
    return Team::Bot;
  }
  return std::nullopt;
}

int RosterIndexOf(const Roster &roster, const EntityId id) {
  for (int i = 0; i < roster.count; ++i) {
    if (roster.members[i] == id) {
      return i;
    }
  }
  return -1;
}

Vec2 KickoffPosition(const SimConfig &config, const GameMode mode,
                     const Team team, const int slot) {
  const float centerY = ArenaCenterY(config);
  const float wingOffset = (mode == GameMode::TwoVsTwo) ? 80.0f : 100.0f;

  if (team == Team::Human) {
    switch (slot) {
    case 0:
      return Vec2{250.0f, centerY};
    case 1:
      return Vec2{300.0f, centerY - wingOffset};
    default:
      return Vec2{300.0f, centerY + wingOffset};
    }
  }
  switch (slot) {
  case 0:
    return Vec2{650.0f, centerY};
  case 1:
    return Vec2{600.0f, centerY - wingOffset};
  default:
    return Vec2{600.0f, centerY + wingOffset};
  }
}

Vec2 BallKickoffPosition(const SimConfig &config) {
  return Vec2{ArenaCenterX(config), ArenaCenterY(config)};
}

int RosterSize(const GameMode mode) {
  switch (mode) {
  case GameMode::OneVsOne:
    return 1;
  case GameMode::TwoVsTwo:
    return 2;
  case GameMode::ThreeVsThree:
    return 3;
  }
  return 1;
}

const char *GameModeName(const GameMode mode) {
  switch (mode) {
  case GameMode::OneVsOne:
    return "1v1";
  case GameMode::TwoVsTwo:
    return "2v2";
  case GameMode::ThreeVsThree:
    return "3v3";
  }
  return "unknown";
}

bool ParseGameMode(const char *str, GameMode &mode) {
  if (str == nullptr) {
    return false;
  }
  if (std::strcmp(str, "1v1") == 0) {
    mode = GameMode::OneVsOne;
  } else if (std::strcmp(str, "2v2") == 0) {
    mode = GameMode::TwoVsTwo;
  } else if (std::strcmp(str, "3v3") == 0) {
    mode = GameMode::ThreeVsThree;
  } else {
    return false;
  }
  return true;
}

const char *MatchStateName(const MatchState state) {
  switch (state) {
  case MatchState::Playing:
    return "playing";
  case MatchState::Paused:
    return "paused";
  case MatchState::KickoffFreeze:
    return "kickoff";
  }
  return "unknown";
}
