#include "sim/Bot.hpp"

#include <cmath>
#include <initializer_list>
#include <limits>

#include "core/Config.hpp"
#include "core/Rng.hpp"

namespace {

constexpr uint8_t kAllPossessions = PossessionBit(Possession::Agent) |
                                    PossessionBit(Possession::Human) |
                                    PossessionBit(Possession::Loose);
constexpr uint8_t kWithoutBall =
    PossessionBit(Possession::Human) | PossessionBit(Possession::Loose);

// Teammate kick tiers, tried in order. Distances are agent-to-human.
struct KickTier {
  bool needAhead;
  bool needGoodPosition;
  float minDistance;
  float maxDistance;
  float maxBallSpeed;
  float probability;
};

constexpr KickTier kTeammateKickTiers[] = {
    {true, true, 40.0f, 450.0f, 280.0f, 0.95f},
    {true, false, 40.0f, 450.0f, 260.0f, 0.9f},
    {false, true, 40.0f, 450.0f, 240.0f, 0.85f},
    {false, false, 40.0f, 450.0f, 220.0f, 0.8f},
    {false, false, 30.0f, 500.0f, 200.0f, 0.65f},
    {true, false, 40.0f, 200.0f, 300.0f, 0.7f},
};

float ArenaWidth(const BotContext &ctx) { return ctx.world->config.arenaWidth; }
float ArenaHeight(const BotContext &ctx) {
  return ctx.world->config.arenaHeight;
}

float ClampFieldY(const BotContext &ctx, const float y, const float margin) {
  return Clamp(y, margin, ArenaHeight(ctx) - margin);
}

Vec2 ClampPassTarget(const BotContext &ctx, const Vec2 &target) {
  return Vec2{Clamp(target.x, 0.0f, ArenaWidth(ctx)),
              ClampFieldY(ctx, target.y, cfg::kFieldMarginY)};
}

// Sign of the agent's attacking direction along x.
float AttackSign(const BotContext &ctx) {
  return (ctx.attackGoal.x > ctx.centerX) ? 1.0f : -1.0f;
}

bool BallInRightHalf(const BotContext &ctx) {
  return ctx.ball->position.x > ctx.centerX;
}

// Point ahead of `receiver` along its run (or toward the attacked goal when
// it is standing still). Returns false when no direction can be formed.
bool LeadReceiver(const BotContext &ctx, const Entity &receiver,
                  const float leadFactor, const float leadMax, Vec2 &out) {
  const float speed = Vec2Length(receiver.velocity);
  const float lead = std::fmin(speed * leadFactor, leadMax);
  const Vec2 direction =
      (speed > cfg::kPassLeadSpeedThreshold)
          ? Vec2Normalize(receiver.velocity)
          : Vec2Normalize(Vec2Sub(ctx.attackGoal, receiver.position));
  if (!Vec2IsFinite(direction) || Vec2LengthSq(direction) <= 0.0f) {
    return false;
  }
  out = ClampPassTarget(
      ctx, Vec2Add(receiver.position, Vec2Scale(direction, lead)));
  return true;
}

// --- Teammates, 1v1 / 2v2 ---

Vec2 TeammateCarry(BotContext &ctx) {
  const Entity &agent = *ctx.agent;
  const Entity &human = *ctx.human;
  if (!Vec2IsFinite(human.position)) {
    return ctx.attackGoal;
  }

  const float dist = Vec2Distance(agent.position, human.position);
  const bool humanAhead = human.position.x > agent.position.x;
  const bool humanWellPlaced =
      human.position.x > ctx.centerX - cfg::kGoodPositionMargin;

  if (humanAhead && humanWellPlaced && dist < 400.0f && dist > 40.0f) {
    Vec2 target{};
    if (LeadReceiver(ctx, human, cfg::kTeamPassLeadFactor,
                     cfg::kTeamPassLeadMax, target)) {
      return target;
    }
    return human.position;
  }
  if (dist < 350.0f && dist > 40.0f) {
    return human.position;
  }
  if (dist < 50.0f) {
    // Too close to receive: open up space toward goal.
    return Vec2{std::fmin(agent.position.x + 80.0f, ctx.attackGoal.x - 60.0f),
                agent.position.y};
  }
  return ctx.attackGoal;
}

Vec2 TeammateSupport(BotContext &ctx) {
  const Vec2 &ball = ctx.ball->position;
  const float spacing = static_cast<float>(ctx.role) * 120.0f - 60.0f;
  const float y = ClampFieldY(ctx, ball.y + spacing, cfg::kSupportMarginY);
  if (BallInRightHalf(ctx)) {
    return Vec2{Clamp(ball.x - 100.0f, 0.0f, ArenaWidth(ctx)), y};
  }
  return Vec2{Clamp(ctx.centerX - 120.0f, 0.0f, ArenaWidth(ctx)), y};
}

// --- Teammates, 3v3 wingers (role 1 top, role 2 bottom) ---

float WingerSide(const BotContext &ctx) {
  return (ctx.role == 1) ? -1.0f : 1.0f;
}

Vec2 WingerCarry(BotContext &ctx) {
  const Entity &agent = *ctx.agent;
  const Entity &human = *ctx.human;
  const Vec2 advance{ctx.attackGoal.x - 100.0f, agent.position.y};
  if (!Vec2IsFinite(human.position)) {
    return advance;
  }

  const float dist = Vec2Distance(agent.position, human.position);
  const bool humanAhead = human.position.x > agent.position.x;
  const bool humanWellPlaced =
      human.position.x > ctx.centerX - cfg::kGoodPositionMargin;

  Vec2 target{};
  if (humanAhead && humanWellPlaced && dist < 450.0f && dist > 40.0f &&
      LeadReceiver(ctx, human, 0.5f, 90.0f, target)) {
    return target;
  }
  if (humanWellPlaced && dist < 400.0f && dist > 40.0f &&
      LeadReceiver(ctx, human, 0.4f, 70.0f, target)) {
    return target;
  }
  if (!humanAhead && dist < 200.0f) {
    return Vec2{std::fmin(agent.position.x + 100.0f, ctx.attackGoal.x - 60.0f),
                agent.position.y};
  }
  if (dist < 50.0f) {
    // Step sideways to open a passing angle.
    const float y = agent.position.y + WingerSide(ctx) * 80.0f;
    return Vec2{agent.position.x, ClampFieldY(ctx, y, cfg::kFieldMarginY)};
  }
  return advance;
}

Vec2 WingerSupport(BotContext &ctx) {
  const Vec2 &ball = ctx.ball->position;
  const Entity &human = *ctx.human;
  const float side = WingerSide(ctx);
  const float wingY =
      ClampFieldY(ctx, ctx.centerY + side * 120.0f, cfg::kFieldMarginY);
  const bool humanHasBall =
      Vec2Distance(human.position, ball) < cfg::kHumanControlRadius;

  if (!BallInRightHalf(ctx)) {
    // Track back, staying wide for the counter.
    return Vec2{std::fmin(ctx.centerX - 100.0f, ball.x + 120.0f), wingY};
  }
  if (!humanHasBall) {
    return Vec2{std::fmax(ball.x - 80.0f, ctx.centerX - 60.0f), wingY};
  }
  if (human.position.x > ctx.centerX + 50.0f) {
    // Overlapping run inside the carrier.
    const float y =
        ClampFieldY(ctx, ctx.centerY + side * 60.0f, cfg::kFieldMarginY);
    return Vec2{
        std::fmin(human.position.x + 80.0f, ctx.attackGoal.x - 40.0f), y};
  }
  return Vec2{std::fmax(ball.x - 40.0f, ctx.centerX - 30.0f), wingY};
}

Vec2 WingerChase(BotContext &ctx) {
  const Vec2 &pos = ctx.agent->position;
  const float distToBall = Vec2Distance(pos, ctx.ball->position);
  const float distToHuman = Vec2Distance(pos, ctx.human->position);
  if (distToBall < 300.0f &&
      (distToBall < distToHuman || distToHuman > 200.0f)) {
    return ctx.predictedBall;
  }
  return WingerSupport(ctx);
}

// --- Opponents, 2v2 / 3v3 ---

Vec2 OpponentCarry(BotContext &ctx) {
  const World &world = *ctx.world;
  const Entity &agent = *ctx.agent;
  const Roster &roster = GetRoster(world, Team::Bot);
  const float sign = AttackSign(ctx);

  const Entity *best = nullptr;
  float bestScore = std::numeric_limits<float>::infinity();
  for (int i = 0; i < roster.count; ++i) {
    if (roster.members[i] == ctx.agentId) {
      continue;
    }
    const Entity &mate = world.entities[roster.members[i]];
    if (!Vec2IsFinite(mate.position)) {
      continue;
    }
    const float dist = Vec2Distance(agent.position, mate.position);
    const bool ahead = (mate.position.x - agent.position.x) * sign > 0.0f;
    const bool wellPlaced = (mate.position.x - ctx.centerX) * sign > -80.0f;
    const bool open = dist > 50.0f && dist < 350.0f;
    const float score = dist + (ahead ? -80.0f : 100.0f) +
                        (wellPlaced ? -50.0f : 50.0f) +
                        (open ? -30.0f : 50.0f);
    if (dist < 400.0f && dist > 40.0f && std::isfinite(score) &&
        score < bestScore) {
      bestScore = score;
      best = &mate;
    }
  }

  if (best == nullptr) {
    return ctx.attackGoal;
  }
  Vec2 target{};
  if (LeadReceiver(ctx, *best, 0.3f, 60.0f, target)) {
    return target;
  }
  return best->position;
}

Vec2 OpponentPairLead(BotContext &ctx) {
  const Vec2 &ball = ctx.ball->position;
  if (!BallInRightHalf(ctx)) {
    return Vec2{std::fmax(ctx.centerX + 100.0f, ball.x - 100.0f), ctx.centerY};
  }
  if (Vec2Distance(ctx.agent->position, ball) < 250.0f) {
    return ctx.predictedBall;
  }
  return Vec2{ball.x - 80.0f, ctx.centerY};
}

Vec2 OpponentPairSupport(BotContext &ctx) {
  const Vec2 &ball = ctx.ball->position;
  const float offset = (ctx.role == 1) ? -100.0f : 100.0f;
  const float y =
      ClampFieldY(ctx, ctx.centerY + offset, cfg::kFieldMarginY);
  if (BallInRightHalf(ctx)) {
    return Vec2{std::fmax(ball.x - 100.0f, ctx.centerX - 40.0f), y};
  }
  return Vec2{std::fmax(ctx.centerX + 80.0f, ball.x - 120.0f), y};
}

Vec2 OpponentTrioCenter(BotContext &ctx) {
  const Vec2 &ball = ctx.ball->position;
  if (!BallInRightHalf(ctx)) {
    return Vec2{std::fmax(ctx.centerX + 110.0f, ball.x - 100.0f), ctx.centerY};
  }
  if (Vec2Distance(ctx.agent->position, ball) < 200.0f) {
    return ctx.predictedBall;
  }
  return Vec2{ball.x - 70.0f, ctx.centerY};
}

Vec2 OpponentTrioWinger(BotContext &ctx) {
  const Vec2 &ball = ctx.ball->position;
  const float side = (ctx.role == 1) ? -1.0f : 1.0f;
  if (BallInRightHalf(ctx)) {
    const float y =
        ClampFieldY(ctx, ctx.centerY + side * 110.0f, cfg::kFieldMarginY);
    return Vec2{std::fmax(ball.x - 90.0f, ctx.centerX - 50.0f), y};
  }
  const float y =
      ClampFieldY(ctx, ctx.centerY + side * 100.0f, cfg::kFieldMarginY);
  return Vec2{std::fmax(ctx.centerX + 90.0f, ball.x - 130.0f), y};
}

// --- Opponent, 1v1 ---

Vec2 OpponentDuelDefend(BotContext &ctx) {
  const Entity &ball = *ctx.ball;
  const Vec2 ballToGoal = Vec2Sub(ctx.defendGoal, ball.position);
  const float ballToGoalDist = Vec2Length(ballToGoal);
  if (!(ballToGoalDist >= 0.1f)) {
    return ctx.defendGoal;
  }

  // Stand `standoff` pixels from the ball on the line to the goal.
  const auto goalSide = [&](const float standoff) {
    const float t = Clamp(standoff / ballToGoalDist, 0.0f, 1.0f);
    return Vec2Add(ball.position, Vec2Scale(ballToGoal, t));
  };

  const float ballSpeed = Vec2Length(ball.velocity);
  if (std::isfinite(ballSpeed) && ballSpeed > 20.0f) {
    const float heading = Vec2Dot(Vec2Normalize(ball.velocity),
                                  Vec2Normalize(ballToGoal));
    if (std::isfinite(heading) && heading > -0.3f) {
      // Ball is heading our way: meet it, but not inside the goal area.
      if (Vec2Distance(ctx.predictedBall, ctx.defendGoal) < 120.0f) {
        return goalSide(100.0f);
      }
      return ctx.predictedBall;
    }
  }
  return goalSide(120.0f);
}

Vec2 OpponentDuel(BotContext &ctx) {
  const Entity &ball = *ctx.ball;
  const bool hasBall = ctx.possession == Possession::Agent;
  const float toOwnGoal = Vec2Distance(ball.position, ctx.defendGoal);
  const float toTargetGoal = Vec2Distance(ball.position, ctx.attackGoal);
  const bool attack =
      BallInRightHalf(ctx) && (hasBall || toTargetGoal < toOwnGoal + 100.0f);

  if (attack) {
    if (hasBall) {
      const float jitter =
          (core::NextFloat01(ctx.bot->rng) - 0.5f) * 60.0f;
      return Vec2{ctx.attackGoal.x, ctx.attackGoal.y + jitter};
    }
    // Come round to the far side of the ball so a touch sends it goalward.
    const Vec2 approach =
        Vec2Normalize(Vec2Sub(ctx.attackGoal, ball.position));
    return Vec2Sub(ball.position, Vec2Scale(approach, 40.0f));
  }

  Vec2 target = OpponentDuelDefend(ctx);
  target.x = Clamp(target.x, ctx.centerX + 50.0f, ArenaWidth(ctx));
  target.y = Clamp(target.y, 0.0f, ArenaHeight(ctx));
  if (!Vec2IsFinite(target)) {
    return ball.position;
  }
  return target;
}

constexpr uint8_t kSmallSides =
    ModeBit(GameMode::OneVsOne) | ModeBit(GameMode::TwoVsTwo);
constexpr uint8_t kTeamModes =
    ModeBit(GameMode::TwoVsTwo) | ModeBit(GameMode::ThreeVsThree);

const BehaviorRule kBehaviorRules[] = {
    {Relation::Teammate, kSmallSides, PossessionBit(Possession::Agent), -1,
     TeammateCarry, "teammate-carry"},
    {Relation::Teammate, kSmallSides, kAllPossessions, -1, TeammateSupport,
     "teammate-support"},
    {Relation::Teammate, ModeBit(GameMode::ThreeVsThree),
     PossessionBit(Possession::Human), -1, WingerSupport, "winger-support"},
    {Relation::Teammate, ModeBit(GameMode::ThreeVsThree),
     PossessionBit(Possession::Agent), -1, WingerCarry, "winger-carry"},
    {Relation::Teammate, ModeBit(GameMode::ThreeVsThree),
     PossessionBit(Possession::Loose), -1, WingerChase, "winger-chase"},
    {Relation::Opponent, kTeamModes, PossessionBit(Possession::Agent), -1,
     OpponentCarry, "opponent-carry"},
    {Relation::Opponent, ModeBit(GameMode::TwoVsTwo), kWithoutBall, 0,
     OpponentPairLead, "opponent-pair-lead"},
    {Relation::Opponent, ModeBit(GameMode::TwoVsTwo), kWithoutBall, -1,
     OpponentPairSupport, "opponent-pair-support"},
    {Relation::Opponent, ModeBit(GameMode::ThreeVsThree), kWithoutBall, 0,
     OpponentTrioCenter, "opponent-trio-center"},
    {Relation::Opponent, ModeBit(GameMode::ThreeVsThree), kWithoutBall, -1,
     OpponentTrioWinger, "opponent-trio-winger"},
    {Relation::Opponent, ModeBit(GameMode::OneVsOne), kAllPossessions, -1,
     OpponentDuel, "opponent-duel"},
};

BotContext BuildContext(Bot &bot, const World &world, const EntityId agentId) {
  BotContext ctx{};
  ctx.bot = &bot;
  ctx.world = &world;
  ctx.agentId = agentId;
  ctx.agent = &world.entities[agentId];
  ctx.ball = &GetBall(world);
  ctx.human = &world.entities[GetHumanPlayer(world)];
  ctx.relation = RelationOf(world, agentId);
  ctx.possession = ClassifyPossession(world, agentId);
  ctx.predictedBall = PredictBallPosition(world, *ctx.agent);
  ctx.centerX = ArenaCenterX(world.config);
  ctx.centerY = ArenaCenterY(world.config);

  const Vec2 leftGoal{0.0f, ctx.centerY};
  const Vec2 rightGoal{world.config.arenaWidth, ctx.centerY};
  if (ctx.relation == Relation::Teammate) {
    ctx.role = RosterIndexOf(world.humanRoster, agentId);
    ctx.attackGoal = rightGoal;
    ctx.defendGoal = leftGoal;
  } else {
    ctx.role = RosterIndexOf(world.botRoster, agentId);
    ctx.attackGoal = leftGoal;
    ctx.defendGoal = rightGoal;
  }
  return ctx;
}

Vec2 Forward(const Relation relation) {
  return Vec2{relation == Relation::Teammate ? 1.0f : -1.0f, 0.0f};
}

bool IsValidAgent(const World &world, const EntityId agentId) {
  return agentId >= 0 && agentId < world.entityCount &&
         IsPlayer(world.entities[agentId]) && FindTeam(world, agentId);
}

} // namespace

void InitBot(Bot &bot, const uint32_t seed) {
  bot.rng = (seed == 0u) ? 1u : seed;
}

const BehaviorRule *FindBehaviorRule(const Relation relation,
                                     const GameMode mode,
                                     const Possession possession,
                                     const int role) {
  for (const BehaviorRule &rule : kBehaviorRules) {
    if (rule.relation != relation) {
      continue;
    }
    if ((rule.modes & ModeBit(mode)) == 0 ||
        (rule.possessions & PossessionBit(possession)) == 0) {
      continue;
    }
    if (rule.role >= 0 && rule.role != role) {
      continue;
    }
    return &rule;
  }
  return nullptr;
}

Relation RelationOf(const World &world, const EntityId agentId) {
  return (RosterIndexOf(world.humanRoster, agentId) >= 0)
             ? Relation::Teammate
             : Relation::Opponent;
}

Possession ClassifyPossession(const World &world, const EntityId agentId) {
  const Entity &agent = world.entities[agentId];
  const Entity &ball = GetBall(world);
  const EntityId humanId = GetHumanPlayer(world);

  const bool agentControls = Vec2Distance(agent.position, ball.position) <
                             world.config.kickRadius + cfg::kControlMargin;
  const bool humanControls =
      agentId != humanId &&
      Vec2Distance(world.entities[humanId].position, ball.position) <
          cfg::kHumanControlRadius;

  // 3v3 wingers defer to the keyboard player whenever it is on the ball.
  if (world.mode == GameMode::ThreeVsThree &&
      RelationOf(world, agentId) == Relation::Teammate && humanControls) {
    return Possession::Human;
  }
  if (agentControls) {
    return Possession::Agent;
  }
  if (humanControls) {
    return Possession::Human;
  }
  return Possession::Loose;
}

Vec2 PredictBallPosition(const World &world, const Entity &agent) {
  const Entity &ball = GetBall(world);
  const SimConfig &config = world.config;

  float timeToIntercept = 0.0f;
  const float ballSpeed = Vec2Length(ball.velocity);
  if (std::isfinite(ballSpeed) && ballSpeed > cfg::kPredictionMinBallSpeed) {
    const float dist = Vec2Distance(agent.position, ball.position);
    const float closing = ballSpeed * cfg::kPredictionSpeedFactor;
    if (closing > 0.1f && std::isfinite(dist)) {
      timeToIntercept = Clamp(dist / closing, 0.0f, cfg::kPredictionMaxTime);
    }
  }

  const Vec2 predicted =
      Vec2Add(ball.position, Vec2Scale(ball.velocity, timeToIntercept));
  if (!Vec2IsFinite(predicted)) {
    return ball.position;
  }
  const float margin = cfg::kPredictionBoundsMargin;
  return Vec2Clamp(predicted, Vec2{-margin, -margin},
                   Vec2{config.arenaWidth + margin,
                        config.arenaHeight + margin});
}

Vec2 ComputeSeparation(const World &world, const EntityId agentId) {
  const Entity &agent = world.entities[agentId];
  const std::optional<Team> team = FindTeam(world, agentId);

  Vec2 push{};
  int neighbours = 0;
  for (const Team side : {Team::Human, Team::Bot}) {
    const Roster &roster = GetRoster(world, side);
    for (int i = 0; i < roster.count; ++i) {
      const EntityId otherId = roster.members[i];
      if (otherId == agentId) {
        continue;
      }
      const Entity &other = world.entities[otherId];
      if (!Vec2IsFinite(other.position)) {
        continue;
      }
      const float dist = Vec2Distance(agent.position, other.position);
      if (!(dist < cfg::kSeparationRadius) || dist <= 0.1f) {
        continue;
      }
      const Vec2 away = Vec2Normalize(Vec2Sub(agent.position, other.position));
      if (!Vec2IsFinite(away)) {
        continue;
      }
      float strength = (cfg::kSeparationRadius - dist) / cfg::kSeparationRadius;
      if (team && *team == side) {
        strength *= cfg::kSeparationSameTeamWeight;
      }
      push = Vec2Add(push, Vec2Scale(away, strength));
      ++neighbours;
    }
  }

  if (neighbours == 0) {
    return Vec2{};
  }
  return Vec2Normalize(push);
}

Vec2 ComputeTarget(Bot &bot, const World &world, const EntityId agentId) {
  const Entity &ball = GetBall(world);
  if (!IsValidAgent(world, agentId)) {
    return ball.position;
  }
  BotContext ctx = BuildContext(bot, world, agentId);
  const BehaviorRule *rule =
      FindBehaviorRule(ctx.relation, world.mode, ctx.possession, ctx.role);
  if (rule == nullptr) {
    return ball.position;
  }
  const Vec2 target = rule->target(ctx);
  return Vec2IsFinite(target) ? target : ball.position;
}

Vec2 GetDesiredDirection(Bot &bot, const World &world, const EntityId agentId) {
  if (!IsValidAgent(world, agentId)) {
    return Vec2{1.0f, 0.0f};
  }
  const Entity &agent = world.entities[agentId];
  const Relation relation = RelationOf(world, agentId);
  const Vec2 forward = Forward(relation);
  if (!Vec2IsFinite(agent.position)) {
    return forward;
  }

  const Vec2 target = ComputeTarget(bot, world, agentId);
  const Vec2 toTarget = Vec2Sub(target, agent.position);
  const float distToTarget = Vec2Length(toTarget);

  Vec2 direction = forward;
  if (std::isfinite(distToTarget) && distToTarget >= 0.1f) {
    direction = Vec2Normalize(toTarget);
  }

  const Vec2 separation = ComputeSeparation(world, agentId);
  if (Vec2IsFinite(separation) && Vec2LengthSq(separation) > 0.0f) {
    const float weight = (world.mode == GameMode::ThreeVsThree)
                             ? cfg::kSeparationBlend3v3
                             : cfg::kSeparationBlend;
    direction = Vec2Lerp(direction, separation, weight);
  }

  // Near the target, teammates lean toward the goal they attack.
  if (relation == Relation::Teammate && distToTarget < cfg::kGoalBlendRadius &&
      distToTarget > 0.1f) {
    const Vec2 attackGoal{world.config.arenaWidth,
                          ArenaCenterY(world.config)};
    const Vec2 toGoal = Vec2Normalize(Vec2Sub(attackGoal, agent.position));
    if (Vec2LengthSq(toGoal) > 0.0f) {
      direction = Vec2Lerp(direction, toGoal, cfg::kGoalBlend);
    }
  }

  const Vec2 result = Vec2Normalize(direction);
  if (Vec2IsFinite(result) && Vec2LengthSq(result) > 0.0f) {
    return result;
  }
  const Vec2 toBall =
      Vec2Normalize(Vec2Sub(GetBall(world).position, agent.position));
  if (Vec2IsFinite(toBall) && Vec2LengthSq(toBall) > 0.0f) {
    return toBall;
  }
  return forward;
}

bool ShouldKick(Bot &bot, const World &world, const EntityId agentId,
                const float difficulty) {
  if (!IsValidAgent(world, agentId)) {
    return false;
  }
  const Entity &agent = world.entities[agentId];
  const Entity &ball = GetBall(world);
  const float dist = Vec2Distance(agent.position, ball.position);
  if (!std::isfinite(dist) || dist > world.config.kickRadius ||
      ball.ball.isFrozen) {
    return false;
  }

  const float centerX = ArenaCenterX(world.config);
  const bool ballInBotHalf = ball.position.x > centerX;
  const bool agentForward = agent.position.x > centerX - 100.0f;
  const float ballSpeed = Vec2Length(ball.velocity);
  const bool teamMode = world.mode == GameMode::TwoVsTwo ||
                        world.mode == GameMode::ThreeVsThree;
  const Relation relation = RelationOf(world, agentId);
  const EntityId humanId = GetHumanPlayer(world);

  if (relation == Relation::Teammate && agentId != humanId && teamMode) {
    const Entity &human = world.entities[humanId];
    const float toHuman = Vec2Distance(agent.position, human.position);
    const bool humanAhead = human.position.x > agent.position.x;
    const bool humanWellPlaced =
        human.position.x > centerX - cfg::kGoodPositionMargin;
    for (const KickTier &tier : kTeammateKickTiers) {
      if (tier.needAhead && !humanAhead) {
        continue;
      }
      if (tier.needGoodPosition && !humanWellPlaced) {
        continue;
      }
      if (toHuman > tier.minDistance && toHuman < tier.maxDistance &&
          ballSpeed < tier.maxBallSpeed) {
        return core::Chance(bot.rng, tier.probability);
      }
    }
  }

  if (relation == Relation::Opponent && teamMode) {
    if (ballInBotHalf && agentForward && ballSpeed < 220.0f) {
      return core::Chance(bot.rng, 0.75f);
    }
    if (ballSpeed < 180.0f) {
      return core::Chance(bot.rng, 0.6f);
    }
  }

  const bool offense = ballInBotHalf && agentForward && ballSpeed < 200.0f;
  return offense && core::Chance(bot.rng, difficulty * 0.7f + 0.3f);
}

void DriveBots(Bot &bot, World &world, const float difficulty) {
  const bool teamMode = world.mode == GameMode::TwoVsTwo ||
                        world.mode == GameMode::ThreeVsThree;
  const EntityId humanId = GetHumanPlayer(world);

  const auto drive = [&](const EntityId id, const bool passFirst) {
    const Vec2 direction = GetDesiredDirection(bot, world, id);
    world.entities[id].player.inputAcceleration =
        Vec2IsFinite(direction) ? direction : Vec2{};
    if (!ShouldKick(bot, world, id, difficulty)) {
      return;
    }
    if (passFirst && TryPass(world, id)) {
      return;
    }
    TryKick(world, id);
  };

  for (int i = 0; i < world.botRoster.count; ++i) {
    drive(world.botRoster.members[i], teamMode);
  }
  for (int i = 0; i < world.humanRoster.count; ++i) {
    const EntityId id = world.humanRoster.members[i];
    if (id != humanId) {
      drive(id, true);
    }
  }
}

const char *RelationName(const Relation relation) {
  switch (relation) {
  case Relation::Teammate:
    return "teammate";
  case Relation::Opponent:
    return "opponent";
  }
  return "unknown";
}

const char *PossessionName(const Possession possession) {
  switch (possession) {
  case Possession::Agent:
    return "agent";
  case Possession::Human:
    return "human";
  case Possession::Loose:
    return "loose";
  }
  return "unknown";
}
