#include <cmath>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <limits>

#include "core/Config.hpp"
#include "core/Log.hpp"
#include "sim/Bot.hpp"
#include "sim/World.hpp"

namespace {
bool NearlyEqual(const float a, const float b, const float eps = 1e-4f) {
  return std::fabs(a - b) <= eps;
}

bool NearlyEqual(const Vec2 &a, const Vec2 &b, const float eps = 1e-4f) {
  return NearlyEqual(a.x, b.x, eps) && NearlyEqual(a.y, b.y, eps);
}

bool IsUnit(const Vec2 &v) {
  return Vec2IsFinite(v) && NearlyEqual(Vec2Length(v), 1.0f, 1e-3f);
}

bool RuleIs(const Relation relation, const GameMode mode,
            const Possession possession, const int role, const char *name) {
  const BehaviorRule *rule = FindBehaviorRule(relation, mode, possession, role);
  return rule != nullptr && std::strcmp(rule->name, name) == 0;
}

Entity &Slot(World &world, const Team team, const int slot) {
  const Roster &roster = GetRoster(world, team);
  return world.entities[roster.members[slot]];
}

// Bot lead on the ball just inside its attacking half, everyone else far.
void SetUpOpponentOnBall(World &world, const GameMode mode) {
  InitWorld(world, mode);
  Slot(world, Team::Bot, 0).position = Vec2{480.0f, 270.0f};
  GetBall(world).position = Vec2{470.0f, 270.0f};
}

Vec2 TargetOf(const World &world, const EntityId agentId) {
  Bot bot{};
  InitBot(bot, 11u);
  return ComputeTarget(bot, world, agentId);
}

Vec2 DirectionOf(const World &world, const EntityId agentId) {
  Bot bot{};
  InitBot(bot, 11u);
  return GetDesiredDirection(bot, world, agentId);
}

// --- Ball prediction ---

bool TestPredictSlowBallStaysPut() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  GetBall(world).velocity = Vec2{5.0f, 0.0f};
  const Vec2 predicted = PredictBallPosition(world, Slot(world, Team::Bot, 0));
  return NearlyEqual(predicted, GetBall(world).position);
}

bool TestPredictLeadsMovingBall() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  Entity &agent = Slot(world, Team::Bot, 0);
  agent.position = Vec2{530.0f, 270.0f};
  GetBall(world).velocity = Vec2{100.0f, 0.0f};
  // 80 px away, closing at 80 px/s: one second of travel.
  const Vec2 predicted = PredictBallPosition(world, agent);
  return NearlyEqual(predicted, Vec2{550.0f, 270.0f}, 1e-2f);
}

bool TestPredictClampedToInflatedArena() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  Entity &agent = Slot(world, Team::Human, 0);
  agent.position = Vec2{100.0f, 270.0f};
  Entity &ball = GetBall(world);
  ball.position = Vec2{850.0f, 270.0f};
  ball.velocity = Vec2{350.0f, -10.0f};
  const Vec2 predicted = PredictBallPosition(world, agent);
  return NearlyEqual(predicted.x,
                     world.config.arenaWidth + cfg::kPredictionBoundsMargin) &&
         predicted.y >= -cfg::kPredictionBoundsMargin;
}

bool TestPredictNonFiniteVelocity() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  GetBall(world).velocity =
      Vec2{std::numeric_limits<float>::quiet_NaN(), 0.0f};
  const Vec2 predicted = PredictBallPosition(world, Slot(world, Team::Bot, 0));
  return NearlyEqual(predicted, GetBall(world).position);
}

// --- Separation ---

bool TestSeparationSingleNeighbour() {
  World world{};
  InitWorld(world, GameMode::TwoVsTwo);
  Slot(world, Team::Bot, 0).position = Vec2{650.0f, 270.0f};
  Slot(world, Team::Bot, 1).position = Vec2{600.0f, 270.0f};
  const Vec2 push = ComputeSeparation(world, world.botRoster.members[0]);
  return NearlyEqual(push, Vec2{1.0f, 0.0f});
}

bool TestSeparationNobodyInRange() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  const Vec2 push = ComputeSeparation(world, world.botRoster.members[0]);
  return NearlyEqual(push, Vec2{});
}

bool TestSeparationFavoursRosterMates() {
  World world{};
  InitWorld(world, GameMode::TwoVsTwo);
  Slot(world, Team::Human, 0).position = Vec2{500.0f, 330.0f};
  Slot(world, Team::Human, 1).position = Vec2{100.0f, 100.0f};
  Slot(world, Team::Bot, 0).position = Vec2{500.0f, 270.0f};
  Slot(world, Team::Bot, 1).position = Vec2{500.0f, 210.0f};
  // Equal distance above and below: the roster mate pushes harder.
  const Vec2 push = ComputeSeparation(world, world.botRoster.members[0]);
  return NearlyEqual(push, Vec2{0.0f, 1.0f});
}

// --- Decision table ---

bool TestBehaviorRuleLookup() {
  return RuleIs(Relation::Teammate, GameMode::TwoVsTwo, Possession::Agent, 1,
                "teammate-carry") &&
         RuleIs(Relation::Teammate, GameMode::TwoVsTwo, Possession::Loose, 1,
                "teammate-support") &&
         RuleIs(Relation::Teammate, GameMode::TwoVsTwo, Possession::Human, 1,
                "teammate-support") &&
         RuleIs(Relation::Teammate, GameMode::ThreeVsThree, Possession::Human,
                2, "winger-support") &&
         RuleIs(Relation::Teammate, GameMode::ThreeVsThree, Possession::Agent,
                1, "winger-carry") &&
         RuleIs(Relation::Teammate, GameMode::ThreeVsThree, Possession::Loose,
                2, "winger-chase") &&
         RuleIs(Relation::Opponent, GameMode::TwoVsTwo, Possession::Agent, 1,
                "opponent-carry") &&
         RuleIs(Relation::Opponent, GameMode::ThreeVsThree, Possession::Agent,
                0, "opponent-carry") &&
         RuleIs(Relation::Opponent, GameMode::TwoVsTwo, Possession::Human, 0,
                "opponent-pair-lead") &&
         RuleIs(Relation::Opponent, GameMode::TwoVsTwo, Possession::Loose, 1,
                "opponent-pair-support") &&
         RuleIs(Relation::Opponent, GameMode::ThreeVsThree, Possession::Loose,
                0, "opponent-trio-center") &&
         RuleIs(Relation::Opponent, GameMode::ThreeVsThree, Possession::Human,
                2, "opponent-trio-winger") &&
         RuleIs(Relation::Opponent, GameMode::OneVsOne, Possession::Agent, 0,
                "opponent-duel") &&
         RuleIs(Relation::Opponent, GameMode::OneVsOne, Possession::Loose, 0,
                "opponent-duel");
}

bool TestEveryOpponentSituationHasRule() {
  for (const GameMode mode :
       {GameMode::OneVsOne, GameMode::TwoVsTwo, GameMode::ThreeVsThree}) {
    for (const Possession possession :
         {Possession::Agent, Possession::Human, Possession::Loose}) {
      for (int role = 0; role < RosterSize(mode); ++role) {
        if (FindBehaviorRule(Relation::Opponent, mode, possession, role) ==
            nullptr) {
          return false;
        }
        if (role > 0 && FindBehaviorRule(Relation::Teammate, mode, possession,
                                         role) == nullptr) {
          return false;
        }
      }
    }
  }
  return true;
}

// --- Possession ---

bool TestClassifyPossession1v1() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  const EntityId botId = world.botRoster.members[0];

  GetBall(world).position = Vec2{640.0f, 270.0f};
  const bool agent = ClassifyPossession(world, botId) == Possession::Agent;

  GetBall(world).position = Vec2{260.0f, 270.0f};
  const bool human = ClassifyPossession(world, botId) == Possession::Human;

  GetBall(world).position = Vec2{450.0f, 270.0f};
  const bool loose = ClassifyPossession(world, botId) == Possession::Loose;

  return agent && human && loose;
}

bool TestWingerDefersToHuman3v3() {
  World world{};
  InitWorld(world, GameMode::ThreeVsThree);
  GetBall(world).position = Vec2{400.0f, 270.0f};
  Slot(world, Team::Human, 0).position = Vec2{380.0f, 270.0f};
  Slot(world, Team::Human, 1).position = Vec2{410.0f, 290.0f};
  Slot(world, Team::Bot, 0).position = Vec2{425.0f, 250.0f};

  return ClassifyPossession(world, world.humanRoster.members[1]) ==
             Possession::Human &&
         ClassifyPossession(world, world.botRoster.members[0]) ==
             Possession::Agent &&
         RelationOf(world, world.humanRoster.members[1]) ==
             Relation::Teammate &&
         RelationOf(world, world.botRoster.members[0]) == Relation::Opponent;
}

// --- Targets and steering ---

bool TestDuelCarrierHeadsForLeftGoal() {
  World world{};
  SetUpOpponentOnBall(world, GameMode::OneVsOne);
  Bot bot{};
  InitBot(bot, 11u);
  const Vec2 target = ComputeTarget(bot, world, world.botRoster.members[0]);
  return NearlyEqual(target.x, 0.0f) &&
         std::fabs(target.y - ArenaCenterY(world.config)) <= 30.0f;
}

bool TestTeammateCarryLooksForward() {
  World world{};
  InitWorld(world, GameMode::TwoVsTwo);
  Slot(world, Team::Human, 1).position = Vec2{400.0f, 270.0f};
  Slot(world, Team::Human, 0).position = Vec2{600.0f, 250.0f};
  GetBall(world).position = Vec2{420.0f, 270.0f};
  Bot bot{};
  InitBot(bot, 11u);
  const Vec2 target = ComputeTarget(bot, world, world.humanRoster.members[1]);
  return target.x > 400.0f;
}

bool TestDuelDefendMeetsIncomingBall() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  const EntityId botId = world.botRoster.members[0];
  Entity &ball = GetBall(world);

  // Loose ball in the human half rolling toward the bot's goal: go to the
  // predicted spot.
  ball.position = Vec2{300.0f, 270.0f};
  ball.velocity = Vec2{200.0f, 0.0f};
  const bool intercept = NearlyEqual(TargetOf(world, botId),
                                     Vec2{700.0f, 270.0f}, 1e-2f);

  // Standing ball: 120 px goal-side of it, clamped 50 px past halfway.
  ball.velocity = Vec2{};
  const bool clamped = NearlyEqual(TargetOf(world, botId),
                                   Vec2{500.0f, 270.0f}, 1e-2f);

  ball.position = Vec2{600.0f, 100.0f};
  const bool goalSide = NearlyEqual(TargetOf(world, botId),
                                    Vec2{704.40f, 159.16f}, 1e-2f);

  // Rolling away from the goal is treated like a standing ball.
  ball.velocity = Vec2{-200.0f, 0.0f};
  const bool awayFromGoal = NearlyEqual(TargetOf(world, botId),
                                        Vec2{704.40f, 159.16f}, 1e-2f);

  ball.velocity = Vec2{200.0f, 0.0f};
  const bool towardGoal = NearlyEqual(TargetOf(world, botId),
                                      Vec2{821.50f, 100.0f}, 0.5f);

  return intercept && clamped && goalSide && awayFromGoal && towardGoal;
}

bool TestDuelDefendStaysOutOfGoalArea() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  const EntityId botId = world.botRoster.members[0];
  Slot(world, Team::Bot, 0).position = Vec2{500.0f, 270.0f};
  Entity &ball = GetBall(world);
  ball.position = Vec2{700.0f, 270.0f};
  ball.velocity = Vec2{300.0f, 0.0f};
  // Predicted spot is 50 px from the goal: hold 100 px in front of the ball.
  return NearlyEqual(TargetOf(world, botId), Vec2{800.0f, 270.0f}, 1e-2f);
}

bool TestDuelApproachesFromGoalSide() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  GetBall(world).position = Vec2{480.0f, 270.0f};
  return NearlyEqual(TargetOf(world, world.botRoster.members[0]),
                     Vec2{520.0f, 270.0f});
}

bool TestPairLeadTargets() {
  World world{};
  InitWorld(world, GameMode::TwoVsTwo);
  const EntityId leadId = world.botRoster.members[0];
  Entity &ball = GetBall(world);

  ball.position = Vec2{300.0f, 270.0f};
  const bool holding =
      NearlyEqual(TargetOf(world, leadId), Vec2{550.0f, 270.0f});

  ball.position = Vec2{700.0f, 300.0f};
  const bool pressing =
      NearlyEqual(TargetOf(world, leadId), Vec2{700.0f, 300.0f});

  Slot(world, Team::Bot, 0).position = Vec2{850.0f, 100.0f};
  ball.position = Vec2{500.0f, 270.0f};
  const bool trailing =
      NearlyEqual(TargetOf(world, leadId), Vec2{420.0f, 270.0f});

  return holding && pressing && trailing;
}

bool TestPairSupportTargets() {
  World world{};
  InitWorld(world, GameMode::TwoVsTwo);
  const EntityId supportId = world.botRoster.members[1];
  Entity &ball = GetBall(world);

  ball.position = Vec2{700.0f, 300.0f};
  const bool ownHalf =
      NearlyEqual(TargetOf(world, supportId), Vec2{600.0f, 170.0f});

  ball.position = Vec2{300.0f, 270.0f};
  const bool farHalf =
      NearlyEqual(TargetOf(world, supportId), Vec2{530.0f, 170.0f});

  return ownHalf && farHalf;
}

bool TestTrioCenterTargets() {
  World world{};
  InitWorld(world, GameMode::ThreeVsThree);
  const EntityId centerId = world.botRoster.members[0];
  Entity &ball = GetBall(world);

  ball.position = Vec2{300.0f, 270.0f};
  const bool holding =
      NearlyEqual(TargetOf(world, centerId), Vec2{560.0f, 270.0f});

  ball.position = Vec2{700.0f, 300.0f};
  const bool pressing =
      NearlyEqual(TargetOf(world, centerId), Vec2{700.0f, 300.0f});

  Slot(world, Team::Bot, 0).position = Vec2{850.0f, 100.0f};
  ball.position = Vec2{500.0f, 270.0f};
  const bool trailing =
      NearlyEqual(TargetOf(world, centerId), Vec2{430.0f, 270.0f});

  return holding && pressing && trailing;
}

bool TestTrioWingerTargets() {
  World world{};
  InitWorld(world, GameMode::ThreeVsThree);
  const EntityId topId = world.botRoster.members[1];
  const EntityId bottomId = world.botRoster.members[2];
  Entity &ball = GetBall(world);

  ball.position = Vec2{700.0f, 300.0f};
  const bool ownHalf =
      NearlyEqual(TargetOf(world, topId), Vec2{610.0f, 160.0f}) &&
      NearlyEqual(TargetOf(world, bottomId), Vec2{610.0f, 380.0f});

  ball.position = Vec2{300.0f, 270.0f};
  const bool farHalf =
      NearlyEqual(TargetOf(world, topId), Vec2{540.0f, 170.0f}) &&
      NearlyEqual(TargetOf(world, bottomId), Vec2{540.0f, 370.0f});

  return ownHalf && farHalf;
}

bool TestOpponentCarryPicksForwardMate() {
  World world{};
  InitWorld(world, GameMode::TwoVsTwo);
  const EntityId carrierId = world.botRoster.members[0];
  Slot(world, Team::Bot, 0).position = Vec2{600.0f, 270.0f};
  GetBall(world).position = Vec2{590.0f, 270.0f};
  Entity &mate = Slot(world, Team::Bot, 1);
  mate.position = Vec2{400.0f, 200.0f};

  const bool standing =
      NearlyEqual(TargetOf(world, carrierId), Vec2{400.0f, 200.0f});
  // Running mate: lead by 0.3 s of its speed.
  mate.velocity = Vec2{-100.0f, 0.0f};
  const bool running =
      NearlyEqual(TargetOf(world, carrierId), Vec2{370.0f, 200.0f});

  World trio{};
  InitWorld(trio, GameMode::ThreeVsThree);
  Slot(trio, Team::Bot, 0).position = Vec2{600.0f, 270.0f};
  GetBall(trio).position = Vec2{590.0f, 270.0f};
  Slot(trio, Team::Bot, 1).position = Vec2{400.0f, 150.0f};
  Slot(trio, Team::Bot, 2).position = Vec2{700.0f, 400.0f};
  // The closer mate is behind the carrier and scores worse.
  const bool scored = NearlyEqual(TargetOf(trio, trio.botRoster.members[0]),
                                  Vec2{400.0f, 150.0f});

  return standing && running && scored;
}

bool TestWingerChaseTargets() {
  World world{};
  InitWorld(world, GameMode::ThreeVsThree);
  const EntityId wingId = world.humanRoster.members[1];
  Slot(world, Team::Human, 0).position = Vec2{400.0f, 350.0f};
  GetBall(world).position = Vec2{400.0f, 300.0f};

  Slot(world, Team::Human, 1).position = Vec2{400.0f, 200.0f};
  const bool chases =
      NearlyEqual(TargetOf(world, wingId), Vec2{400.0f, 300.0f});

  // Human is nearer: fall back to holding the wing.
  Slot(world, Team::Human, 1).position = Vec2{400.0f, 420.0f};
  const bool holdsWing =
      NearlyEqual(TargetOf(world, wingId), Vec2{350.0f, 150.0f});

  return chases && holdsWing;
}

bool TestWingerOverlapsCarrier() {
  World world{};
  InitWorld(world, GameMode::ThreeVsThree);
  Slot(world, Team::Human, 0).position = Vec2{600.0f, 270.0f};
  GetBall(world).position = Vec2{620.0f, 270.0f};
  return NearlyEqual(TargetOf(world, world.humanRoster.members[2]),
                     Vec2{680.0f, 330.0f});
}

bool TestTeammateSupportSpacing() {
  World world{};
  InitWorld(world, GameMode::TwoVsTwo);
  const EntityId wingId = world.humanRoster.members[1];
  Entity &ball = GetBall(world);

  ball.position = Vec2{600.0f, 200.0f};
  const bool attacking =
      NearlyEqual(TargetOf(world, wingId), Vec2{500.0f, 260.0f});

  // Clamped 60 px off the bottom touchline.
  ball.position = Vec2{300.0f, 450.0f};
  const bool defending =
      NearlyEqual(TargetOf(world, wingId), Vec2{330.0f, 480.0f});

  return attacking && defending;
}

bool TestSeparationBlendWeights() {
  World pair{};
  InitWorld(pair, GameMode::TwoVsTwo);
  GetBall(pair).position = Vec2{300.0f, 270.0f};
  Slot(pair, Team::Bot, 1).position = Vec2{600.0f, 450.0f};
  Slot(pair, Team::Human, 0).position = Vec2{650.0f, 200.0f};
  const bool pairBlend =
      NearlyEqual(DirectionOf(pair, pair.botRoster.members[0]),
                  Vec2{-0.83205f, 0.55470f}, 1e-3f);

  World trio{};
  InitWorld(trio, GameMode::ThreeVsThree);
  GetBall(trio).position = Vec2{300.0f, 270.0f};
  Slot(trio, Team::Human, 0).position = Vec2{650.0f, 200.0f};
  const bool trioBlend =
      NearlyEqual(DirectionOf(trio, trio.botRoster.members[0]),
                  Vec2{-0.70711f, 0.70711f}, 1e-3f);

  return pairBlend && trioBlend;
}

bool TestTeammateLeansTowardGoalNearTarget() {
  World world{};
  InitWorld(world, GameMode::TwoVsTwo);
  Slot(world, Team::Human, 1).position = Vec2{450.0f, 300.0f};
  GetBall(world).position = Vec2{600.0f, 200.0f};
  // Target (500, 260) is within the blend radius.
  return NearlyEqual(DirectionOf(world, world.humanRoster.members[1]),
                     Vec2{0.84897f, -0.52844f}, 1e-3f);
}

bool TestDesiredDirectionIsUnit() {
  for (const GameMode mode :
       {GameMode::OneVsOne, GameMode::TwoVsTwo, GameMode::ThreeVsThree}) {
    World world{};
    InitWorld(world, mode);
    Bot bot{};
    InitBot(bot, 5u);
    GetBall(world).velocity = Vec2{-120.0f, 40.0f};
    for (int i = 0; i < world.entityCount; ++i) {
      if (i == world.ball || i == GetHumanPlayer(world)) {
        continue;
      }
      if (!IsUnit(GetDesiredDirection(bot, world, i))) {
        return false;
      }
    }
  }
  return true;
}

bool TestDesiredDirectionSurvivesNaNBall() {
  for (const GameMode mode :
       {GameMode::OneVsOne, GameMode::TwoVsTwo, GameMode::ThreeVsThree}) {
    World world{};
    InitWorld(world, mode);
    Bot bot{};
    InitBot(bot, 5u);
    GetBall(world).position = Vec2{std::numeric_limits<float>::quiet_NaN(),
                                   std::numeric_limits<float>::quiet_NaN()};
    for (int i = 0; i < world.botRoster.count; ++i) {
      if (!IsUnit(GetDesiredDirection(bot, world, world.botRoster.members[i]))) {
        return false;
      }
    }
    for (int i = 1; i < world.humanRoster.count; ++i) {
      if (!IsUnit(
              GetDesiredDirection(bot, world, world.humanRoster.members[i]))) {
        return false;
      }
    }
  }
  return true;
}

bool TestInvalidAgentSteersForward() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  Bot bot{};
  return IsUnit(GetDesiredDirection(bot, world, world.ball)) &&
         IsUnit(GetDesiredDirection(bot, world, 42));
}

// --- Kick decisions ---

bool TestNoKickWhenFrozenOrFar() {
  World world{};
  SetUpOpponentOnBall(world, GameMode::OneVsOne);
  Bot bot{};
  InitBot(bot, 3u);
  const uint32_t before = bot.rng;
  const EntityId botId = world.botRoster.members[0];

  FreezeBall(GetBall(world), 1.0f);
  const bool frozen = ShouldKick(bot, world, botId, 1.0f);

  GetBall(world).ball.isFrozen = false;
  GetBall(world).position = Vec2{300.0f, 270.0f};
  const bool far = ShouldKick(bot, world, botId, 1.0f);

  return !frozen && !far && bot.rng == before;
}

bool TestFullDifficultyDuelAlwaysKicks() {
  World world{};
  SetUpOpponentOnBall(world, GameMode::OneVsOne);
  Bot bot{};
  InitBot(bot, 3u);
  const uint32_t before = bot.rng;
  const EntityId botId = world.botRoster.members[0];
  for (int i = 0; i < 200; ++i) {
    if (!ShouldKick(bot, world, botId, 1.0f)) {
      return false;
    }
  }
  return bot.rng == before;
}

bool TestDuelHoldsInOwnHalf() {
  World world{};
  InitWorld(world, GameMode::OneVsOne);
  Slot(world, Team::Bot, 0).position = Vec2{410.0f, 270.0f};
  GetBall(world).position = Vec2{400.0f, 270.0f};
  Bot bot{};
  InitBot(bot, 3u);
  for (int i = 0; i < 50; ++i) {
    if (ShouldKick(bot, world, world.botRoster.members[0], 1.0f)) {
      return false;
    }
  }
  return true;
}

bool TestSameSeedSameDecisions() {
  World world{};
  SetUpOpponentOnBall(world, GameMode::TwoVsTwo);
  const EntityId botId = world.botRoster.members[0];
  Bot a{};
  Bot b{};
  InitBot(a, 1234u);
  InitBot(b, 1234u);
  for (int i = 0; i < 500; ++i) {
    if (ShouldKick(a, world, botId, 1.0f) != ShouldKick(b, world, botId, 1.0f)) {
      return false;
    }
  }
  return a.rng == b.rng;
}

bool TestZeroSeedIsUsable() {
  Bot bot{};
  InitBot(bot, 0u);
  return bot.rng != 0u;
}

bool TestOpponentTeamKickRate() {
  World world{};
  SetUpOpponentOnBall(world, GameMode::TwoVsTwo);
  const EntityId botId = world.botRoster.members[0];
  Bot bot{};
  InitBot(bot, 99u);
  constexpr int kDraws = 4000;
  int kicks = 0;
  for (int i = 0; i < kDraws; ++i) {
    if (ShouldKick(bot, world, botId, 1.0f)) {
      ++kicks;
    }
  }
  const float rate = static_cast<float>(kicks) / kDraws;
  return rate > 0.70f && rate < 0.80f;
}

bool TestTeammateTopTierKickRate() {
  World world{};
  InitWorld(world, GameMode::TwoVsTwo);
  Slot(world, Team::Human, 1).position = Vec2{400.0f, 270.0f};
  Slot(world, Team::Human, 0).position = Vec2{600.0f, 250.0f};
  GetBall(world).position = Vec2{420.0f, 270.0f};
  const EntityId wingId = world.humanRoster.members[1];
  Bot bot{};
  InitBot(bot, 77u);
  constexpr int kDraws = 4000;
  int kicks = 0;
  for (int i = 0; i < kDraws; ++i) {
    if (ShouldKick(bot, world, wingId, 1.0f)) {
      ++kicks;
    }
  }
  const float rate = static_cast<float>(kicks) / kDraws;
  return rate > 0.92f && rate < 0.98f;
}

// --- Driving ---

bool TestDriveBotsWritesUnitInputs() {
  World world{};
  InitWorld(world, GameMode::ThreeVsThree);
  Bot bot{};
  InitBot(bot, 8u);
  DriveBots(bot, world, 1.0f);
  const EntityId humanId = GetHumanPlayer(world);
  for (int i = 0; i < world.entityCount; ++i) {
    if (i == world.ball) {
      continue;
    }
    const Vec2 &input = world.entities[i].player.inputAcceleration;
    if (i == humanId) {
      if (!NearlyEqual(input, Vec2{})) {
        return false;
      }
    } else if (!IsUnit(input)) {
      return false;
    }
  }
  return true;
}

bool TestWingerFeedsHuman() {
  for (uint32_t seed = 1; seed <= 50; ++seed) {
    World world{};
    InitWorld(world, GameMode::TwoVsTwo);
    Slot(world, Team::Human, 1).position = Vec2{400.0f, 270.0f};
    Slot(world, Team::Human, 0).position = Vec2{600.0f, 250.0f};
    GetBall(world).position = Vec2{420.0f, 270.0f};
    Bot bot{};
    InitBot(bot, seed);
    DriveBots(bot, world, 1.0f);
    const Vec2 &v = GetBall(world).velocity;
    if (Vec2LengthSq(v) > 0.0f) {
      const Vec2 toHuman = Vec2Normalize(
          Vec2Sub(Slot(world, Team::Human, 0).position, GetBall(world).position));
      return Vec2Dot(Vec2Normalize(v), toHuman) > 0.99f;
    }
  }
  return false;
}

bool TestNames() {
  return std::strcmp(RelationName(Relation::Teammate), "teammate") == 0 &&
         std::strcmp(PossessionName(Possession::Loose), "loose") == 0;
}
} // namespace

int main() {
  Log::Init("bot_tests.log");
  int failed = 0;

  auto run = [&](const char *name, const bool ok) {
    if (!ok) {
      std::cerr << "[FAIL] " << name << '\n';
      ++failed;
    } else {
      std::cout << "[PASS] " << name << '\n';
    }
  };

  run("predict_slow_ball_stays_put", TestPredictSlowBallStaysPut());
  run("predict_leads_moving_ball", TestPredictLeadsMovingBall());
  run("predict_clamped_to_inflated_arena",
      TestPredictClampedToInflatedArena());
  run("predict_non_finite_velocity", TestPredictNonFiniteVelocity());
  run("separation_single_neighbour", TestSeparationSingleNeighbour());
  run("separation_nobody_in_range", TestSeparationNobodyInRange());
  run("separation_favours_roster_mates", TestSeparationFavoursRosterMates());
  run("behavior_rule_lookup", TestBehaviorRuleLookup());
  run("every_situation_has_rule", TestEveryOpponentSituationHasRule());
  run("classify_possession_1v1", TestClassifyPossession1v1());
  run("winger_defers_to_human_3v3", TestWingerDefersToHuman3v3());
  run("duel_carrier_heads_for_left_goal", TestDuelCarrierHeadsForLeftGoal());
  run("teammate_carry_looks_forward", TestTeammateCarryLooksForward());
  run("duel_defend_meets_incoming_ball", TestDuelDefendMeetsIncomingBall());
  run("duel_defend_stays_out_of_goal_area",
      TestDuelDefendStaysOutOfGoalArea());
  run("duel_approaches_from_goal_side", TestDuelApproachesFromGoalSide());
  run("pair_lead_targets", TestPairLeadTargets());
  run("pair_support_targets", TestPairSupportTargets());
  run("trio_center_targets", TestTrioCenterTargets());
  run("trio_winger_targets", TestTrioWingerTargets());
  run("opponent_carry_picks_forward_mate",
      TestOpponentCarryPicksForwardMate());
  run("winger_chase_targets", TestWingerChaseTargets());
  run("winger_overlaps_carrier", TestWingerOverlapsCarrier());
  run("teammate_support_spacing", TestTeammateSupportSpacing());
  run("separation_blend_weights", TestSeparationBlendWeights());
  run("teammate_leans_toward_goal_near_target",
      TestTeammateLeansTowardGoalNearTarget());
  run("desired_direction_is_unit", TestDesiredDirectionIsUnit());
  run("desired_direction_survives_nan_ball",
      TestDesiredDirectionSurvivesNaNBall());
  run("invalid_agent_steers_forward", TestInvalidAgentSteersForward());
  run("no_kick_when_frozen_or_far", TestNoKickWhenFrozenOrFar());
  run("full_difficulty_duel_always_kicks",
      TestFullDifficultyDuelAlwaysKicks());
  run("duel_holds_in_own_half", TestDuelHoldsInOwnHalf());
  run("same_seed_same_decisions", TestSameSeedSameDecisions());
  run("zero_seed_is_usable", TestZeroSeedIsUsable());
  run("opponent_team_kick_rate", TestOpponentTeamKickRate());
  run("teammate_top_tier_kick_rate", TestTeammateTopTierKickRate());
  run("drive_bots_writes_unit_inputs", TestDriveBotsWritesUnitInputs());
  run("winger_feeds_human", TestWingerFeedsHuman());
  run("names", TestNames());

  Log::Shutdown();
  return (failed == 0) ? 0 : 1;
}
