#pragma once

#include <array>
#include <optional>

#include "sim/Entity.hpp"
#include "sim/Physics.hpp"
#include "sim/SimConfig.hpp"

enum class GameMode {
  OneVsOne,
  TwoVsTwo,
  ThreeVsThree,
};

enum class MatchState {
  Playing,
  Paused,
  KickoffFreeze,
};

enum class Team {
  Human, // attacks the right goal
  Bot,   // attacks the left goal
};

constexpr int kMaxRosterSize = 3;
constexpr int kMaxEntities = kMaxRosterSize * 2 + 1;

// Ordered roster. Slot 0 is the lead player (the keyboard-driven player on
// the human team); later slots are wingers.
struct Roster {
  std::array<EntityId, kMaxRosterSize> members{};
  int count = 0;
};

struct Score {
  int human = 0;
  int bot = 0;
};

// Authoritative match state. Entities are created once by InitWorld and only
// repositioned afterwards; rosters hold indices into `entities`.
struct World {
  SimConfig config{}; // fixed for the session
  GameMode mode = GameMode::OneVsOne;

  std::array<Entity, kMaxEntities> entities{};
  int entityCount = 0;
  Roster humanRoster{};
  Roster botRoster{};
  EntityId ball = kInvalidEntity;

  Score score{};
  float kickoffFreezeTime = 0.0f;
  bool isPaused = false;
};

void InitWorld(World &world, GameMode mode, const SimConfig &config = {});

// Advances one fixed step. Bot-roster players accelerate with
// `botAccelerationMultiplier`, human-roster players with 1.0. Returns the
// scoring side when a goal happened this step.
GoalOutcome UpdateWorld(World &world, float dt,
                        float botAccelerationMultiplier = 1.0f);

// Re-applies the kickoff layout and freezes the ball.
void ResetKickoff(World &world);

// Kickoff plus zeroed score.
void ResetWorld(World &world);

bool TryKick(World &world, EntityId playerId);

// Passes to a same-roster teammate. Returns the receiver, or nothing when
// the ball is out of reach, frozen, or no teammate qualifies.
std::optional<EntityId> TryPass(World &world, EntityId passerId);

MatchState GetMatchState(const World &world);

Entity &GetBall(World &world);
const Entity &GetBall(const World &world);
EntityId GetHumanPlayer(const World &world);

const Roster &GetRoster(const World &world, Team team);
std::optional<Team> FindTeam(const World &world, EntityId id);
// -1 when `id` is not on the roster.
int RosterIndexOf(const Roster &roster, EntityId id);

// Fixed spawn/kickoff coordinates for roster slot `slot` of `team`.
Vec2 KickoffPosition(const SimConfig &config, GameMode mode, Team team,
                     int slot);
Vec2 BallKickoffPosition(const SimConfig &config);

int RosterSize(GameMode mode);
const char *GameModeName(GameMode mode);
bool ParseGameMode(const char *str, GameMode &mode);
const char *MatchStateName(MatchState state);
