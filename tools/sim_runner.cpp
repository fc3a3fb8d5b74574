// sim_runner: headless match runner
//
// Plays a full match without a window. The keyboard slot is driven by a
// simple autopilot, every other player by the bot decision engine.
// Outputs structured metrics for tuning and regression testing.
//
// Usage:
//   sim_runner [options]
//     --mode <1v1|2v2|3v3>          Roster size (default: 1v1)
//     --seed <hex|dec>              Bot seed (default: 0xC0FFEE)
//     --ticks <n>                   Sim ticks to run (default: 18000 = 5 min at 60Hz)
//     --config <path>               JSON physics overrides
//     --json                        Output as JSON instead of plain text
//     --quiet                       Only output final summary line
//     -h, --help                    Print usage

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

#include "core/Config.hpp"
#include "core/CrashHandler.hpp"
#include "core/Log.hpp"
#include "sim/Match.hpp"
#include "sim/SimConfig.hpp"

namespace {

struct RunnerArgs {
    GameMode mode = GameMode::OneVsOne;
    uint32_t seed = 0xC0FFEEu;
    int maxTicks = 18000;           // 5 minutes at 60 Hz
    std::string configPath;
    bool json = false;
    bool quiet = false;
    bool help = false;
    bool valid = true;
};

struct RunnerStats {
    int ticksRun = 0;
    int frozenTicks = 0;
    int humanGoals = 0;
    int botGoals = 0;
    int firstGoalTick = -1;
};

uint32_t ParseSeed(const char* str) {
    // Accept 0x prefix for hex, otherwise decimal.
    return static_cast<uint32_t>(std::strtoul(str, nullptr, 0));
}

RunnerArgs ParseArgs(int argc, char* argv[]) {
    RunnerArgs args{};
    for (int i = 1; i < argc; ++i) {
        if ((std::strcmp(argv[i], "--mode") == 0) && i + 1 < argc) {
            const char* value = argv[++i];
            if (!ParseGameMode(value, args.mode)) {
                std::fprintf(stderr, "Unknown mode '%s' (expected 1v1, 2v2 or 3v3)\n", value);
                args.valid = false;
            }
        } else if ((std::strcmp(argv[i], "--seed") == 0) && i + 1 < argc) {
            args.seed = ParseSeed(argv[++i]);
        } else if ((std::strcmp(argv[i], "--ticks") == 0) && i + 1 < argc) {
            args.maxTicks = std::atoi(argv[++i]);
            if (args.maxTicks < 0) args.maxTicks = 0;
        } else if ((std::strcmp(argv[i], "--config") == 0) && i + 1 < argc) {
            args.configPath = argv[++i];
        } else if (std::strcmp(argv[i], "--json") == 0) {
            args.json = true;
        } else if (std::strcmp(argv[i], "--quiet") == 0) {
            args.quiet = true;
        } else if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            args.help = true;
        } else {
            std::fprintf(stderr, "Unknown option '%s'\n", argv[i]);
            args.valid = false;
        }
    }
    return args;
}

void PrintUsage() {
    std::printf(
        "sim_runner: headless MiniSoccer match runner\n"
        "\n"
        "Usage: sim_runner [options]\n"
        "  --mode <1v1|2v2|3v3>          Roster size (default: 1v1)\n"
        "  --seed <hex|dec>              Bot seed (default: 0xC0FFEE)\n"
        "  --ticks <n>                   Sim ticks (default: 18000 = 5 min)\n"
        "  --config <path>               JSON physics overrides\n"
        "  --json                        Output as JSON\n"
        "  --quiet                       Only final summary line\n"
        "  -h, --help                    This message\n"
    );
}

// Runs at a point just behind the ball on the line to the right-hand goal,
// and asks for a pass/kick whenever the ball is playable and goalward.
HumanCommand Autopilot(const World& world) {
    HumanCommand command{};
    const Entity& human = world.entities[GetHumanPlayer(world)];
    const Entity& ball = GetBall(world);

    const Vec2 goal{world.config.arenaWidth, ArenaCenterY(world.config)};
    const Vec2 ballToGoal = Vec2Normalize(Vec2Sub(goal, ball.position));
    const Vec2 behindBall =
        Vec2Sub(ball.position, Vec2Scale(ballToGoal, world.config.kickRadius * 0.6f));
    command.move = Vec2Normalize(Vec2Sub(behindBall, human.position));

    const float dist = Vec2Distance(human.position, ball.position);
    command.kickRequested = !ball.ball.isFrozen &&
                            dist <= world.config.kickRadius &&
                            ball.position.x > human.position.x;
    return command;
}

}  // namespace

int main(int argc, char* argv[]) {
    const RunnerArgs args = ParseArgs(argc, argv);
    if (args.help) {
        PrintUsage();
        return 0;
    }
    if (!args.valid) {
        PrintUsage();
        return 2;
    }

    // Keep stdout clean for the report; the log file still gets everything.
    Log::Init("sim_runner.log",
              (args.json || args.quiet) ? spdlog::level::warn : spdlog::level::info);
    CrashHandler::Init();

    SimConfig config{};
    if (!args.configPath.empty() && !LoadSimConfig(args.configPath, config)) {
        std::fprintf(stderr, "Could not load config '%s'\n", args.configPath.c_str());
        Log::Shutdown();
        return 2;
    }

    Match match{};
    InitMatch(match, args.mode, config, args.seed);

    // --- Run sim ---
    using Clock = std::chrono::steady_clock;
    const auto wallStart = Clock::now();

    RunnerStats stats{};
    for (int t = 0; t < args.maxTicks; ++t) {
        match.command = Autopilot(match.world);
        const MatchFrameResult frame = StepMatch(match, cfg::kFixedDt);
        stats.ticksRun += frame.steps;

        if (GetBall(match.world).ball.isFrozen) {
            ++stats.frozenTicks;
        }
        if (frame.goal == GoalOutcome::LeftScored) {
            ++stats.humanGoals;
        } else if (frame.goal == GoalOutcome::RightScored) {
            ++stats.botGoals;
        }
        if (frame.goal != GoalOutcome::None && stats.firstGoalTick < 0) {
            stats.firstGoalTick = stats.ticksRun;
        }
    }

    const auto wallEnd = Clock::now();
    const float wallMs = std::chrono::duration<float, std::milli>(wallEnd - wallStart).count();

    // --- Compute metrics ---
    const Score& score = match.world.score;
    const float simTime = static_cast<float>(stats.ticksRun) * cfg::kFixedDt;
    const float perfMsPer1k = (stats.ticksRun > 0) ? (wallMs / (static_cast<float>(stats.ticksRun) / 1000.0f)) : 0.0f;
    const char* leader = (score.human > score.bot) ? "HUMAN" : (score.bot > score.human) ? "BOT" : "DRAW";

    // --- Output ---
    if (args.json) {
        std::printf("{\n");
        std::printf("  \"mode\": \"%s\",\n", GameModeName(args.mode));
        std::printf("  \"seed\": \"0x%08X\",\n", args.seed);
        std::printf("  \"ticks_run\": %d,\n", stats.ticksRun);
        std::printf("  \"ticks_max\": %d,\n", args.maxTicks);
        std::printf("  \"sim_time\": %.2f,\n", simTime);
        std::printf("  \"score_human\": %d,\n", score.human);
        std::printf("  \"score_bot\": %d,\n", score.bot);
        std::printf("  \"goals_human\": %d,\n", stats.humanGoals);
        std::printf("  \"goals_bot\": %d,\n", stats.botGoals);
        std::printf("  \"first_goal_tick\": %d,\n", stats.firstGoalTick);
        std::printf("  \"frozen_ticks\": %d,\n", stats.frozenTicks);
        std::printf("  \"result\": \"%s\",\n", leader);
        std::printf("  \"wall_ms\": %.2f,\n", wallMs);
        std::printf("  \"ms_per_1k_ticks\": %.3f\n", perfMsPer1k);
        std::printf("}\n");
    } else if (args.quiet) {
        std::printf("%s seed=0x%08X ticks=%d score=%d:%d result=%s\n",
                    GameModeName(args.mode), args.seed, stats.ticksRun,
                    score.human, score.bot, leader);
    } else {
        std::printf("=== MiniSoccer Sim Runner ===\n");
        std::printf("Mode:          %s\n", GameModeName(args.mode));
        std::printf("Seed:          0x%08X\n", args.seed);
        std::printf("Ticks:         %d / %d\n", stats.ticksRun, args.maxTicks);
        std::printf("Sim time:      %.2f s\n", simTime);
        std::printf("Score:         %d : %d (%s)\n", score.human, score.bot, leader);
        std::printf("Goals:         human %d, bot %d\n", stats.humanGoals, stats.botGoals);
        std::printf("First goal:    tick %d\n", stats.firstGoalTick);
        std::printf("Frozen ticks:  %d\n", stats.frozenTicks);
        std::printf("Wall time:     %.2f ms (%.3f ms / 1k ticks)\n", wallMs, perfMsPer1k);
    }

    Log::Shutdown();
    return 0;
}
