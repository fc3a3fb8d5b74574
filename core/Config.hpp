#pragma once

namespace cfg {
constexpr int kHudHeight = 60;

constexpr float kFixedDt = 1.0f / 60.0f;
constexpr float kMaxFrameTime = 0.1f;
constexpr int kMaxSimStepsPerFrame = 3;

// --- Players ---
constexpr float kPlayerRadius = 18.0f;
constexpr float kPlayerMass = 2.2f;
constexpr float kPlayerRestitution = 0.35f;
constexpr float kPlayerMaxSpeed = 180.0f;     // px/s
constexpr float kPlayerAcceleration = 500.0f; // px/s^2 at full input
constexpr float kPlayerDamping = 0.991f;      // per tick

// --- Ball ---
constexpr float kBallRadius = 10.0f;
constexpr float kBallMass = 0.9f;
constexpr float kBallRestitution = 0.88f;
constexpr float kBallMaxSpeed = 350.0f;
constexpr float kBallDamping = 0.992f;

// --- Kicking ---
constexpr float kKickRadius = 35.0f;
constexpr float kKickForce = 320.0f; // ball speed right after a kick
constexpr float kKickInputThreshold = 0.001f;
constexpr float kKickVelocityThreshold = 1.0f;

// --- Passing ---
constexpr float kPassMinDistance = 30.0f;
constexpr float kPassMaxDistance = 500.0f;
constexpr float kPassLeadSpeedThreshold = 5.0f;
constexpr float kHumanPassLeadFactor = 0.45f;
constexpr float kHumanPassLeadMax = 85.0f;
constexpr float kHumanPassForceScale = 0.92f;
constexpr float kTeamPassLeadFactor = 0.35f;
constexpr float kTeamPassLeadMax = 70.0f;
constexpr float kTeamPassForceScale = 0.9f;
constexpr float kPassBehindPenalty = 1000.0f;
constexpr float kPassAheadBonus = 50.0f;
constexpr float kPassTargetMarginY = 80.0f;
constexpr float kGoodPositionMargin = 100.0f; // distance behind halfway

// --- Arena ---
constexpr float kArenaWidth = 900.0f;
constexpr float kArenaHeight = 540.0f;
constexpr float kGoalHeight = 160.0f;
constexpr float kWallThickness = 20.0f;

// --- Physics ---
constexpr float kCollisionSlop = 0.1f;
constexpr float kPositionCorrectionPercent = 0.8f;
constexpr float kDegenerateDistance = 0.0001f;

// --- Match flow ---
constexpr float kKickoffFreezeDuration = 1.0f;
constexpr float kBotAccelerationMultiplier = 1.2f;
constexpr float kBotDifficulty = 1.0f;

// --- Bot AI ---
constexpr float kControlMargin = 20.0f;      // added to kick radius
constexpr float kHumanControlRadius = 40.0f; // human "has the ball"
constexpr float kPredictionMinBallSpeed = 10.0f;
constexpr float kPredictionSpeedFactor = 0.8f;
constexpr float kPredictionMaxTime = 2.0f;
constexpr float kPredictionBoundsMargin = 100.0f;
constexpr float kSeparationRadius = 100.0f;
constexpr float kSeparationSameTeamWeight = 1.5f;
constexpr float kSeparationBlend3v3 = 0.5f;
constexpr float kSeparationBlend = 0.4f;
constexpr float kGoalBlendRadius = 80.0f;
constexpr float kGoalBlend = 0.2f;
constexpr float kFieldMarginY = 80.0f;
constexpr float kSupportMarginY = 60.0f;

// --- Front end ---
constexpr int kPaletteCount = 2;
constexpr float kVelocityIndicatorScale = 0.2f; // px drawn per px/s
constexpr float kGoalBannerDuration = 1.5f;
constexpr float kCenterCircleRadius = 60.0f;

// --- Controls ---
struct KeyConfig {
  int left = 263;         // KEY_LEFT
  int leftAlt = 65;       // KEY_A
  int right = 262;        // KEY_RIGHT
  int rightAlt = 68;      // KEY_D
  int up = 265;           // KEY_UP
  int upAlt = 87;         // KEY_W
  int down = 264;         // KEY_DOWN
  int downAlt = 83;       // KEY_S
  int kick = 32;          // KEY_SPACE
  int pause = 80;         // KEY_P
  int reset = 82;         // KEY_R
  int mode1v1 = 49;       // KEY_ONE
  int mode2v2 = 50;       // KEY_TWO
  int mode3v3 = 51;       // KEY_THREE
  int toggleVelocity = 290; // KEY_F1
  int cyclePalette = 291;   // KEY_F2
  int back = 256;         // KEY_ESCAPE
};

extern KeyConfig keys;

} // namespace cfg
