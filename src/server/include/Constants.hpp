#pragma once

#include "constants/GameConstants.hpp"
#include <cstdint>

// [ALL-AGENTS] Global constants for the KnutGame server
// All magic numbers MUST be defined here, not scattered in code

namespace KnutGame {
namespace Constants {

inline constexpr const char* VERSION = "1.4.0";

// ============================================================================
// GAMEPLAY CONSTANTS
// ============================================================================

// [PHYSICS_AGENT] Nominal maximum lateral player speed (px/s)
inline constexpr float NOMINAL_MAX_SPEED = SharedConstants::MOVE_SPEED;
inline constexpr float TARGET_FPS = SharedConstants::TARGET_FPS;

// ============================================================================
// SESSION INTEGRITY CONSTANTS
// ============================================================================

// [SECURITY_AGENT] Session duration limits
inline constexpr int64_t MIN_SESSION_DURATION_MS = 1000;
inline constexpr int64_t MAX_SESSION_DURATION_MS = 60 * 60 * 1000;  // 1 hour
inline constexpr int64_t DURATION_MISMATCH_TOLERANCE_MS = 500;

// [SECURITY_AGENT] Pickups happen on the player's lane: canvasHeight * 0.9, +-64px
inline constexpr float PICKUP_LANE_HEIGHT_FRACTION = 0.9f;
inline constexpr float PICKUP_LANE_TOLERANCE_PX = 64.0f;

// [SECURITY_AGENT] Event volume limits
inline constexpr uint32_t MAX_MOVES_PER_SESSION = SharedConstants::MAX_MOVES_PER_SESSION;
inline constexpr uint32_t MAX_ITEMS_PER_SESSION = SharedConstants::MAX_ITEMS_PER_SESSION;

// ============================================================================
// ANTI-CHEAT DEFAULTS
// ============================================================================

// [SECURITY_AGENT] Rule thresholds
inline constexpr float DEFAULT_SPEED_TOLERANCE = 1.2f;         // 20% over nominal speed
inline constexpr float DEFAULT_PROXIMITY_TOLERANCE_PX = 48.0f;
inline constexpr float DEFAULT_STUTTER_TOLERANCE_MS = 100.0f;
inline constexpr float DEFAULT_LOW_FPS_THRESHOLD = 30.0f;
inline constexpr float DEFAULT_CONFIDENCE_THRESHOLD = 0.8f;

// [SECURITY_AGENT] Adjustment caps
inline constexpr float MAX_SPEED_MULTIPLIER = 2.0f;
inline constexpr float MAX_PROXIMITY_MULTIPLIER = 1.8f;
inline constexpr float MAX_TIME_WINDOW_EXTENSION_MS = 500.0f;

// ============================================================================
// PERFORMANCE ADJUSTMENT TUNING
// ============================================================================

// [PERFORMANCE_AGENT] Severity weights (low / medium / high)
inline constexpr float SEVERITY_WEIGHT_LOW = 1.0f;
inline constexpr float SEVERITY_WEIGHT_MEDIUM = 2.0f;
inline constexpr float SEVERITY_WEIGHT_HIGH = 3.0f;

// [PERFORMANCE_AGENT] Deficit term scales
inline constexpr float FPS_DEFICIT_SCALE = 0.5f;        // speed only
inline constexpr float SCORE_DEFICIT_SCALE = 0.4f;
inline constexpr float ISSUE_WEIGHT_SCALE = 0.05f;      // per severity point
inline constexpr float MEMORY_LEVEL_SCALE = 0.06f;      // per pressure level (0..5), proximity only
inline constexpr float MEMORY_ISSUE_SCALE = 0.05f;      // per severity point of memory issues
inline constexpr int32_t MAX_MEMORY_PRESSURE_LEVEL = 5;

// [PERFORMANCE_AGENT] Time window extension per issue
inline constexpr float EXTENSION_PER_SEVERITY_MS = 25.0f;
inline constexpr float EXTENSION_PER_DURATION_MS = 0.25f;  // fraction of issue duration

// [PERFORMANCE_AGENT] Stutter tolerance growth per severity point
inline constexpr float STUTTER_GROWTH_PER_STUTTER_WEIGHT_MS = 40.0f;
inline constexpr float STUTTER_GROWTH_PER_OTHER_WEIGHT_MS = 15.0f;

// ============================================================================
// RULE LENIENCY
// ============================================================================

// [SECURITY_AGENT] Extra speed allowance inside a stutter window, per severity point
inline constexpr float STUTTER_SPEED_BONUS_PER_WEIGHT = 0.5f;

// [SECURITY_AGENT] Hard ceiling = baseline * maxSpeedMultiplier * factor
// 240 px/s * 2.0 * 1.5 = 720 px/s, far below any teleport (500px in 100ms = 5000 px/s)
inline constexpr float ANTI_TELEPORT_FACTOR = 1.5f;

// [SECURITY_AGENT] Extra proximity allowance near a performance issue, per severity point
inline constexpr float ISSUE_PROXIMITY_BONUS_PER_WEIGHT = 0.25f;

// [SECURITY_AGENT] Proximity ceiling = base * maxProximityMultiplier * factor
inline constexpr float PROXIMITY_CEILING_FACTOR = 1.25f;

// ============================================================================
// CONFIDENCE
// ============================================================================

// [SECURITY_AGENT] Confidence starts at 1 and loses weighted deficits.
// Equivalent to 0.5 + 0.3 * score + 0.2 * min(1, fps / lowFpsThreshold): weights sum to 1
inline constexpr float CONFIDENCE_SCORE_DEFICIT_WEIGHT = 0.3f;
inline constexpr float CONFIDENCE_FPS_DEFICIT_WEIGHT = 0.2f;  // only below lowFpsThreshold
inline constexpr float CONFIDENCE_ISSUE_PENALTY = 0.02f;      // per severity point

} // namespace Constants
} // namespace KnutGame
