#pragma once

#include "security/AntiCheatConfig.hpp"
#include "security/PerformanceAdjustment.hpp"
#include "security/PerformanceContext.hpp"
#include "security/ValidationResult.hpp"
#include "session/SessionTypes.hpp"
#include <cstdint>
#include <optional>
#include <vector>

// [SECURITY_AGENT] Item pickup distance check
// Compares each pickup against the player's interpolated lateral position.
// Pickups happen on a single lane, so only x is checked.

namespace KnutGame {
namespace Security {

class ProximityValidator {
public:
    // moves must be sorted by timestamp. Fail-fast: stops at the first offending item.
    [[nodiscard]] static RuleCheckResult validate(const std::vector<MoveEvent>& moves,
        const std::vector<ItemEvent>& items, const PerformanceContext& context,
        const PerformanceAdjustment& adjustment, const AntiCheatOptions& options);

    // Player x at timestampMs, linearly interpolated between the bracketing moves.
    // Uses the single available side at the edges; nullopt when there are no moves.
    [[nodiscard]] static std::optional<float> expectedPlayerX(
        const std::vector<MoveEvent>& moves, int32_t timestampMs);

    // Absolute limit that no context can lift (px)
    [[nodiscard]] static float proximityCeiling(const AntiCheatOptions& options);

    // Heaviest issue whose extended span contains timestampMs, 0 if none
    [[nodiscard]] static float nearbyIssueWeight(const PerformanceContext& context,
        int32_t timestampMs, float extensionMs);
};

} // namespace Security
} // namespace KnutGame
