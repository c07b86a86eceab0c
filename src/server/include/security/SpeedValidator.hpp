#pragma once

#include "security/AntiCheatConfig.hpp"
#include "security/PerformanceAdjustment.hpp"
#include "security/PerformanceContext.hpp"
#include "security/ValidationResult.hpp"
#include "session/SessionTypes.hpp"
#include <vector>

// [SECURITY_AGENT] Lateral speed check over consecutive move samples
// Movement overlapping a recorded stutter gets extra leniency, but never
// past the anti-teleport ceiling

namespace KnutGame {
namespace Security {

// [SECURITY_AGENT] Time span in which a client stall may distort movement
struct StutterWindow {
    float startMs{0.0f};
    float endMs{0.0f};
    float severityWeight{0.0f};

    [[nodiscard]] bool overlaps(int32_t fromMs, int32_t toMs) const {
        return static_cast<float>(fromMs) <= endMs && static_cast<float>(toMs) >= startMs;
    }
};

class SpeedValidator {
public:
    // moves must be sorted by timestamp. Fail-fast: stops at the first offending pair.
    [[nodiscard]] static RuleCheckResult validate(const std::vector<MoveEvent>& moves,
        const PerformanceContext& context, const PerformanceAdjustment& adjustment,
        const AntiCheatOptions& options);

    // nominal max speed * baseSpeedTolerance (px/s)
    [[nodiscard]] static float baselineSpeed(const AntiCheatOptions& options);

    // Absolute limit that no context can lift (px/s)
    [[nodiscard]] static float hardCeiling(const AntiCheatOptions& options);

    // |dx| / dt with dt clamped to at least 1ms (px/s)
    [[nodiscard]] static float measureSpeed(const MoveEvent& from, const MoveEvent& to);

    // One window per stutter issue plus one per bare stutter timestamp
    [[nodiscard]] static std::vector<StutterWindow> buildStutterWindows(
        const PerformanceContext& context, const PerformanceAdjustment& adjustment);
};

} // namespace Security
} // namespace KnutGame
