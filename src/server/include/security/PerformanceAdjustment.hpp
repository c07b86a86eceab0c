#pragma once

#include "security/AntiCheatConfig.hpp"
#include "security/PerformanceContext.hpp"

// [PERFORMANCE_AGENT] Converts a performance report into rule leniency
// Degraded clients get wider speed/proximity tolerances and time windows

namespace KnutGame {
namespace Security {

struct PerformanceAdjustment {
    float speedToleranceMultiplier{1.0f};      // [1.0, maxSpeedMultiplier]
    float proximityToleranceMultiplier{1.0f};  // [1.0, maxProximityMultiplier]
    float timeWindowExtensionMs{0.0f};         // [0, maxTimeWindowExtensionMs]
    float stutterToleranceMs{0.0f};

    static PerformanceAdjustment neutral() { return PerformanceAdjustment{}; }

    // True when no multiplier or extension deviates from the neutral adjustment.
    // stutterToleranceMs is excluded: it mirrors the configured floor.
    [[nodiscard]] bool isNeutral() const {
        return speedToleranceMultiplier <= 1.0f &&
               proximityToleranceMultiplier <= 1.0f &&
               timeWindowExtensionMs <= 0.0f;
    }
};

class PerformanceAdjustmentCalculator {
public:
    // Pure; same inputs always give the same adjustment
    [[nodiscard]] static PerformanceAdjustment calculate(
        const PerformanceContext& context, const AntiCheatOptions& options);

    // Individual deficit terms, exposed for testing and diagnostics
    [[nodiscard]] static float fpsDeficitTerm(const PerformanceContext& context,
        const AntiCheatOptions& options);
    [[nodiscard]] static float scoreDeficitTerm(const PerformanceContext& context);
    [[nodiscard]] static float issueDensityTerm(const PerformanceContext& context);
    [[nodiscard]] static float memoryPressureTerm(const PerformanceContext& context);

private:
    [[nodiscard]] static float timeWindowExtension(const PerformanceContext& context,
        const AntiCheatOptions& options);
    [[nodiscard]] static float stutterTolerance(const PerformanceContext& context,
        const AntiCheatOptions& options);
};

} // namespace Security
} // namespace KnutGame
