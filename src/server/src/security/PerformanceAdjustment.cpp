#include "security/PerformanceAdjustment.hpp"
#include "Constants.hpp"
#include <algorithm>

namespace KnutGame {
namespace Security {

PerformanceAdjustment PerformanceAdjustmentCalculator::calculate(
    const PerformanceContext& context, const AntiCheatOptions& options) {

    if (!options.performanceAdjustmentEnabled) {
        return PerformanceAdjustment::neutral();
    }

    const float fpsTerm = fpsDeficitTerm(context, options);
    const float scoreTerm = scoreDeficitTerm(context);
    const float issueTerm = issueDensityTerm(context);
    const float memoryTerm = memoryPressureTerm(context);

    PerformanceAdjustment adjustment;
    adjustment.speedToleranceMultiplier = std::clamp(
        1.0f + fpsTerm + scoreTerm + issueTerm,
        1.0f, std::max(1.0f, options.maxSpeedMultiplier));

    // Pickup misjudgment follows GC pauses more than raw frame rate,
    // so memory pressure widens proximity only
    adjustment.proximityToleranceMultiplier = std::clamp(
        1.0f + scoreTerm + issueTerm + memoryTerm,
        1.0f, std::max(1.0f, options.maxProximityMultiplier));

    adjustment.timeWindowExtensionMs = timeWindowExtension(context, options);
    adjustment.stutterToleranceMs = stutterTolerance(context, options);
    return adjustment;
}

float PerformanceAdjustmentCalculator::fpsDeficitTerm(const PerformanceContext& context,
    const AntiCheatOptions& options) {

    if (options.lowFpsThreshold <= 0.0f) return 0.0f;

    float deficit = std::max(0.0f, options.lowFpsThreshold - context.averageFps) /
        options.lowFpsThreshold;
    deficit = std::min(1.0f, deficit);
    return deficit * Constants::FPS_DEFICIT_SCALE;
}

float PerformanceAdjustmentCalculator::scoreDeficitTerm(const PerformanceContext& context) {
    const int32_t score = std::clamp(context.performanceScore, 0, 100);
    const float deficit = static_cast<float>(100 - score) / 100.0f;
    return deficit * Constants::SCORE_DEFICIT_SCALE;
}

float PerformanceAdjustmentCalculator::issueDensityTerm(const PerformanceContext& context) {
    return context.totalIssueWeight() * Constants::ISSUE_WEIGHT_SCALE;
}

float PerformanceAdjustmentCalculator::memoryPressureTerm(const PerformanceContext& context) {
    const int32_t level = std::clamp(context.memoryPressureLevel, 0,
        Constants::MAX_MEMORY_PRESSURE_LEVEL);
    const float memoryIssueWeight =
        context.totalIssueWeight(PerformanceIssueKind::MEMORY_PRESSURE);

    return static_cast<float>(level) * Constants::MEMORY_LEVEL_SCALE +
           memoryIssueWeight * Constants::MEMORY_ISSUE_SCALE;
}

float PerformanceAdjustmentCalculator::timeWindowExtension(
    const PerformanceContext& context, const AntiCheatOptions& options) {

    float extension = 0.0f;
    for (const auto& issue : context.issues) {
        extension += issue.weight() * Constants::EXTENSION_PER_SEVERITY_MS;
        extension += std::max(0.0f, issue.durationMs) * Constants::EXTENSION_PER_DURATION_MS;
    }
    return std::clamp(extension, 0.0f, std::max(0.0f, options.maxTimeWindowExtensionMs));
}

float PerformanceAdjustmentCalculator::stutterTolerance(
    const PerformanceContext& context, const AntiCheatOptions& options) {

    const float configured = std::max(0.0f, options.stutterToleranceMs);
    const float stutterWeight = context.totalIssueWeight(PerformanceIssueKind::STUTTER);
    const float otherWeight = context.totalIssueWeight() - stutterWeight;

    const float grown = configured +
        stutterWeight * Constants::STUTTER_GROWTH_PER_STUTTER_WEIGHT_MS +
        otherWeight * Constants::STUTTER_GROWTH_PER_OTHER_WEIGHT_MS;

    // Same headroom as the time window extension
    const float cap = configured + std::max(0.0f, options.maxTimeWindowExtensionMs);
    return std::max(configured, std::min(grown, cap));
}

} // namespace Security
} // namespace KnutGame
