#include "security/ConfidenceCalculator.hpp"
#include "Constants.hpp"
#include <algorithm>
#include <cstdint>

namespace KnutGame {
namespace Security {

float ConfidenceCalculator::calculate(const SubmitSessionRequest& request,
    const PerformanceContext& context, const AntiCheatOptions& options) {

    const float scoreDeficit =
        static_cast<float>(100 - std::clamp(context.performanceScore, 0, 100)) / 100.0f;

    float fpsDeficit = 0.0f;
    if (options.lowFpsThreshold > 0.0f) {
        fpsDeficit = std::clamp(
            (options.lowFpsThreshold - context.averageFps) / options.lowFpsThreshold, 0.0f, 1.0f);
    }

    const float confidence = 1.0f -
        scoreDeficit * Constants::CONFIDENCE_SCORE_DEFICIT_WEIGHT -
        fpsDeficit * Constants::CONFIDENCE_FPS_DEFICIT_WEIGHT -
        issuePenalty(request, context);

    return std::clamp(confidence, 0.0f, 1.0f);
}

float ConfidenceCalculator::issuePenalty(const SubmitSessionRequest& request,
    const PerformanceContext& context) {

    // Unknown duration: count everything
    const int64_t durationMs = context.sessionDurationMs > 0
        ? context.sessionDurationMs
        : request.durationMs();

    float weight = 0.0f;
    for (const auto& issue : context.issues) {
        if (durationMs > 0 && issue.timestampMs > durationMs) continue;
        weight += issue.weight();
    }
    return weight * Constants::CONFIDENCE_ISSUE_PENALTY;
}

} // namespace Security
} // namespace KnutGame
