#include "security/SpeedValidator.hpp"
#include "Constants.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <vector>

namespace KnutGame {
namespace Security {

RuleCheckResult SpeedValidator::validate(const std::vector<MoveEvent>& moves,
    const PerformanceContext& context, const PerformanceAdjustment& adjustment,
    const AntiCheatOptions& options) {

    // Nothing to compare
    if (moves.size() < 2) return RuleCheckResult::pass();

    const float baseline = baselineSpeed(options);
    const bool adjusted = !adjustment.isNeutral();
    const float allowed = baseline * adjustment.speedToleranceMultiplier;
    const float ceiling = hardCeiling(options);

    std::vector<StutterWindow> windows;
    if (adjusted) {
        windows = buildStutterWindows(context, adjustment);
    }

    for (size_t i = 1; i < moves.size(); ++i) {
        const MoveEvent& prev = moves[i - 1];
        const MoveEvent& curr = moves[i];
        const float speed = measureSpeed(prev, curr);

        RuleCheckResult result;
        result.actualValue = speed;
        result.timestampMs = curr.timestampMs;

        if (!adjusted) {
            if (speed > baseline) {
                result.violated = true;
                result.reason = ValidationReason::SPEED_EXCEEDED;
                result.allowedValue = baseline;
                return result;
            }
            continue;
        }

        // Strongest stutter overlapping this pair decides the bonus
        float stutterWeight = 0.0f;
        for (const auto& window : windows) {
            if (window.overlaps(prev.timestampMs, curr.timestampMs)) {
                stutterWeight = std::max(stutterWeight, window.severityWeight);
            }
        }

        if (stutterWeight > 0.0f) {
            const float bonus = 1.0f + stutterWeight * Constants::STUTTER_SPEED_BONUS_PER_WEIGHT;
            const float limit = std::min(allowed * bonus, ceiling);
            if (speed > limit) {
                result.violated = true;
                result.reason = ValidationReason::SPEED_EXCEEDED_DESPITE_STUTTER;
                result.allowedValue = limit;
                return result;
            }
        } else if (speed > allowed) {
            result.violated = true;
            result.reason = ValidationReason::DYNAMIC_SPEED_EXCEEDED;
            result.allowedValue = allowed;
            return result;
        }
    }

    return RuleCheckResult::pass();
}

float SpeedValidator::baselineSpeed(const AntiCheatOptions& options) {
    return Constants::NOMINAL_MAX_SPEED * options.baseSpeedTolerance;
}

float SpeedValidator::hardCeiling(const AntiCheatOptions& options) {
    return baselineSpeed(options) * options.maxSpeedMultiplier * Constants::ANTI_TELEPORT_FACTOR;
}

float SpeedValidator::measureSpeed(const MoveEvent& from, const MoveEvent& to) {
    const int64_t dtMs = std::max<int64_t>(1,
        static_cast<int64_t>(to.timestampMs) - static_cast<int64_t>(from.timestampMs));
    const float dx = std::abs(to.x - from.x);
    return dx / (static_cast<float>(dtMs) / 1000.0f);
}

std::vector<StutterWindow> SpeedValidator::buildStutterWindows(
    const PerformanceContext& context, const PerformanceAdjustment& adjustment) {

    std::vector<StutterWindow> windows;
    const float extension = adjustment.timeWindowExtensionMs;

    for (const auto& issue : context.issues) {
        if (issue.kind != PerformanceIssueKind::STUTTER) continue;

        // Window end is widened from t + duration to t + max(duration, stutterToleranceMs):
        // a reported stutter stalls the client for at least stutterToleranceMs
        const float stallMs = std::max(issue.durationMs, adjustment.stutterToleranceMs);
        StutterWindow window;
        window.startMs = static_cast<float>(issue.timestampMs) - extension;
        window.endMs = static_cast<float>(issue.timestampMs) + stallMs + extension;
        window.severityWeight = issue.weight();
        windows.push_back(window);
    }

    // Timestamps without a matching issue carry no severity or duration;
    // treat them as low severity stalling for stutterToleranceMs
    for (int32_t timestamp : context.stutterTimestamps) {
        const bool covered = std::any_of(context.issues.begin(), context.issues.end(),
            [timestamp](const PerformanceIssue& issue) {
                return issue.kind == PerformanceIssueKind::STUTTER &&
                       issue.timestampMs == timestamp;
            });
        if (covered) continue;

        StutterWindow window;
        window.startMs = static_cast<float>(timestamp) - extension;
        window.endMs = static_cast<float>(timestamp) + adjustment.stutterToleranceMs + extension;
        window.severityWeight = severityWeight(IssueSeverity::LOW);
        windows.push_back(window);
    }

    return windows;
}

} // namespace Security
} // namespace KnutGame
