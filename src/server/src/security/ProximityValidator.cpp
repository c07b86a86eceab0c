#include "security/ProximityValidator.hpp"
#include "Constants.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <glm/glm.hpp>

namespace KnutGame {
namespace Security {

RuleCheckResult ProximityValidator::validate(const std::vector<MoveEvent>& moves,
    const std::vector<ItemEvent>& items, const PerformanceContext& context,
    const PerformanceAdjustment& adjustment, const AntiCheatOptions& options) {

    const bool adjusted = !adjustment.isNeutral();
    const float base = options.baseProximityTolerancePx;
    const float allowed = base * adjustment.proximityToleranceMultiplier;
    const float ceiling = proximityCeiling(options);

    for (const auto& item : items) {
        // No movement data: nothing to compare against
        const std::optional<float> playerX = expectedPlayerX(moves, item.timestampMs);
        if (!playerX) continue;

        const float distance = std::abs(item.position().x - *playerX);

        RuleCheckResult result;
        result.actualValue = distance;
        result.timestampMs = item.timestampMs;

        if (!adjusted) {
            if (distance > base) {
                result.violated = true;
                result.reason = ValidationReason::PROXIMITY_EXCEEDED;
                result.allowedValue = base;
                return result;
            }
            continue;
        }

        float limit = allowed;
        const float issueWeight =
            nearbyIssueWeight(context, item.timestampMs, adjustment.timeWindowExtensionMs);
        if (issueWeight > 0.0f) {
            const float bonus = 1.0f + issueWeight * Constants::ISSUE_PROXIMITY_BONUS_PER_WEIGHT;
            limit = std::max(allowed, std::min(allowed * bonus, ceiling));
        }

        if (distance > limit) {
            result.violated = true;
            result.reason = ValidationReason::DYNAMIC_PROXIMITY_EXCEEDED;
            result.allowedValue = limit;
            return result;
        }
    }

    return RuleCheckResult::pass();
}

std::optional<float> ProximityValidator::expectedPlayerX(
    const std::vector<MoveEvent>& moves, int32_t timestampMs) {

    if (moves.empty()) return std::nullopt;

    // First move at/after the target, and last move at/before it
    auto after = std::lower_bound(moves.begin(), moves.end(), timestampMs,
        [](const MoveEvent& move, int32_t t) { return move.timestampMs < t; });
    auto upper = std::upper_bound(moves.begin(), moves.end(), timestampMs,
        [](int32_t t, const MoveEvent& move) { return t < move.timestampMs; });

    const bool hasAfter = after != moves.end();
    const bool hasBefore = upper != moves.begin();

    if (!hasBefore) return after->x;
    const MoveEvent& before = *(upper - 1);
    if (!hasAfter) return before.x;

    // Widened: timestamps come straight from the client
    const int64_t span = static_cast<int64_t>(after->timestampMs) - static_cast<int64_t>(before.timestampMs);
    if (span <= 0) return before.x;

    const int64_t elapsed = static_cast<int64_t>(timestampMs) - static_cast<int64_t>(before.timestampMs);
    const float t = static_cast<float>(elapsed) / static_cast<float>(span);
    return glm::mix(before.x, after->x, std::clamp(t, 0.0f, 1.0f));
}

float ProximityValidator::proximityCeiling(const AntiCheatOptions& options) {
    return options.baseProximityTolerancePx * options.maxProximityMultiplier *
        Constants::PROXIMITY_CEILING_FACTOR;
}

float ProximityValidator::nearbyIssueWeight(const PerformanceContext& context,
    int32_t timestampMs, float extensionMs) {

    const float t = static_cast<float>(timestampMs);
    float weight = 0.0f;
    for (const auto& issue : context.issues) {
        const float start = static_cast<float>(issue.timestampMs) - extensionMs;
        const float end = static_cast<float>(issue.timestampMs) +
            std::max(0.0f, issue.durationMs) + extensionMs;
        if (t >= start && t <= end) {
            weight = std::max(weight, issue.weight());
        }
    }
    return weight;
}

} // namespace Security
} // namespace KnutGame
