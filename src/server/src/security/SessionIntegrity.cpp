#include "security/SessionIntegrity.hpp"
#include "Constants.hpp"
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <string>
#include <unordered_set>

namespace KnutGame {
namespace Security {

IntegrityResult SessionIntegrityChecker::check(const SubmitSessionRequest& request) {
    IntegrityResult result;

    // Size limits first: everything below is linear in event count
    if (request.events.moves.size() > Constants::MAX_MOVES_PER_SESSION) {
        result.violation = IntegrityViolation::TOO_MANY_MOVES;
        return result;
    }
    if (request.events.items.size() > Constants::MAX_ITEMS_PER_SESSION) {
        result.violation = IntegrityViolation::TOO_MANY_ITEMS;
        return result;
    }

    const int64_t durationMs = request.durationMs();
    if (durationMs < Constants::MIN_SESSION_DURATION_MS) {
        result.violation = IntegrityViolation::DURATION_TOO_SHORT;
        return result;
    }
    if (durationMs > Constants::MAX_SESSION_DURATION_MS) {
        result.violation = IntegrityViolation::DURATION_TOO_LONG;
        return result;
    }

    if (hasDuplicateItems(request)) {
        result.violation = IntegrityViolation::DUPLICATE_ITEM;
        return result;
    }

    if (isOutOfBounds(request)) {
        result.violation = IntegrityViolation::OUT_OF_BOUNDS;
        return result;
    }

    if (hasItemOffLane(request)) {
        result.violation = IntegrityViolation::ITEM_WRONG_LANE;
        return result;
    }

    const int32_t lastT = lastEventTime(request);
    if (lastT > 0 &&
        std::llabs(static_cast<int64_t>(lastT) - durationMs) > Constants::DURATION_MISMATCH_TOLERANCE_MS) {
        result.violation = IntegrityViolation::DURATION_MISMATCH;
        return result;
    }

    return result;
}

bool SessionIntegrityChecker::hasDuplicateItems(const SubmitSessionRequest& request) {
    std::unordered_set<std::string> seen;
    seen.reserve(request.events.items.size());
    for (const auto& item : request.events.items) {
        if (!seen.insert(item.itemId).second) {
            return true;
        }
    }
    return false;
}

bool SessionIntegrityChecker::isOutOfBounds(const SubmitSessionRequest& request) {
    const float width = static_cast<float>(request.canvasWidth);
    const float height = static_cast<float>(request.canvasHeight);

    for (const auto& move : request.events.moves) {
        if (move.x < 0.0f || move.x > width) return true;
    }
    for (const auto& item : request.events.items) {
        if (item.x < 0.0f || item.x > width || item.y < 0.0f || item.y > height) return true;
    }
    return false;
}

bool SessionIntegrityChecker::hasItemOffLane(const SubmitSessionRequest& request) {
    const float laneY = static_cast<float>(request.canvasHeight) * Constants::PICKUP_LANE_HEIGHT_FRACTION;
    for (const auto& item : request.events.items) {
        if (std::abs(item.y - laneY) > Constants::PICKUP_LANE_TOLERANCE_PX) return true;
    }
    return false;
}

int32_t SessionIntegrityChecker::lastEventTime(const SubmitSessionRequest& request) {
    int32_t last = -1;
    for (const auto& move : request.events.moves) last = std::max(last, move.timestampMs);
    for (const auto& hit : request.events.hits) last = std::max(last, hit.timestampMs);
    for (const auto& item : request.events.items) last = std::max(last, item.timestampMs);
    return last;
}

} // namespace Security
} // namespace KnutGame
