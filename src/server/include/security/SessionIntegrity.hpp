#pragma once

#include "session/SessionTypes.hpp"
#include <cstdint>

// [SECURITY_AGENT] Structural sanity checks on a submitted session
// Runs before the performance-aware rules; failures here are never excused
// by client performance

namespace KnutGame {
namespace Security {

enum class IntegrityViolation : uint8_t {
    NONE = 0,
    DURATION_TOO_SHORT = 1,
    DURATION_TOO_LONG = 2,
    DURATION_MISMATCH = 3,   // Last event far from the reported session length
    DUPLICATE_ITEM = 4,      // Same item id picked up twice
    OUT_OF_BOUNDS = 5,       // Event outside the canvas
    TOO_MANY_MOVES = 6,
    TOO_MANY_ITEMS = 7,
    ITEM_WRONG_LANE = 8      // Pickup away from the player's lane near the canvas bottom
};

inline const char* integrityViolationToString(IntegrityViolation violation) {
    switch (violation) {
        case IntegrityViolation::NONE: return "None";
        case IntegrityViolation::DURATION_TOO_SHORT: return "DurationTooShort";
        case IntegrityViolation::DURATION_TOO_LONG: return "DurationTooLong";
        case IntegrityViolation::DURATION_MISMATCH: return "DurationMismatch";
        case IntegrityViolation::DUPLICATE_ITEM: return "DuplicateItem";
        case IntegrityViolation::OUT_OF_BOUNDS: return "OutOfBounds";
        case IntegrityViolation::TOO_MANY_MOVES: return "TooManyMoves";
        case IntegrityViolation::TOO_MANY_ITEMS: return "TooManyItems";
        case IntegrityViolation::ITEM_WRONG_LANE: return "ItemPickupWrongLane";
        default: return "Unknown";
    }
}

struct IntegrityResult {
    IntegrityViolation violation{IntegrityViolation::NONE};

    [[nodiscard]] bool ok() const { return violation == IntegrityViolation::NONE; }
    [[nodiscard]] const char* reason() const { return integrityViolationToString(violation); }
};

class SessionIntegrityChecker {
public:
    // First violation found, in order: size, duration, duplicates, bounds, lane, duration match
    [[nodiscard]] static IntegrityResult check(const SubmitSessionRequest& request);

private:
    [[nodiscard]] static bool hasDuplicateItems(const SubmitSessionRequest& request);
    [[nodiscard]] static bool isOutOfBounds(const SubmitSessionRequest& request);
    [[nodiscard]] static bool hasItemOffLane(const SubmitSessionRequest& request);
    [[nodiscard]] static int32_t lastEventTime(const SubmitSessionRequest& request);
};

} // namespace Security
} // namespace KnutGame
