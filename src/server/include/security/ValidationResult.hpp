#pragma once

#include "security/PerformanceAdjustment.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// [SECURITY_AGENT] Outcome types shared by the rule validators and the orchestrator

namespace KnutGame {
namespace Security {

// [SECURITY_AGENT] Closed set of rejection reasons
enum class ValidationReason : uint8_t {
    SPEED_EXCEEDED = 0,                  // Over baseline, no adjustment applied
    DYNAMIC_SPEED_EXCEEDED = 1,          // Over adjusted limit, outside any stutter window
    SPEED_EXCEEDED_DESPITE_STUTTER = 2,  // Over limit even with the stutter-window bonus
    PROXIMITY_EXCEEDED = 3,              // Pickup too far, no adjustment applied
    DYNAMIC_PROXIMITY_EXCEEDED = 4,      // Pickup too far for the adjusted tolerance
    LOW_CONFIDENCE = 5                   // Rules passed, trust score below threshold
};

inline constexpr size_t VALIDATION_REASON_COUNT = 6;

inline const char* validationReasonToString(ValidationReason reason) {
    switch (reason) {
        case ValidationReason::SPEED_EXCEEDED: return "SpeedExceeded";
        case ValidationReason::DYNAMIC_SPEED_EXCEEDED: return "DynamicSpeedExceeded";
        case ValidationReason::SPEED_EXCEEDED_DESPITE_STUTTER: return "SpeedExceededDespiteStutter";
        case ValidationReason::PROXIMITY_EXCEEDED: return "ProximityExceeded";
        case ValidationReason::DYNAMIC_PROXIMITY_EXCEEDED: return "DynamicProximityExceeded";
        case ValidationReason::LOW_CONFIDENCE: return "LowConfidence";
        default: return "Unknown";
    }
}

inline std::optional<ValidationReason> validationReasonFromString(std::string_view name) {
    if (name == "SpeedExceeded") return ValidationReason::SPEED_EXCEEDED;
    if (name == "DynamicSpeedExceeded") return ValidationReason::DYNAMIC_SPEED_EXCEEDED;
    if (name == "SpeedExceededDespiteStutter") return ValidationReason::SPEED_EXCEEDED_DESPITE_STUTTER;
    if (name == "ProximityExceeded") return ValidationReason::PROXIMITY_EXCEEDED;
    if (name == "DynamicProximityExceeded") return ValidationReason::DYNAMIC_PROXIMITY_EXCEEDED;
    if (name == "LowConfidence") return ValidationReason::LOW_CONFIDENCE;
    return std::nullopt;
}

// [SECURITY_AGENT] Result of a single rule validator (speed or proximity)
struct RuleCheckResult {
    bool violated{false};
    ValidationReason reason{ValidationReason::SPEED_EXCEEDED};

    // Additional context
    float actualValue{0.0f};    // Measured speed (px/s) or distance (px)
    float allowedValue{0.0f};   // Limit it was compared against
    int32_t timestampMs{0};     // Event that tripped the rule

    static RuleCheckResult pass() { return RuleCheckResult{}; }
};

// [SECURITY_AGENT] Final decision for one submitted session
// Invariants: reason set iff !isValid; adjustmentDetails set iff performanceAdjusted
struct ValidationResult {
    bool isValid{true};
    std::optional<ValidationReason> reason;
    float confidence{1.0f};  // 0.0 - 1.0
    bool performanceAdjusted{false};
    std::optional<PerformanceAdjustment> adjustmentDetails;

    [[nodiscard]] const char* reasonString() const {
        return reason ? validationReasonToString(*reason) : "";
    }
};

} // namespace Security
} // namespace KnutGame
