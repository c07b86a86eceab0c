#pragma once

#include "Constants.hpp"
#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

// [PERFORMANCE_AGENT] Summarized client performance report for one session
// Aggregated upstream from raw frame-time and memory telemetry; read-only here

namespace KnutGame {
namespace Security {

enum class PerformanceIssueKind : uint8_t {
    STUTTER = 0,          // Frame-time spike
    LOW_FPS = 1,          // Sustained frame rate below threshold
    MEMORY_PRESSURE = 2   // GC / allocation pause
};

inline const char* issueKindToString(PerformanceIssueKind kind) {
    switch (kind) {
        case PerformanceIssueKind::STUTTER: return "stutter";
        case PerformanceIssueKind::LOW_FPS: return "low_fps";
        case PerformanceIssueKind::MEMORY_PRESSURE: return "memory_pressure";
        default: return "unknown";
    }
}

inline std::optional<PerformanceIssueKind> issueKindFromString(std::string_view name) {
    if (name == "stutter") return PerformanceIssueKind::STUTTER;
    if (name == "low_fps") return PerformanceIssueKind::LOW_FPS;
    if (name == "memory_pressure") return PerformanceIssueKind::MEMORY_PRESSURE;
    return std::nullopt;
}

enum class IssueSeverity : uint8_t {
    LOW = 0,
    MEDIUM = 1,
    HIGH = 2
};

inline const char* severityToString(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::LOW: return "low";
        case IssueSeverity::MEDIUM: return "medium";
        case IssueSeverity::HIGH: return "high";
        default: return "unknown";
    }
}

inline std::optional<IssueSeverity> severityFromString(std::string_view name) {
    if (name == "low") return IssueSeverity::LOW;
    if (name == "medium") return IssueSeverity::MEDIUM;
    if (name == "high") return IssueSeverity::HIGH;
    return std::nullopt;
}

// [PERFORMANCE_AGENT] low=1, medium=2, high=3
inline constexpr float severityWeight(IssueSeverity severity) {
    switch (severity) {
        case IssueSeverity::LOW: return Constants::SEVERITY_WEIGHT_LOW;
        case IssueSeverity::MEDIUM: return Constants::SEVERITY_WEIGHT_MEDIUM;
        case IssueSeverity::HIGH: return Constants::SEVERITY_WEIGHT_HIGH;
    }
    return Constants::SEVERITY_WEIGHT_LOW;
}

struct PerformanceIssue {
    PerformanceIssueKind kind{PerformanceIssueKind::STUTTER};
    IssueSeverity severity{IssueSeverity::LOW};
    int32_t timestampMs{0};   // Relative to session start
    float durationMs{0.0f};
    float fpsAtTime{0.0f};

    [[nodiscard]] float weight() const { return severityWeight(severity); }
};

struct PerformanceContext {
    std::vector<PerformanceIssue> issues;
    float averageFps{Constants::TARGET_FPS};
    int32_t memoryPressureLevel{0};   // 0..5
    int32_t performanceScore{100};    // 0..100
    int64_t sessionDurationMs{0};
    std::vector<int32_t> stutterTimestamps;

    // Healthy client: no deficits, no issues
    static PerformanceContext neutral() { return PerformanceContext{}; }

    // Sum of severity weights, optionally restricted to one issue kind
    [[nodiscard]] float totalIssueWeight() const {
        float total = 0.0f;
        for (const auto& issue : issues) {
            total += issue.weight();
        }
        return total;
    }

    [[nodiscard]] float totalIssueWeight(PerformanceIssueKind kind) const {
        float total = 0.0f;
        for (const auto& issue : issues) {
            if (issue.kind == kind) {
                total += issue.weight();
            }
        }
        return total;
    }
};

} // namespace Security
} // namespace KnutGame
