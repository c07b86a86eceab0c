#include "serialization/SessionJson.hpp"
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace KnutGame {

using nlohmann::json;

namespace {

// Enum fields arrive as names; unknown names are a malformed request
template <typename Enum>
Enum requireEnum(std::optional<Enum> parsed, const std::string& name, const char* field) {
    if (!parsed) {
        throw std::invalid_argument(std::string("unknown ") + field + " '" + name + "'");
    }
    return *parsed;
}

} // namespace

// ============================================================================
// Session events
// ============================================================================

void to_json(json& j, const MoveEvent& move) {
    j = json{{"t", move.timestampMs}, {"x", move.x}};
}

void from_json(const json& j, MoveEvent& move) {
    j.at("t").get_to(move.timestampMs);
    j.at("x").get_to(move.x);
}

void to_json(json& j, const ItemEvent& item) {
    j = json{
        {"t", item.timestampMs},
        {"id", item.itemId},
        {"type", itemKindToString(item.kind)},
        {"x", item.x},
        {"y", item.y}
    };
}

void from_json(const json& j, ItemEvent& item) {
    j.at("t").get_to(item.timestampMs);
    j.at("id").get_to(item.itemId);
    j.at("x").get_to(item.x);
    j.at("y").get_to(item.y);

    // Older clients send the enum ordinal
    const json& type = j.at("type");
    if (type.is_number_integer()) {
        const int ordinal = type.get<int>();
        if (ordinal < 0 || ordinal > static_cast<int>(ItemKind::MULTI)) {
            throw std::invalid_argument("item type ordinal out of range: " + std::to_string(ordinal));
        }
        item.kind = static_cast<ItemKind>(ordinal);
    } else {
        const std::string name = type.get<std::string>();
        item.kind = requireEnum(itemKindFromString(name), name, "item type");
    }
}

void to_json(json& j, const HitEvent& hit) {
    j = json{{"t", hit.timestampMs}, {"x", hit.x}, {"y", hit.y}};
}

void from_json(const json& j, HitEvent& hit) {
    j.at("t").get_to(hit.timestampMs);
    hit.x = j.value("x", 0.0f);
    hit.y = j.value("y", 0.0f);
}

void to_json(json& j, const EventEnvelope& events) {
    j = json{{"moves", events.moves}, {"hits", events.hits}, {"items", events.items}};
}

void from_json(const json& j, EventEnvelope& events) {
    events.moves = j.value("moves", std::vector<MoveEvent>{});
    events.hits = j.value("hits", std::vector<HitEvent>{});
    events.items = j.value("items", std::vector<ItemEvent>{});
}

void to_json(json& j, const SubmitSessionRequest& request) {
    j = json{
        {"sessionId", request.sessionId},
        {"canvasWidth", request.canvasWidth},
        {"canvasHeight", request.canvasHeight},
        {"startedAt", request.startedAtMs},
        {"endedAt", request.endedAtMs},
        {"events", request.events}
    };
}

void from_json(const json& j, SubmitSessionRequest& request) {
    j.at("sessionId").get_to(request.sessionId);
    j.at("canvasWidth").get_to(request.canvasWidth);
    j.at("canvasHeight").get_to(request.canvasHeight);
    j.at("startedAt").get_to(request.startedAtMs);
    j.at("endedAt").get_to(request.endedAtMs);
    request.events = j.value("events", EventEnvelope{});
}

namespace Security {

// ============================================================================
// Performance context
// ============================================================================

void to_json(json& j, const PerformanceIssue& issue) {
    j = json{
        {"type", issueKindToString(issue.kind)},
        {"severity", severityToString(issue.severity)},
        {"timestamp", issue.timestampMs},
        {"duration", issue.durationMs},
        {"fpsAtTime", issue.fpsAtTime}
    };
}

void from_json(const json& j, PerformanceIssue& issue) {
    const std::string type = j.at("type").get<std::string>();
    const std::string severity = j.at("severity").get<std::string>();
    issue.kind = requireEnum(issueKindFromString(type), type, "issue type");
    issue.severity = requireEnum(severityFromString(severity), severity, "severity");
    j.at("timestamp").get_to(issue.timestampMs);
    issue.durationMs = j.value("duration", 0.0f);
    issue.fpsAtTime = j.value("fpsAtTime", 0.0f);
}

void to_json(json& j, const PerformanceContext& context) {
    j = json{
        {"issues", context.issues},
        {"averageFps", context.averageFps},
        {"memoryPressureLevel", context.memoryPressureLevel},
        {"performanceScore", context.performanceScore},
        {"sessionDurationMs", context.sessionDurationMs},
        {"stutterTimestamps", context.stutterTimestamps}
    };
}

void from_json(const json& j, PerformanceContext& context) {
    const PerformanceContext defaults;
    context.issues = j.value("issues", std::vector<PerformanceIssue>{});
    context.averageFps = j.value("averageFps", defaults.averageFps);
    context.memoryPressureLevel = j.value("memoryPressureLevel", defaults.memoryPressureLevel);
    context.performanceScore = j.value("performanceScore", defaults.performanceScore);
    context.sessionDurationMs = j.value("sessionDurationMs", defaults.sessionDurationMs);
    context.stutterTimestamps = j.value("stutterTimestamps", std::vector<int32_t>{});
}

// ============================================================================
// Options
// ============================================================================

void to_json(json& j, const AntiCheatOptions& options) {
    j = json{
        {"baseSpeedTolerance", options.baseSpeedTolerance},
        {"baseProximityTolerancePx", options.baseProximityTolerancePx},
        {"stutterToleranceMs", options.stutterToleranceMs},
        {"lowFpsThreshold", options.lowFpsThreshold},
        {"confidenceThreshold", options.confidenceThreshold},
        {"performanceAdjustmentEnabled", options.performanceAdjustmentEnabled},
        {"maxSpeedMultiplier", options.maxSpeedMultiplier},
        {"maxProximityMultiplier", options.maxProximityMultiplier},
        {"maxTimeWindowExtensionMs", options.maxTimeWindowExtensionMs}
    };
}

void from_json(const json& j, AntiCheatOptions& options) {
    const AntiCheatOptions defaults;
    options.baseSpeedTolerance = j.value("baseSpeedTolerance", defaults.baseSpeedTolerance);
    options.baseProximityTolerancePx =
        j.value("baseProximityTolerancePx", defaults.baseProximityTolerancePx);
    options.stutterToleranceMs = j.value("stutterToleranceMs", defaults.stutterToleranceMs);
    options.lowFpsThreshold = j.value("lowFpsThreshold", defaults.lowFpsThreshold);
    options.confidenceThreshold = j.value("confidenceThreshold", defaults.confidenceThreshold);
    options.performanceAdjustmentEnabled =
        j.value("performanceAdjustmentEnabled", defaults.performanceAdjustmentEnabled);
    options.maxSpeedMultiplier = j.value("maxSpeedMultiplier", defaults.maxSpeedMultiplier);
    options.maxProximityMultiplier =
        j.value("maxProximityMultiplier", defaults.maxProximityMultiplier);
    options.maxTimeWindowExtensionMs =
        j.value("maxTimeWindowExtensionMs", defaults.maxTimeWindowExtensionMs);
}

// ============================================================================
// Results
// ============================================================================

void to_json(json& j, const PerformanceAdjustment& adjustment) {
    j = json{
        {"speedToleranceMultiplier", adjustment.speedToleranceMultiplier},
        {"proximityToleranceMultiplier", adjustment.proximityToleranceMultiplier},
        {"timeWindowExtensionMs", adjustment.timeWindowExtensionMs},
        {"stutterToleranceMs", adjustment.stutterToleranceMs}
    };
}

void from_json(const json& j, PerformanceAdjustment& adjustment) {
    j.at("speedToleranceMultiplier").get_to(adjustment.speedToleranceMultiplier);
    j.at("proximityToleranceMultiplier").get_to(adjustment.proximityToleranceMultiplier);
    j.at("timeWindowExtensionMs").get_to(adjustment.timeWindowExtensionMs);
    j.at("stutterToleranceMs").get_to(adjustment.stutterToleranceMs);
}

void to_json(json& j, const ValidationResult& result) {
    j = json{
        {"isValid", result.isValid},
        {"reason", nullptr},
        {"confidence", result.confidence},
        {"performanceAdjusted", result.performanceAdjusted},
        {"adjustmentDetails", nullptr}
    };
    if (result.reason) {
        j["reason"] = validationReasonToString(*result.reason);
    }
    if (result.adjustmentDetails) {
        j["adjustmentDetails"] = *result.adjustmentDetails;
    }
}

} // namespace Security

// ============================================================================
// Parse / load helpers
// ============================================================================

namespace Serialization {

namespace {

template <typename T>
std::optional<T> parseAs(const std::string& text, const char* what) {
    try {
        return nlohmann::json::parse(text).get<T>();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[CONFIG] Malformed " << what << ": " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
        std::cerr << "[CONFIG] Malformed " << what << ": " << e.what() << "\n";
    }
    return std::nullopt;
}

std::optional<std::string> readFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        std::cerr << "[CONFIG] Cannot open " << path << "\n";
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

template <typename T>
std::optional<T> loadAs(const std::string& path, const char* what) {
    const std::optional<std::string> text = readFile(path);
    if (!text) return std::nullopt;
    return parseAs<T>(*text, what);
}

} // namespace

std::optional<SubmitSessionRequest> parseSessionRequest(const std::string& text) {
    return parseAs<SubmitSessionRequest>(text, "session request");
}

std::optional<Security::PerformanceContext> parsePerformanceContext(const std::string& text) {
    return parseAs<Security::PerformanceContext>(text, "performance context");
}

std::optional<Security::AntiCheatOptions> parseAntiCheatOptions(const std::string& text) {
    return parseAs<Security::AntiCheatOptions>(text, "anti-cheat options");
}

std::optional<SubmitSessionRequest> loadSessionRequest(const std::string& path) {
    return loadAs<SubmitSessionRequest>(path, "session request");
}

std::optional<Security::PerformanceContext> loadPerformanceContext(const std::string& path) {
    return loadAs<Security::PerformanceContext>(path, "performance context");
}

std::optional<Security::AntiCheatOptions> loadAntiCheatOptions(const std::string& path) {
    return loadAs<Security::AntiCheatOptions>(path, "anti-cheat options");
}

} // namespace Serialization
} // namespace KnutGame
