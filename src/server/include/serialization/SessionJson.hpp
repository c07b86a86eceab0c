#pragma once

#include "security/AntiCheatConfig.hpp"
#include "security/PerformanceAdjustment.hpp"
#include "security/PerformanceContext.hpp"
#include "security/ValidationResult.hpp"
#include "session/SessionTypes.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

// [NETWORK_AGENT] JSON wire format of the session submission endpoint
// camelCase keys; event timestamps are "t" in milliseconds from session start

namespace KnutGame {

void to_json(nlohmann::json& j, const MoveEvent& move);
void from_json(const nlohmann::json& j, MoveEvent& move);
void to_json(nlohmann::json& j, const ItemEvent& item);
void from_json(const nlohmann::json& j, ItemEvent& item);
void to_json(nlohmann::json& j, const HitEvent& hit);
void from_json(const nlohmann::json& j, HitEvent& hit);
void to_json(nlohmann::json& j, const EventEnvelope& events);
void from_json(const nlohmann::json& j, EventEnvelope& events);
void to_json(nlohmann::json& j, const SubmitSessionRequest& request);
void from_json(const nlohmann::json& j, SubmitSessionRequest& request);

namespace Security {

void to_json(nlohmann::json& j, const PerformanceIssue& issue);
void from_json(const nlohmann::json& j, PerformanceIssue& issue);
void to_json(nlohmann::json& j, const PerformanceContext& context);
void from_json(const nlohmann::json& j, PerformanceContext& context);

// Missing keys keep their defaults
void to_json(nlohmann::json& j, const AntiCheatOptions& options);
void from_json(const nlohmann::json& j, AntiCheatOptions& options);

void to_json(nlohmann::json& j, const PerformanceAdjustment& adjustment);
void from_json(const nlohmann::json& j, PerformanceAdjustment& adjustment);
void to_json(nlohmann::json& j, const ValidationResult& result);

} // namespace Security

namespace Serialization {

// Parse helpers: log the error to std::cerr and return nullopt on malformed input
[[nodiscard]] std::optional<SubmitSessionRequest> parseSessionRequest(const std::string& text);
[[nodiscard]] std::optional<Security::PerformanceContext> parsePerformanceContext(
    const std::string& text);
[[nodiscard]] std::optional<Security::AntiCheatOptions> parseAntiCheatOptions(
    const std::string& text);

// Same, reading the whole file at path
[[nodiscard]] std::optional<SubmitSessionRequest> loadSessionRequest(const std::string& path);
[[nodiscard]] std::optional<Security::PerformanceContext> loadPerformanceContext(
    const std::string& path);
[[nodiscard]] std::optional<Security::AntiCheatOptions> loadAntiCheatOptions(
    const std::string& path);

} // namespace Serialization
} // namespace KnutGame
