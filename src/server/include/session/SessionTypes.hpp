#pragma once

#include <cstdint>
#include <glm/glm.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// [NETWORK_AGENT] Session telemetry submitted by the client at game over
// All types are plain values; a request is built once and never mutated

namespace KnutGame {

// ============================================================================
// EVENTS
// ============================================================================

// [PHYSICS_AGENT] Lateral player position sample
struct MoveEvent {
    int32_t timestampMs{0};  // Relative to session start
    float x{0.0f};
};

enum class ItemKind : uint8_t {
    POINTS = 0,
    LIFE = 1,
    SLOWMO = 2,
    MULTI = 3
};

inline const char* itemKindToString(ItemKind kind) {
    switch (kind) {
        case ItemKind::POINTS: return "POINTS";
        case ItemKind::LIFE: return "LIFE";
        case ItemKind::SLOWMO: return "SLOWMO";
        case ItemKind::MULTI: return "MULTI";
        default: return "UNKNOWN";
    }
}

inline std::optional<ItemKind> itemKindFromString(std::string_view name) {
    if (name == "POINTS") return ItemKind::POINTS;
    if (name == "LIFE") return ItemKind::LIFE;
    if (name == "SLOWMO") return ItemKind::SLOWMO;
    if (name == "MULTI") return ItemKind::MULTI;
    return std::nullopt;
}

// [COMBAT_AGENT] Item pickup reported by the client
struct ItemEvent {
    int32_t timestampMs{0};
    std::string itemId;
    ItemKind kind{ItemKind::POINTS};
    float x{0.0f};
    float y{0.0f};

    [[nodiscard]] glm::vec2 position() const { return glm::vec2(x, y); }
};

// [COMBAT_AGENT] Obstacle hit (not consumed by the movement validators)
struct HitEvent {
    int32_t timestampMs{0};
    float x{0.0f};
    float y{0.0f};
};

struct EventEnvelope {
    std::vector<MoveEvent> moves;
    std::vector<HitEvent> hits;
    std::vector<ItemEvent> items;
};

// ============================================================================
// REQUEST
// ============================================================================

struct SubmitSessionRequest {
    std::string sessionId;
    int32_t canvasWidth{0};
    int32_t canvasHeight{0};
    int64_t startedAtMs{0};  // Client wall clock, unix epoch milliseconds
    int64_t endedAtMs{0};
    EventEnvelope events;

    [[nodiscard]] int64_t durationMs() const { return endedAtMs - startedAtMs; }
};

} // namespace KnutGame
