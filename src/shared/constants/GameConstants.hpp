#pragma once

// [ALL-AGENTS] Shared constants between client and server
// Mirrored in the TypeScript client (gameConfig.ts); values must match exactly

#include <cstdint>

namespace KnutGame {
namespace SharedConstants {

// Lateral player movement (pixels per second)
inline constexpr float MOVE_SPEED = 200.0f;

// Falling obstacles
inline constexpr float FALL_SPEED_MIN = 150.0f;
inline constexpr float FALL_SPEED_MAX = 250.0f;
inline constexpr uint32_t INVULNERABILITY_MS = 1000;

// Items
inline constexpr uint32_t ITEM_SPAWN_INTERVAL_MS = 2500;
inline constexpr float ITEM_DROP_CHANCE = 0.35f;  // 35% on spawn tick
inline constexpr uint32_t LIFE_MAX = 5;

// Session limits (client buffers never exceed these)
inline constexpr uint32_t MAX_MOVES_PER_SESSION = 50000;
inline constexpr uint32_t MAX_ITEMS_PER_SESSION = 500;

// Client frame budget
inline constexpr float TARGET_FPS = 60.0f;

} // namespace SharedConstants
} // namespace KnutGame
