#pragma once

#include "Constants.hpp"
#include <atomic>
#include <memory>

// [SECURITY_AGENT] Tunable anti-cheat parameters
// All values can be replaced at runtime as a whole snapshot

namespace KnutGame {
namespace Security {

struct AntiCheatOptions {
    // ========================================================================
    // RULE THRESHOLDS
    // ========================================================================

    // Tolerance multiplier over nominal max speed (1.2 = 20% tolerance for lag)
    float baseSpeedTolerance = Constants::DEFAULT_SPEED_TOLERANCE;

    // Maximum lateral distance between pickup and player (pixels)
    float baseProximityTolerancePx = Constants::DEFAULT_PROXIMITY_TOLERANCE_PX;

    // Minimum assumed stall length of a reported stutter (milliseconds)
    float stutterToleranceMs = Constants::DEFAULT_STUTTER_TOLERANCE_MS;

    // Average FPS below which the frame-rate deficit starts counting
    float lowFpsThreshold = Constants::DEFAULT_LOW_FPS_THRESHOLD;

    // Sessions scoring below this confidence are rejected
    float confidenceThreshold = Constants::DEFAULT_CONFIDENCE_THRESHOLD;

    // ========================================================================
    // PERFORMANCE ADJUSTMENT
    // ========================================================================

    // When false, every context yields the neutral adjustment
    bool performanceAdjustmentEnabled = true;

    float maxSpeedMultiplier = Constants::MAX_SPEED_MULTIPLIER;
    float maxProximityMultiplier = Constants::MAX_PROXIMITY_MULTIPLIER;
    float maxTimeWindowExtensionMs = Constants::MAX_TIME_WINDOW_EXTENSION_MS;
};

// [SECURITY_AGENT] Immutable options snapshot shared by in-flight validations
using AntiCheatOptionsPtr = std::shared_ptr<const AntiCheatOptions>;

// [SECURITY_AGENT] Atomically swappable holder for the active snapshot
// Readers see either the fully-old or the fully-new options, never a mix
class AntiCheatOptionsStore {
public:
    AntiCheatOptionsStore()
        : current_(std::make_shared<const AntiCheatOptions>()) {}

    explicit AntiCheatOptionsStore(const AntiCheatOptions& options)
        : current_(std::make_shared<const AntiCheatOptions>(options)) {}

    AntiCheatOptionsStore(const AntiCheatOptionsStore&) = delete;
    AntiCheatOptionsStore& operator=(const AntiCheatOptionsStore&) = delete;

    [[nodiscard]] AntiCheatOptionsPtr load() const {
        return current_.load(std::memory_order_acquire);
    }

    void store(const AntiCheatOptions& options) {
        current_.store(std::make_shared<const AntiCheatOptions>(options),
            std::memory_order_release);
    }

private:
    std::atomic<AntiCheatOptionsPtr> current_;
};

} // namespace Security
} // namespace KnutGame
