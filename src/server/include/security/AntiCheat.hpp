#pragma once

#include "security/AntiCheatConfig.hpp"
#include "security/PerformanceAdjustment.hpp"
#include "security/PerformanceContext.hpp"
#include "security/ValidationResult.hpp"
#include "session/SessionTypes.hpp"
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>

// [SECURITY_AGENT] Performance-aware anti-cheat for submitted game sessions
// Relaxes movement rules for clients that genuinely stuttered, ran at low FPS
// or were under memory pressure, while still rejecting impossible movement

namespace KnutGame {
namespace Security {

// [SECURITY_AGENT] Callback for rejected sessions
using RejectionCallback = std::function<void(const SubmitSessionRequest& request,
    const ValidationResult& result)>;

// [SECURITY_AGENT] Main validation engine
// validate/validateWithContext are safe to call from any number of threads.
// Options are an immutable snapshot; setPerformanceThresholds swaps it atomically.
class SmartAntiCheat {
public:
    SmartAntiCheat();
    explicit SmartAntiCheat(const AntiCheatOptions& options);
    ~SmartAntiCheat();

    // Non-copyable
    SmartAntiCheat(const SmartAntiCheat&) = delete;
    SmartAntiCheat& operator=(const SmartAntiCheat&) = delete;

    // Logs the active thresholds
    [[nodiscard]] bool initialize();

    void shutdown();

    // ========================================================================
    // VALIDATION METHODS
    // ========================================================================

    // Rule checks with no performance context: neutral adjustment, no confidence gate
    [[nodiscard]] ValidationResult validate(const SubmitSessionRequest& request);

    // Adjustment -> speed -> proximity -> confidence gate
    [[nodiscard]] ValidationResult validateWithContext(const SubmitSessionRequest& request,
        const PerformanceContext& context);

    // Adjustment the current options derive from a context
    [[nodiscard]] PerformanceAdjustment getPerformanceAdjustment(
        const PerformanceContext& context) const;

    [[nodiscard]] float calculateConfidence(const SubmitSessionRequest& request,
        const PerformanceContext& context) const;

    // ========================================================================
    // CONFIGURATION
    // ========================================================================

    // Replace the whole options snapshot at runtime
    void setPerformanceThresholds(const AntiCheatOptions& options);
    [[nodiscard]] AntiCheatOptions getPerformanceThresholds() const;

    // ========================================================================
    // ACTIONS
    // ========================================================================

    // Set before validations start; invoked on the validating thread
    void setOnSessionRejected(RejectionCallback cb) { onSessionRejected_ = std::move(cb); }

    // ========================================================================
    // STATISTICS
    // ========================================================================

    [[nodiscard]] uint32_t getTotalValidations() const { return totalValidations_.load(); }
    [[nodiscard]] uint32_t getTotalRejections() const { return totalRejections_.load(); }
    [[nodiscard]] uint32_t getRejectionCount(ValidationReason reason) const;

    void resetStatistics();

private:
    // context == nullptr: neutral adjustment and no confidence gate
    [[nodiscard]] ValidationResult evaluate(const SubmitSessionRequest& request,
        const PerformanceContext* context);

    [[nodiscard]] ValidationResult reject(const SubmitSessionRequest& request,
        ValidationReason reason, float confidence,
        const PerformanceAdjustment& adjustment, const RuleCheckResult* rule);

    void reportRejection(const SubmitSessionRequest& request, const ValidationResult& result,
        const RuleCheckResult* rule);

private:
    // Configuration
    AntiCheatOptionsStore options_;

    // Callbacks
    RejectionCallback onSessionRejected_;

    // Statistics
    std::atomic<uint32_t> totalValidations_{0};
    std::atomic<uint32_t> totalRejections_{0};
    std::array<std::atomic<uint32_t>, VALIDATION_REASON_COUNT> rejectionCounts_{};

    // Initialization state
    bool initialized_{false};
};

} // namespace Security
} // namespace KnutGame
