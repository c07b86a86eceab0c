#include "security/AntiCheat.hpp"
#include "security/ConfidenceCalculator.hpp"
#include "security/ProximityValidator.hpp"
#include "security/SpeedValidator.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <vector>

namespace KnutGame {
namespace Security {

namespace {

template <typename Event>
bool byTimestamp(const Event& a, const Event& b) {
    return a.timestampMs < b.timestampMs;
}

// Returns events unchanged when already ordered, otherwise a sorted copy in scratch
template <typename Event>
const std::vector<Event>& sortedByTime(const std::vector<Event>& events,
    std::vector<Event>& scratch) {

    if (std::is_sorted(events.begin(), events.end(), byTimestamp<Event>)) {
        return events;
    }
    scratch = events;
    std::stable_sort(scratch.begin(), scratch.end(), byTimestamp<Event>);
    return scratch;
}

} // namespace

// ============================================================================
// SmartAntiCheat Implementation
// ============================================================================

SmartAntiCheat::SmartAntiCheat() = default;

SmartAntiCheat::SmartAntiCheat(const AntiCheatOptions& options)
    : options_(options) {
}

SmartAntiCheat::~SmartAntiCheat() {
    shutdown();
}

bool SmartAntiCheat::initialize() {
    if (initialized_) {
        return true;
    }

    const AntiCheatOptionsPtr options = options_.load();

    std::ostringstream out;
    out << "[ANTICHEAT] System initialized\n"
        << "[ANTICHEAT] Speed tolerance: " << options->baseSpeedTolerance << "x\n"
        << "[ANTICHEAT] Proximity tolerance: " << options->baseProximityTolerancePx << "px\n"
        << "[ANTICHEAT] Confidence threshold: " << options->confidenceThreshold << "\n"
        << "[ANTICHEAT] Performance adjustment: "
        << (options->performanceAdjustmentEnabled ? "enabled" : "disabled") << "\n";
    std::clog << out.str();

    initialized_ = true;
    return true;
}

void SmartAntiCheat::shutdown() {
    if (!initialized_) {
        return;
    }

    std::clog << "[ANTICHEAT] " << totalRejections_.load() << " of "
              << totalValidations_.load() << " sessions rejected\n";

    initialized_ = false;
}

ValidationResult SmartAntiCheat::validate(const SubmitSessionRequest& request) {
    return evaluate(request, nullptr);
}

ValidationResult SmartAntiCheat::validateWithContext(const SubmitSessionRequest& request,
    const PerformanceContext& context) {
    return evaluate(request, &context);
}

ValidationResult SmartAntiCheat::evaluate(const SubmitSessionRequest& request,
    const PerformanceContext* context) {

    ++totalValidations_;

    // One snapshot for the whole validation
    const AntiCheatOptionsPtr options = options_.load();

    static const PerformanceContext neutralContext = PerformanceContext::neutral();
    const PerformanceContext& effectiveContext = context ? *context : neutralContext;
    const PerformanceAdjustment adjustment = context
        ? PerformanceAdjustmentCalculator::calculate(*context, *options)
        : PerformanceAdjustment::neutral();

    // Without context confidence is always "good"
    const float confidence = context
        ? ConfidenceCalculator::calculate(request, *context, *options)
        : 1.0f;

    std::vector<MoveEvent> moveScratch;
    std::vector<ItemEvent> itemScratch;
    const auto& moves = sortedByTime(request.events.moves, moveScratch);
    const auto& items = sortedByTime(request.events.items, itemScratch);

    const RuleCheckResult speed =
        SpeedValidator::validate(moves, effectiveContext, adjustment, *options);
    if (speed.violated) {
        return reject(request, speed.reason, confidence, adjustment, &speed);
    }

    const RuleCheckResult proximity =
        ProximityValidator::validate(moves, items, effectiveContext, adjustment, *options);
    if (proximity.violated) {
        return reject(request, proximity.reason, confidence, adjustment, &proximity);
    }

    if (context && confidence < options->confidenceThreshold) {
        return reject(request, ValidationReason::LOW_CONFIDENCE, confidence, adjustment, nullptr);
    }

    ValidationResult result;
    result.isValid = true;
    result.confidence = confidence;
    result.performanceAdjusted = !adjustment.isNeutral();
    if (result.performanceAdjusted) {
        result.adjustmentDetails = adjustment;
    }
    return result;
}

ValidationResult SmartAntiCheat::reject(const SubmitSessionRequest& request,
    ValidationReason reason, float confidence,
    const PerformanceAdjustment& adjustment, const RuleCheckResult* rule) {

    ValidationResult result;
    result.isValid = false;
    result.reason = reason;
    result.confidence = confidence;
    result.performanceAdjusted = !adjustment.isNeutral();
    if (result.performanceAdjusted) {
        result.adjustmentDetails = adjustment;
    }

    ++totalRejections_;
    ++rejectionCounts_[static_cast<size_t>(reason)];

    reportRejection(request, result, rule);
    return result;
}

void SmartAntiCheat::reportRejection(const SubmitSessionRequest& request,
    const ValidationResult& result, const RuleCheckResult* rule) {

    std::ostringstream line;
    line << "[ANTICHEAT] Session " << request.sessionId
         << " rejected [" << result.reasonString() << "]";
    if (rule) {
        line << " at t=" << rule->timestampMs << "ms"
             << " (" << rule->actualValue << " > " << rule->allowedValue << ")";
    }
    line << " (confidence: " << static_cast<int>(result.confidence * 100) << "%)"
         << (result.performanceAdjusted ? " [adjusted]" : "") << "\n";
    std::cerr << line.str();

    if (onSessionRejected_) {
        onSessionRejected_(request, result);
    }
}

PerformanceAdjustment SmartAntiCheat::getPerformanceAdjustment(
    const PerformanceContext& context) const {
    return PerformanceAdjustmentCalculator::calculate(context, *options_.load());
}

float SmartAntiCheat::calculateConfidence(const SubmitSessionRequest& request,
    const PerformanceContext& context) const {
    return ConfidenceCalculator::calculate(request, context, *options_.load());
}

void SmartAntiCheat::setPerformanceThresholds(const AntiCheatOptions& options) {
    options_.store(options);

    std::ostringstream line;
    line << "[CONFIG] Anti-cheat thresholds replaced"
         << " (speed " << options.baseSpeedTolerance << "x"
         << ", proximity " << options.baseProximityTolerancePx << "px"
         << ", confidence " << options.confidenceThreshold
         << ", adjustment " << (options.performanceAdjustmentEnabled ? "on" : "off") << ")\n";
    std::clog << line.str();
}

AntiCheatOptions SmartAntiCheat::getPerformanceThresholds() const {
    return *options_.load();
}

uint32_t SmartAntiCheat::getRejectionCount(ValidationReason reason) const {
    return rejectionCounts_[static_cast<size_t>(reason)].load();
}

void SmartAntiCheat::resetStatistics() {
    totalValidations_ = 0;
    totalRejections_ = 0;
    for (auto& count : rejectionCounts_) {
        count = 0;
    }
}

} // namespace Security
} // namespace KnutGame
