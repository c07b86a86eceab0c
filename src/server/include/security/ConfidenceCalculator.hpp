#pragma once

#include "security/AntiCheatConfig.hpp"
#include "security/PerformanceContext.hpp"
#include "session/SessionTypes.hpp"

// [SECURITY_AGENT] Aggregate trust score for a session, 0.0 - 1.0
// Independent of rule pass/fail; used as the final gate and for reporting

namespace KnutGame {
namespace Security {

class ConfidenceCalculator {
public:
    // 1 minus the weighted score deficit, the weighted fps deficit below
    // lowFpsThreshold and a penalty per issue severity point
    [[nodiscard]] static float calculate(const SubmitSessionRequest& request,
        const PerformanceContext& context, const AntiCheatOptions& options);

    // Issues stamped after the session ended cannot have affected it and are ignored.
    // Session length is the context's; the request's reported length if the context has none.
    [[nodiscard]] static float issuePenalty(const SubmitSessionRequest& request,
        const PerformanceContext& context);
};

} // namespace Security
} // namespace KnutGame
