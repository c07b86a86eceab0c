// [SECURITY_AGENT] Unit tests for the item pickup distance check

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "security/ProximityValidator.hpp"
#include "SessionFixtures.hpp"
#include <vector>

using namespace KnutGame;
using namespace KnutGame::Security;
using namespace KnutGame::Testing;

namespace {

RuleCheckResult checkProximity(const std::vector<ItemEvent>& items, const PerformanceContext& context,
    const AntiCheatOptions& options = AntiCheatOptions{}) {
    auto adjustment = PerformanceAdjustmentCalculator::calculate(context, options);
    return ProximityValidator::validate(steadySession().events.moves, items, context, adjustment, options);
}

} // namespace

TEST_CASE("Expected player position", "[proximity]") {
    const auto moves = steadySession().events.moves;

    SECTION("Interpolates between bracketing moves") {
        auto x = ProximityValidator::expectedPlayerX(moves, 1500);
        REQUIRE(x.has_value());
        REQUIRE(*x == Catch::Approx(415.0f));
    }

    SECTION("Exact timestamp uses that move") {
        REQUIRE(*ProximityValidator::expectedPlayerX(moves, 1000) == Catch::Approx(410.0f));
    }

    SECTION("Uses the single available side at the edges") {
        std::vector<MoveEvent> late = {{1000, 410.0f}, {2000, 420.0f}};
        REQUIRE(*ProximityValidator::expectedPlayerX(late, 500) == Catch::Approx(410.0f));
        REQUIRE(*ProximityValidator::expectedPlayerX(late, 5000) == Catch::Approx(420.0f));
    }

    SECTION("Timestamps near the integer limits interpolate without overflow") {
        std::vector<MoveEvent> wide = {{-2000000000, 0.0f}, {2000000000, 100.0f}};
        REQUIRE(*ProximityValidator::expectedPlayerX(wide, 0) == Catch::Approx(50.0f));
        REQUIRE(*ProximityValidator::expectedPlayerX(wide, 1000000000) == Catch::Approx(75.0f));
    }

    SECTION("No moves gives no position") {
        REQUIRE_FALSE(ProximityValidator::expectedPlayerX({}, 1500).has_value());
    }
}

TEST_CASE("Proximity check without performance context", "[proximity]") {
    const PerformanceContext neutral = PerformanceContext::neutral();

    SECTION("Nearby pickup passes") {
        REQUIRE_FALSE(checkProximity(steadySession().events.items, neutral).violated);
    }

    SECTION("Far pickup is rejected as ProximityExceeded") {
        auto result = checkProximity({item(1500, "far", 500.0f)}, neutral);

        REQUIRE(result.violated);
        REQUIRE(result.reason == ValidationReason::PROXIMITY_EXCEEDED);
        REQUIRE(result.actualValue == Catch::Approx(85.0f));
        REQUIRE(result.allowedValue == Catch::Approx(48.0f));
    }

    SECTION("Vertical offset is ignored") {
        REQUIRE_FALSE(checkProximity({item(1500, "high", 415.0f, 10.0f)}, neutral).violated);
    }

    SECTION("No moves means nothing to compare") {
        AntiCheatOptions options;
        auto result = ProximityValidator::validate({}, {item(1500, "far", 790.0f)}, neutral,
            PerformanceAdjustment::neutral(), options);
        REQUIRE_FALSE(result.violated);
    }

    SECTION("Stops at the first offending item") {
        auto result = checkProximity(
            {item(500, "ok", 405.0f), item(1500, "far", 500.0f), item(2500, "farther", 600.0f)}, neutral);
        REQUIRE(result.violated);
        REQUIRE(result.timestampMs == 1500);
    }
}

TEST_CASE("Proximity leniency near performance issues", "[proximity]") {
    AntiCheatOptions options;

    SECTION("Nearby issue weight covers the extended issue span") {
        const PerformanceContext context = poorContext();
        REQUIRE(ProximityValidator::nearbyIssueWeight(context, 1100, 0.0f) == Catch::Approx(2.0f));
        REQUIRE(ProximityValidator::nearbyIssueWeight(context, 2100, 0.0f) == Catch::Approx(3.0f));
        REQUIRE(ProximityValidator::nearbyIssueWeight(context, 5000, 0.0f) == 0.0f);
        REQUIRE(ProximityValidator::nearbyIssueWeight(context, 900, 150.0f) == Catch::Approx(2.0f));
    }

    SECTION("Distant pickup passes under memory pressure but not on a good client") {
        const ItemEvent far = item(1500, "far", 500.0f);

        auto lenient = PerformanceAdjustmentCalculator::calculate(memoryPressureContext(), options);
        REQUIRE(lenient.proximityToleranceMultiplier > 1.0f);
        REQUIRE_FALSE(checkProximity({far}, memoryPressureContext()).violated);

        PerformanceContext perfect = goodContext();
        perfect.performanceScore = 100;
        auto strict = checkProximity({far}, perfect);
        REQUIRE(strict.violated);
        REQUIRE(strict.reason == ValidationReason::PROXIMITY_EXCEEDED);

        auto slightlyAdjusted = checkProximity({far}, goodContext());
        REQUIRE(slightlyAdjusted.violated);
        REQUIRE(slightlyAdjusted.reason == ValidationReason::DYNAMIC_PROXIMITY_EXCEEDED);
    }

    SECTION("Extreme deviations hit the proximity ceiling") {
        REQUIRE(ProximityValidator::proximityCeiling(options) == Catch::Approx(108.0f));

        auto result = checkProximity({item(1500, "teleported", 700.0f)}, extremeContext());
        REQUIRE(result.violated);
        REQUIRE(result.reason == ValidationReason::DYNAMIC_PROXIMITY_EXCEEDED);
        REQUIRE(result.allowedValue <= ProximityValidator::proximityCeiling(options));
    }
}

TEST_CASE("Worse context never fails a pickup that passed without one", "[proximity]") {
    // Exactly at the 48px base tolerance
    const std::vector<ItemEvent> items = {item(1500, "edge", 463.0f), item(2500, "edge-2", 377.0f)};

    REQUIRE_FALSE(checkProximity(items, PerformanceContext::neutral()).violated);
    REQUIRE_FALSE(checkProximity(items, goodContext()).violated);
    REQUIRE_FALSE(checkProximity(items, poorContext()).violated);
    REQUIRE_FALSE(checkProximity(items, memoryPressureContext()).violated);
    REQUIRE_FALSE(checkProximity(items, extremeContext()).violated);
}
