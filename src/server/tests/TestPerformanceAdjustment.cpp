// [PERFORMANCE_AGENT] Unit tests for performance-based rule leniency

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "security/PerformanceAdjustment.hpp"
#include "SessionFixtures.hpp"

using namespace KnutGame;
using namespace KnutGame::Security;
using namespace KnutGame::Testing;

TEST_CASE("Adjustment follows client performance", "[adjustment]") {
    AntiCheatOptions options;

    SECTION("Good performance stays close to neutral") {
        auto adjustment = PerformanceAdjustmentCalculator::calculate(goodContext(), options);

        REQUIRE(adjustment.speedToleranceMultiplier == Catch::Approx(1.0f).margin(0.05f));
        REQUIRE(adjustment.proximityToleranceMultiplier == Catch::Approx(1.0f).margin(0.05f));
        REQUIRE(adjustment.timeWindowExtensionMs == Catch::Approx(0.0f).margin(1.0f));
        REQUIRE(adjustment.stutterToleranceMs == Catch::Approx(options.stutterToleranceMs));
    }

    SECTION("Healthy client with a perfect score is exactly neutral") {
        PerformanceContext perfect;
        perfect.performanceScore = 100;

        auto adjustment = PerformanceAdjustmentCalculator::calculate(perfect, options);
        REQUIRE(adjustment.isNeutral());
        REQUIRE(adjustment.speedToleranceMultiplier == 1.0f);
        REQUIRE(adjustment.proximityToleranceMultiplier == 1.0f);
    }

    SECTION("Poor performance widens every tolerance") {
        auto adjustment = PerformanceAdjustmentCalculator::calculate(poorContext(), options);

        REQUIRE(adjustment.speedToleranceMultiplier > 1.2f);
        REQUIRE(adjustment.proximityToleranceMultiplier > 1.1f);
        REQUIRE(adjustment.timeWindowExtensionMs > 50.0f);
        REQUIRE(adjustment.stutterToleranceMs > 100.0f);
        REQUIRE_FALSE(adjustment.isNeutral());
    }

    SECTION("Extreme performance saturates at the caps") {
        auto adjustment = PerformanceAdjustmentCalculator::calculate(extremeContext(), options);

        REQUIRE(adjustment.speedToleranceMultiplier == Catch::Approx(options.maxSpeedMultiplier));
        REQUIRE(adjustment.proximityToleranceMultiplier == Catch::Approx(options.maxProximityMultiplier));
        REQUIRE(adjustment.timeWindowExtensionMs == Catch::Approx(options.maxTimeWindowExtensionMs));
        REQUIRE(adjustment.stutterToleranceMs ==
            Catch::Approx(options.stutterToleranceMs + options.maxTimeWindowExtensionMs));
    }
}

TEST_CASE("Adjustment caps and disabling", "[adjustment]") {
    AntiCheatOptions options;

    SECTION("Caps hold for any extreme context") {
        PerformanceContext worst = extremeContext();
        worst.averageFps = 0.0f;
        worst.performanceScore = 0;
        for (int i = 0; i < 100; ++i) {
            worst.issues.push_back(issue(PerformanceIssueKind::MEMORY_PRESSURE,
                IssueSeverity::HIGH, i * 10, 5000.0f));
        }

        auto adjustment = PerformanceAdjustmentCalculator::calculate(worst, options);
        REQUIRE(adjustment.speedToleranceMultiplier <= 2.0f);
        REQUIRE(adjustment.proximityToleranceMultiplier <= 1.8f);
        REQUIRE(adjustment.timeWindowExtensionMs <= 500.0f);
    }

    SECTION("Custom caps are respected") {
        options.maxSpeedMultiplier = 1.5f;
        options.maxProximityMultiplier = 1.2f;
        options.maxTimeWindowExtensionMs = 100.0f;

        auto adjustment = PerformanceAdjustmentCalculator::calculate(extremeContext(), options);
        REQUIRE(adjustment.speedToleranceMultiplier == Catch::Approx(1.5f));
        REQUIRE(adjustment.proximityToleranceMultiplier == Catch::Approx(1.2f));
        REQUIRE(adjustment.timeWindowExtensionMs == Catch::Approx(100.0f));
        REQUIRE(adjustment.stutterToleranceMs == Catch::Approx(200.0f));
    }

    SECTION("Disabled adjustment ignores the context entirely") {
        options.performanceAdjustmentEnabled = false;

        for (const auto& context : {goodContext(), poorContext(), extremeContext()}) {
            auto adjustment = PerformanceAdjustmentCalculator::calculate(context, options);
            REQUIRE(adjustment.speedToleranceMultiplier == 1.0f);
            REQUIRE(adjustment.proximityToleranceMultiplier == 1.0f);
            REQUIRE(adjustment.timeWindowExtensionMs == 0.0f);
            REQUIRE(adjustment.stutterToleranceMs == 0.0f);
        }
    }
}

TEST_CASE("Adjustment is monotonic in context severity", "[adjustment]") {
    AntiCheatOptions options;

    auto good = PerformanceAdjustmentCalculator::calculate(goodContext(), options);
    auto poor = PerformanceAdjustmentCalculator::calculate(poorContext(), options);
    auto extreme = PerformanceAdjustmentCalculator::calculate(extremeContext(), options);

    REQUIRE(poor.speedToleranceMultiplier >= good.speedToleranceMultiplier);
    REQUIRE(extreme.speedToleranceMultiplier >= poor.speedToleranceMultiplier);
    REQUIRE(poor.proximityToleranceMultiplier >= good.proximityToleranceMultiplier);
    REQUIRE(extreme.proximityToleranceMultiplier >= poor.proximityToleranceMultiplier);
    REQUIRE(poor.timeWindowExtensionMs >= good.timeWindowExtensionMs);
    REQUIRE(extreme.timeWindowExtensionMs >= poor.timeWindowExtensionMs);
    REQUIRE(poor.stutterToleranceMs >= good.stutterToleranceMs);
    REQUIRE(extreme.stutterToleranceMs >= poor.stutterToleranceMs);

    SECTION("Adding an issue never shrinks the adjustment") {
        PerformanceContext worse = poorContext();
        worse.issues.push_back(issue(PerformanceIssueKind::LOW_FPS, IssueSeverity::LOW, 2800, 50.0f));

        auto worseAdjustment = PerformanceAdjustmentCalculator::calculate(worse, options);
        REQUIRE(worseAdjustment.speedToleranceMultiplier >= poor.speedToleranceMultiplier);
        REQUIRE(worseAdjustment.proximityToleranceMultiplier >= poor.proximityToleranceMultiplier);
        REQUIRE(worseAdjustment.timeWindowExtensionMs >= poor.timeWindowExtensionMs);
        REQUIRE(worseAdjustment.stutterToleranceMs >= poor.stutterToleranceMs);
    }
}

TEST_CASE("Adjustment deficit terms", "[adjustment]") {
    AntiCheatOptions options;

    SECTION("FPS deficit counts only below the threshold") {
        PerformanceContext context;
        context.averageFps = 45.0f;
        REQUIRE(PerformanceAdjustmentCalculator::fpsDeficitTerm(context, options) == 0.0f);

        context.averageFps = 15.0f;
        REQUIRE(PerformanceAdjustmentCalculator::fpsDeficitTerm(context, options) ==
            Catch::Approx(0.25f));

        context.averageFps = 0.0f;
        REQUIRE(PerformanceAdjustmentCalculator::fpsDeficitTerm(context, options) ==
            Catch::Approx(0.5f));
    }

    SECTION("Score deficit scales with the missing points") {
        PerformanceContext context;
        context.performanceScore = 40;
        REQUIRE(PerformanceAdjustmentCalculator::scoreDeficitTerm(context) == Catch::Approx(0.24f));

        context.performanceScore = 150;
        REQUIRE(PerformanceAdjustmentCalculator::scoreDeficitTerm(context) == 0.0f);
    }

    SECTION("Issue density sums severity weights") {
        PerformanceContext context;
        context.issues = {
            issue(PerformanceIssueKind::STUTTER, IssueSeverity::LOW, 100, 10.0f),
            issue(PerformanceIssueKind::LOW_FPS, IssueSeverity::MEDIUM, 200, 10.0f),
            issue(PerformanceIssueKind::MEMORY_PRESSURE, IssueSeverity::HIGH, 300, 10.0f)
        };
        REQUIRE(context.totalIssueWeight() == Catch::Approx(6.0f));
        REQUIRE(PerformanceAdjustmentCalculator::issueDensityTerm(context) == Catch::Approx(0.3f));
    }

    SECTION("Memory pressure widens proximity only") {
        PerformanceContext context;
        context.performanceScore = 100;
        context.memoryPressureLevel = 5;

        auto adjustment = PerformanceAdjustmentCalculator::calculate(context, options);
        REQUIRE(adjustment.speedToleranceMultiplier == 1.0f);
        REQUIRE(adjustment.proximityToleranceMultiplier == Catch::Approx(1.3f));
        REQUIRE(PerformanceAdjustmentCalculator::memoryPressureTerm(context) == Catch::Approx(0.3f));
    }
}

TEST_CASE("Adjustment is pure", "[adjustment]") {
    AntiCheatOptions options;
    const PerformanceContext context = poorContext();

    auto first = PerformanceAdjustmentCalculator::calculate(context, options);
    auto second = PerformanceAdjustmentCalculator::calculate(context, options);

    REQUIRE(first.speedToleranceMultiplier == second.speedToleranceMultiplier);
    REQUIRE(first.proximityToleranceMultiplier == second.proximityToleranceMultiplier);
    REQUIRE(first.timeWindowExtensionMs == second.timeWindowExtensionMs);
    REQUIRE(first.stutterToleranceMs == second.stutterToleranceMs);
    REQUIRE(context.issues.size() == poorContext().issues.size());
}
