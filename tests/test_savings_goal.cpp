#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "savings_goal.hpp"
#include "logger.hpp"
#include <cmath>

using namespace fincalc;
using Catch::Matchers::WithinAbs;

namespace {

void quiet_logger() {
    LoggerConfig config;
    config.enable_console = false;
    Logger::get_instance().configure(config);
}

} // anonymous namespace

// ============================================================================
// balance_at
// ============================================================================

TEST_CASE("Balance at time zero is the initial principal", "[savings]") {
    SavingsGoalEstimator estimator(2500.0, 100.0, 0.05, 10000.0);
    REQUIRE(estimator.balance_at(0.0) == 2500.0);
    REQUIRE(estimator.balance_at(-3.0) == 2500.0);
}

TEST_CASE("Balance with interest and contributions", "[savings]") {
    SavingsGoalEstimator estimator(1000.0, 100.0, 0.05, 1e6);

    // 1000 * 1.05^2 + 100 * (1.05^2 - 1) / 0.05
    REQUIRE_THAT(estimator.balance_at(2.0), WithinAbs(1102.5 + 205.0, 1e-9));
}

TEST_CASE("Zero rate uses the linear contribution term", "[savings]") {
    SavingsGoalEstimator estimator(500.0, 100.0, 0.0, 1e6);
    REQUIRE_THAT(estimator.balance_at(7.5), WithinAbs(500.0 + 750.0, 1e-9));

    SavingsGoalEstimator tiny_rate(500.0, 100.0, 1e-12, 1e6);
    REQUIRE_THAT(tiny_rate.balance_at(7.5), WithinAbs(1250.0, 1e-6));
}

TEST_CASE("Balance is non-decreasing over time", "[savings]") {
    SavingsGoalEstimator estimator(1000.0, 250.0, 0.03, 1e6);
    double previous = estimator.balance_at(0.0);
    for (int step = 1; step <= 200; ++step) {
        double current = estimator.balance_at(step * 0.25);
        REQUIRE(current >= previous);
        previous = current;
    }
}

// ============================================================================
// time_to_reach_target
// ============================================================================

TEST_CASE("Target already met returns zero", "[savings]") {
    quiet_logger();
    SavingsGoalEstimator estimator(5000.0, 0.0, 0.0, 5000.0);
    SavingsEstimate result = estimator.estimate();

    REQUIRE(result.time == 0.0);
    REQUIRE(result.final_balance == 5000.0);
    REQUIRE(result.iterations == 0);
    REQUIRE(estimator.time_to_reach_target() == 0.0);
}

TEST_CASE("Linear growth reaches the target at deficit over contribution", "[savings]") {
    quiet_logger();
    SavingsGoalEstimator estimator(0.0, 100.0, 0.0, 1000.0);
    REQUIRE_THAT(estimator.time_to_reach_target(), WithinAbs(10.0, 0.1));
}

TEST_CASE("Pure compounding approaches the doubling time", "[savings]") {
    quiet_logger();
    SavingsGoalEstimator estimator(1000.0, 0.0, 0.05, 2000.0);
    double exact = std::log(2.0) / std::log(1.05);

    double t = estimator.time_to_reach_target();
    REQUIRE(t > 13.0);
    REQUIRE(t < 15.0);
    REQUIRE(t >= exact);
    REQUIRE(t - exact <= SavingsParameters::DEFAULT_PRECISION);
}

TEST_CASE("Reference scenario lands between eight and ten periods", "[savings][regression]") {
    quiet_logger();
    SavingsGoalEstimator estimator(0.0, 1000.0, 0.05, 10000.0);
    SavingsEstimate result = estimator.estimate();

    REQUIRE(result.time > 8.0);
    REQUIRE(result.time < 10.0);
    REQUIRE(result.final_balance >= 10000.0);
    REQUIRE(result.iterations > 0);
    REQUIRE(format_years_and_months(result.time) == "8 years and 4 months");
}

TEST_CASE("Estimate brackets the target within the precision", "[savings]") {
    quiet_logger();
    SavingsParameters params(5000.0, 200.0, 0.04, 20000.0, 0.001);
    SavingsGoalEstimator estimator(params);
    SavingsEstimate result = estimator.estimate();

    REQUIRE(estimator.balance_at(result.time) >= 20000.0);
    REQUIRE(estimator.balance_at(result.time - params.precision) < 20000.0);
}

TEST_CASE("Finer precision takes more iterations", "[savings]") {
    quiet_logger();
    SavingsGoalEstimator coarse(SavingsParameters(0.0, 1000.0, 0.05, 10000.0));
    SavingsGoalEstimator fine(SavingsParameters(0.0, 1000.0, 0.05, 10000.0, 0.001));

    SavingsEstimate coarse_result = coarse.estimate();
    SavingsEstimate fine_result = fine.estimate();

    REQUIRE(fine_result.iterations > coarse_result.iterations);
    REQUIRE(fine_result.time <= coarse_result.time);
}

TEST_CASE("Repeated estimates are identical", "[savings]") {
    quiet_logger();
    SavingsGoalEstimator estimator(1200.0, 300.0, 0.06, 25000.0);
    REQUIRE(estimator.time_to_reach_target() == estimator.time_to_reach_target());
}

TEST_CASE("Higher rate or contribution shortens the time", "[savings]") {
    quiet_logger();
    double base = SavingsGoalEstimator(0.0, 1000.0, 0.05, 10000.0).time_to_reach_target();
    double faster_rate = SavingsGoalEstimator(0.0, 1000.0, 0.10, 10000.0).time_to_reach_target();
    double bigger_contribution = SavingsGoalEstimator(0.0, 2000.0, 0.05, 10000.0).time_to_reach_target();

    REQUIRE(faster_rate < base);
    REQUIRE(bigger_contribution < base);
}

TEST_CASE("Long horizons beyond the minimum bound are found", "[savings]") {
    quiet_logger();
    // Interest-only growth from 1 to 1e6 at 1% takes about 1388 periods
    SavingsGoalEstimator estimator(1.0, 0.0, 0.01, 1e6);
    double t = estimator.time_to_reach_target();
    REQUIRE(t > 1388.0);
    REQUIRE(t < 1389.0);
}

TEST_CASE("Linear growth with the documented reference values", "[savings]") {
    quiet_logger();
    SavingsGoalEstimator estimator(0.0, 1000.0, 0.0, 10000.0);
    REQUIRE_THAT(estimator.time_to_reach_target(), WithinAbs(10.0, 0.1));
}

TEST_CASE("Precision finer than double spacing still terminates", "[savings]") {
    quiet_logger();
    SavingsParameters params(0.0, 1000.0, 0.05, 10000.0, 1e-20);
    SavingsGoalEstimator estimator(params);
    SavingsEstimate result = estimator.estimate();

    REQUIRE(estimator.balance_at(result.time) >= 10000.0);
    REQUIRE(result.time > 8.0);
    REQUIRE(result.time < 9.0);
    REQUIRE(result.iterations < 200);
}

TEST_CASE("Tiny rate with the default precision terminates", "[savings]") {
    quiet_logger();
    // The answer is near 6.2e14, where doubles are 0.125 apart
    SavingsParameters params(1000.0, 0.0, 1e-15, 2000.0);
    SavingsGoalEstimator estimator(params);
    SavingsEstimate result = estimator.estimate();

    REQUIRE(estimator.balance_at(result.time) >= 2000.0);
    REQUIRE(result.time > 1e14);
    REQUIRE(result.iterations < 200);
}

// ============================================================================
// Error handling
// ============================================================================

TEST_CASE("Goal is unreachable without contributions or interest", "[savings][error]") {
    quiet_logger();
    SavingsGoalEstimator estimator(100.0, 0.0, 0.0, 1000.0);
    REQUIRE_THROWS_AS(estimator.time_to_reach_target(), UnreachableGoalError);
}

TEST_CASE("Documented unreachable case throws", "[savings][error]") {
    quiet_logger();
    SavingsGoalEstimator estimator(1000.0, 0.0, 0.0, 5000.0);
    REQUIRE_THROWS_AS(estimator.time_to_reach_target(), UnreachableGoalError);
}

TEST_CASE("Goal is unreachable with interest but nothing to compound", "[savings][error]") {
    quiet_logger();
    SavingsGoalEstimator estimator(0.0, 0.0, 0.05, 1000.0);
    REQUIRE_THROWS_AS(estimator.estimate(), UnreachableGoalError);
}

TEST_CASE("Shrinking balance is unreachable within the horizon", "[savings][error]") {
    quiet_logger();
    // Contributions are outpaced by a negative rate
    SavingsGoalEstimator estimator(1000.0, 10.0, -0.05, 5000.0);
    REQUIRE_THROWS_AS(estimator.estimate(), UnreachableGoalError);
}

TEST_CASE("Invalid estimator parameters are rejected", "[savings][error]") {
    REQUIRE_THROWS_AS(SavingsGoalEstimator(SavingsParameters(0.0, 100.0, 0.05, 1000.0, 0.0)),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(SavingsGoalEstimator(SavingsParameters(0.0, 100.0, 0.05, 1000.0, -1.0)),
                      std::invalid_argument);
    REQUIRE_THROWS_AS(SavingsGoalEstimator(0.0, 100.0, -1.0, 1000.0), std::invalid_argument);
}

// ============================================================================
// format_years_and_months
// ============================================================================

TEST_CASE("Durations format as years and months", "[savings][format]") {
    REQUIRE(format_years_and_months(5.0) == "5 years");
    REQUIRE(format_years_and_months(5.5) == "5 years and 6 months");
    REQUIRE(format_years_and_months(0.25) == "3 months");
    REQUIRE(format_years_and_months(0.0) == "0 months");
    REQUIRE(format_years_and_months(2.99) == "3 years");
}
