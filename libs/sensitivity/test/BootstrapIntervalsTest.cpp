// BootstrapIntervalsTest.cpp
//
// Unit tests for the type-7 quantile and the pivotal / percentile intervals.

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <stdexcept>
#include <vector>

#include "BootstrapIntervals.h"

using namespace qmc_sensitivity;

TEST_CASE("BootstrapIntervals::quantileType7 matches linear interpolation", "[Bootstrap][Quantile]")
{
    const std::vector<double> s = { 5.0, 1.0, 4.0, 2.0, 3.0 };

    REQUIRE(BootstrapIntervals::quantileType7(s, 0.0) == 1.0);
    REQUIRE(BootstrapIntervals::quantileType7(s, 1.0) == 5.0);
    REQUIRE(BootstrapIntervals::quantileType7(s, 0.5) == Catch::Approx(3.0));
    // h = 4 * 0.1 = 0.4 -> 1 + 0.4 * (2 - 1)
    REQUIRE(BootstrapIntervals::quantileType7(s, 0.1) == Catch::Approx(1.4));
    // h = 4 * 0.975 = 3.9 -> 4 + 0.9 * (5 - 4)
    REQUIRE(BootstrapIntervals::quantileType7(s, 0.975) == Catch::Approx(4.9));

    // Input is not reordered
    REQUIRE(s == std::vector<double>{ 5.0, 1.0, 4.0, 2.0, 3.0 });
}

TEST_CASE("BootstrapIntervals::quantileType7 edge sizes", "[Bootstrap][Quantile]")
{
    REQUIRE(BootstrapIntervals::quantileType7({ 2.5 }, 0.025) == 2.5);
    REQUIRE(BootstrapIntervals::quantileType7({ 2.5 }, 0.975) == 2.5);
    REQUIRE(BootstrapIntervals::quantileType7({ 1.0, 3.0 }, 0.25) == Catch::Approx(1.5));
    REQUIRE_THROWS_AS(BootstrapIntervals::quantileType7({}, 0.5), std::invalid_argument);
}

TEST_CASE("BootstrapIntervals::compute pivotal and percentile", "[Bootstrap][Interval]")
{
    // 5 replicates, 2 QoI elements
    EvaluationMatrix reps(5, 2);
    const double col0[] = { 0.1, 0.2, 0.3, 0.4, 0.5 };
    for (std::size_t b = 0; b < 5; ++b)
    {
        reps(b, 0) = col0[b];
        reps(b, 1) = 1.0;
    }
    const std::vector<double> theta = { 0.3, 1.0 };
    const double alpha = 0.5;   // quantiles at 0.25 and 0.75 -> 0.2 and 0.4

    const auto pivotal = BootstrapIntervals::compute(reps, theta, alpha, IntervalMethod::PIVOTAL);
    REQUIRE(pivotal.low[0] == Catch::Approx(2 * 0.3 - 0.4));
    REQUIRE(pivotal.high[0] == Catch::Approx(2 * 0.3 - 0.2));
    REQUIRE(pivotal.low[1] == Catch::Approx(1.0));
    REQUIRE(pivotal.high[1] == Catch::Approx(1.0));

    const auto percentile = BootstrapIntervals::compute(reps, theta, alpha, IntervalMethod::PERCENTILE);
    REQUIRE(percentile.low[0] == Catch::Approx(0.2));
    REQUIRE(percentile.high[0] == Catch::Approx(0.4));
}

TEST_CASE("BootstrapIntervals::compute with one replicate collapses to a point", "[Bootstrap][Interval]")
{
    EvaluationMatrix reps(1, 1);
    reps(0, 0) = 0.35;

    const auto ci = BootstrapIntervals::compute(reps, { 0.3 }, 0.05);
    REQUIRE(ci.low[0] == ci.high[0]);
    REQUIRE(ci.low[0] == Catch::Approx(2 * 0.3 - 0.35));
}

TEST_CASE("BootstrapIntervals::compute rejects bad arguments", "[Bootstrap][Interval][Errors]")
{
    EvaluationMatrix reps(3, 1, 0.5);

    REQUIRE_THROWS_AS(BootstrapIntervals::compute(reps, { 0.5 }, 0.0), ConfigError);
    REQUIRE_THROWS_AS(BootstrapIntervals::compute(reps, { 0.5 }, 1.0), ConfigError);
    REQUIRE_THROWS_AS(BootstrapIntervals::compute(EvaluationMatrix(0, 1), { 0.5 }, 0.05), ConfigError);
    REQUIRE_THROWS_AS(BootstrapIntervals::compute(reps, { 0.5, 0.5 }, 0.05), ShapeError);
}
