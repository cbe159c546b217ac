#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "black_scholes.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

using namespace plantval;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using Catch::Matchers::ContainsSubstring;

// ============================================================================
// Normal CDF Tests
// ============================================================================

TEST_CASE("Normal CDF reference values", "[black_scholes][cdf]") {
    REQUIRE_THAT(norm_cdf(0.0), WithinAbs(0.5, 1e-15));
    REQUIRE_THAT(norm_cdf(1.0), WithinAbs(0.8413447460685429, 1e-12));
    REQUIRE_THAT(norm_cdf(-1.0), WithinAbs(0.15865525393145707, 1e-12));
    REQUIRE_THAT(norm_cdf(1.959963984540054), WithinAbs(0.975, 1e-12));
    REQUIRE_THAT(norm_cdf(-3.0), WithinAbs(0.0013498980316301035, 1e-14));
}

TEST_CASE("Normal CDF is symmetric and bounded", "[black_scholes][cdf]") {
    for (double x = -8.0; x <= 8.0; x += 0.25) {
        double p = norm_cdf(x);
        REQUIRE(p >= 0.0);
        REQUIRE(p <= 1.0);
        REQUIRE_THAT(p + norm_cdf(-x), WithinAbs(1.0, 1e-14));
    }
}

// ============================================================================
// Black-Scholes Call Tests
// ============================================================================

TEST_CASE("Black-Scholes call matches textbook value", "[black_scholes]") {
    // S=100, K=100, r=5%, sigma=20%, T=1 -> 10.4506
    OptionInputs inputs(100.0, 100.0, 0.05, 0.20, 1);
    REQUIRE_THAT(black_scholes_call(inputs), WithinAbs(10.450583572185565, 1e-9));

    BlackScholesTerms terms = black_scholes_terms(inputs);
    REQUIRE_THAT(terms.d1, WithinAbs(0.35, 1e-12));
    REQUIRE_THAT(terms.d2, WithinAbs(0.15, 1e-12));
}

TEST_CASE("Black-Scholes call respects no-arbitrage bounds", "[black_scholes]") {
    for (double pv : {10.0, 50.0, 100.0, 200.0, 1000.0}) {
        OptionInputs inputs(pv, 100.0, 0.07, 0.25, 10);
        double call = black_scholes_call(inputs);
        double lower = std::max(0.0, pv - 100.0 * std::exp(-0.07 * 10.0));

        REQUIRE(call >= lower - 1e-9);
        REQUIRE(call <= pv);
    }
}

TEST_CASE("Call value is non-decreasing in volatility", "[black_scholes]") {
    double previous = 0.0;
    for (double vol = 0.01; vol < 1.0; vol += 0.01) {
        double call = black_scholes_call(OptionInputs(12'999'035'439.48, 8.5e9, 0.07, vol, 25));
        REQUIRE(call >= previous);
        previous = call;
    }
}

// ============================================================================
// Domain Error Tests
// ============================================================================

TEST_CASE("Non-positive present value raises a Black-Scholes error", "[black_scholes][error]") {
    REQUIRE_THROWS_AS(black_scholes_call(OptionInputs(0.0, 100.0, 0.05, 0.2, 5)),
                      BlackScholesError);
    REQUIRE_THROWS_AS(black_scholes_call(OptionInputs(-1.0, 100.0, 0.05, 0.2, 5)),
                      BlackScholesError);
    REQUIRE_THROWS_WITH(black_scholes_call(OptionInputs(-1.0, 100.0, 0.05, 0.2, 5)),
                        ContainsSubstring("Black-Scholes"));
}

TEST_CASE("Non-positive maturity raises a Black-Scholes error", "[black_scholes][error]") {
    REQUIRE_THROWS_AS(black_scholes_call(OptionInputs(100.0, 100.0, 0.05, 0.2, 0)),
                      BlackScholesError);
    REQUIRE_THROWS_WITH(black_scholes_call(OptionInputs(100.0, 100.0, 0.05, 0.2, 0)),
                        ContainsSubstring("time to maturity"));
}

TEST_CASE("Black-Scholes error is a domain error", "[black_scholes][error]") {
    REQUIRE_THROWS_AS(black_scholes_call(OptionInputs(0.0, 100.0, 0.05, 0.2, 5)),
                      std::domain_error);
}

TEST_CASE("Raw terms report plain domain errors", "[black_scholes][error]") {
    REQUIRE_THROWS_AS(black_scholes_terms(OptionInputs(0.0, 100.0, 0.05, 0.2, 5)),
                      std::domain_error);
    REQUIRE_THROWS_AS(black_scholes_terms(OptionInputs(100.0, 100.0, 0.05, 0.0, 5)),
                      std::domain_error);
}
