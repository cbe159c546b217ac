#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "scenario.hpp"
#include "valuation.hpp"
#include "black_scholes.hpp"
#include "errors.hpp"
#include <stdexcept>
#include <string>

using namespace plantval;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using Catch::Matchers::ContainsSubstring;

namespace {

constexpr double REFERENCE_PV = 12'999'035'439.477345;

ScenarioResultSet evaluate_reference(const ScenarioSet& scenarios = ScenarioSet::defaults()) {
    return evaluate_scenarios(REFERENCE_PV, 8.5e9, 25, 0.07, 0.25, scenarios);
}

} // anonymous namespace

// ============================================================================
// Scenario / ScenarioSet Tests
// ============================================================================

TEST_CASE("Default scenario set in definition order", "[scenario]") {
    ScenarioSet set = ScenarioSet::defaults();

    REQUIRE(set.size() == 4);
    REQUIRE(set.get(0) == Scenario("Low", 0.10));
    REQUIRE(set.get(1) == Scenario("Medium", 0.20));
    REQUIRE(set.get(2) == Scenario("High", 0.40));
    REQUIRE(set.get(3) == Scenario("Optimal", 0.90));
    REQUIRE_NOTHROW(set.validate());
}

TEST_CASE("ScenarioSet add and access", "[scenario]") {
    ScenarioSet set;
    REQUIRE(set.empty());

    set.add(Scenario("Base", 1.0));
    Scenario half("Half", 0.5);
    set.add(half);

    REQUIRE(set.size() == 2);
    REQUIRE(set.get(0).name == "Base");
    REQUIRE(set.get(1).utilisation_rate == 0.5);
    REQUIRE_THROWS_AS(set.get(2), std::out_of_range);

    set.clear();
    REQUIRE(set.empty());
}

TEST_CASE("ScenarioSet validation", "[scenario][error]") {
    SECTION("Full utilisation is allowed") {
        ScenarioSet set{Scenario("Full", 1.0)};
        REQUIRE_NOTHROW(set.validate());
    }

    SECTION("Zero utilisation is rejected") {
        ScenarioSet set{Scenario("Idle", 0.0)};
        REQUIRE_THROWS_AS(set.validate(), InvalidParameterError);
    }

    SECTION("Utilisation above one is rejected") {
        ScenarioSet set{Scenario("Overdrive", 1.2)};
        REQUIRE_THROWS_WITH(set.validate(), ContainsSubstring("Overdrive"));
    }

    SECTION("Duplicate names are rejected") {
        ScenarioSet set{Scenario("Low", 0.1), Scenario("Low", 0.2)};
        REQUIRE_THROWS_WITH(set.validate(), ContainsSubstring("Duplicate"));
    }

    SECTION("Empty names are rejected") {
        ScenarioSet set{Scenario("", 0.5)};
        REQUIRE_THROWS_AS(set.validate(), InvalidParameterError);
    }
}

// ============================================================================
// Scenario Evaluation Tests
// ============================================================================

TEST_CASE("Adjusted present value is base PV times utilisation", "[scenario][evaluation]") {
    ScenarioResultSet results = evaluate_reference();

    REQUIRE(results.size() == 4);
    for (const auto& result : results) {
        REQUIRE(result.adjusted_present_value == REFERENCE_PV * result.utilisation_rate);
    }
    REQUIRE(results.at("Low").adjusted_present_value == REFERENCE_PV * 0.10);
    REQUIRE(results.at("Medium").adjusted_present_value == REFERENCE_PV * 0.20);
    REQUIRE(results.at("High").adjusted_present_value == REFERENCE_PV * 0.40);
    REQUIRE(results.at("Optimal").adjusted_present_value == REFERENCE_PV * 0.90);
}

TEST_CASE("Scenario results keep definition order", "[scenario][evaluation]") {
    ScenarioSet set{Scenario("Zeta", 0.9), Scenario("Alpha", 0.3), Scenario("Mid", 0.6)};
    ScenarioResultSet results = evaluate_reference(set);

    REQUIRE(results.size() == 3);
    REQUIRE(results.get(0).scenario_name == "Zeta");
    REQUIRE(results.get(1).scenario_name == "Alpha");
    REQUIRE(results.get(2).scenario_name == "Mid");
}

TEST_CASE("Scenario option matches direct Black-Scholes pricing", "[scenario][evaluation]") {
    ScenarioResultSet results = evaluate_reference();

    for (const auto& result : results) {
        double direct = black_scholes_call(OptionInputs(
            result.adjusted_present_value, 8.5e9, 0.07, 0.25, 25));
        REQUIRE(result.option_value == direct);
    }
}

TEST_CASE("Option value rises with utilisation", "[scenario][evaluation]") {
    ScenarioResultSet results = evaluate_reference();

    REQUIRE(results.at("Low").option_value < results.at("Medium").option_value);
    REQUIRE(results.at("Medium").option_value < results.at("High").option_value);
    REQUIRE(results.at("High").option_value < results.at("Optimal").option_value);
}

TEST_CASE("Low adoption scenario", "[scenario][e2e]") {
    ScenarioResultSet results = evaluate_reference();
    const ScenarioResult& low = results.at("Low");

    REQUIRE_THAT(low.adjusted_present_value, WithinAbs(1'299'903'543.95, 0.01));
    REQUIRE_THAT(low.option_value, WithinAbs(564'234'565.48, 0.01));
    REQUIRE_THAT(low.npv(), WithinAbs(-7'200'096'456.05, 0.01));
}

TEST_CASE("Optimal adoption scenario", "[scenario][e2e]") {
    ScenarioResultSet results = evaluate_reference();
    const ScenarioResult& optimal = results.at("Optimal");

    REQUIRE_THAT(optimal.adjusted_present_value, WithinAbs(11'699'131'895.53, 0.01));
    REQUIRE_THAT(optimal.option_value, WithinAbs(10'313'593'064.38, 0.01));
    REQUIRE_THAT(optimal.npv(), WithinAbs(3'199'131'895.53, 0.01));
}

TEST_CASE("Scenarios chained from the base valuation", "[scenario][e2e]") {
    ValuationParameters params;
    ValuationResult base = evaluate(params);
    ScenarioResultSet results = evaluate_scenarios(base.present_value, params);

    REQUIRE(results.size() == 4);
    REQUIRE_THAT(results.at("Low").option_value, WithinAbs(564'234'565.48, 0.01));
    REQUIRE_THAT(results.at("Optimal").option_value, WithinAbs(10'313'593'064.38, 0.01));
    REQUIRE(results.at("Medium").initial_investment == params.initial_investment);
}

TEST_CASE("Empty scenario set yields no results", "[scenario][boundary]") {
    ScenarioResultSet results = evaluate_reference(ScenarioSet());
    REQUIRE(results.empty());
}

TEST_CASE("Unknown scenario lookup throws", "[scenario][error]") {
    ScenarioResultSet results = evaluate_reference();
    REQUIRE_FALSE(results.contains("Nominal"));
    REQUIRE(results.contains("High"));
    REQUIRE_THROWS_AS(results.at("Nominal"), std::out_of_range);
}

// ============================================================================
// Failure Propagation Tests
// ============================================================================

TEST_CASE("Non-positive base PV aborts the batch naming the scenario", "[scenario][error]") {
    REQUIRE_THROWS_AS(evaluate_scenarios(-1.0e9, 8.5e9, 25, 0.07, 0.25), ScenarioEvaluationError);

    try {
        evaluate_scenarios(-1.0e9, 8.5e9, 25, 0.07, 0.25);
        FAIL("Expected ScenarioEvaluationError");
    } catch (const ScenarioEvaluationError& e) {
        // First scenario in definition order is reported
        REQUIRE(e.scenario_name() == "Low");
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("Low"));
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("Black-Scholes"));
    }
}

TEST_CASE("Scenario failures are Black-Scholes errors", "[scenario][error]") {
    REQUIRE_THROWS_AS(evaluate_scenarios(0.0, 8.5e9, 25, 0.07, 0.25), BlackScholesError);
    REQUIRE_THROWS_AS(evaluate_scenarios(REFERENCE_PV, 8.5e9, 0, 0.07, 0.25), BlackScholesError);
}

TEST_CASE("Invalid scenario set is rejected before pricing", "[scenario][error]") {
    ScenarioSet set{Scenario("Low", 0.1), Scenario("Broken", -0.5)};
    REQUIRE_THROWS_AS(evaluate_reference(set), InvalidParameterError);
}
