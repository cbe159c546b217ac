#include "scenario.hpp"
#include "black_scholes.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <chrono>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>

namespace plantval {

// ============================================================================
// Scenario Implementation
// ============================================================================

Scenario::Scenario() : utilisation_rate(1.0) {}

Scenario::Scenario(std::string scenario_name, double rate)
    : name(std::move(scenario_name)), utilisation_rate(rate) {}

bool Scenario::operator==(const Scenario& other) const {
    return name == other.name && utilisation_rate == other.utilisation_rate;
}

// ============================================================================
// ScenarioSet Implementation
// ============================================================================

ScenarioSet::ScenarioSet() = default;

ScenarioSet::ScenarioSet(std::initializer_list<Scenario> scenarios)
    : scenarios_(scenarios) {}

void ScenarioSet::add(const Scenario& scenario) {
    scenarios_.push_back(scenario);
}

void ScenarioSet::add(Scenario&& scenario) {
    scenarios_.push_back(std::move(scenario));
}

const Scenario& ScenarioSet::get(size_t index) const {
    if (index >= scenarios_.size()) {
        throw std::out_of_range("Scenario index out of range");
    }
    return scenarios_[index];
}

size_t ScenarioSet::size() const {
    return scenarios_.size();
}

bool ScenarioSet::empty() const {
    return scenarios_.empty();
}

void ScenarioSet::reserve(size_t count) {
    scenarios_.reserve(count);
}

void ScenarioSet::clear() {
    scenarios_.clear();
}

void ScenarioSet::validate() const {
    std::set<std::string> seen;
    for (const auto& scenario : scenarios_) {
        if (scenario.name.empty()) {
            throw InvalidParameterError("Scenario name must not be empty");
        }
        if (!seen.insert(scenario.name).second) {
            throw InvalidParameterError("Duplicate scenario name: " + scenario.name);
        }
        if (!(scenario.utilisation_rate > 0.0 && scenario.utilisation_rate <= 1.0)) {
            throw InvalidParameterError("Scenario '" + scenario.name +
                                        "': utilisation_rate must be in (0, 1] (got " +
                                        std::to_string(scenario.utilisation_rate) + ")");
        }
    }
}

ScenarioSet ScenarioSet::defaults() {
    return ScenarioSet{
        Scenario("Low", 0.10),
        Scenario("Medium", 0.20),
        Scenario("High", 0.40),
        Scenario("Optimal", 0.90)
    };
}

// ============================================================================
// ScenarioResult Implementation
// ============================================================================

ScenarioResult::ScenarioResult()
    : utilisation_rate(0.0),
      adjusted_present_value(0.0),
      option_value(0.0),
      initial_investment(0.0) {}

ScenarioResult::ScenarioResult(const std::string& name, double rate, double adjusted_pv,
                               double option, double investment)
    : scenario_name(name),
      utilisation_rate(rate),
      adjusted_present_value(adjusted_pv),
      option_value(option),
      initial_investment(investment) {}

// ============================================================================
// ScenarioResultSet Implementation
// ============================================================================

void ScenarioResultSet::add(ScenarioResult&& result) {
    results_.push_back(std::move(result));
}

const ScenarioResult& ScenarioResultSet::at(const std::string& scenario_name) const {
    for (const auto& result : results_) {
        if (result.scenario_name == scenario_name) {
            return result;
        }
    }
    throw std::out_of_range("No result for scenario: " + scenario_name);
}

bool ScenarioResultSet::contains(const std::string& scenario_name) const {
    for (const auto& result : results_) {
        if (result.scenario_name == scenario_name) {
            return true;
        }
    }
    return false;
}

const ScenarioResult& ScenarioResultSet::get(size_t index) const {
    if (index >= results_.size()) {
        throw std::out_of_range("Scenario result index out of range");
    }
    return results_[index];
}

size_t ScenarioResultSet::size() const {
    return results_.size();
}

bool ScenarioResultSet::empty() const {
    return results_.empty();
}

void ScenarioResultSet::reserve(size_t count) {
    results_.reserve(count);
}

// ============================================================================
// Scenario Evaluation
// ============================================================================

ScenarioResultSet evaluate_scenarios(
    double base_present_value,
    double initial_investment,
    int time_to_maturity,
    double discount_rate,
    double volatility,
    const ScenarioSet& scenarios)
{
    Logger& logger = Logger::get_instance();
    LogContext ctx("scenarios", "scenario_evaluation");

    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        scenarios.validate();
    } catch (const InvalidParameterError& e) {
        logger.log_error(ctx, e.what());
        throw;
    }

    const size_t count = scenarios.size();
    std::vector<ScenarioResult> slots(count);
    std::vector<std::string> failures(count);
    std::vector<char> failed(count, 0);

    // Each scenario is independent; results land in pre-sized slots so the
    // output order matches definition order whether or not the loop runs in parallel
#ifdef HAVE_OPENMP
    #pragma omp parallel for schedule(static)
#endif
    for (size_t i = 0; i < count; ++i) {
        const Scenario& scenario = scenarios.get(i);
        ScenarioResult& result = slots[i];
        result.scenario_name = scenario.name;
        result.utilisation_rate = scenario.utilisation_rate;
        result.initial_investment = initial_investment;
        result.adjusted_present_value = base_present_value * scenario.utilisation_rate;

        try {
            result.option_value = black_scholes_call(OptionInputs(
                result.adjusted_present_value, initial_investment, discount_rate,
                volatility, time_to_maturity));
        } catch (const BlackScholesError& e) {
            failures[i] = e.what();
            failed[i] = 1;
        }
    }

    // Surface the first failure in definition order
    for (size_t i = 0; i < count; ++i) {
        if (failed[i]) {
            ScenarioEvaluationError error(slots[i].scenario_name, failures[i]);
            LogContext failed_ctx = ctx;
            failed_ctx.scenario = slots[i].scenario_name;
            logger.log_error(failed_ctx, error.what());
            throw error;
        }
    }

    ScenarioResultSet results;
    results.reserve(count);
    for (auto& result : slots) {
        LogContext scenario_ctx = ctx;
        scenario_ctx.scenario = result.scenario_name;
        logger.log_scenario_evaluated(scenario_ctx, result);
        results.add(std::move(result));
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();
    logger.log_scenario_batch_complete(ctx, results.size(), elapsed_ms);

    return results;
}

ScenarioResultSet evaluate_scenarios(
    double base_present_value,
    const ValuationParameters& params,
    const ScenarioSet& scenarios)
{
    return evaluate_scenarios(base_present_value, params.initial_investment,
                              params.time_to_maturity, params.discount_rate,
                              params.volatility, scenarios);
}

} // namespace plantval
