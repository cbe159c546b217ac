#ifndef PLANTVAL_SCENARIO_HPP
#define PLANTVAL_SCENARIO_HPP

#include "parameters.hpp"
#include <cstddef>
#include <initializer_list>
#include <string>
#include <vector>

namespace plantval {

// Scenario: named utilisation level applied to the base-case present value
struct Scenario {
    std::string name;
    double utilisation_rate;    // Fraction of base-case value realised, in (0, 1]

    Scenario();
    Scenario(std::string scenario_name, double rate);

    bool operator==(const Scenario& other) const;
};

// ScenarioSet: ordered collection of scenarios
// Iteration order is definition order and is preserved in every result
class ScenarioSet {
public:
    ScenarioSet();
    ScenarioSet(std::initializer_list<Scenario> scenarios);

    void add(const Scenario& scenario);
    void add(Scenario&& scenario);

    const Scenario& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    std::vector<Scenario>::const_iterator begin() const { return scenarios_.begin(); }
    std::vector<Scenario>::const_iterator end() const { return scenarios_.end(); }

    void reserve(size_t count);
    void clear();

    // Throws InvalidParameterError on an empty name, a duplicate name or a
    // utilisation rate outside (0, 1]
    void validate() const;

    // Low 10%, Medium 20%, High 40%, Optimal 90%
    static ScenarioSet defaults();

private:
    std::vector<Scenario> scenarios_;
};

// Result of repricing the option under one scenario
struct ScenarioResult {
    std::string scenario_name;
    double utilisation_rate;
    double adjusted_present_value;  // Base PV x utilisation rate
    double option_value;            // Black-Scholes call on the adjusted PV
    double initial_investment;

    // Net present value of the scenario: adjusted PV less initial investment
    double npv() const { return adjusted_present_value - initial_investment; }

    ScenarioResult();
    ScenarioResult(const std::string& name, double rate, double adjusted_pv,
                   double option, double investment);
};

// Scenario results in scenario definition order, with lookup by name
class ScenarioResultSet {
public:
    void add(ScenarioResult&& result);

    // Throws std::out_of_range if no scenario of that name was evaluated
    const ScenarioResult& at(const std::string& scenario_name) const;
    bool contains(const std::string& scenario_name) const;

    const ScenarioResult& get(size_t index) const;
    size_t size() const;
    bool empty() const;

    std::vector<ScenarioResult>::const_iterator begin() const { return results_.begin(); }
    std::vector<ScenarioResult>::const_iterator end() const { return results_.end(); }

    void reserve(size_t count);

private:
    std::vector<ScenarioResult> results_;
};

// Reprice the investment option under each scenario
//
// For each scenario, in definition order:
//   adjusted_pv  = base_present_value * utilisation_rate
//   option_value = Black-Scholes call on adjusted_pv with the shared
//                  investment, maturity, rate and volatility
//
// The cash flows are not re-projected: utilisation scales the aggregate
// present value directly.
//
// Throws InvalidParameterError for an invalid scenario set and
// ScenarioEvaluationError naming the first scenario (in definition order)
// whose option could not be priced. No partial results are returned.
ScenarioResultSet evaluate_scenarios(
    double base_present_value,
    double initial_investment,
    int time_to_maturity,
    double discount_rate,
    double volatility,
    const ScenarioSet& scenarios = ScenarioSet::defaults()
);

// Overload taking the shared market inputs from the base-case parameters
ScenarioResultSet evaluate_scenarios(
    double base_present_value,
    const ValuationParameters& params,
    const ScenarioSet& scenarios = ScenarioSet::defaults()
);

} // namespace plantval

#endif // PLANTVAL_SCENARIO_HPP
