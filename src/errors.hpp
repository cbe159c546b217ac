#ifndef PLANTVAL_ERRORS_HPP
#define PLANTVAL_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace plantval {

/**
 * @brief Thrown before any computation when a valuation input violates its
 * allowed range. The message names the violated constraint.
 */
class InvalidParameterError : public std::invalid_argument {
public:
    explicit InvalidParameterError(const std::string& message)
        : std::invalid_argument(message) {}
};

/**
 * @brief Thrown when the option-pricing step cannot be evaluated
 * (non-positive present value or non-positive time to maturity).
 */
class BlackScholesError : public std::domain_error {
public:
    explicit BlackScholesError(const std::string& message)
        : std::domain_error(message) {}
};

/**
 * @brief Option-pricing failure inside a scenario batch
 */
class ScenarioEvaluationError : public BlackScholesError {
public:
    ScenarioEvaluationError(const std::string& scenario_name, const std::string& message)
        : BlackScholesError("Scenario '" + scenario_name + "': " + message),
          scenario_name_(scenario_name) {}

    const std::string& scenario_name() const { return scenario_name_; }

private:
    std::string scenario_name_;
};

} // namespace plantval

#endif // PLANTVAL_ERRORS_HPP
