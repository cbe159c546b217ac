#include "black_scholes.hpp"
#include "errors.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>
#include <string>

namespace plantval {

namespace {

constexpr double INV_SQRT2 = 0.70710678118654752440084436210484903928;

std::string describe(const OptionInputs& inputs) {
    std::ostringstream oss;
    oss << "pv=" << inputs.present_value
        << ", investment=" << inputs.initial_investment
        << ", rate=" << inputs.discount_rate
        << ", volatility=" << inputs.volatility
        << ", maturity=" << inputs.time_to_maturity;
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// OptionInputs Implementation
// ============================================================================

OptionInputs::OptionInputs()
    : present_value(0.0), initial_investment(0.0), discount_rate(0.0),
      volatility(0.0), time_to_maturity(0) {}

OptionInputs::OptionInputs(double pv, double investment, double rate, double vol, int maturity)
    : present_value(pv), initial_investment(investment), discount_rate(rate),
      volatility(vol), time_to_maturity(maturity) {}

// ============================================================================
// Black-Scholes Implementation
// ============================================================================

double norm_cdf(double x) {
    // erfc keeps full relative precision in the lower tail
    return 0.5 * std::erfc(-x * INV_SQRT2);
}

BlackScholesTerms black_scholes_terms(const OptionInputs& inputs) {
    if (!(inputs.present_value > 0.0)) {
        throw std::domain_error("log undefined for non-positive present value");
    }
    if (!(inputs.initial_investment > 0.0)) {
        throw std::domain_error("log undefined for non-positive initial investment");
    }
    if (inputs.time_to_maturity <= 0) {
        throw std::domain_error("time to maturity must be positive (sqrt(T) in denominator)");
    }
    if (!(inputs.volatility > 0.0)) {
        throw std::domain_error("volatility must be positive (sigma in denominator)");
    }

    const double T = static_cast<double>(inputs.time_to_maturity);
    const double sigma = inputs.volatility;
    const double sig_sqrt_t = sigma * std::sqrt(T);

    BlackScholesTerms terms;
    terms.d1 = (std::log(inputs.present_value / inputs.initial_investment)
                + (inputs.discount_rate + 0.5 * sigma * sigma) * T) / sig_sqrt_t;
    terms.d2 = terms.d1 - sig_sqrt_t;
    return terms;
}

double black_scholes_call(const OptionInputs& inputs) {
    BlackScholesTerms terms;
    try {
        terms = black_scholes_terms(inputs);
    } catch (const std::domain_error& e) {
        throw BlackScholesError("Black-Scholes option valuation failed: " +
                                std::string(e.what()) + " (" + describe(inputs) + ")");
    }

    const double T = static_cast<double>(inputs.time_to_maturity);
    const double df = std::exp(-inputs.discount_rate * T);

    return inputs.present_value * norm_cdf(terms.d1)
         - inputs.initial_investment * df * norm_cdf(terms.d2);
}

} // namespace plantval
