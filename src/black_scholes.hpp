#ifndef PLANTVAL_BLACK_SCHOLES_HPP
#define PLANTVAL_BLACK_SCHOLES_HPP

namespace plantval {

// Standard normal cumulative distribution function
double norm_cdf(double x);

// Inputs of the call-option analogue used for real-option valuation.
// The present value of the project plays the underlying, the capital cost
// plays the strike and the project discount rate doubles as the risk-free rate.
struct OptionInputs {
    double present_value;       // Underlying asset value
    double initial_investment;  // Strike
    double discount_rate;       // Used as the risk-free rate
    double volatility;          // Annual volatility of the underlying
    int time_to_maturity;       // Years

    OptionInputs();
    OptionInputs(double pv, double investment, double rate, double vol, int maturity);
};

struct BlackScholesTerms {
    double d1;
    double d2;
};

// d1/d2 terms of the Black-Scholes formula
// Throws std::domain_error when present_value <= 0, initial_investment <= 0
// or time_to_maturity <= 0
BlackScholesTerms black_scholes_terms(const OptionInputs& inputs);

// Black-Scholes call value:
//   pv * N(d1) - I * exp(-r * T) * N(d2)
// Throws BlackScholesError (wrapping the underlying domain failure) when the
// formula cannot be evaluated
double black_scholes_call(const OptionInputs& inputs);

} // namespace plantval

#endif // PLANTVAL_BLACK_SCHOLES_HPP
