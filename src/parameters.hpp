#ifndef PLANTVAL_PARAMETERS_HPP
#define PLANTVAL_PARAMETERS_HPP

namespace plantval {

// Financial inputs of a single plant valuation.
// Default-constructed parameters describe the reference plant:
//   8.5bn capital cost, 1.2bn base cash flow, 7% discount rate,
//   25% volatility, 25 year horizon, 2% growth, 0.9bn decommissioning
struct ValuationParameters {
    static constexpr double DEFAULT_INITIAL_INVESTMENT = 8'500'000'000.0;
    static constexpr double DEFAULT_BASE_CASH_FLOW = 1'200'000'000.0;
    static constexpr double DEFAULT_DISCOUNT_RATE = 0.07;
    static constexpr double DEFAULT_VOLATILITY = 0.25;
    static constexpr int DEFAULT_TIME_TO_MATURITY = 25;
    static constexpr double DEFAULT_GROWTH_RATE = 0.02;
    static constexpr double DEFAULT_DECOMMISSIONING_COST = 900'000'000.0;

    double initial_investment;      // Capital cost (> 0), also the option strike
    double base_cash_flow;          // Year-1 cash flow at full output (> 0)
    double discount_rate;           // Annual discount rate, in (0, 1)
    double volatility;              // Annual volatility of project value, in (0, 1)
    int time_to_maturity;           // Projection horizon in years
    double growth_rate;             // Annual cash flow growth
    double decommissioning_cost;    // End-of-life cost charged in the final year (>= 0)

    ValuationParameters();
    ValuationParameters(double investment, double cash_flow, double rate, double vol,
                        int maturity, double growth, double decommissioning);

    // Throws InvalidParameterError naming the first violated constraint
    void validate() const;
};

} // namespace plantval

#endif // PLANTVAL_PARAMETERS_HPP
