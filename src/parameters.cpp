#include "parameters.hpp"
#include "errors.hpp"
#include <string>

namespace plantval {

ValuationParameters::ValuationParameters()
    : initial_investment(DEFAULT_INITIAL_INVESTMENT),
      base_cash_flow(DEFAULT_BASE_CASH_FLOW),
      discount_rate(DEFAULT_DISCOUNT_RATE),
      volatility(DEFAULT_VOLATILITY),
      time_to_maturity(DEFAULT_TIME_TO_MATURITY),
      growth_rate(DEFAULT_GROWTH_RATE),
      decommissioning_cost(DEFAULT_DECOMMISSIONING_COST) {}

ValuationParameters::ValuationParameters(double investment, double cash_flow, double rate,
                                         double vol, int maturity, double growth,
                                         double decommissioning)
    : initial_investment(investment),
      base_cash_flow(cash_flow),
      discount_rate(rate),
      volatility(vol),
      time_to_maturity(maturity),
      growth_rate(growth),
      decommissioning_cost(decommissioning) {}

void ValuationParameters::validate() const {
    // Negated comparisons so that NaN inputs are rejected too
    if (!(initial_investment > 0.0)) {
        throw InvalidParameterError("initial_investment must be positive (got " +
                                    std::to_string(initial_investment) + ")");
    }
    if (!(base_cash_flow > 0.0)) {
        throw InvalidParameterError("base_cash_flow must be positive (got " +
                                    std::to_string(base_cash_flow) + ")");
    }
    if (!(discount_rate > 0.0 && discount_rate < 1.0)) {
        throw InvalidParameterError("discount_rate must be between 0 and 1 exclusive (got " +
                                    std::to_string(discount_rate) + ")");
    }
    if (!(volatility > 0.0 && volatility < 1.0)) {
        throw InvalidParameterError("volatility must be between 0 and 1 exclusive (got " +
                                    std::to_string(volatility) + ")");
    }
    if (!(decommissioning_cost >= 0.0)) {
        throw InvalidParameterError("decommissioning_cost must not be negative (got " +
                                    std::to_string(decommissioning_cost) + ")");
    }
}

} // namespace plantval
