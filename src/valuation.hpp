#ifndef PLANTVAL_VALUATION_HPP
#define PLANTVAL_VALUATION_HPP

#include "parameters.hpp"
#include "projection.hpp"
#include <vector>

namespace plantval {

// Result of a single plant valuation
struct ValuationResult {
    double present_value;                   // PV of projected net cash flows
    double option_value;                    // Real-option value of the right to invest
    CashFlowSeries cash_flows;              // Net cash flow per year
    std::vector<YearlyCashFlow> detailed;   // Per-year breakdown (only if requested)
    double initial_investment;              // Capital cost the NPV is measured against

    // Net present value: present value less initial investment
    double npv() const { return present_value - initial_investment; }

    ValuationResult();
};

// Configuration options for valuation
struct ValuationConfig {
    bool detailed_cashflows;    // If true, populate the per-year breakdown

    ValuationConfig();
};

// Run the base-case valuation
//
// 1. Validate parameters (InvalidParameterError on failure)
// 2. Project net annual cash flows
// 3. Discount them to a present value
// 4. Price the investment as a Black-Scholes call with the present value as
//    underlying and the capital cost as strike (BlackScholesError on failure)
ValuationResult evaluate(const ValuationParameters& params,
                         const ValuationConfig& config = ValuationConfig());

} // namespace plantval

#endif // PLANTVAL_VALUATION_HPP
