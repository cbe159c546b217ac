#ifndef PLANTVAL_PROJECTION_HPP
#define PLANTVAL_PROJECTION_HPP

#include "parameters.hpp"
#include <vector>

namespace plantval {

// Net cash flow per year, index 0..N-1 for years 1..N
using CashFlowSeries = std::vector<double>;

// Fraction of capital cost spent on maintenance every year
constexpr double MAINTENANCE_RATE = 0.025;

// Years of linear ramp-up before the plant reaches full output
constexpr int RAMP_UP_YEARS = 3;

// Detailed cash flow for a single year
struct YearlyCashFlow {
    int year;                       // Calendar year of operation (1-based)
    double ramp_up_factor;          // Fraction of full output
    double gross_cash_flow;         // Base cash flow after growth and ramp-up
    double maintenance_cost;        // Fixed share of capital cost
    double decommissioning_cost;    // Non-zero in the final year only
    double net_cash_flow;           // Gross less maintenance and decommissioning
    double discount_factor;         // 1 / (1 + r)^year
    double discounted_cash_flow;    // Net cash flow x discount factor
};

// Ramp-up factor for year index t (0-based): min(1, (t + 1) / 3)
double ramp_up_factor(int year_index);

// Project net annual cash flows for the plant
//
// For each year index t in [0, time_to_maturity):
//   1. gross = base_cash_flow * (1 + growth_rate)^t * ramp_up_factor(t)
//   2. net   = gross - MAINTENANCE_RATE * initial_investment
// The decommissioning cost is then charged against the final year only.
// A non-positive horizon yields an empty series.
CashFlowSeries project_cash_flows(const ValuationParameters& params);

// Same projection with the per-year breakdown and discounting detail
std::vector<YearlyCashFlow> project_detailed_cash_flows(const ValuationParameters& params);

// Present value with end-of-year discounting: sum of cf[t-1] / (1 + r)^t
double present_value(const CashFlowSeries& cash_flows, double discount_rate);

} // namespace plantval

#endif // PLANTVAL_PROJECTION_HPP
