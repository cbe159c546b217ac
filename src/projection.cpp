#include "projection.hpp"
#include <algorithm>
#include <cmath>

namespace plantval {

double ramp_up_factor(int year_index) {
    return std::min(1.0, static_cast<double>(year_index + 1) / RAMP_UP_YEARS);
}

CashFlowSeries project_cash_flows(const ValuationParameters& params) {
    CashFlowSeries cash_flows;
    if (params.time_to_maturity <= 0) {
        return cash_flows;
    }
    cash_flows.reserve(static_cast<size_t>(params.time_to_maturity));

    const double maintenance_cost = params.initial_investment * MAINTENANCE_RATE;

    for (int t = 0; t < params.time_to_maturity; ++t) {
        double annual_cf = params.base_cash_flow
                         * std::pow(1.0 + params.growth_rate, t)
                         * ramp_up_factor(t);
        annual_cf -= maintenance_cost;
        cash_flows.push_back(annual_cf);
    }

    // End-of-life cost lands entirely in the final year
    cash_flows.back() -= params.decommissioning_cost;

    return cash_flows;
}

std::vector<YearlyCashFlow> project_detailed_cash_flows(const ValuationParameters& params) {
    std::vector<YearlyCashFlow> flows;
    if (params.time_to_maturity <= 0) {
        return flows;
    }
    flows.reserve(static_cast<size_t>(params.time_to_maturity));

    const double maintenance_cost = params.initial_investment * MAINTENANCE_RATE;

    for (int t = 0; t < params.time_to_maturity; ++t) {
        YearlyCashFlow cf;
        cf.year = t + 1;
        cf.ramp_up_factor = ramp_up_factor(t);
        cf.gross_cash_flow = params.base_cash_flow
                           * std::pow(1.0 + params.growth_rate, t)
                           * cf.ramp_up_factor;
        cf.maintenance_cost = maintenance_cost;
        cf.decommissioning_cost = (t == params.time_to_maturity - 1)
                                ? params.decommissioning_cost : 0.0;
        cf.net_cash_flow = cf.gross_cash_flow - cf.maintenance_cost - cf.decommissioning_cost;
        cf.discount_factor = 1.0 / std::pow(1.0 + params.discount_rate, cf.year);
        cf.discounted_cash_flow = cf.net_cash_flow / std::pow(1.0 + params.discount_rate, cf.year);
        flows.push_back(cf);
    }

    return flows;
}

double present_value(const CashFlowSeries& cash_flows, double discount_rate) {
    double pv = 0.0;
    for (size_t i = 0; i < cash_flows.size(); ++i) {
        // Cash flows occur at end of year, so year 1 is discounted one full period
        const double year = static_cast<double>(i + 1);
        pv += cash_flows[i] / std::pow(1.0 + discount_rate, year);
    }
    return pv;
}

} // namespace plantval
