#include "valuation.hpp"
#include "black_scholes.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <chrono>
#include <string>

namespace plantval {

// ============================================================================
// ValuationResult Implementation
// ============================================================================

ValuationResult::ValuationResult()
    : present_value(0.0),
      option_value(0.0),
      initial_investment(0.0) {}

// ============================================================================
// ValuationConfig Implementation
// ============================================================================

ValuationConfig::ValuationConfig()
    : detailed_cashflows(false) {}

// ============================================================================
// Valuation Implementation
// ============================================================================

ValuationResult evaluate(const ValuationParameters& params, const ValuationConfig& config) {
    Logger& logger = Logger::get_instance();
    LogContext ctx("base", "valuation");

    auto start_time = std::chrono::high_resolution_clock::now();

    try {
        params.validate();
    } catch (const InvalidParameterError& e) {
        logger.log_error(ctx, e.what());
        throw;
    }

    logger.log_valuation_start(ctx, params);

    if (params.growth_rate >= params.discount_rate) {
        logger.log_warning(ctx, "growth_rate " + std::to_string(params.growth_rate) +
                                " is not below discount_rate " + std::to_string(params.discount_rate));
    }

    ValuationResult result;
    result.initial_investment = params.initial_investment;
    result.cash_flows = project_cash_flows(params);
    result.present_value = present_value(result.cash_flows, params.discount_rate);

    if (config.detailed_cashflows) {
        result.detailed = project_detailed_cash_flows(params);
    }

    logger.log_debug(ctx, "Cash flows projected", {
        {"years", std::to_string(result.cash_flows.size())},
        {"present_value", std::to_string(result.present_value)}
    });

    ctx.stage = "option_pricing";
    try {
        result.option_value = black_scholes_call(OptionInputs(
            result.present_value, params.initial_investment, params.discount_rate,
            params.volatility, params.time_to_maturity));
    } catch (const BlackScholesError& e) {
        logger.log_error(ctx, e.what());
        throw;
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    double elapsed_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    ctx.stage = "valuation";
    logger.log_valuation_complete(ctx, result, elapsed_ms);

    return result;
}

} // namespace plantval
