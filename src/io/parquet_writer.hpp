#ifndef PLANTVAL_PARQUET_WRITER_HPP
#define PLANTVAL_PARQUET_WRITER_HPP

#include "../valuation.hpp"
#include "../scenario.hpp"
#include <string>

namespace plantval {

class ParquetWriter {
public:
    /**
     * Write the projected cash flows to a Parquet file.
     *
     * Output schema:
     *   - year: int32 (1-based)
     *   - net_cash_flow: float64
     *
     * @param result ValuationResult holding the cash flow series
     * @param filepath Path to output Parquet file
     * @throws std::runtime_error if the series is empty or the file cannot be written
     */
    static void write_cash_flows(const ValuationResult& result, const std::string& filepath);

    /**
     * Write scenario results to a Parquet file, in definition order.
     *
     * Output schema:
     *   - scenario: utf8
     *   - utilisation_rate: float64
     *   - adjusted_present_value: float64
     *   - option_value: float64
     *   - npv: float64
     *
     * @throws std::runtime_error if there are no results or the file cannot be written
     */
    static void write_scenarios(const ScenarioResultSet& results, const std::string& filepath);
};

} // namespace plantval

#endif // PLANTVAL_PARQUET_WRITER_HPP
