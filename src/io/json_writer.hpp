#ifndef PLANTVAL_IO_JSON_WRITER_HPP
#define PLANTVAL_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../valuation.hpp"
#include "../scenario.hpp"

namespace plantval {
namespace io {

// Write the base case and scenario results as a JSON document
// Includes present value, option value and NPV for the base case and every
// scenario (in definition order), the cash flow series and, when present,
// the per-year breakdown
void write_valuation_json(std::ostream& os, const ValuationResult& base,
                          const ScenarioResultSet& scenarios,
                          bool pretty_print = true);

// Write the JSON document to a file
void write_valuation_json(const std::string& filepath, const ValuationResult& base,
                          const ScenarioResultSet& scenarios,
                          bool pretty_print = true);

} // namespace io
} // namespace plantval

#endif // PLANTVAL_IO_JSON_WRITER_HPP
