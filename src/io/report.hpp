#ifndef PLANTVAL_IO_REPORT_HPP
#define PLANTVAL_IO_REPORT_HPP

#include <ostream>
#include <string>
#include "../valuation.hpp"
#include "../scenario.hpp"

namespace plantval {
namespace io {

// Format an amount as "<currency> 1,234,567.89"
// Two decimal places, comma thousands separators, sign before the digits
std::string format_currency(double amount, const std::string& currency = "AUD");

// Write the human-readable report: base case block followed by one block per
// scenario, each with present value, option value and NPV
void write_text_report(std::ostream& os, const ValuationResult& base,
                       const ScenarioResultSet& scenarios,
                       const std::string& currency = "AUD");

} // namespace io
} // namespace plantval

#endif // PLANTVAL_IO_REPORT_HPP
