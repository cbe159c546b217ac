#include "report.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace plantval {
namespace io {

namespace {

std::string format_percent(double fraction) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(0) << fraction * 100.0 << "%";
    return oss.str();
}

} // anonymous namespace

std::string format_currency(double amount, const std::string& currency) {
    std::ostringstream fixed;
    fixed << std::fixed << std::setprecision(2) << std::fabs(amount);
    const std::string digits = fixed.str();

    const size_t dot = digits.find('.');
    const std::string integer_part = digits.substr(0, dot);
    const std::string fraction_part = digits.substr(dot);

    std::string grouped;
    grouped.reserve(integer_part.size() + integer_part.size() / 3);
    for (size_t i = 0; i < integer_part.size(); ++i) {
        if (i > 0 && (integer_part.size() - i) % 3 == 0) {
            grouped += ',';
        }
        grouped += integer_part[i];
    }

    // Values that round to zero print without a sign
    const bool negative = amount < 0.0 && (grouped != "0" || fraction_part != ".00");

    std::string result = currency.empty() ? "" : currency + " ";
    if (negative) {
        result += '-';
    }
    result += grouped + fraction_part;
    return result;
}

void write_text_report(std::ostream& os, const ValuationResult& base,
                       const ScenarioResultSet& scenarios,
                       const std::string& currency) {
    os << "Base Case Valuation\n";
    os << "  Present Value:          " << format_currency(base.present_value, currency) << "\n";
    os << "  Option Value:           " << format_currency(base.option_value, currency) << "\n";
    os << "  NPV:                    " << format_currency(base.npv(), currency) << "\n";

    if (scenarios.empty()) {
        return;
    }

    os << "\nScenario Analysis\n";
    for (const auto& result : scenarios) {
        os << "  " << result.scenario_name << " ("
           << format_percent(result.utilisation_rate) << " utilisation)\n";
        os << "    Adjusted Present Value: "
           << format_currency(result.adjusted_present_value, currency) << "\n";
        os << "    Option Value:           "
           << format_currency(result.option_value, currency) << "\n";
        os << "    NPV:                    "
           << format_currency(result.npv(), currency) << "\n";
    }
}

} // namespace io
} // namespace plantval
