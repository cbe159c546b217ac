#include "json_writer.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace plantval {
namespace io {

namespace {

json yearly_to_json(const YearlyCashFlow& cf) {
    json j;
    j["year"] = cf.year;
    j["ramp_up_factor"] = cf.ramp_up_factor;
    j["gross_cash_flow"] = cf.gross_cash_flow;
    j["maintenance_cost"] = cf.maintenance_cost;
    j["decommissioning_cost"] = cf.decommissioning_cost;
    j["net_cash_flow"] = cf.net_cash_flow;
    j["discount_factor"] = cf.discount_factor;
    j["discounted_cash_flow"] = cf.discounted_cash_flow;
    return j;
}

} // anonymous namespace

void write_valuation_json(std::ostream& os, const ValuationResult& base,
                          const ScenarioResultSet& scenarios,
                          bool pretty_print) {
    json doc;

    // Base case
    json& base_json = doc["base_case"];
    base_json["present_value"] = base.present_value;
    base_json["option_value"] = base.option_value;
    base_json["npv"] = base.npv();
    base_json["initial_investment"] = base.initial_investment;
    base_json["cash_flows"] = base.cash_flows;

    if (!base.detailed.empty()) {
        json detailed = json::array();
        for (const auto& cf : base.detailed) {
            detailed.push_back(yearly_to_json(cf));
        }
        base_json["detailed_cash_flows"] = std::move(detailed);
    }

    // Scenarios, in definition order
    json scenario_list = json::array();
    for (const auto& result : scenarios) {
        json s;
        s["name"] = result.scenario_name;
        s["utilisation_rate"] = result.utilisation_rate;
        s["adjusted_present_value"] = result.adjusted_present_value;
        s["option_value"] = result.option_value;
        s["npv"] = result.npv();
        scenario_list.push_back(std::move(s));
    }
    doc["scenarios"] = std::move(scenario_list);

    os << doc.dump(pretty_print ? 2 : -1) << "\n";
}

void write_valuation_json(const std::string& filepath, const ValuationResult& base,
                          const ScenarioResultSet& scenarios,
                          bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_valuation_json(file, base, scenarios, pretty_print);
}

} // namespace io
} // namespace plantval
