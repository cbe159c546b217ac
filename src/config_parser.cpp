#include "config_parser.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace plantval {

namespace {

template <typename T>
void read_optional(const json& section, const char* key, T& target) {
    if (section.contains(key)) {
        target = section[key].get<T>();
    }
}

// Horizon must be a whole number of years that fits in an int
int read_years(const json& value) {
    if (value.is_number_unsigned()) {
        auto years = value.get<std::uint64_t>();
        if (years <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
            return static_cast<int>(years);
        }
    } else if (value.is_number_integer()) {
        auto years = value.get<std::int64_t>();
        if (years >= std::numeric_limits<int>::min() && years <= std::numeric_limits<int>::max()) {
            return static_cast<int>(years);
        }
    }
    throw ConfigParseError("'time_to_maturity' must be an integer (got " + value.dump() + ")");
}

void parse_parameters(const json& j, ValuationParameters& params) {
    if (!j.is_object()) {
        throw ConfigParseError("'parameters' must be an object");
    }
    read_optional(j, "initial_investment", params.initial_investment);
    read_optional(j, "base_cash_flow", params.base_cash_flow);
    read_optional(j, "discount_rate", params.discount_rate);
    read_optional(j, "volatility", params.volatility);
    if (j.contains("time_to_maturity")) {
        params.time_to_maturity = read_years(j["time_to_maturity"]);
    }
    read_optional(j, "growth_rate", params.growth_rate);
    read_optional(j, "decommissioning_cost", params.decommissioning_cost);
}

ScenarioSet parse_scenarios(const json& j) {
    if (!j.is_array()) {
        throw ConfigParseError("'scenarios' must be an array");
    }

    ScenarioSet scenarios;
    scenarios.reserve(j.size());
    for (const auto& scenario_json : j) {
        if (!scenario_json.contains("name")) {
            throw ConfigParseError("Scenario missing required field: name");
        }
        std::string name = scenario_json["name"].get<std::string>();

        if (!scenario_json.contains("utilisation_rate")) {
            throw ConfigParseError("Scenario '" + name + "' missing required field: utilisation_rate");
        }
        double rate = scenario_json["utilisation_rate"].get<double>();

        scenarios.add(Scenario(std::move(name), rate));
    }
    return scenarios;
}

} // anonymous namespace

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        // Check for ${VAR} syntax
        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++; // Skip '{'
        }

        // Extract variable name
        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        std::string var_name = result.substr(name_start, pos - name_start);

        if (braces) {
            if (pos >= result.size() || result[pos] != '}') {
                throw ConfigParseError("Unterminated variable reference in: " + value);
            }
            pos++; // Skip '}'
        }

        // A lone '$' stays literal
        if (var_name.empty()) {
            continue;
        }

        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);

    if (p.is_absolute()) {
        return path;
    }

    fs::path config_dir = fs::path(config_file_path).parent_path();
    fs::path resolved = config_dir / p;
    return resolved.string();
}

RunConfig parse_run_config_from_string(const std::string& json_string) {
    RunConfig config;

    try {
        json j = json::parse(json_string);

        if (!j.is_object()) {
            throw ConfigParseError("Configuration root must be an object");
        }

        if (j.contains("parameters")) {
            parse_parameters(j["parameters"], config.parameters);
        }

        if (j.contains("scenarios")) {
            config.scenarios = parse_scenarios(j["scenarios"]);
        }

        if (j.contains("output")) {
            const auto& output = j["output"];
            if (output.contains("currency")) {
                config.output.currency = expand_environment_variables(
                    output["currency"].get<std::string>());
            }
            read_optional(output, "detailed_cashflows", config.output.detailed_cashflows);
        }

        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            if (logging.contains("level")) {
                try {
                    config.logging.min_level = string_to_level(logging["level"].get<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw ConfigParseError(e.what());
                }
            }
            read_optional(logging, "json", config.logging.enable_json);
            read_optional(logging, "console", config.logging.enable_console);
            if (logging.contains("file")) {
                config.logging.log_file_path = expand_environment_variables(
                    logging["file"].get<std::string>());
                config.logging.enable_file = !config.logging.log_file_path.empty();
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON value out of range: ") + e.what());
    }

    return config;
}

RunConfig parse_run_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    RunConfig config = parse_run_config_from_string(buffer.str());

    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

} // namespace plantval
