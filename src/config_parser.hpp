#ifndef PLANTVAL_CONFIG_PARSER_HPP
#define PLANTVAL_CONFIG_PARSER_HPP

#include "parameters.hpp"
#include "scenario.hpp"
#include "logger.hpp"
#include <stdexcept>
#include <string>

namespace plantval {

/**
 * @brief Exception thrown when config file parsing fails
 */
class ConfigParseError : public std::runtime_error {
public:
    explicit ConfigParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Presentation settings for a run
 */
struct OutputConfig {
    std::string currency;       ///< Currency code prefixed to amounts
    bool detailed_cashflows;    ///< Include the per-year breakdown

    OutputConfig() : currency("AUD"), detailed_cashflows(false) {}
};

/**
 * @brief Everything a valuation run needs, with the reference defaults
 */
struct RunConfig {
    ValuationParameters parameters;
    ScenarioSet scenarios;
    OutputConfig output;
    LoggerConfig logging;

    RunConfig() : scenarios(ScenarioSet::defaults()) {}
};

/**
 * @brief Parses a run configuration from a JSON file
 *
 * Relative log file paths are resolved against the config file's directory.
 *
 * @param file_path Path to the JSON configuration file
 * @return Parsed configuration, defaults filled in for missing keys
 * @throws ConfigParseError if file cannot be read or JSON is invalid
 */
RunConfig parse_run_config_from_file(const std::string& file_path);

/**
 * @brief Parses a run configuration from a JSON string
 *
 * Recognised sections: "parameters", "scenarios", "output", "logging".
 * An explicit "scenarios" array replaces the default scenario set.
 *
 * @param json_string JSON configuration as string
 * @return Parsed configuration
 * @throws ConfigParseError if JSON is invalid or a value has the wrong type
 */
RunConfig parse_run_config_from_string(const std::string& json_string);

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 *
 * @param value String potentially containing variable references
 * @return String with variables expanded
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves file paths relative to config file directory
 *
 * Absolute paths are returned unchanged.
 *
 * @param path File path to resolve
 * @param config_file_path Path to the configuration file
 * @return Resolved path
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace plantval

#endif // PLANTVAL_CONFIG_PARSER_HPP
