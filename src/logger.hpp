/**
 * @file logger.hpp
 * @brief Structured logging for valuation runs with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted or plain-text line output
 * - Context tracking (run identifier, stage, scenario)
 * - Valuation and scenario events with their key figures
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef PLANTVAL_LOGGER_HPP
#define PLANTVAL_LOGGER_HPP

#include "parameters.hpp"
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <fstream>
#include <string>

namespace plantval {

struct ValuationResult;
struct ScenarioResult;

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Intermediate values (cash flow totals, d1/d2)
    INFO,    ///< Valuation start/end, scenario results
    WARN,    ///< Non-fatal issues
    ERROR    ///< Validation and pricing failures
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 *
 * @throws std::invalid_argument for an unknown level name
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Context attached to every log event
 */
struct LogContext {
    std::string run_id;      ///< Which computation (base, scenarios)
    std::string stage;       ///< Current step (valuation, option_pricing, ...)
    std::string scenario;    ///< Scenario name, empty outside the scenario loop

    LogContext() = default;

    LogContext(const std::string& id, const std::string& stage_name)
        : run_id(id), stage(stage_name) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("plantval.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "plantval.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *
 *   LogContext ctx("base", "valuation");
 *   logger.log_valuation_start(ctx, params);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Opens (appends to) the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log the inputs of a valuation run
     */
    void log_valuation_start(const LogContext& ctx, const ValuationParameters& params);

    /**
     * @brief Log the outcome of a valuation run
     *
     * @param elapsed_ms Wall time of the run in milliseconds
     */
    void log_valuation_complete(const LogContext& ctx, const ValuationResult& result,
                                double elapsed_ms);

    /**
     * @brief Log one repriced scenario
     */
    void log_scenario_evaluated(const LogContext& ctx, const ScenarioResult& result);

    /**
     * @brief Log completion of a scenario batch
     */
    void log_scenario_batch_complete(const LogContext& ctx, size_t scenario_count,
                                     double elapsed_ms);

    /**
     * @brief Log error with context
     */
    void log_error(const LogContext& ctx, const std::string& error_message);

    /**
     * @brief Log warning message
     */
    void log_warning(const LogContext& ctx, const std::string& warning_message);

    /**
     * @brief Log free-form debug details
     */
    void log_debug(const LogContext& ctx, const std::string& message,
                   const std::map<std::string, std::string>& details);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message,
             const LogContext& ctx, std::map<std::string, std::string> fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace plantval

#endif // PLANTVAL_LOGGER_HPP
