/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include "valuation.hpp"
#include "scenario.hpp"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace plantval {

namespace {

std::string format_amount(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // anonymous namespace

LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: " + level_str);
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::log_valuation_start(const LogContext& ctx, const ValuationParameters& params) {
    std::map<std::string, std::string> fields;
    fields["event"] = "valuation_start";
    fields["initial_investment"] = format_amount(params.initial_investment);
    fields["base_cash_flow"] = format_amount(params.base_cash_flow);
    fields["discount_rate"] = std::to_string(params.discount_rate);
    fields["volatility"] = std::to_string(params.volatility);
    fields["time_to_maturity"] = std::to_string(params.time_to_maturity);
    fields["growth_rate"] = std::to_string(params.growth_rate);
    fields["decommissioning_cost"] = format_amount(params.decommissioning_cost);

    log(LogLevel::INFO, "Starting valuation", ctx, std::move(fields));
}

void Logger::log_valuation_complete(const LogContext& ctx, const ValuationResult& result,
                                    double elapsed_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "valuation_complete";
    fields["present_value"] = format_amount(result.present_value);
    fields["option_value"] = format_amount(result.option_value);
    fields["npv"] = format_amount(result.npv());
    fields["years"] = std::to_string(result.cash_flows.size());
    fields["execution_time_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::INFO, "Valuation completed", ctx, std::move(fields));
}

void Logger::log_scenario_evaluated(const LogContext& ctx, const ScenarioResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "scenario_evaluated";
    fields["utilisation_rate"] = std::to_string(result.utilisation_rate);
    fields["adjusted_present_value"] = format_amount(result.adjusted_present_value);
    fields["option_value"] = format_amount(result.option_value);
    fields["npv"] = format_amount(result.npv());

    log(LogLevel::INFO, "Scenario evaluated", ctx, std::move(fields));
}

void Logger::log_scenario_batch_complete(const LogContext& ctx, size_t scenario_count,
                                         double elapsed_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "scenario_batch_complete";
    fields["scenario_count"] = std::to_string(scenario_count);
    fields["execution_time_ms"] = std::to_string(elapsed_ms);

    log(LogLevel::INFO, "Scenario batch completed", ctx, std::move(fields));
}

void Logger::log_error(const LogContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Valuation error", ctx, std::move(fields));
}

void Logger::log_warning(const LogContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, ctx, std::move(fields));
}

void Logger::log_debug(const LogContext& ctx, const std::string& message,
                       const std::map<std::string, std::string>& details) {
    std::map<std::string, std::string> fields = details;
    fields["event"] = "debug";

    log(LogLevel::DEBUG, message, ctx, std::move(fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const LogContext& ctx,
    std::map<std::string, std::string> fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    fields["run_id"] = ctx.run_id;
    fields["stage"] = ctx.stage;
    if (!ctx.scenario.empty()) {
        fields["scenario"] = ctx.scenario;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace plantval
