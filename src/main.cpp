#include <cstddef>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include "config_parser.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "scenario.hpp"
#include "valuation.hpp"
#include "io/json_writer.hpp"
#include "io/parquet_writer.hpp"
#include "io/report.hpp"

namespace {

constexpr int EXIT_USAGE = 1;
constexpr int EXIT_VALUATION_FAILED = 2;

struct CLIArgs {
    std::string config_path;
    std::string output_path;
    std::string parquet_dir;
    std::string log_level;
    bool log_text = false;
    bool detailed = false;
    bool help = false;
    // Parameter overrides, applied on top of the config file
    std::optional<double> initial_investment;
    std::optional<double> base_cash_flow;
    std::optional<double> discount_rate;
    std::optional<double> volatility;
    std::optional<int> time_to_maturity;
    std::optional<double> growth_rate;
    std::optional<double> decommissioning_cost;
};

void print_usage(const char* program_name) {
    std::cerr << "PlantVal v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [options]\n\n";
    std::cerr << "Configuration:\n";
    std::cerr << "  --config <path>                 JSON run configuration\n\n";
    std::cerr << "Parameter overrides (defaults: reference plant):\n";
    std::cerr << "  --initial-investment <amount>   Capital cost (default: 8500000000)\n";
    std::cerr << "  --base-cash-flow <amount>       Annual cash flow at full output (default: 1200000000)\n";
    std::cerr << "  --discount-rate <rate>          Discount rate in (0,1) (default: 0.07)\n";
    std::cerr << "  --volatility <rate>             Volatility in (0,1) (default: 0.25)\n";
    std::cerr << "  --maturity <years>              Time to maturity (default: 25)\n";
    std::cerr << "  --growth-rate <rate>            Annual cash flow growth (default: 0.02)\n";
    std::cerr << "  --decommissioning-cost <amount> End-of-life cost (default: 900000000)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --detailed                      Include the per-year cash flow breakdown\n";
    std::cerr << "  --output <path>                 JSON output file (default: text report on stdout)\n";
    std::cerr << "  --parquet-dir <path>            Also write cash_flows.parquet and scenarios.parquet\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>             DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-text                      Plain-text log lines instead of JSON\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                          Show this help message\n";
}

// Whole-string numeric conversion; trailing characters are rejected
double parse_double(const std::string& text) {
    size_t consumed = 0;
    double value = std::stod(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("not a number: " + text);
    }
    return value;
}

int parse_int(const std::string& text) {
    size_t consumed = 0;
    int value = std::stoi(text, &consumed);
    if (consumed != text.size()) {
        throw std::invalid_argument("not an integer: " + text);
    }
    return value;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--parquet-dir" && i + 1 < argc) {
                args.parquet_dir = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            } else if (arg == "--log-text") {
                args.log_text = true;
            } else if (arg == "--detailed") {
                args.detailed = true;
            } else if (arg == "--initial-investment" && i + 1 < argc) {
                args.initial_investment = parse_double(argv[++i]);
            } else if (arg == "--base-cash-flow" && i + 1 < argc) {
                args.base_cash_flow = parse_double(argv[++i]);
            } else if (arg == "--discount-rate" && i + 1 < argc) {
                args.discount_rate = parse_double(argv[++i]);
            } else if (arg == "--volatility" && i + 1 < argc) {
                args.volatility = parse_double(argv[++i]);
            } else if (arg == "--maturity" && i + 1 < argc) {
                args.time_to_maturity = parse_int(argv[++i]);
            } else if (arg == "--growth-rate" && i + 1 < argc) {
                args.growth_rate = parse_double(argv[++i]);
            } else if (arg == "--decommissioning-cost" && i + 1 < argc) {
                args.decommissioning_cost = parse_double(argv[++i]);
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        }
    } catch (const std::logic_error& e) {
        // parse_double / parse_int report bad numbers as invalid_argument or out_of_range
        std::cerr << "Error: Invalid numeric argument (" << e.what() << ")\n\n";
        return false;
    }
    return true;
}

void apply_overrides(const CLIArgs& args, plantval::RunConfig& config) {
    plantval::ValuationParameters& p = config.parameters;
    if (args.initial_investment) p.initial_investment = *args.initial_investment;
    if (args.base_cash_flow) p.base_cash_flow = *args.base_cash_flow;
    if (args.discount_rate) p.discount_rate = *args.discount_rate;
    if (args.volatility) p.volatility = *args.volatility;
    if (args.time_to_maturity) p.time_to_maturity = *args.time_to_maturity;
    if (args.growth_rate) p.growth_rate = *args.growth_rate;
    if (args.decommissioning_cost) p.decommissioning_cost = *args.decommissioning_cost;

    if (args.detailed) config.output.detailed_cashflows = true;
    if (args.log_text) config.logging.enable_json = false;
    if (!args.log_level.empty()) {
        config.logging.min_level = plantval::string_to_level(args.log_level);
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return EXIT_USAGE;
    }

    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    plantval::RunConfig config;
    try {
        if (!args.config_path.empty()) {
            config = plantval::parse_run_config_from_file(args.config_path);
        }
        apply_overrides(args, config);
    } catch (const plantval::ConfigParseError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return EXIT_USAGE;
    }

    plantval::Logger& logger = plantval::Logger::get_instance();
    logger.configure(config.logging);
    plantval::LogContext ctx("cli", "run");

    try {
        plantval::ValuationConfig valuation_config;
        valuation_config.detailed_cashflows = config.output.detailed_cashflows;

        plantval::ValuationResult base = plantval::evaluate(config.parameters, valuation_config);
        plantval::ScenarioResultSet scenarios = plantval::evaluate_scenarios(
            base.present_value, config.parameters, config.scenarios);

        if (args.output_path.empty()) {
            plantval::io::write_text_report(std::cout, base, scenarios, config.output.currency);
        } else {
            plantval::io::write_valuation_json(args.output_path, base, scenarios);
            std::cerr << "Output written to: " << args.output_path << "\n";
        }

        if (!args.parquet_dir.empty()) {
            plantval::ParquetWriter::write_cash_flows(base, args.parquet_dir + "/cash_flows.parquet");
            if (!scenarios.empty()) {
                plantval::ParquetWriter::write_scenarios(scenarios, args.parquet_dir + "/scenarios.parquet");
            }
        }

        logger.flush();
        return 0;
    } catch (const plantval::InvalidParameterError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        logger.flush();
        return EXIT_USAGE;
    } catch (const plantval::BlackScholesError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        logger.flush();
        return EXIT_VALUATION_FAILED;
    } catch (const std::exception& e) {
        logger.log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        logger.flush();
        return EXIT_VALUATION_FAILED;
    }
}
