#pragma once

/**
 * CLI utilities for the regime evaluation tool
 *
 * Provides command-line argument parsing and related utilities.
 */

#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

namespace gpo {
namespace util {

/**
 * Command-line arguments for gpo_evaluate.
 */
struct CLIArgs {
    std::string prices_file;   // Daily closes CSV (evaluate mode)
    std::string config_file;   // Engine config JSON (empty = built-in defaults)
    std::string weights_file;  // Weight override JSON
    std::string holdings_file; // Current holdings JSON
    std::optional<double> drawdown;        // Hypothetical drawdown in percent (simulate mode)
    std::optional<double> vix;
    std::optional<double> spread;
    std::optional<double> portfolio_value;
    std::string log_level; // Empty = from config
    bool json = false;
    bool verbose = false;
    bool help = false;
};

/**
 * Print help message for gpo_evaluate.
 */
inline void print_help() {
    std::cout << R"(
Regime-Aware Allocation Engine
==============================

Usage: gpo_evaluate [options]

Modes:
  --prices FILE          Evaluate from a daily closes CSV (date,close)
  --drawdown PCT         Simulate a hypothetical drawdown (e.g. -35)

Options:
  --vix N                Volatility index level
  --spread PCT           High-yield credit spread in percent
  --value AMOUNT         Portfolio value to allocate
  --holdings FILE        Current holdings JSON ({"key": value, ...})
  --config FILE          Engine config JSON (default: built-in)
  --weights FILE         Weight override JSON (equity_weights / reserve_weights)
  --json                 Print the result as JSON
  --log-level LEVEL      trace, debug, info, warn, error, off
  -v, --verbose          Same as --log-level debug
  -h, --help             Show this help

Examples:
  gpo_evaluate --prices acwi.csv --vix 32 --spread 5.1
  gpo_evaluate --prices acwi.csv --value 250000 --holdings holdings.json
  gpo_evaluate --drawdown -42 --value 100000 --json
)";
}

/**
 * Parse a numeric option value.
 *
 * @throws std::invalid_argument when the whole string is not a number
 */
inline double parse_number(const std::string& option, const std::string& value) {
    size_t used = 0;
    double result = 0;
    try {
        result = std::stod(value, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != value.size()) {
        throw std::invalid_argument(option + " expects a number, got '" + value + "'");
    }
    return result;
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                args.help = true;
            }
            else if (arg == "--verbose" || arg == "-v") {
                args.verbose = true;
            }
            else if (arg == "--json") {
                args.json = true;
            }
            else if (arg == "--prices" && i + 1 < argc) {
                args.prices_file = argv[++i];
            }
            else if (arg == "--config" && i + 1 < argc) {
                args.config_file = argv[++i];
            }
            else if (arg == "--weights" && i + 1 < argc) {
                args.weights_file = argv[++i];
            }
            else if (arg == "--holdings" && i + 1 < argc) {
                args.holdings_file = argv[++i];
            }
            else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = argv[++i];
            }
            else if (arg == "--drawdown" && i + 1 < argc) {
                args.drawdown = parse_number(arg, argv[++i]);
            }
            else if (arg == "--vix" && i + 1 < argc) {
                args.vix = parse_number(arg, argv[++i]);
            }
            else if (arg == "--spread" && i + 1 < argc) {
                args.spread = parse_number(arg, argv[++i]);
            }
            else if (arg == "--value" && i + 1 < argc) {
                args.portfolio_value = parse_number(arg, argv[++i]);
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                std::cerr << "Use --help for usage information.\n";
                return false;
            }
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        return false;
    }

    if (args.help)
        return true;

    if (args.prices_file.empty() == !args.drawdown.has_value()) {
        std::cerr << "Exactly one of --prices or --drawdown is required.\n";
        std::cerr << "Use --help for usage information.\n";
        return false;
    }
    if (args.drawdown && !args.portfolio_value) {
        std::cerr << "--drawdown requires --value.\n";
        return false;
    }
    if (!args.holdings_file.empty() && !args.portfolio_value) {
        std::cerr << "--holdings requires --value.\n";
        return false;
    }
    return true;
}

}  // namespace util
}  // namespace gpo
