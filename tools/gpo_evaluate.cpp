/**
 * gpo_evaluate - regime evaluation from the command line
 *
 * Evaluates the current regime from a price history, or simulates a
 * hypothetical drawdown, and prints the allocation for a portfolio value.
 *
 * Usage:
 *   gpo_evaluate --prices acwi.csv                     # Regime + recovery
 *   gpo_evaluate --prices acwi.csv --vix 32 --value 1e5
 *   gpo_evaluate --drawdown -42 --value 100000 --json  # What-if
 *   gpo_evaluate -h                                    # Help
 */

#include "../include/config/engine_config.hpp"
#include "../include/engine/evaluator.hpp"
#include "../include/exchange/market_data.hpp"
#include "../include/io/report.hpp"
#include "../include/logging/logger.hpp"
#include "../include/util/cli.hpp"

#include <exception>
#include <iostream>
#include <optional>
#include <utility>

using gpo::util::parse_args;
using gpo::util::print_help;

int main(int argc, char* argv[]) {
    gpo::util::CLIArgs args;
    if (!parse_args(argc, argv, args)) {
        return 1;
    }
    if (args.help) {
        print_help();
        return 0;
    }

    gpo::logging::Logger logger(gpo::logging::LogLevel::Info);

    try {
        auto config = args.config_file.empty() ? gpo::config::EngineConfig::defaults()
                                               : gpo::config::ConfigParser::load(args.config_file);
        if (!args.weights_file.empty()) {
            gpo::config::ConfigParser::apply_weight_overrides(args.weights_file, config);
        }

        if (args.verbose)
            logger.set_min_level(gpo::logging::LogLevel::Debug);
        else if (!args.log_level.empty())
            logger.set_min_level(gpo::logging::parse_level(args.log_level));
        else
            logger.set_min_level(gpo::logging::parse_level(config.log_level));

        GPO_LOGF_DEBUG(logger, Config, "config: %s, weights: %s", args.config_file.empty() ? "built-in"
                                                                                          : args.config_file.c_str(),
                       args.weights_file.empty() ? "config" : args.weights_file.c_str());

        std::optional<gpo::Holdings> holdings;
        if (!args.holdings_file.empty()) {
            holdings = gpo::config::ConfigParser::load_holdings(args.holdings_file);
            GPO_LOGF_DEBUG(logger, Config, "%zu holdings from %s", holdings->size(), args.holdings_file.c_str());
        }

        gpo::strategy::StressIndicators indicators;
        indicators.volatility = args.vix;
        indicators.credit_spread = args.spread;

        gpo::engine::Evaluator evaluator(std::move(config), &logger);

        if (args.drawdown) {
            auto sim = evaluator.simulate(*args.drawdown, indicators, *args.portfolio_value, holdings);
            if (args.json)
                std::cout << gpo::io::to_json(sim).dump(2) << "\n";
            else
                gpo::io::render_text(std::cout, sim);
        } else {
            auto series = gpo::exchange::load_price_csv(args.prices_file);
            auto eval = evaluator.evaluate(series, indicators, args.portfolio_value, holdings);
            if (args.json)
                std::cout << gpo::io::to_json(eval).dump(2) << "\n";
            else
                gpo::io::render_text(std::cout, eval);
        }
    } catch (const std::exception& e) {
        // Fatal is printed even with --log-level off
        GPO_LOG_FATAL(logger, System, e.what());
        return 1;
    }

    return 0;
}
