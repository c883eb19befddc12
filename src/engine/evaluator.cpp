#include "../../include/engine/evaluator.hpp"
#include "../../include/errors.hpp"

#include <utility>

namespace gpo::engine {

Evaluator::Evaluator(config::EngineConfig config, logging::Logger* logger)
    : config_(std::move(config)), classifier_(config_.thresholds), recovery_(config_.recovery),
      allocator_(config_.instruments, config_.simple_model, config_.rebalance_band), logger_(logger) {
    config_.validate();
}

Evaluation Evaluator::evaluate(const PriceSeries& series, const strategy::StressIndicators& indicators,
                               std::optional<Money> portfolio_value, const std::optional<Holdings>& holdings,
                               const WeightOverrides& overrides) const {
    if (holdings && !portfolio_value) {
        throw InvalidPortfolioValue("holdings were supplied without a portfolio value");
    }

    if (logger_) {
        GPO_LOGF_DEBUG(*logger_, Data, "evaluating %zu prices (%s .. %s)", series.size(),
                       series.empty() ? "-" : series.front().date.c_str(),
                       series.empty() ? "-" : series.back().date.c_str());
    }

    Evaluation eval;
    eval.drawdown = analytics::DrawdownAnalyzer::analyze(series);
    eval.regime = classifier_.classify(eval.drawdown.drawdown_pct, indicators);
    eval.recovery = recovery_.recovery(eval.drawdown.trough_price, eval.drawdown.current_price);
    eval.drawdown_curve = analytics::DrawdownAnalyzer::drawdown_curve(series, config_.drawdown_curve_points);

    log_regime(eval.regime);

    if (logger_) {
        const auto& dd = eval.drawdown;
        GPO_LOGF_INFO(*logger_, Data, "price %.2f, ATH %.2f (%s), drawdown %.2f%%, trough %.2f (%s)",
                      dd.current_price, dd.ath, dd.ath_date.c_str(), dd.drawdown_pct, dd.trough_price,
                      dd.trough_date.c_str());

        // Advisory signals may disagree; reported, never reconciled
        if (eval.regime.id != strategy::RegimeId::A && eval.recovery.progress_to_b >= PERCENT) {
            GPO_LOGF_WARN(*logger_, Recovery, "recovery checkpoint %.2f reached while regime is still %s",
                          eval.recovery.c_to_b_price, strategy::regime_to_string(eval.regime.id));
        }
    }

    if (portfolio_value) {
        eval.allocation = allocate(eval.regime, *portfolio_value, holdings, overrides);
    }

    return eval;
}

Simulation Evaluator::simulate(double drawdown_pct, const strategy::StressIndicators& indicators,
                               Money portfolio_value, const std::optional<Holdings>& holdings,
                               const WeightOverrides& overrides) const {
    Simulation sim;
    sim.regime = classifier_.classify(drawdown_pct, indicators);
    log_regime(sim.regime);
    sim.allocation = allocate(sim.regime, portfolio_value, holdings, overrides);
    return sim;
}

trading::AllocationResult Evaluator::allocate(const strategy::Regime& regime, Money portfolio_value,
                                              const std::optional<Holdings>& holdings,
                                              const WeightOverrides& overrides) const {
    const auto& equity = overrides.equity ? *overrides.equity : config_.equity_weights;
    const auto& reserve = overrides.reserve ? *overrides.reserve : config_.reserve_weights;

    auto result = allocator_.allocate(regime, equity, reserve, portfolio_value, holdings);

    if (logger_) {
        GPO_LOGF_INFO(*logger_, Allocation, "portfolio %.2f -> equity %.2f / reserve %.2f, TER %.4f%%",
                      result.portfolio_value, result.equity_value, result.reserve_value,
                      result.weighted_expense_ratio * PERCENT);
        for (const auto& action : result.rebalance_actions) {
            GPO_LOG_INFO(*logger_, Allocation, action.describe());
        }
    }
    return result;
}

void Evaluator::log_regime(const strategy::Regime& regime) const {
    if (!logger_)
        return;

    GPO_LOGF_INFO(*logger_, Regime, "regime %s (%s): %.0f%% equity / %.0f%% reserve",
                  strategy::regime_to_string(regime.id), regime.label.c_str(), regime.equity_pct * PERCENT,
                  regime.reserve_pct * PERCENT);
    for (const auto& trigger : regime.triggers_met) {
        GPO_LOG_DEBUG(*logger_, Regime, trigger);
    }
}

} // namespace gpo::engine
