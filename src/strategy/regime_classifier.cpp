#include "../../include/strategy/regime_classifier.hpp"

#include <cmath>
#include <cstdio>

namespace gpo::strategy {

namespace {

bool at_least(const std::optional<double>& value, double threshold) {
    return value.has_value() && std::isfinite(*value) && *value >= threshold;
}

template <typename... Args>
std::string format(const char* fmt, Args... args) {
    char buffer[128];
    std::snprintf(buffer, sizeof(buffer), fmt, args...);
    return buffer;
}

} // namespace

Regime RegimeClassifier::make_regime(RegimeId id) {
    Regime regime;
    regime.id = id;
    regime.label = regime_label(id);

    switch (id) {
    case RegimeId::C:
        regime.equity_pct = config::regime::C_EQUITY_SHARE;
        regime.reserve_pct = config::regime::C_RESERVE_SHARE;
        regime.description = "Full-scale market panic detected. Deploy ALL remaining reserves into equities. "
                             "Target allocation: 100% Equity / 0% Reserve.";
        break;
    case RegimeId::B:
        regime.equity_pct = config::regime::B_EQUITY_SHARE;
        regime.reserve_pct = config::regime::B_RESERVE_SHARE;
        regime.description = "Equity scarcity detected. Deploy 50% of the Investment Reserve into equities. "
                             "Target allocation: 90% Equity / 10% Reserve.";
        break;
    case RegimeId::A:
    default:
        regime.equity_pct = config::regime::A_EQUITY_SHARE;
        regime.reserve_pct = config::regime::A_RESERVE_SHARE;
        regime.description = "Markets operating normally. Maintain standard allocation: "
                             "80% Equity / 20% Reserve. Rebalance quarterly.";
        break;
    }
    return regime;
}

Regime RegimeClassifier::classify(double drawdown_pct, const StressIndicators& indicators) const {
    const auto& t = thresholds_;

    // Stress confirmations (credit spread tiers are nested: extreme implies elevated)
    bool spread_extreme = at_least(indicators.credit_spread, t.spread_extreme);
    bool spread_elevated = at_least(indicators.credit_spread, t.spread_elevated);
    bool vol_stressed = at_least(indicators.volatility, t.volatility_stress);

    std::vector<std::string> confirmations;
    if (spread_extreme) {
        confirmations.push_back(
            format("Credit spread %.2f%% >= %.2f%% (extreme)", *indicators.credit_spread, t.spread_extreme));
    } else if (spread_elevated) {
        confirmations.push_back(
            format("Credit spread %.2f%% >= %.2f%% (elevated)", *indicators.credit_spread, t.spread_elevated));
    }
    if (vol_stressed) {
        confirmations.push_back(format("Volatility %.1f >= %g", *indicators.volatility, t.volatility_stress));
    }

    // NaN drawdown fails both comparisons and falls through to A
    RegimeId id = RegimeId::A;
    double crossed = 0;
    if (drawdown_pct <= t.drawdown_c && (spread_extreme || vol_stressed)) {
        id = RegimeId::C;
        crossed = t.drawdown_c;
    } else if (drawdown_pct <= t.drawdown_b && (spread_elevated || vol_stressed)) {
        id = RegimeId::B;
        crossed = t.drawdown_b;
    }

    Regime regime = make_regime(id);
    if (id != RegimeId::A) {
        regime.triggers_met.push_back(format("Drawdown %.1f%% <= %g%%", drawdown_pct, crossed));
    }
    regime.triggers_met.insert(regime.triggers_met.end(), confirmations.begin(), confirmations.end());

    regime.drawdown_pct = drawdown_pct;
    regime.volatility = indicators.volatility;
    regime.credit_spread = indicators.credit_spread;
    return regime;
}

} // namespace gpo::strategy
