#include "../../include/trading/allocation_calculator.hpp"
#include "../../include/errors.hpp"

#include <cmath>
#include <string>

namespace gpo::trading {

namespace {

// 12000.4 -> "12,000"
std::string format_amount(Money amount) {
    std::string digits = std::to_string(std::llround(std::abs(amount)));
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0)
            out.push_back(',');
        out.push_back(*it);
        ++count;
    }
    return std::string(out.rbegin(), out.rend());
}

} // namespace

// =============================================================================
// RebalanceAction
// =============================================================================

std::string RebalanceAction::describe() const {
    return std::string(side_to_string(side)) + " " + format_amount(amount) + " of " + display_name + " (" +
           instrument_key + ")";
}

// =============================================================================
// AllocationCalculator
// =============================================================================

std::vector<double> AllocationCalculator::normalize(const config::WeightTable& weights) {
    for (const auto& e : weights) {
        if (!std::isfinite(e.weight) || e.weight < 0) {
            throw InvalidWeights("weight for '" + e.key + "' must be a non-negative number");
        }
    }

    double total = weights.total();

    std::vector<double> normalized;
    normalized.reserve(weights.size());
    for (const auto& e : weights) {
        normalized.push_back(total > 0 ? e.weight / total : 0.0);
    }
    return normalized;
}

AllocationResult AllocationCalculator::allocate(const strategy::Regime& regime,
                                                const config::WeightTable& equity_weights,
                                                const config::WeightTable& reserve_weights, Money portfolio_value,
                                                const std::optional<Holdings>& current_holdings) const {
    if (!std::isfinite(portfolio_value) || portfolio_value < 0) {
        throw InvalidPortfolioValue("portfolio value must be a non-negative number");
    }
    for (const auto& e : equity_weights) {
        if (reserve_weights.contains(e.key)) {
            throw InvalidWeights("instrument '" + e.key + "' appears in both sleeves");
        }
    }

    AllocationResult result;
    result.regime_id = regime.id;
    result.portfolio_value = portfolio_value;
    result.equity_pct = regime.equity_pct;
    result.reserve_pct = regime.reserve_pct;
    result.equity_value = portfolio_value * regime.equity_pct;
    result.reserve_value = portfolio_value * regime.reserve_pct;

    add_sleeve(result, Sleeve::Equity, equity_weights, result.equity_value);
    add_sleeve(result, Sleeve::Reserve, reserve_weights, result.reserve_value);

    if (current_holdings) {
        apply_holdings(result, *current_holdings);
    }

    add_simple_model(result);

    // Cost is weighted by share of the whole portfolio, not of the sleeve
    if (portfolio_value > 0) {
        for (const auto& p : result.positions)
            result.weighted_expense_ratio += p.target_value / portfolio_value * p.expense_ratio;
        for (const auto& p : result.simple_positions)
            result.simple_weighted_expense_ratio += p.target_value / portfolio_value * p.expense_ratio;
    }

    build_rebalance_actions(result);
    return result;
}

void AllocationCalculator::add_sleeve(AllocationResult& result, Sleeve sleeve, const config::WeightTable& weights,
                                      Money sleeve_value) const {
    const double sleeve_share = (sleeve == Sleeve::Equity) ? result.equity_pct : result.reserve_pct;
    const auto normalized = normalize(weights);

    size_t i = 0;
    for (const auto& e : weights) {
        Position p = make_position(e.key, sleeve);
        p.target_weight = normalized[i++];
        p.portfolio_weight = p.target_weight * sleeve_share;
        p.target_value = p.target_weight * sleeve_value;
        result.positions.push_back(std::move(p));
    }
}

void AllocationCalculator::apply_holdings(AllocationResult& result, const Holdings& holdings) const {
    for (const auto& [key, value] : holdings) {
        if (!std::isfinite(value)) {
            throw InvalidPortfolioValue("current holding for '" + key + "' must be finite");
        }
    }

    for (auto& p : result.positions) {
        auto it = holdings.find(p.instrument_key);
        Money current = (it == holdings.end()) ? 0.0 : it->second;
        p.current_value = current;
        p.trade_delta = p.target_value - current;
    }

    // Held but not targeted: sell everything
    for (const auto& [key, value] : holdings) {
        if (result.find(key) != nullptr)
            continue;

        Position p = make_position(key, Sleeve::Orphan);
        p.current_value = value;
        p.trade_delta = -value;
        result.positions.push_back(std::move(p));
    }
}

void AllocationCalculator::add_simple_model(AllocationResult& result) const {
    const auto& sm = simple_model_;

    // Satellite scales with the equity share relative to the normal regime;
    // the world fund takes the rest of the equity, cash takes the reserve.
    double scale = sm.baseline_equity_share > 0 ? result.equity_pct / sm.baseline_equity_share : 0.0;
    double satellite = sm.satellite_share * scale;
    double world = result.equity_pct - satellite;
    double cash = result.reserve_pct;

    const std::pair<const config::InstrumentMeta*, double> legs[] = {
        {&sm.world, world},
        {&sm.satellite, satellite},
        {&sm.cash, cash},
    };

    for (const auto& [meta, weight] : legs) {
        Position p = from_meta(*meta, Sleeve::Simple);
        p.target_weight = weight;
        p.portfolio_weight = weight;
        p.target_value = result.portfolio_value * weight;
        result.simple_positions.push_back(std::move(p));
    }
}

void AllocationCalculator::build_rebalance_actions(AllocationResult& result) const {
    const Money band = rebalance_band_ * result.portfolio_value;

    for (const auto& p : result.positions) {
        if (!p.trade_delta || std::abs(*p.trade_delta) <= band)
            continue;

        RebalanceAction action;
        action.instrument_key = p.instrument_key;
        action.display_name = p.display_name;
        action.side = *p.trade_delta > 0 ? Side::Buy : Side::Sell;
        action.amount = std::abs(*p.trade_delta);
        result.rebalance_actions.push_back(std::move(action));
    }
}

Position AllocationCalculator::make_position(const InstrumentKey& key, Sleeve sleeve) const {
    if (const auto* meta = instruments_.find(key)) {
        return from_meta(*meta, sleeve);
    }

    Position p;
    p.instrument_key = key;
    p.sleeve = sleeve;
    p.display_name = key;
    return p;
}

Position AllocationCalculator::from_meta(const config::InstrumentMeta& meta, Sleeve sleeve) {
    Position p;
    p.instrument_key = meta.key;
    p.sleeve = sleeve;
    p.display_name = meta.display_name;
    p.identifier_code = meta.identifier_code;
    p.tracked_index_label = meta.tracked_index_label;
    p.expense_ratio = meta.expense_ratio;
    return p;
}

} // namespace gpo::trading
