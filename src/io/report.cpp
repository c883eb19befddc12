#include "../../include/io/report.hpp"

#include <iomanip>
#include <optional>

namespace gpo::io {

namespace {

json optional_number(const std::optional<double>& value) {
    return value ? json(*value) : json(nullptr);
}

void render_regime(std::ostream& out, const strategy::Regime& regime) {
    out << "[ Regime ]\n";
    out << "  regime:        " << strategy::regime_to_string(regime.id) << " - " << regime.label << "\n";
    out << "  split:         " << std::setprecision(0) << regime.equity_pct * PERCENT << "% equity / "
        << regime.reserve_pct * PERCENT << "% reserve\n";
    out << std::setprecision(2);
    out << "  drawdown:      " << regime.drawdown_pct << "%\n";
    out << "  volatility:    ";
    if (regime.volatility)
        out << *regime.volatility << "\n";
    else
        out << "n/a\n";
    out << "  credit spread: ";
    if (regime.credit_spread)
        out << *regime.credit_spread << "%\n";
    else
        out << "n/a\n";
    if (regime.triggers_met.empty()) {
        out << "  triggers:      none\n";
    } else {
        for (const auto& trigger : regime.triggers_met)
            out << "  trigger:       " << trigger << "\n";
    }
    out << "  " << regime.description << "\n\n";
}

void render_positions(std::ostream& out, const std::vector<trading::Position>& positions) {
    for (const auto& p : positions) {
        out << "  " << std::left << std::setw(18) << p.instrument_key << std::right << std::setw(8)
            << std::setprecision(2) << p.portfolio_weight * PERCENT << "%  " << std::setw(14) << p.target_value;
        if (p.trade_delta) {
            out << "  delta " << std::showpos << std::setw(13) << *p.trade_delta << std::noshowpos;
        }
        out << "  " << p.display_name << "\n";
    }
}

void render_allocation(std::ostream& out, const trading::AllocationResult& result) {
    out << std::setprecision(2);
    out << "[ Allocation ]\n";
    out << "  portfolio:     " << result.portfolio_value << "\n";
    out << "  equity:        " << result.equity_value << "\n";
    out << "  reserve:       " << result.reserve_value << "\n";
    out << "  weighted TER:  " << std::setprecision(4) << result.weighted_expense_ratio * PERCENT << "%\n\n";

    out << "[ Positions ]\n";
    render_positions(out, result.positions);
    out << "\n[ Simplified Model ]\n";
    render_positions(out, result.simple_positions);
    out << "  weighted TER:  " << std::setprecision(4) << result.simple_weighted_expense_ratio * PERCENT << "%\n";

    if (!result.rebalance_actions.empty()) {
        out << "\n[ Rebalance ]\n";
        for (const auto& action : result.rebalance_actions)
            out << "  " << action.describe() << "\n";
    }
    out << "\n";
}

} // namespace

// =============================================================================
// JSON
// =============================================================================

json to_json(const analytics::DrawdownSnapshot& snap) {
    json j;
    j["current_price"] = snap.current_price;
    j["ath"] = snap.ath;
    j["ath_date"] = snap.ath_date;
    j["drawdown_pct"] = snap.drawdown_pct;
    j["trough_price"] = snap.trough_price;
    j["trough_date"] = snap.trough_date;
    j["trough_drawdown_pct"] = snap.trough_drawdown_pct;
    return j;
}

json to_json(const analytics::DrawdownPoint& point) {
    json j;
    j["date"] = point.date;
    j["price"] = point.price;
    j["running_ath"] = point.running_ath;
    j["drawdown_pct"] = point.drawdown_pct;
    return j;
}

json to_json(const strategy::Regime& regime) {
    json j;
    j["regime"] = strategy::regime_to_string(regime.id);
    j["label"] = regime.label;
    j["description"] = regime.description;
    j["equity_pct"] = regime.equity_pct;
    j["reserve_pct"] = regime.reserve_pct;
    j["triggers_met"] = regime.triggers_met;
    j["drawdown_pct"] = regime.drawdown_pct;
    j["volatility"] = optional_number(regime.volatility);
    j["credit_spread"] = optional_number(regime.credit_spread);
    return j;
}

json to_json(const strategy::RecoveryState& state) {
    json j;
    j["trough_price"] = state.trough_price;
    j["current_price"] = state.current_price;
    j["c_to_b_price"] = state.c_to_b_price;
    j["b_to_a_price"] = state.b_to_a_price;
    j["progress_to_b"] = state.progress_to_b;
    j["progress_to_a"] = optional_number(state.progress_to_a);
    return j;
}

json to_json(const trading::Position& position) {
    json j;
    j["instrument_key"] = position.instrument_key;
    j["sleeve"] = trading::sleeve_to_string(position.sleeve);
    j["display_name"] = position.display_name;
    j["identifier_code"] = position.identifier_code;
    j["tracked_index_label"] = position.tracked_index_label;
    j["expense_ratio"] = position.expense_ratio;
    j["target_weight"] = position.target_weight;
    j["portfolio_weight"] = position.portfolio_weight;
    j["target_value"] = position.target_value;
    j["current_value"] = optional_number(position.current_value);
    j["trade_delta"] = optional_number(position.trade_delta);
    return j;
}

json to_json(const trading::RebalanceAction& action) {
    json j;
    j["instrument_key"] = action.instrument_key;
    j["side"] = side_to_string(action.side);
    j["amount"] = action.amount;
    j["description"] = action.describe();
    return j;
}

json to_json(const trading::AllocationResult& result) {
    json j;
    j["regime_id"] = strategy::regime_to_string(result.regime_id);
    j["portfolio_value"] = result.portfolio_value;
    j["equity_value"] = result.equity_value;
    j["reserve_value"] = result.reserve_value;
    j["equity_pct"] = result.equity_pct;
    j["reserve_pct"] = result.reserve_pct;

    j["positions"] = json::array();
    for (const auto& p : result.positions)
        j["positions"].push_back(to_json(p));

    j["simple_positions"] = json::array();
    for (const auto& p : result.simple_positions)
        j["simple_positions"].push_back(to_json(p));

    j["weighted_expense_ratio"] = result.weighted_expense_ratio;
    j["weighted_expense_ratio_pct"] = result.weighted_expense_ratio * PERCENT;
    j["simple_weighted_expense_ratio"] = result.simple_weighted_expense_ratio;

    j["rebalance_actions"] = json::array();
    for (const auto& a : result.rebalance_actions)
        j["rebalance_actions"].push_back(to_json(a));
    return j;
}

json to_json(const engine::Evaluation& eval) {
    json j;
    j["drawdown"] = to_json(eval.drawdown);
    j["regime"] = to_json(eval.regime);
    j["recovery"] = to_json(eval.recovery);
    j["allocation"] = eval.allocation ? to_json(*eval.allocation) : json(nullptr);

    j["drawdown_curve"] = json::array();
    for (const auto& point : eval.drawdown_curve)
        j["drawdown_curve"].push_back(to_json(point));
    return j;
}

json to_json(const engine::Simulation& sim) {
    json j;
    j["regime"] = to_json(sim.regime);
    j["allocation"] = to_json(sim.allocation);
    return j;
}

// =============================================================================
// Text
// =============================================================================

void render_text(std::ostream& out, const engine::Evaluation& eval) {
    const auto& dd = eval.drawdown;
    const auto& rec = eval.recovery;

    out << std::fixed << std::setprecision(2);
    out << "\n=== REGIME EVALUATION ===\n\n";

    out << "[ Market ]\n";
    out << "  price:         " << dd.current_price << "\n";
    out << "  ATH:           " << dd.ath << " (" << dd.ath_date << ")\n";
    out << "  drawdown:      " << dd.drawdown_pct << "%\n";
    out << "  trough:        " << dd.trough_price << " (" << dd.trough_date << ", " << dd.trough_drawdown_pct
        << "%)\n\n";

    render_regime(out, eval.regime);

    out << std::setprecision(2);
    out << "[ Recovery ]\n";
    out << "  C -> B at:     " << rec.c_to_b_price << " (" << std::setprecision(1) << rec.progress_to_b
        << "% there)\n";
    out << std::setprecision(2);
    out << "  B -> A at:     " << rec.b_to_a_price;
    if (rec.progress_to_a)
        out << " (" << std::setprecision(1) << *rec.progress_to_a << "% there)\n";
    else
        out << " (not started)\n";
    out << "\n";

    if (eval.allocation)
        render_allocation(out, *eval.allocation);
}

void render_text(std::ostream& out, const engine::Simulation& sim) {
    out << std::fixed << std::setprecision(2);
    out << "\n=== REGIME SIMULATION ===\n\n";
    render_regime(out, sim.regime);
    render_allocation(out, sim.allocation);
}

} // namespace gpo::io
