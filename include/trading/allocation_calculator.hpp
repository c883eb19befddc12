#pragma once

/**
 * AllocationCalculator - regime split -> per-instrument targets
 *
 * Features:
 * - Equity and reserve sleeves, each normalized against its own total
 * - Instrument metadata (name, ISIN, index, TER) from the registry
 * - Simplified 3-instrument view computed by its own fixed rule
 * - Trade deltas against current holdings, orphaned holdings liquidated
 * - Weighted expense ratio re-based to the whole portfolio
 * - BUY/SELL rebalance actions outside a tolerance band
 *
 * Usage:
 *   AllocationCalculator calc(config.instruments, config.simple_model);
 *   auto result = calc.allocate(regime, config.equity_weights, config.reserve_weights, 100000.0);
 *
 * Every call is independent and deterministic; inputs are never modified.
 */

#include "../config/engine_config.hpp"
#include "../strategy/regime_classifier.hpp"
#include "../types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gpo {
namespace trading {

enum class Sleeve : uint8_t {
    Equity = 0,
    Reserve = 1,
    Orphan = 2, // Held but not targeted: liquidated
    Simple = 3  // Simplified model view
};

inline const char* sleeve_to_string(Sleeve sleeve) {
    switch (sleeve) {
    case Sleeve::Equity:
        return "equity";
    case Sleeve::Reserve:
        return "reserve";
    case Sleeve::Orphan:
        return "orphan";
    case Sleeve::Simple:
        return "simple";
    default:
        return "unknown";
    }
}

// =============================================================================
// Position - one target line of an allocation
// =============================================================================
struct Position {
    InstrumentKey instrument_key;
    Sleeve sleeve = Sleeve::Equity;

    // Metadata (display name falls back to the key for unregistered instruments)
    std::string display_name;
    std::string identifier_code;
    std::string tracked_index_label;
    double expense_ratio = 0;

    // Share within the sleeve for Equity/Reserve, share of the portfolio for Simple
    double target_weight = 0;
    double portfolio_weight = 0; // Share of the whole portfolio
    Money target_value = 0;

    // Present only when current holdings were supplied
    std::optional<Money> current_value;
    std::optional<Money> trade_delta; // > 0 buy, < 0 sell
};

struct RebalanceAction {
    InstrumentKey instrument_key;
    std::string display_name;
    Side side = Side::Buy;
    Money amount = 0; // Always positive

    // "BUY 12,000 of iShares Core S&P 500 UCITS ETF (north_america)"
    std::string describe() const;
};

struct AllocationResult {
    strategy::RegimeId regime_id = strategy::RegimeId::A;
    Money portfolio_value = 0;
    Money equity_value = 0;
    Money reserve_value = 0;
    double equity_pct = 0;
    double reserve_pct = 0;

    std::vector<Position> positions;        // Equity sleeve, reserve sleeve, then orphans
    std::vector<Position> simple_positions; // World, satellite, cash

    double weighted_expense_ratio = 0;        // Fraction, full model
    double simple_weighted_expense_ratio = 0; // Fraction, simplified model

    std::vector<RebalanceAction> rebalance_actions;

    const Position* find(const InstrumentKey& key) const {
        for (const auto& p : positions) {
            if (p.instrument_key == key)
                return &p;
        }
        return nullptr;
    }
};

// =============================================================================
// AllocationCalculator
// =============================================================================
class AllocationCalculator {
public:
    explicit AllocationCalculator(config::InstrumentRegistry instruments,
                                  config::SimpleModelConfig simple_model = config::SimpleModelConfig(),
                                  double rebalance_band = config::allocation::REBALANCE_BAND_SHARE)
        : instruments_(std::move(instruments)), simple_model_(std::move(simple_model)),
          rebalance_band_(rebalance_band) {}

    /**
     * Compute targets for both models and, when holdings are supplied,
     * the trades that move the current state onto the targets.
     *
     * @throws InvalidPortfolioValue portfolio_value < 0 or non-finite, or a non-finite holding
     * @throws InvalidWeights negative or non-finite weight, or a key in both sleeves
     */
    AllocationResult allocate(const strategy::Regime& regime, const config::WeightTable& equity_weights,
                              const config::WeightTable& reserve_weights, Money portfolio_value,
                              const std::optional<Holdings>& current_holdings = std::nullopt) const;

    /**
     * Sleeve-normalized weights, in table order. A zero total yields all zeros.
     */
    static std::vector<double> normalize(const config::WeightTable& weights);

    double rebalance_band() const { return rebalance_band_; }

private:
    config::InstrumentRegistry instruments_;
    config::SimpleModelConfig simple_model_;
    double rebalance_band_;

    void add_sleeve(AllocationResult& result, Sleeve sleeve, const config::WeightTable& weights,
                    Money sleeve_value) const;
    void add_simple_model(AllocationResult& result) const;
    void apply_holdings(AllocationResult& result, const Holdings& holdings) const;
    void build_rebalance_actions(AllocationResult& result) const;

    Position make_position(const InstrumentKey& key, Sleeve sleeve) const;
    static Position from_meta(const config::InstrumentMeta& meta, Sleeve sleeve);
};

} // namespace trading
} // namespace gpo
