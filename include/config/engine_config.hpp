#pragma once

#include "../types.hpp"
#include "defaults.hpp"

#include <nlohmann/json.hpp>

#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace gpo {
namespace config {

/**
 * Regime classification thresholds
 */
struct RegimeThresholds {
    double drawdown_b = thresholds::DRAWDOWN_B_PCT;
    double drawdown_c = thresholds::DRAWDOWN_C_PCT;
    double spread_elevated = thresholds::SPREAD_ELEVATED;
    double spread_extreme = thresholds::SPREAD_EXTREME;
    double volatility_stress = thresholds::VOLATILITY_STRESS;
};

/**
 * Recovery checkpoint rallies (fractions, 0.5 = +50%)
 */
struct RecoveryConfig {
    double c_to_b_rally = recovery::C_TO_B_RALLY;
    double b_to_a_rally = recovery::B_TO_A_RALLY;
};

struct WeightEntry {
    InstrumentKey key;
    double weight = 0;

    bool operator==(const WeightEntry&) const = default;
};

/**
 * WeightTable - instrument key -> raw weight, in insertion order
 *
 * Order is preserved so positions come out in the order the table was
 * configured. Weights are not validated here; validation happens when the
 * table is loaded (EngineConfig::validate) or used (AllocationCalculator).
 */
class WeightTable {
public:
    WeightTable() = default;
    WeightTable(std::initializer_list<WeightEntry> entries) {
        for (const auto& e : entries)
            set(e.key, e.weight);
    }

    // Insert or replace, existing keys keep their position
    void set(const InstrumentKey& key, double weight) {
        for (auto& e : entries_) {
            if (e.key == key) {
                e.weight = weight;
                return;
            }
        }
        entries_.push_back({key, weight});
    }

    const WeightEntry* find(const InstrumentKey& key) const {
        for (const auto& e : entries_) {
            if (e.key == key)
                return &e;
        }
        return nullptr;
    }

    bool contains(const InstrumentKey& key) const { return find(key) != nullptr; }

    double total() const {
        double sum = 0;
        for (const auto& e : entries_)
            sum += e.weight;
        return sum;
    }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    std::vector<WeightEntry>::const_iterator begin() const { return entries_.begin(); }
    std::vector<WeightEntry>::const_iterator end() const { return entries_.end(); }
    const std::vector<WeightEntry>& entries() const { return entries_; }

    bool operator==(const WeightTable&) const = default;

private:
    std::vector<WeightEntry> entries_;
};

/**
 * Static descriptor of one instrument (UCITS ETF, ETC or cash account)
 */
struct InstrumentMeta {
    InstrumentKey key;
    std::string display_name;
    std::string identifier_code; // ISIN, "N/A" for cash
    std::string ticker;
    std::string tracked_index_label;
    double expense_ratio = 0; // TER as a fraction (0.0007 = 0.07%)
};

/**
 * InstrumentRegistry - closed set of known instruments, keyed like WeightTable
 */
class InstrumentRegistry {
public:
    // Insert or replace
    void add(InstrumentMeta meta) {
        auto it = index_.find(meta.key);
        if (it != index_.end()) {
            instruments_[it->second] = std::move(meta);
            return;
        }
        index_[meta.key] = instruments_.size();
        instruments_.push_back(std::move(meta));
    }

    const InstrumentMeta* find(const InstrumentKey& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &instruments_[it->second];
    }

    bool contains(const InstrumentKey& key) const { return index_.count(key) > 0; }
    size_t size() const { return instruments_.size(); }
    const std::vector<InstrumentMeta>& all() const { return instruments_; }

private:
    std::vector<InstrumentMeta> instruments_;
    std::map<InstrumentKey, size_t> index_;
};

/**
 * Simplified 3-instrument model: world equity + small-cap satellite + cash
 */
struct SimpleModelConfig {
    InstrumentMeta world{"acwi_imi", "SPDR MSCI ACWI IMI UCITS ETF", "IE00B3YLTY66", "SPYI.DE", "MSCI ACWI IMI", 0.0017};
    InstrumentMeta satellite{"small_caps", "iShares MSCI World Small Cap UCITS ETF", "IE00BF4RFH31", "IUSN.DE",
                             "MSCI World Small Cap", 0.0035};
    InstrumentMeta cash{"cash", "High-Yield Savings / Money Market", "N/A", "N/A", "N/A", 0.0};
    double baseline_equity_share = allocation::SIMPLE_BASELINE_EQUITY_SHARE;
    double satellite_share = allocation::SIMPLE_SATELLITE_SHARE;
};

/**
 * Complete engine configuration. Loaded once, then read-only.
 */
struct EngineConfig {
    RegimeThresholds thresholds;
    RecoveryConfig recovery;
    WeightTable equity_weights;
    WeightTable reserve_weights;
    InstrumentRegistry instruments;
    SimpleModelConfig simple_model;
    double rebalance_band = allocation::REBALANCE_BAND_SHARE;
    size_t drawdown_curve_points = curve::DEFAULT_POINTS;
    std::string log_level = "info";

    // Built-in Equal-Value regional weights, reserve mix and ETF universe
    static EngineConfig defaults();

    /**
     * Check internal consistency. Throws InvalidWeights for bad weight tables
     * and ConfigError for everything else.
     */
    void validate() const;
};

/**
 * JSON configuration loader (nlohmann::ordered_json keeps table order)
 *
 * Format:
 * {
 *   "thresholds": { "drawdown_b": -20, "spread_elevated": 2.5, ... },
 *   "recovery": { "c_to_b_rally": 0.5, "b_to_a_rally": 0.25 },
 *   "equity_weights": { "north_america": 0.4848, ... },
 *   "reserve_weights": { "inflation_linked": 0.5, ... },
 *   "instruments": { "gold": { "name": "...", "isin": "...", "ter": 0.0015 } },
 *   "simple_model": { "baseline_equity_share": 0.8, "satellite_share": 0.1 },
 *   "rebalance_band": 0.01,
 *   "drawdown_curve_points": 504,
 *   "log_level": "info"
 * }
 *
 * Every section is optional; missing values keep the defaults. A weight table
 * present in the document replaces the default table as a whole.
 */
class ConfigParser {
public:
    using json = nlohmann::ordered_json;

    static EngineConfig load(const std::string& filename);
    static EngineConfig parse_text(const std::string& text);
    static EngineConfig parse(const json& doc, EngineConfig base = EngineConfig::defaults());

    // Apply a weight override file ({"equity_weights": ..., "reserve_weights": ...})
    static void apply_weight_overrides(const std::string& filename, EngineConfig& config);

    static WeightTable parse_weights(const json& obj, const std::string& section);
    static Holdings load_holdings(const std::string& filename);
    static Holdings parse_holdings(const json& obj);

private:
    static json read_file(const std::string& filename);
};

} // namespace config
} // namespace gpo
