#include "../../include/config/engine_config.hpp"
#include "../../include/errors.hpp"
#include "../../include/logging/logger.hpp"

#include <cmath>
#include <cstdint>
#include <fstream>
#include <set>
#include <stdexcept>

namespace gpo::config {

// =============================================================================
// Built-in Defaults
// =============================================================================

EngineConfig EngineConfig::defaults() {
    EngineConfig config;

    // Equal-Value regional weights (share of the equity sleeve, normalized at use)
    config.equity_weights = {
        {"north_america", 0.4848}, {"europe", 0.1615}, {"emerging_markets", 0.0814},
        {"small_caps", 0.0777},    {"japan", 0.0587},  {"pacific_ex_jp", 0.0175},
    };

    // Reserve composition (share of the reserve sleeve)
    config.reserve_weights = {
        {"inflation_linked", 0.50},
        {"money_market", 0.40},
        {"gold", 0.05},
        {"cash", 0.05},
    };

    auto& reg = config.instruments;
    reg.add({"north_america", "iShares Core S&P 500 UCITS ETF", "IE00B5BMR087", "SXR8.DE", "S&P 500", 0.0007});
    reg.add({"europe", "Lyxor Core STOXX Europe 600 UCITS ETF", "LU0908500753", "MEUD.PA", "STOXX Europe 600", 0.0007});
    reg.add({"emerging_markets", "iShares Core MSCI EM IMI UCITS ETF", "IE00BKM4GZ66", "IS3N.DE", "MSCI EM IMI",
             0.0018});
    reg.add({"small_caps", "iShares MSCI World Small Cap UCITS ETF", "IE00BF4RFH31", "IUSN.DE",
             "MSCI World Small Cap", 0.0035});
    reg.add({"japan", "Amundi Prime Japan UCITS ETF", "LU1931974775", "PRIJ.DE", "MSCI Japan", 0.0005});
    reg.add({"pacific_ex_jp", "iShares MSCI Pacific ex-Japan UCITS ETF", "IE00B52MJY50", "IQQP.DE",
             "MSCI Pacific ex-Japan", 0.0020});
    reg.add({"inflation_linked", "iShares Euro Inflation Linked Govt Bond UCITS ETF", "IE00B0M62X26", "IBCI.DE",
             "Bloomberg Euro Govt Inflation-Linked", 0.0020});
    reg.add({"money_market", "Xtrackers II EUR Overnight Rate Swap UCITS ETF", "LU0290358497", "XEON.DE",
             "EUR Overnight Rate", 0.0010});
    reg.add({"gold", "Xtrackers IE Physical Gold ETC", "DE000A2T0VU5", "XAD5.DE", "Gold Spot", 0.0015});
    reg.add({"cash", "Cash / High-Yield Savings", "N/A", "N/A", "N/A", 0.0});

    return config;
}

// =============================================================================
// Validation
// =============================================================================

namespace {

void validate_table(const WeightTable& table, const char* section) {
    for (const auto& e : table) {
        if (!std::isfinite(e.weight) || e.weight < 0) {
            throw InvalidWeights(std::string(section) + ": weight for '" + e.key + "' must be a non-negative number");
        }
    }
}

void require(bool condition, const std::string& message) {
    if (!condition)
        throw ConfigError(message);
}

} // namespace

void EngineConfig::validate() const {
    const auto& t = thresholds;
    require(std::isfinite(t.drawdown_b) && std::isfinite(t.drawdown_c) && std::isfinite(t.spread_elevated) &&
                std::isfinite(t.spread_extreme) && std::isfinite(t.volatility_stress),
            "thresholds must be finite numbers");
    require(t.drawdown_c <= t.drawdown_b && t.drawdown_b <= 0, "thresholds: need drawdown_c <= drawdown_b <= 0");
    require(t.spread_elevated <= t.spread_extreme, "thresholds: need spread_elevated <= spread_extreme");

    require(std::isfinite(recovery.c_to_b_rally) && recovery.c_to_b_rally > 0, "recovery: c_to_b_rally must be > 0");
    require(std::isfinite(recovery.b_to_a_rally) && recovery.b_to_a_rally > 0, "recovery: b_to_a_rally must be > 0");

    validate_table(equity_weights, "equity_weights");
    validate_table(reserve_weights, "reserve_weights");

    if (!(equity_weights.total() > 0)) {
        throw InvalidWeights("equity_weights must have a positive total");
    }
    if (std::abs(reserve_weights.total() - 1.0) > WEIGHT_EPSILON) {
        throw InvalidWeights("reserve_weights must sum to 1.0, got " + std::to_string(reserve_weights.total()));
    }

    std::set<InstrumentKey> seen;
    for (const auto* table : {&equity_weights, &reserve_weights}) {
        for (const auto& e : *table) {
            if (!seen.insert(e.key).second) {
                throw InvalidWeights("instrument '" + e.key + "' appears in both sleeves");
            }
            require(instruments.contains(e.key), "weight table references unknown instrument '" + e.key + "'");
        }
    }

    for (const auto& meta : instruments.all()) {
        require(std::isfinite(meta.expense_ratio) && meta.expense_ratio >= 0,
                "instrument '" + meta.key + "': expense ratio must be a non-negative number");
    }

    const auto& sm = simple_model;
    require(std::isfinite(sm.baseline_equity_share) && sm.baseline_equity_share > 0,
            "simple_model: baseline_equity_share must be > 0");
    require(std::isfinite(sm.satellite_share) && sm.satellite_share >= 0 &&
                sm.satellite_share <= sm.baseline_equity_share,
            "simple_model: satellite_share must lie in [0, baseline_equity_share]");

    require(std::isfinite(rebalance_band) && rebalance_band >= 0, "rebalance_band must be >= 0");

    try {
        logging::parse_level(log_level);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
}

// =============================================================================
// ConfigParser
// =============================================================================

ConfigParser::json ConfigParser::read_file(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filename);
    }

    try {
        return json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError(filename + ": " + e.what());
    }
}

EngineConfig ConfigParser::load(const std::string& filename) {
    return parse(read_file(filename));
}

EngineConfig ConfigParser::parse_text(const std::string& text) {
    json doc;
    try {
        doc = json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigError(e.what());
    }
    return parse(doc);
}

EngineConfig ConfigParser::parse(const json& doc, EngineConfig base) {
    if (!doc.is_object()) {
        throw ConfigError("configuration root must be a JSON object");
    }

    EngineConfig config = std::move(base);

    try {
        if (doc.contains("thresholds")) {
            const auto& t = doc.at("thresholds");
            auto& out = config.thresholds;
            out.drawdown_b = t.value("drawdown_b", out.drawdown_b);
            out.drawdown_c = t.value("drawdown_c", out.drawdown_c);
            out.spread_elevated = t.value("spread_elevated", out.spread_elevated);
            out.spread_extreme = t.value("spread_extreme", out.spread_extreme);
            out.volatility_stress = t.value("volatility_stress", out.volatility_stress);
        }

        if (doc.contains("recovery")) {
            const auto& r = doc.at("recovery");
            config.recovery.c_to_b_rally = r.value("c_to_b_rally", config.recovery.c_to_b_rally);
            config.recovery.b_to_a_rally = r.value("b_to_a_rally", config.recovery.b_to_a_rally);
        }

        // Instruments merge into the registry; an existing key keeps unspecified fields
        if (doc.contains("instruments")) {
            const auto& section = doc.at("instruments");
            if (!section.is_object())
                throw ConfigError("instruments must be an object");
            for (const auto& item : section.items()) {
                const auto& v = item.value();
                InstrumentMeta meta;
                if (const auto* existing = config.instruments.find(item.key()))
                    meta = *existing;
                meta.key = item.key();
                meta.display_name = v.value("name", meta.display_name);
                meta.identifier_code = v.value("isin", meta.identifier_code);
                meta.ticker = v.value("ticker", meta.ticker);
                meta.tracked_index_label = v.value("index", meta.tracked_index_label);
                meta.expense_ratio = v.value("ter", meta.expense_ratio);
                config.instruments.add(meta);
            }
        }

        if (doc.contains("equity_weights"))
            config.equity_weights = parse_weights(doc.at("equity_weights"), "equity_weights");
        if (doc.contains("reserve_weights"))
            config.reserve_weights = parse_weights(doc.at("reserve_weights"), "reserve_weights");

        if (doc.contains("simple_model")) {
            const auto& sm = doc.at("simple_model");
            config.simple_model.baseline_equity_share =
                sm.value("baseline_equity_share", config.simple_model.baseline_equity_share);
            config.simple_model.satellite_share = sm.value("satellite_share", config.simple_model.satellite_share);
        }

        config.rebalance_band = doc.value("rebalance_band", config.rebalance_band);

        if (doc.contains("drawdown_curve_points")) {
            auto points = doc.at("drawdown_curve_points").get<int64_t>();
            if (points < 0)
                throw ConfigError("drawdown_curve_points must be >= 0");
            config.drawdown_curve_points = static_cast<size_t>(points);
        }

        config.log_level = doc.value("log_level", config.log_level);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("malformed configuration: ") + e.what());
    }

    config.validate();
    return config;
}

void ConfigParser::apply_weight_overrides(const std::string& filename, EngineConfig& config) {
    json doc = read_file(filename);
    if (!doc.is_object() || (!doc.contains("equity_weights") && !doc.contains("reserve_weights"))) {
        throw ConfigError(filename + ": provide equity_weights and/or reserve_weights");
    }

    EngineConfig updated = config;
    if (doc.contains("equity_weights"))
        updated.equity_weights = parse_weights(doc.at("equity_weights"), "equity_weights");
    if (doc.contains("reserve_weights"))
        updated.reserve_weights = parse_weights(doc.at("reserve_weights"), "reserve_weights");

    // Validate before touching the caller's config
    updated.validate();
    config = std::move(updated);
}

WeightTable ConfigParser::parse_weights(const json& obj, const std::string& section) {
    if (!obj.is_object()) {
        throw ConfigError(section + " must be an object of instrument -> weight");
    }

    WeightTable table;
    for (const auto& item : obj.items()) {
        if (!item.value().is_number()) {
            throw ConfigError(section + ": weight for '" + item.key() + "' must be a number");
        }
        table.set(item.key(), item.value().get<double>());
    }
    return table;
}

Holdings ConfigParser::load_holdings(const std::string& filename) {
    return parse_holdings(read_file(filename));
}

Holdings ConfigParser::parse_holdings(const json& obj) {
    if (!obj.is_object()) {
        throw ConfigError("holdings must be an object of instrument -> value");
    }

    Holdings holdings;
    for (const auto& item : obj.items()) {
        if (!item.value().is_number()) {
            throw ConfigError("holding for '" + item.key() + "' must be a number");
        }
        holdings[item.key()] = item.value().get<double>();
    }
    return holdings;
}

} // namespace gpo::config
