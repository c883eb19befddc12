#pragma once

/**
 * RegimeClassifier - three-state market stress classification
 *
 * Drawdown depth alone never escalates: every escalation needs a stress
 * confirmation from credit spreads or volatility, which separates genuine
 * stress from an ordinary pullback.
 *
 *   C (Escalation)      drawdown <= drawdown_c AND (spread >= extreme  OR vol >= stress)
 *   B (Equity Scarcity) drawdown <= drawdown_b AND (spread >= elevated OR vol >= stress)
 *   A (Normal)          otherwise
 *
 * C is tested first. Stateless: every call classifies from scratch, there is
 * no hysteresis and no remembered regime.
 */

#include "../config/engine_config.hpp"
#include "../types.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gpo {
namespace strategy {

/**
 * Regime identifiers, rank-ordered by severity (A < B < C)
 */
enum class RegimeId : uint8_t {
    A = 0, // Normal
    B = 1, // Equity scarcity
    C = 2  // Escalation
};

inline const char* regime_to_string(RegimeId id) {
    switch (id) {
    case RegimeId::A:
        return "A";
    case RegimeId::B:
        return "B";
    case RegimeId::C:
        return "C";
    default:
        return "?";
    }
}

inline const char* regime_label(RegimeId id) {
    switch (id) {
    case RegimeId::A:
        return "Normal";
    case RegimeId::B:
        return "Equity Scarcity";
    case RegimeId::C:
        return "Escalation";
    default:
        return "Unknown";
    }
}

inline int severity(RegimeId id) { return static_cast<int>(id); }

/**
 * Stress confirmations. Absent values fail their confirmation test.
 */
struct StressIndicators {
    std::optional<double> volatility;    // VIX level
    std::optional<double> credit_spread; // BBB OAS, percentage points
};

struct Regime {
    RegimeId id = RegimeId::A;
    std::string label;
    std::string description;
    double equity_pct = 0;  // Equity share, 0-1
    double reserve_pct = 0; // Reserve share, 0-1; equity_pct + reserve_pct == 1
    std::vector<std::string> triggers_met; // Display only

    // Inputs echoed for reporting
    double drawdown_pct = 0;
    std::optional<double> volatility;
    std::optional<double> credit_spread;
};

class RegimeClassifier {
public:
    explicit RegimeClassifier(const config::RegimeThresholds& thresholds = config::RegimeThresholds())
        : thresholds_(thresholds) {}

    /**
     * Classify from drawdown (0-100 scale, <= 0) and stress indicators.
     * Total over all inputs: non-finite values fail their test, never throw.
     */
    Regime classify(double drawdown_pct, const StressIndicators& indicators) const;

    /**
     * Regime record for an id without evaluating any triggers
     */
    static Regime make_regime(RegimeId id);

    const config::RegimeThresholds& thresholds() const { return thresholds_; }

private:
    config::RegimeThresholds thresholds_;
};

} // namespace strategy
} // namespace gpo
