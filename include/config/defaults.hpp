#pragma once

#include <cstddef>

/**
 * Centralized configuration defaults for the allocation engine.
 *
 * All default values are defined here to avoid duplication across:
 * - RegimeThresholds
 * - RecoveryConfig
 * - SimpleModelConfig
 * - EngineConfig
 *
 * Naming:
 * - _PCT suffix on drawdowns: percentage on a 0-100 scale (-20.0 = -20%)
 * - _SHARE suffix: fraction of the portfolio (0.80 = 80%)
 * - spreads are in percentage points of option-adjusted spread
 */

namespace gpo::config {

// =============================================================================
// Regime Splits (equity share / reserve share, each pair sums to 1.0)
// =============================================================================
namespace regime {
constexpr double A_EQUITY_SHARE = 0.80; // Normal
constexpr double A_RESERVE_SHARE = 0.20;

constexpr double B_EQUITY_SHARE = 0.90; // Equity scarcity: half the reserve deployed
constexpr double B_RESERVE_SHARE = 0.10;

constexpr double C_EQUITY_SHARE = 1.00; // Escalation: whole reserve deployed
constexpr double C_RESERVE_SHARE = 0.00;
} // namespace regime

// =============================================================================
// Classification Thresholds
// =============================================================================
namespace thresholds {
// Drawdown from all-time high
constexpr double DRAWDOWN_B_PCT = -20.0;
constexpr double DRAWDOWN_C_PCT = -40.0;

// BBB corporate OAS
constexpr double SPREAD_ELEVATED = 2.5;
constexpr double SPREAD_EXTREME = 4.5;

// VIX level. A single tier serves both the elevated and extreme confirmation.
constexpr double VOLATILITY_STRESS = 30.0;
} // namespace thresholds

// =============================================================================
// Recovery Checkpoints
// =============================================================================
namespace recovery {
constexpr double C_TO_B_RALLY = 0.50; // +50% from trough
constexpr double B_TO_A_RALLY = 0.25; // further +25% from the C->B level
} // namespace recovery

// =============================================================================
// Allocation
// =============================================================================
namespace allocation {
// Trades smaller than this share of portfolio value produce no rebalance action
constexpr double REBALANCE_BAND_SHARE = 0.01;

// Simplified 3-instrument model is calibrated against the normal regime
constexpr double SIMPLE_BASELINE_EQUITY_SHARE = 0.80;
constexpr double SIMPLE_SATELLITE_SHARE = 0.10;
} // namespace allocation

// =============================================================================
// Drawdown Curve
// =============================================================================
namespace curve {
constexpr std::size_t DEFAULT_POINTS = 504; // ~2 years of trading days
} // namespace curve

} // namespace gpo::config
