#pragma once

/**
 * Evaluator - end-to-end regime evaluation
 *
 * Wires the pure components together:
 *
 *   prices --> DrawdownAnalyzer --drawdown--> RegimeClassifier --split--> AllocationCalculator
 *                      |
 *                      +--trough/current--> RecoveryTracker
 *
 * The Evaluator owns an immutable copy of the configuration. Weight overrides
 * are per call and never stored. Calls do not modify the Evaluator, so one
 * instance may serve concurrent callers (the logger serializes its output).
 */

#include "../analytics/drawdown_analyzer.hpp"
#include "../config/engine_config.hpp"
#include "../logging/logger.hpp"
#include "../strategy/recovery_tracker.hpp"
#include "../strategy/regime_classifier.hpp"
#include "../trading/allocation_calculator.hpp"

#include <optional>
#include <vector>

namespace gpo {
namespace engine {

struct Evaluation {
    analytics::DrawdownSnapshot drawdown;
    strategy::Regime regime;
    strategy::RecoveryState recovery;
    std::optional<trading::AllocationResult> allocation; // Only with a portfolio value
    std::vector<analytics::DrawdownPoint> drawdown_curve;
};

// What-if result for a hypothetical drawdown
struct Simulation {
    strategy::Regime regime;
    trading::AllocationResult allocation;
};

struct WeightOverrides {
    std::optional<config::WeightTable> equity;
    std::optional<config::WeightTable> reserve;
};

class Evaluator {
public:
    /**
     * @throws InvalidWeights / ConfigError when the configuration is inconsistent
     */
    explicit Evaluator(config::EngineConfig config, logging::Logger* logger = nullptr);

    /**
     * Allocation is computed only when portfolio_value is given.
     * @throws InvalidPortfolioValue when holdings are given without a portfolio value
     */
    Evaluation evaluate(const PriceSeries& series, const strategy::StressIndicators& indicators,
                        std::optional<Money> portfolio_value = std::nullopt,
                        const std::optional<Holdings>& holdings = std::nullopt,
                        const WeightOverrides& overrides = WeightOverrides()) const;

    Simulation simulate(double drawdown_pct, const strategy::StressIndicators& indicators, Money portfolio_value,
                        const std::optional<Holdings>& holdings = std::nullopt,
                        const WeightOverrides& overrides = WeightOverrides()) const;

    const config::EngineConfig& config() const { return config_; }

private:
    config::EngineConfig config_;
    strategy::RegimeClassifier classifier_;
    strategy::RecoveryTracker recovery_;
    trading::AllocationCalculator allocator_;
    logging::Logger* logger_; // Optional, not owned

    trading::AllocationResult allocate(const strategy::Regime& regime, Money portfolio_value,
                                       const std::optional<Holdings>& holdings,
                                       const WeightOverrides& overrides) const;

    void log_regime(const strategy::Regime& regime) const;
};

} // namespace engine
} // namespace gpo
