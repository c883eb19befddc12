#pragma once

#include "../config/engine_config.hpp"

#include <optional>

namespace gpo {
namespace strategy {

/**
 * Recovery checkpoints after a drawdown episode
 *
 * progress_to_a stays empty until the C->B checkpoint has been reached, so a
 * consumer can tell "not started" apart from "started, at 0%".
 */
struct RecoveryState {
    double trough_price = 0;
    double current_price = 0;
    double c_to_b_price = 0;
    double b_to_a_price = 0;
    double progress_to_b = 0;            // 0-100, clamped
    std::optional<double> progress_to_a; // 0-100, clamped
};

/**
 * RecoveryTracker - advisory only, never drives the classifier
 */
class RecoveryTracker {
public:
    /**
     * @throws ConfigError when a rally is not a positive finite fraction
     */
    explicit RecoveryTracker(const config::RecoveryConfig& config = config::RecoveryConfig());

    /**
     * @throws InvalidPrice trough_price <= 0 or non-finite, or current_price non-finite
     */
    RecoveryState recovery(double trough_price, double current_price) const;

private:
    config::RecoveryConfig config_;
};

} // namespace strategy
} // namespace gpo
