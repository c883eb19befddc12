#include "../../include/strategy/recovery_tracker.hpp"
#include "../../include/errors.hpp"
#include "../../include/types.hpp"

#include <algorithm>
#include <cmath>

namespace gpo::strategy {

namespace {

double clamp_progress(double value) { return std::clamp(value, 0.0, PERCENT); }

} // namespace

RecoveryTracker::RecoveryTracker(const config::RecoveryConfig& config) : config_(config) {
    if (!std::isfinite(config_.c_to_b_rally) || config_.c_to_b_rally <= 0) {
        throw ConfigError("recovery: c_to_b_rally must be > 0");
    }
    if (!std::isfinite(config_.b_to_a_rally) || config_.b_to_a_rally <= 0) {
        throw ConfigError("recovery: b_to_a_rally must be > 0");
    }
}

RecoveryState RecoveryTracker::recovery(double trough_price, double current_price) const {
    if (!std::isfinite(trough_price) || trough_price <= 0) {
        throw InvalidPrice("trough price must be positive and finite");
    }
    if (!std::isfinite(current_price)) {
        throw InvalidPrice("current price must be finite");
    }

    RecoveryState state;
    state.trough_price = trough_price;
    state.current_price = current_price;
    state.c_to_b_price = trough_price * (1.0 + config_.c_to_b_rally);
    state.b_to_a_price = state.c_to_b_price * (1.0 + config_.b_to_a_rally);

    state.progress_to_b =
        clamp_progress((current_price - trough_price) / (state.c_to_b_price - trough_price) * PERCENT);

    if (current_price >= state.c_to_b_price) {
        state.progress_to_a = clamp_progress((current_price - state.c_to_b_price) /
                                             (state.b_to_a_price - state.c_to_b_price) * PERCENT);
    }
    return state;
}

} // namespace gpo::strategy
