#pragma once

/**
 * DrawdownAnalyzer - drawdown of a price series against its running peak
 *
 * Every point is measured against its own running all-time high (the maximum
 * of all prices up to and including that point). The trough is the point
 * with the deepest such drawdown, which is not necessarily the lowest price:
 * a later, lower price can sit under a lower peak.
 *
 * Pure functions; no state is kept between calls.
 */

#include "../config/defaults.hpp"
#include "../types.hpp"

#include <vector>

namespace gpo {
namespace analytics {

struct DrawdownSnapshot {
    double current_price = 0;
    double ath = 0;
    Date ath_date;                   // First date the final ATH level was reached
    double drawdown_pct = 0;         // <= 0, 0-100 scale
    double trough_price = 0;
    Date trough_date;                // Earliest point of deepest drawdown
    double trough_drawdown_pct = 0;  // Drawdown at the trough, <= drawdown_pct
};

/**
 * One point of the underwater curve, for chart consumers
 */
struct DrawdownPoint {
    Date date;
    double price = 0;
    double running_ath = 0;
    double drawdown_pct = 0;
};

class DrawdownAnalyzer {
public:
    /**
     * Analyze a chronologically ascending series.
     *
     * @throws InsufficientData fewer than 2 points
     * @throws InvalidPrice any price non-positive or non-finite
     */
    static DrawdownSnapshot analyze(const PriceSeries& series);

    /**
     * Per-point drawdown curve, limited to the last max_points points
     * (0 = whole series). Running peaks are taken over the full series.
     * Same validation as analyze().
     */
    static std::vector<DrawdownPoint> drawdown_curve(const PriceSeries& series,
                                                     size_t max_points = config::curve::DEFAULT_POINTS);

    // (price - peak) / peak * 100
    static double drawdown_pct(double price, double peak) { return (price - peak) / peak * PERCENT; }

private:
    static void validate(const PriceSeries& series);
};

} // namespace analytics
} // namespace gpo
