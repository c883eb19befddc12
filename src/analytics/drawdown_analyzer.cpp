#include "../../include/analytics/drawdown_analyzer.hpp"
#include "../../include/errors.hpp"

#include <cmath>
#include <string>

namespace gpo::analytics {

void DrawdownAnalyzer::validate(const PriceSeries& series) {
    if (series.size() < 2) {
        throw InsufficientData("need at least 2 prices, got " + std::to_string(series.size()));
    }

    for (const auto& point : series) {
        if (!std::isfinite(point.price) || point.price <= 0) {
            throw InvalidPrice("price on " + point.date + " must be positive and finite");
        }
    }
}

DrawdownSnapshot DrawdownAnalyzer::analyze(const PriceSeries& series) {
    validate(series);

    double peak = series.front().price;
    const PricePoint* peak_point = &series.front();

    // First point has drawdown 0; strict comparisons keep the earliest on ties
    const PricePoint* trough_point = &series.front();
    double trough_dd = 0;

    for (const auto& point : series) {
        if (point.price > peak) {
            peak = point.price;
            peak_point = &point;
        }

        double dd = drawdown_pct(point.price, peak);
        if (dd < trough_dd) {
            trough_dd = dd;
            trough_point = &point;
        }
    }

    DrawdownSnapshot snap;
    snap.current_price = series.back().price;
    snap.ath = peak;
    snap.ath_date = peak_point->date;
    snap.drawdown_pct = drawdown_pct(snap.current_price, peak);
    snap.trough_price = trough_point->price;
    snap.trough_date = trough_point->date;
    snap.trough_drawdown_pct = trough_dd;
    return snap;
}

std::vector<DrawdownPoint> DrawdownAnalyzer::drawdown_curve(const PriceSeries& series, size_t max_points) {
    validate(series);

    size_t first = 0;
    if (max_points > 0 && series.size() > max_points) {
        first = series.size() - max_points;
    }

    std::vector<DrawdownPoint> curve;
    curve.reserve(series.size() - first);

    double peak = 0;
    for (size_t i = 0; i < series.size(); ++i) {
        const auto& point = series[i];
        if (point.price > peak)
            peak = point.price;
        if (i < first)
            continue;

        curve.push_back({point.date, point.price, peak, drawdown_pct(point.price, peak)});
    }
    return curve;
}

} // namespace gpo::analytics
