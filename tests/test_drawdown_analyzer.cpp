#include <cassert>
#include <cmath>
#include <cstdio>
#include <initializer_list>
#include <iostream>
#include <limits>
#include "../include/analytics/drawdown_analyzer.hpp"
#include "../include/errors.hpp"

using namespace gpo;
using namespace gpo::analytics;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "  " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))
#define ASSERT_THROWS(expr, type) do { \
    bool thrown = false; \
    try { expr; } catch (const type&) { thrown = true; } \
    assert(thrown); \
} while(0)

static PriceSeries make_series(std::initializer_list<double> prices) {
    PriceSeries series;
    int day = 1;
    for (double p : prices) {
        char date[16];
        std::snprintf(date, sizeof(date), "2024-01-%02d", day++);
        series.push_back({date, p});
    }
    return series;
}

// === Snapshot ===

TEST(test_drawdown_below_peak) {
    auto snap = DrawdownAnalyzer::analyze(make_series({100, 120, 150, 90, 95}));

    ASSERT_NEAR(snap.current_price, 95.0, 1e-12);
    ASSERT_NEAR(snap.ath, 150.0, 1e-12);
    ASSERT_EQ(snap.ath_date, "2024-01-03");
    ASSERT_NEAR(snap.drawdown_pct, -36.666666, 1e-4);

    // Trough is the deepest point, not the last one
    ASSERT_NEAR(snap.trough_price, 90.0, 1e-12);
    ASSERT_EQ(snap.trough_date, "2024-01-04");
    ASSERT_NEAR(snap.trough_drawdown_pct, -40.0, 1e-9);
}

TEST(test_drawdown_ends_at_trough) {
    auto snap = DrawdownAnalyzer::analyze(make_series({100, 120, 150, 90, 80}));

    ASSERT_NEAR(snap.drawdown_pct, -46.666666, 1e-4);
    ASSERT_NEAR(snap.trough_price, 80.0, 1e-12);
    ASSERT_EQ(snap.trough_date, "2024-01-05");
    ASSERT_NEAR(snap.trough_drawdown_pct, snap.drawdown_pct, 1e-12);
}

TEST(test_drawdown_at_new_high_is_zero) {
    auto snap = DrawdownAnalyzer::analyze(make_series({100, 90, 110}));

    ASSERT_EQ(snap.drawdown_pct, 0.0);
    ASSERT_NEAR(snap.ath, 110.0, 1e-12);
    ASSERT_EQ(snap.ath_date, "2024-01-03");
    ASSERT_NEAR(snap.trough_price, 90.0, 1e-12);
}

TEST(test_monotonic_rise_has_no_trough_below_zero) {
    auto snap = DrawdownAnalyzer::analyze(make_series({100, 101, 102, 103}));

    ASSERT_EQ(snap.drawdown_pct, 0.0);
    ASSERT_EQ(snap.trough_drawdown_pct, 0.0);
    ASSERT_EQ(snap.trough_date, "2024-01-01");
}

TEST(test_ath_date_is_first_occurrence) {
    auto snap = DrawdownAnalyzer::analyze(make_series({100, 150, 120, 150, 130}));

    ASSERT_EQ(snap.ath_date, "2024-01-02");
    ASSERT_NEAR(snap.trough_price, 120.0, 1e-12);
}

TEST(test_trough_tie_keeps_earliest) {
    auto snap = DrawdownAnalyzer::analyze(make_series({100, 80, 90, 80, 95}));

    ASSERT_EQ(snap.trough_date, "2024-01-02");
    ASSERT_NEAR(snap.trough_drawdown_pct, -20.0, 1e-9);
}

TEST(test_drawdown_never_positive) {
    auto series = make_series({50, 70, 65, 90, 30, 45, 120, 119});
    auto snap = DrawdownAnalyzer::analyze(series);
    ASSERT_TRUE(snap.drawdown_pct <= 0);
    ASSERT_TRUE(snap.trough_drawdown_pct <= snap.drawdown_pct);
    ASSERT_TRUE(snap.trough_drawdown_pct >= -100.0);
}

TEST(test_ath_bounds_price_and_never_falls) {
    const double prices[] = {100, 95, 130, 80, 130, 140, 60, 61, 139.5, 200, 10, 199};
    PriceSeries series;
    DrawdownSnapshot previous;
    int day = 1;

    for (double p : prices) {
        char date[16];
        std::snprintf(date, sizeof(date), "2024-03-%02d", day++);
        series.push_back({date, p});
        if (series.size() < 2)
            continue;

        auto snap = DrawdownAnalyzer::analyze(series);
        ASSERT_TRUE(snap.ath >= snap.current_price);
        if (series.size() > 2)
            ASSERT_TRUE(snap.ath >= previous.ath);
        previous = snap;
    }
    ASSERT_NEAR(previous.ath, 200.0, 1e-12);
}

// === Errors ===

TEST(test_rejects_short_series) {
    ASSERT_THROWS(DrawdownAnalyzer::analyze(PriceSeries{}), InsufficientData);
    ASSERT_THROWS(DrawdownAnalyzer::analyze(make_series({100})), InsufficientData);
}

TEST(test_rejects_bad_prices) {
    ASSERT_THROWS(DrawdownAnalyzer::analyze(make_series({100, 0})), InvalidPrice);
    ASSERT_THROWS(DrawdownAnalyzer::analyze(make_series({100, -5})), InvalidPrice);
    ASSERT_THROWS(DrawdownAnalyzer::analyze(make_series({100, std::numeric_limits<double>::quiet_NaN()})),
                  InvalidPrice);
    ASSERT_THROWS(DrawdownAnalyzer::analyze(make_series({std::numeric_limits<double>::infinity(), 100})),
                  InvalidPrice);
}

TEST(test_error_carries_code) {
    bool thrown = false;
    try {
        DrawdownAnalyzer::analyze(make_series({100}));
    } catch (const EngineError& e) {
        thrown = true;
        ASSERT_TRUE(e.code() == ErrorCode::InsufficientData);
    }
    ASSERT_TRUE(thrown);
}

// === Curve ===

TEST(test_curve_covers_whole_series) {
    auto curve = DrawdownAnalyzer::drawdown_curve(make_series({100, 120, 150, 90, 95}), 0);

    ASSERT_EQ(curve.size(), 5u);
    ASSERT_EQ(curve[0].drawdown_pct, 0.0);
    ASSERT_NEAR(curve[1].running_ath, 120.0, 1e-12);
    ASSERT_NEAR(curve[3].drawdown_pct, -40.0, 1e-9);
    ASSERT_NEAR(curve[4].running_ath, 150.0, 1e-12);
}

TEST(test_curve_tail_keeps_full_history_peak) {
    // Peak falls outside the returned window
    auto curve = DrawdownAnalyzer::drawdown_curve(make_series({100, 200, 150, 120, 100}), 2);

    ASSERT_EQ(curve.size(), 2u);
    ASSERT_EQ(curve[0].date, "2024-01-04");
    ASSERT_NEAR(curve[0].running_ath, 200.0, 1e-12);
    ASSERT_NEAR(curve[1].drawdown_pct, -50.0, 1e-9);
}

TEST(test_curve_last_point_matches_snapshot) {
    auto series = make_series({100, 120, 150, 90, 95});
    auto curve = DrawdownAnalyzer::drawdown_curve(series);
    auto snap = DrawdownAnalyzer::analyze(series);

    ASSERT_EQ(curve.size(), series.size());
    ASSERT_NEAR(curve.back().drawdown_pct, snap.drawdown_pct, 1e-12);
}

int main() {
    std::cout << "=== Drawdown Analyzer Tests ===\n\n";

    RUN_TEST(test_drawdown_below_peak);
    RUN_TEST(test_drawdown_ends_at_trough);
    RUN_TEST(test_drawdown_at_new_high_is_zero);
    RUN_TEST(test_monotonic_rise_has_no_trough_below_zero);
    RUN_TEST(test_ath_date_is_first_occurrence);
    RUN_TEST(test_trough_tie_keeps_earliest);
    RUN_TEST(test_drawdown_never_positive);
    RUN_TEST(test_ath_bounds_price_and_never_falls);

    RUN_TEST(test_rejects_short_series);
    RUN_TEST(test_rejects_bad_prices);
    RUN_TEST(test_error_carries_code);

    RUN_TEST(test_curve_covers_whole_series);
    RUN_TEST(test_curve_tail_keeps_full_history_peak);
    RUN_TEST(test_curve_last_point_matches_snapshot);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
