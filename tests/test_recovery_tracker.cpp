#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include "../include/errors.hpp"
#include "../include/strategy/recovery_tracker.hpp"

using namespace gpo;
using namespace gpo::strategy;

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

TEST(test_checkpoint_prices) {
    RecoveryTracker tracker;
    auto rec = tracker.recovery(60.0, 75.0);

    ASSERT_NEAR(rec.c_to_b_price, 90.0, 1e-9);   // 60 * 1.5
    ASSERT_NEAR(rec.b_to_a_price, 112.5, 1e-9);  // 90 * 1.25
    ASSERT_NEAR(rec.progress_to_b, 50.0, 1e-9);
    ASSERT_FALSE(rec.progress_to_a.has_value());
}

TEST(test_reaching_first_checkpoint) {
    RecoveryTracker tracker;
    auto rec = tracker.recovery(90.0, 135.0);

    ASSERT_NEAR(rec.c_to_b_price, 135.0, 1e-9);
    ASSERT_NEAR(rec.b_to_a_price, 168.75, 1e-9);
    ASSERT_NEAR(rec.progress_to_b, 100.0, 1e-9);
    ASSERT_TRUE(rec.progress_to_a.has_value());
    ASSERT_NEAR(*rec.progress_to_a, 0.0, 1e-9);
}

TEST(test_progress_between_checkpoints) {
    RecoveryTracker tracker;
    auto rec = tracker.recovery(60.0, 101.25);

    ASSERT_NEAR(rec.progress_to_b, 100.0, 1e-9);
    ASSERT_NEAR(*rec.progress_to_a, 50.0, 1e-9);
}

TEST(test_progress_is_clamped) {
    RecoveryTracker tracker;

    auto below = tracker.recovery(100.0, 80.0);
    ASSERT_EQ(below.progress_to_b, 0.0);
    ASSERT_FALSE(below.progress_to_a.has_value());

    auto above = tracker.recovery(100.0, 500.0);
    ASSERT_EQ(above.progress_to_b, 100.0);
    ASSERT_EQ(*above.progress_to_a, 100.0);
}

TEST(test_checkpoints_ordered) {
    RecoveryTracker tracker;
    for (double trough : {0.01, 1.0, 42.0, 1234.5}) {
        auto rec = tracker.recovery(trough, trough);
        ASSERT_TRUE(rec.trough_price < rec.c_to_b_price);
        ASSERT_TRUE(rec.c_to_b_price < rec.b_to_a_price);
        ASSERT_EQ(rec.progress_to_b, 0.0);
    }
}

TEST(test_custom_rallies) {
    config::RecoveryConfig cfg;
    cfg.c_to_b_rally = 1.0;
    cfg.b_to_a_rally = 0.5;
    RecoveryTracker tracker(cfg);

    auto rec = tracker.recovery(50.0, 125.0);
    ASSERT_NEAR(rec.c_to_b_price, 100.0, 1e-9);
    ASSERT_NEAR(rec.b_to_a_price, 150.0, 1e-9);
    ASSERT_NEAR(*rec.progress_to_a, 50.0, 1e-9);
}

TEST(test_rejects_bad_trough) {
    RecoveryTracker tracker;
    ASSERT_THROWS(tracker.recovery(0.0, 100.0), InvalidPrice);
    ASSERT_THROWS(tracker.recovery(-10.0, 100.0), InvalidPrice);
    ASSERT_THROWS(tracker.recovery(std::numeric_limits<double>::quiet_NaN(), 100.0), InvalidPrice);
    ASSERT_THROWS(tracker.recovery(100.0, std::numeric_limits<double>::infinity()), InvalidPrice);
}

TEST(test_rejects_non_positive_rallies) {
    config::RecoveryConfig zero;
    zero.c_to_b_rally = 0.0;
    zero.b_to_a_rally = 0.0;
    ASSERT_THROWS(RecoveryTracker{zero}, ConfigError);

    config::RecoveryConfig negative;
    negative.b_to_a_rally = -0.25;
    ASSERT_THROWS(RecoveryTracker{negative}, ConfigError);

    config::RecoveryConfig nan;
    nan.c_to_b_rally = std::numeric_limits<double>::quiet_NaN();
    ASSERT_THROWS(RecoveryTracker{nan}, ConfigError);
}

int main() {
    std::cout << "=== Recovery Tracker Tests ===\n\n";

    RUN_TEST(test_checkpoint_prices);
    RUN_TEST(test_reaching_first_checkpoint);
    RUN_TEST(test_progress_between_checkpoints);
    RUN_TEST(test_progress_is_clamped);
    RUN_TEST(test_checkpoints_ordered);
    RUN_TEST(test_custom_rallies);
    RUN_TEST(test_rejects_bad_trough);
    RUN_TEST(test_rejects_non_positive_rallies);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
