#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace gpo {

// Instrument keys are configuration strings ("north_america", "gold", ...)
using InstrumentKey = std::string;
using Date = std::string; // ISO 8601 calendar date: YYYY-MM-DD
using Money = double;     // Portfolio currency

/**
 * One closing price of the tracked index
 */
struct PricePoint {
    Date date;
    double price = 0;
};

// Chronologically ascending, no duplicate dates
using PriceSeries = std::vector<PricePoint>;

// Current holdings: instrument key -> value in portfolio currency
using Holdings = std::map<InstrumentKey, Money>;

enum class Side : uint8_t { Buy = 0, Sell = 1 };

inline const char* side_to_string(Side side) {
    switch (side) {
    case Side::Buy:
        return "BUY";
    case Side::Sell:
        return "SELL";
    default:
        return "?";
    }
}

// Percentages are reported on a 0-100 scale, fractions on 0-1
constexpr double PERCENT = 100.0;

// Tolerance for sums that must equal 1.0 (weights, splits)
constexpr double WEIGHT_EPSILON = 1e-9;

} // namespace gpo
