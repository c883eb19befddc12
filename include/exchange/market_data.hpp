#pragma once

#include "../types.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace gpo {
namespace exchange {

namespace detail {

inline std::string trim(const std::string& s) {
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

// "2024-01-02" -> 2024-01-02
inline std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"')
        return trim(s.substr(1, s.size() - 2));
    return s;
}

inline std::vector<std::string> split_csv(const std::string& line) {
    std::vector<std::string> tokens;
    std::stringstream ss(line);
    std::string token;
    while (std::getline(ss, token, ',')) {
        tokens.push_back(unquote(trim(token)));
    }
    return tokens;
}

inline std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

} // namespace detail

/**
 * Parse daily closes from CSV
 *
 * Format (header optional):
 *   date,close
 *   2024-01-02,101.25
 *
 * With a header the price column is the one named "close" (or "adj_close"),
 * extra columns are ignored; a header without one is rejected. Fields may be
 * double-quoted. Without a header the first column is the date
 * and the second the price. Dates must be strictly ascending.
 *
 * Prices are not range-checked here; DrawdownAnalyzer rejects bad values.
 */
inline PriceSeries parse_price_csv(std::istream& in) {
    PriceSeries series;
    std::string line;
    size_t line_no = 0;
    size_t date_col = 0;
    size_t price_col = 1;
    bool first_row = true;

    while (std::getline(in, line)) {
        ++line_no;
        line = detail::trim(line);
        if (line.empty())
            continue;

        auto tokens = detail::split_csv(line);

        // Header row: first non-empty line whose first field does not start with a digit
        bool header = first_row && (tokens.empty() || tokens[0].empty() ||
                                    !std::isdigit(static_cast<unsigned char>(tokens[0][0])));
        first_row = false;
        if (header) {
            bool has_price = false;
            for (size_t i = 0; i < tokens.size(); ++i) {
                auto name = detail::to_lower(tokens[i]);
                if (name == "date") {
                    date_col = i;
                } else if (name == "close" || name == "adj_close") {
                    price_col = i;
                    has_price = true;
                }
            }
            if (!has_price) {
                throw std::runtime_error("line " + std::to_string(line_no) +
                                         ": header has no close or adj_close column");
            }
            continue;
        }

        if (tokens.size() <= std::max(date_col, price_col)) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": expected date and close columns");
        }

        PricePoint point;
        point.date = tokens[date_col];
        try {
            size_t used = 0;
            point.price = std::stod(tokens[price_col], &used);
            if (used != tokens[price_col].size())
                throw std::invalid_argument(tokens[price_col]);
        } catch (const std::logic_error&) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": bad price '" + tokens[price_col] + "'");
        }

        if (!series.empty() && !(series.back().date < point.date)) {
            throw std::runtime_error("line " + std::to_string(line_no) + ": date " + point.date +
                                     " is not after " + series.back().date);
        }

        series.push_back(point);
    }

    return series;
}

inline PriceSeries load_price_csv(const std::string& filename) {
    std::ifstream file(filename);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    return parse_price_csv(file);
}

} // namespace exchange
} // namespace gpo
