#include <cassert>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <sstream>
#include "../include/exchange/market_data.hpp"

using namespace gpo;
using namespace gpo::exchange;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_EQ(a, b) assert((a) == (b))
#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_NEAR(a, b, eps) assert(std::abs((a) - (b)) < (eps))

static bool parse_fails(const std::string& text) {
    std::istringstream in(text);
    try {
        parse_price_csv(in);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

// === CSV Tests ===

TEST(test_load_prices_csv_with_header) {
    const std::string filename = "/tmp/test_prices_header.csv";

    std::ofstream f(filename);
    f << "Date,Open,High,Low,Close,Volume\n";
    f << "2024-01-02,100.0,101.0,99.0,100.5,1000\n";
    f << "2024-01-03,100.5,103.0,100.0,102.25,1200\n";
    f.close();

    auto series = load_price_csv(filename);

    ASSERT_EQ(series.size(), 2u);
    ASSERT_EQ(series[0].date, "2024-01-02");
    ASSERT_NEAR(series[0].price, 100.5, 1e-12);
    ASSERT_NEAR(series[1].price, 102.25, 1e-12);

    std::remove(filename.c_str());
}

TEST(test_load_prices_csv_no_header) {
    const std::string filename = "/tmp/test_prices_noheader.csv";

    std::ofstream f(filename);
    f << "2024-01-02,100.5\n";
    f << "\n";
    f << "2024-01-03, 99.75\r\n";
    f.close();

    auto series = load_price_csv(filename);

    ASSERT_EQ(series.size(), 2u);
    ASSERT_EQ(series[1].date, "2024-01-03");
    ASSERT_NEAR(series[1].price, 99.75, 1e-12);

    std::remove(filename.c_str());
}

TEST(test_adj_close_column) {
    std::istringstream in("close_time,adj_close,date\n1,55.5,2024-02-01\n2,56.0,2024-02-02\n");
    auto series = parse_price_csv(in);

    ASSERT_EQ(series.size(), 2u);
    ASSERT_EQ(series[0].date, "2024-02-01");
    ASSERT_NEAR(series[0].price, 55.5, 1e-12);
}

TEST(test_load_prices_csv_empty_file) {
    std::istringstream in("");
    ASSERT_TRUE(parse_price_csv(in).empty());

    std::istringstream header_only("date,close\n");
    ASSERT_TRUE(parse_price_csv(header_only).empty());
}

TEST(test_rejects_bad_rows) {
    ASSERT_TRUE(parse_fails("2024-01-02,abc\n"));
    ASSERT_TRUE(parse_fails("2024-01-02,100x\n"));
    ASSERT_TRUE(parse_fails("2024-01-02\n"));
}

TEST(test_rejects_unsorted_dates) {
    ASSERT_TRUE(parse_fails("2024-01-03,100\n2024-01-02,101\n"));
    ASSERT_TRUE(parse_fails("2024-01-02,100\n2024-01-02,101\n"));
    ASSERT_FALSE(parse_fails("2024-01-02,100\n2024-01-03,101\n"));
}

TEST(test_quoted_fields) {
    // No header: the first quoted row is data
    std::istringstream in("\"2024-01-02\",\"100.5\"\n\"2024-01-03\",101\n");
    auto series = parse_price_csv(in);

    ASSERT_EQ(series.size(), 2u);
    ASSERT_EQ(series[0].date, "2024-01-02");
    ASSERT_NEAR(series[0].price, 100.5, 1e-12);

    std::istringstream quoted_header("\"Date\",\"Close\"\n2024-01-02,99\n");
    auto with_header = parse_price_csv(quoted_header);
    ASSERT_EQ(with_header.size(), 1u);
    ASSERT_NEAR(with_header[0].price, 99.0, 1e-12);
}

TEST(test_rejects_header_without_price_column) {
    ASSERT_TRUE(parse_fails("date,open,volume\n2024-01-02,100,5000\n"));
}

TEST(test_load_prices_csv_file_not_found) {
    bool exception_thrown = false;
    try {
        load_price_csv("/tmp/nonexistent_prices.csv");
    } catch (const std::runtime_error& e) {
        exception_thrown = true;
    }
    ASSERT_TRUE(exception_thrown);
}

int main() {
    std::cout << "=== Market Data Tests ===\n\n";

    RUN_TEST(test_load_prices_csv_with_header);
    RUN_TEST(test_load_prices_csv_no_header);
    RUN_TEST(test_adj_close_column);
    RUN_TEST(test_load_prices_csv_empty_file);
    RUN_TEST(test_rejects_bad_rows);
    RUN_TEST(test_rejects_unsorted_dates);
    RUN_TEST(test_quoted_fields);
    RUN_TEST(test_rejects_header_without_price_column);
    RUN_TEST(test_load_prices_csv_file_not_found);

    std::cout << "\nAll tests PASSED!\n";
    return 0;
}
