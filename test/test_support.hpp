// test_support.hpp
// Shared test reporter and synthetic market builders for the test executables

#pragma once

#include <cassert>
#include <cmath>
#include <functional>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "../include/equitybt/core/date.hpp"
#include "../include/equitybt/core/logger.hpp"
#include "../include/equitybt/data/in_memory_data_access.hpp"
#include "../include/equitybt/data/market_data.hpp"

namespace equitybt {
namespace testing {

// ============================================================================
// Test Reporter
// ============================================================================

class TestReporter {
private:
    int tests_run_ = 0;
    int tests_passed_ = 0;
    std::vector<std::string> failures_;

public:
    void test(const std::string& name, std::function<void()> test_func) {
        tests_run_++;
        std::cout << "Running: " << name << " ... ";
        try {
            test_func();
            tests_passed_++;
            std::cout << "✓ PASSED" << std::endl;
        } catch (const std::exception& e) {
            std::cout << "✗ FAILED: " << e.what() << std::endl;
            failures_.push_back(name + ": " + e.what());
        }
    }

    // Process exit code: non-zero when anything failed
    int report() const {
        std::cout << "\n=== Test Results ===" << std::endl;
        std::cout << "Tests Run: " << tests_run_ << std::endl;
        std::cout << "Tests Passed: " << tests_passed_ << std::endl;
        std::cout << "Tests Failed: " << (tests_run_ - tests_passed_) << std::endl;
        if (tests_run_ > 0) {
            std::cout << "Success Rate: " << std::fixed << std::setprecision(1)
                      << (100.0 * tests_passed_ / tests_run_) << "%" << std::endl;
        }

        if (!failures_.empty()) {
            std::cout << "\nFailures:" << std::endl;
            for (const auto& f : failures_) {
                std::cout << "  - " << f << std::endl;
            }
        }
        return failures_.empty() ? 0 : 1;
    }
};

inline bool near(double a, double b, double tol = 1e-9) {
    return std::abs(a - b) <= tol * std::max(1.0, std::max(std::abs(a), std::abs(b)));
}

// Runs `fn` and reports whether it threw E
template<typename E, typename Fn>
bool throws(Fn fn) {
    try {
        fn();
    } catch (const E&) {
        return true;
    }
    return false;
}

// Keeps test output readable
inline void quietLogs() {
    Logger::setLevel(LogLevel::ERROR);
}

// ============================================================================
// Synthetic Market Builders
// ============================================================================

inline Date d(const std::string& text) {
    return Date::parse(text);
}

// `count` consecutive weekdays starting at `first` (moved forward off a weekend)
inline std::vector<Date> businessDays(Date first, size_t count) {
    std::vector<Date> out;
    Date day = first;
    while (out.size() < count) {
        if (day.weekday() < 5) out.push_back(day);
        day = day.addDays(1);
    }
    return out;
}

inline Bar makeBar(Date date, double close, double market_cap = std::nan("")) {
    Bar bar;
    bar.date = date;
    bar.open = close;
    bar.high = close;
    bar.low = close;
    bar.close = close;
    bar.volume = 1000.0;
    bar.market_cap = market_cap;
    return bar;
}

inline Bar makeBar(Date date, double open, double high, double low, double close) {
    Bar bar;
    bar.date = date;
    bar.open = open;
    bar.high = high;
    bar.low = low;
    bar.close = close;
    bar.volume = 1000.0;
    return bar;
}

// Flat series at `price`, optionally carrying a constant market cap
inline std::vector<Bar> flatSeries(const std::vector<Date>& dates, double price,
                                   double market_cap = std::nan("")) {
    std::vector<Bar> bars;
    for (const auto& date : dates) bars.push_back(makeBar(date, price, market_cap));
    return bars;
}

// Geometric drift of `daily_pct` per day from `start_price`
inline std::vector<Bar> trendSeries(const std::vector<Date>& dates, double start_price, double daily_pct,
                                    double market_cap = std::nan("")) {
    std::vector<Bar> bars;
    double price = start_price;
    for (const auto& date : dates) {
        bars.push_back(makeBar(date, price, market_cap));
        price *= 1.0 + daily_pct / 100.0;
    }
    return bars;
}

inline FundamentalRecord makeFundamentals(const std::string& code, Date available, double net_income,
                                          double total_equity = 1000.0, double revenue = 5000.0) {
    FundamentalRecord record;
    record.stock_code = code;
    record.available_date = available;
    record.net_income = net_income;
    record.total_equity = total_equity;
    record.total_assets = total_equity * 2.0;
    record.total_liabilities = total_equity;
    record.revenue = revenue;
    record.operating_income = net_income * 1.2;
    return record;
}

inline StockHistory makeHistory(std::vector<Bar> bars) {
    StockHistory history;
    history.bars = std::move(bars);
    return history;
}

} // namespace testing
} // namespace equitybt
