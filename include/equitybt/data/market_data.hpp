// market_data.hpp
// Market data records: daily bars, point-in-time fundamentals, universe membership
// Plus the in-run data set every simulation component reads from

#pragma once

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../core/date.hpp"

namespace equitybt {

// ============================================================================
// Records
// ============================================================================

struct Bar {
    Date date;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;
    double market_cap = std::numeric_limits<double>::quiet_NaN();
    double listed_shares = std::numeric_limits<double>::quiet_NaN();

    // A bar without a usable close counts as a missing price
    bool hasValidClose() const {
        return std::isfinite(close) && close > 0.0;
    }

    bool validate() const {
        return high >= low && volume >= 0.0;
    }
};

// One financial statement, usable from available_date onwards. Missing items are NaN.
struct FundamentalRecord {
    std::string stock_code;
    Date available_date;
    double net_income = std::numeric_limits<double>::quiet_NaN();
    double total_equity = std::numeric_limits<double>::quiet_NaN();
    double total_assets = std::numeric_limits<double>::quiet_NaN();
    double total_liabilities = std::numeric_limits<double>::quiet_NaN();
    double revenue = std::numeric_limits<double>::quiet_NaN();
    double operating_income = std::numeric_limits<double>::quiet_NaN();
    double gross_profit = std::numeric_limits<double>::quiet_NaN();
    double operating_cash_flow = std::numeric_limits<double>::quiet_NaN();
};

struct MembershipRecord {
    std::string stock_code;
    std::string universe;
    std::string theme;
    std::optional<Date> valid_from;
    std::optional<Date> valid_to;

    bool activeOn(Date date) const {
        if (valid_from && date < *valid_from) return false;
        if (valid_to && date > *valid_to) return false;
        return true;
    }
};

// ============================================================================
// Universe Filter
// ============================================================================

// Union of universes, themes and explicit tickers; empty or use_all admits everything
struct UniverseFilter {
    bool use_all = false;
    std::set<std::string> universes;
    std::set<std::string> themes;
    std::set<std::string> tickers;

    bool admitsAll() const {
        return use_all || (universes.empty() && themes.empty() && tickers.empty());
    }

    // Canonical text form; std::set keeps every part sorted
    std::string canonical() const {
        if (admitsAll()) return "*";
        std::string out;
        auto append = [&out](const char* tag, const std::set<std::string>& items) {
            out += tag;
            out += '[';
            bool first = true;
            for (const auto& item : items) {
                if (!first) out += ',';
                out += item;
                first = false;
            }
            out += ']';
        };
        append("u", universes);
        append("t", themes);
        append("s", tickers);
        return out;
    }
};

// ============================================================================
// Stock History and Market Data Set
// ============================================================================

struct StockHistory {
    std::vector<Bar> bars;                        // ascending by date, unique dates
    std::vector<FundamentalRecord> fundamentals;  // ascending by available_date
    std::vector<MembershipRecord> memberships;

    // Index of the bar dated exactly `date`
    std::optional<size_t> indexOn(Date date) const {
        auto it = std::lower_bound(bars.begin(), bars.end(), date,
            [](const Bar& bar, Date d) { return bar.date < d; });
        if (it == bars.end() || it->date != date) return std::nullopt;
        return static_cast<size_t>(it - bars.begin());
    }

    const Bar* barOn(Date date) const {
        auto idx = indexOn(date);
        return idx ? &bars[*idx] : nullptr;
    }

    // Latest statement already published on `date`
    const FundamentalRecord* fundamentalsAsOf(Date date) const {
        const FundamentalRecord* latest = nullptr;
        for (const auto& record : fundamentals) {
            if (record.available_date > date) break;
            latest = &record;
        }
        return latest;
    }

    bool matches(const UniverseFilter& filter, const std::string& stock_code, Date date) const {
        if (filter.admitsAll()) return true;
        if (filter.tickers.count(stock_code)) return true;
        for (const auto& m : memberships) {
            if (!m.activeOn(date)) continue;
            if (!m.universe.empty() && filter.universes.count(m.universe)) return true;
            if (!m.theme.empty() && filter.themes.count(m.theme)) return true;
        }
        return false;
    }
};

class MarketDataSet {
private:
    std::map<std::string, StockHistory> stocks_;

public:
    void addStock(const std::string& stock_code, StockHistory history) {
        auto by_date = [](const Bar& a, const Bar& b) { return a.date < b.date; };
        std::stable_sort(history.bars.begin(), history.bars.end(), by_date);
        history.bars.erase(std::unique(history.bars.begin(), history.bars.end(),
            [](const Bar& a, const Bar& b) { return a.date == b.date; }), history.bars.end());
        std::stable_sort(history.fundamentals.begin(), history.fundamentals.end(),
            [](const FundamentalRecord& a, const FundamentalRecord& b) {
                return a.available_date < b.available_date;
            });
        stocks_[stock_code] = std::move(history);
    }

    const StockHistory* find(const std::string& stock_code) const {
        auto it = stocks_.find(stock_code);
        return it == stocks_.end() ? nullptr : &it->second;
    }

    const std::map<std::string, StockHistory>& stocks() const { return stocks_; }
    std::map<std::string, StockHistory>& stocks() { return stocks_; }

    size_t size() const { return stocks_.size(); }
    bool empty() const { return stocks_.empty(); }

    // Business dates in [from, to] on which at least one admitted stock traded
    std::vector<Date> tradingDates(Date from, Date to, const UniverseFilter& filter) const {
        std::set<Date> dates;
        for (const auto& [code, history] : stocks_) {
            for (const auto& bar : history.bars) {
                if (bar.date < from || bar.date > to) continue;
                if (!bar.hasValidClose()) continue;
                if (!history.matches(filter, code, bar.date)) continue;
                dates.insert(bar.date);
            }
        }
        return std::vector<Date>(dates.begin(), dates.end());
    }
};

} // namespace equitybt
