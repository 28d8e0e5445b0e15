// data_access.hpp
// Data Access Interface consumed by the backtest engine

#pragma once

#include <string>
#include <vector>
#include "../core/date.hpp"
#include "../data/market_data.hpp"

namespace equitybt {

// ============================================================================
// Data Access Interface
// ============================================================================

class IDataAccess {
public:
    virtual ~IDataAccess() = default;

    // Every stock code the source knows about, ascending
    virtual std::vector<std::string> listStocks() const = 0;

    // Daily bars dated within [from, to], ascending
    virtual std::vector<Bar> loadPrices(const std::string& stock_code, Date from, Date to) const = 0;

    // Statements with available_date <= as_of, ascending
    virtual std::vector<FundamentalRecord> loadFundamentals(const std::string& stock_code, Date as_of) const = 0;

    virtual std::vector<MembershipRecord> loadMemberships(const std::string& stock_code) const = 0;

    // Identifies the data behind this source for shared factor caches
    virtual std::string sourceId() const { return "default"; }
};

} // namespace equitybt
