// in_memory_data_access.hpp
// IDataAccess backed by in-process containers, filled by the CSV loader or by tests

#pragma once

#include <algorithm>
#include <map>
#include <string>
#include <vector>
#include "../interfaces/data_access.hpp"

namespace equitybt {

// ============================================================================
// In-Memory Data Access
// ============================================================================

class InMemoryDataAccess : public IDataAccess {
private:
    std::string source_id_;
    std::map<std::string, std::vector<Bar>> prices_;
    std::map<std::string, std::vector<FundamentalRecord>> fundamentals_;
    std::map<std::string, std::vector<MembershipRecord>> memberships_;

public:
    explicit InMemoryDataAccess(std::string source_id = "memory")
        : source_id_(std::move(source_id)) {}

    void addBar(const std::string& stock_code, const Bar& bar) {
        prices_[stock_code].push_back(bar);
    }

    void addBars(const std::string& stock_code, const std::vector<Bar>& bars) {
        auto& series = prices_[stock_code];
        series.insert(series.end(), bars.begin(), bars.end());
    }

    void addFundamental(const FundamentalRecord& record) {
        fundamentals_[record.stock_code].push_back(record);
    }

    void addMembership(const MembershipRecord& record) {
        memberships_[record.stock_code].push_back(record);
    }

    std::vector<std::string> listStocks() const override {
        std::vector<std::string> codes;
        codes.reserve(prices_.size());
        for (const auto& entry : prices_) codes.push_back(entry.first);
        return codes;
    }

    std::vector<Bar> loadPrices(const std::string& stock_code, Date from, Date to) const override {
        std::vector<Bar> out;
        auto it = prices_.find(stock_code);
        if (it == prices_.end()) return out;
        for (const auto& bar : it->second) {
            if (bar.date >= from && bar.date <= to) out.push_back(bar);
        }
        std::stable_sort(out.begin(), out.end(),
            [](const Bar& a, const Bar& b) { return a.date < b.date; });
        return out;
    }

    std::vector<FundamentalRecord> loadFundamentals(const std::string& stock_code, Date as_of) const override {
        std::vector<FundamentalRecord> out;
        auto it = fundamentals_.find(stock_code);
        if (it == fundamentals_.end()) return out;
        for (const auto& record : it->second) {
            if (record.available_date <= as_of) out.push_back(record);
        }
        std::stable_sort(out.begin(), out.end(),
            [](const FundamentalRecord& a, const FundamentalRecord& b) {
                return a.available_date < b.available_date;
            });
        return out;
    }

    std::vector<MembershipRecord> loadMemberships(const std::string& stock_code) const override {
        auto it = memberships_.find(stock_code);
        if (it == memberships_.end()) return {};
        return it->second;
    }

    std::string sourceId() const override { return source_id_; }
};

} // namespace equitybt
