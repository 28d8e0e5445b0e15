// csv_data_loader.hpp
// CSV loaders for prices, fundamentals and universe membership
// Rows are appended to an InMemoryDataAccess; malformed rows raise DataException

#pragma once

#include <fstream>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include "../core/exceptions.hpp"
#include "../core/logger.hpp"
#include "in_memory_data_access.hpp"

namespace equitybt {

// ============================================================================
// CSV Data Loader
// ============================================================================

class CsvDataLoader {
public:
    struct CsvConfig {
        bool has_header;
        char delimiter;
        bool check_data_integrity;

        CsvConfig()
            : has_header(true)
            , delimiter(',')
            , check_data_integrity(true) {}

        static CsvConfig getDefault() {
            return CsvConfig();
        }
    };

    struct LoadStats {
        size_t rows_loaded = 0;
        size_t rows_skipped = 0;
    };

private:
    CsvConfig config_;

    std::vector<std::string> splitLine(const std::string& line) const {
        std::vector<std::string> tokens;
        std::stringstream ss(line);
        std::string token;
        while (std::getline(ss, token, config_.delimiter)) {
            token.erase(0, token.find_first_not_of(" \t\r\n"));
            token.erase(token.find_last_not_of(" \t\r\n") + 1);
            tokens.push_back(token);
        }
        // getline drops a trailing empty field
        if (!line.empty() && line.back() == config_.delimiter) tokens.emplace_back();
        return tokens;
    }

    // Empty field means "not reported"
    static double parseNumber(const std::string& token) {
        if (token.empty()) return std::numeric_limits<double>::quiet_NaN();
        size_t consumed = 0;
        double value = std::stod(token, &consumed);
        if (consumed != token.size()) {
            throw std::invalid_argument("not a number: '" + token + "'");
        }
        return value;
    }

    static std::optional<Date> parseOptionalDate(const std::string& token) {
        if (token.empty()) return std::nullopt;
        return Date::parse(token);
    }

    template<typename RowHandler>
    LoadStats forEachRow(const std::string& filepath, size_t min_columns, RowHandler handler) const {
        std::ifstream file(filepath);
        if (!file.is_open()) {
            throw DataException("Failed to open CSV file: " + filepath);
        }

        LoadStats stats;
        std::string line;
        size_t line_num = 0;

        if (config_.has_header) {
            if (!std::getline(file, line)) {
                throw DataException("Empty CSV file: " + filepath);
            }
            ++line_num;
        }

        while (std::getline(file, line)) {
            ++line_num;
            if (line.empty() || line == "\r") continue;

            auto tokens = splitLine(line);
            if (tokens.size() < min_columns) {
                throw DataException(filepath + ":" + std::to_string(line_num) +
                                    ": expected at least " + std::to_string(min_columns) +
                                    " columns, got " + std::to_string(tokens.size()));
            }

            try {
                if (handler(tokens)) {
                    ++stats.rows_loaded;
                } else {
                    ++stats.rows_skipped;
                }
            } catch (const std::exception& e) {
                throw DataException(filepath + ":" + std::to_string(line_num) + ": " + e.what());
            }
        }
        return stats;
    }

public:
    CsvDataLoader() : config_(CsvConfig::getDefault()) {}
    explicit CsvDataLoader(const CsvConfig& config) : config_(config) {}

    // date,stock_code,open,high,low,close,volume[,market_cap[,listed_shares]]
    LoadStats loadPrices(const std::string& filepath, InMemoryDataAccess& target) const {
        auto stats = forEachRow(filepath, 7, [&](const std::vector<std::string>& t) {
            Bar bar;
            bar.date = Date::parse(t[0]);
            bar.open = parseNumber(t[2]);
            bar.high = parseNumber(t[3]);
            bar.low = parseNumber(t[4]);
            bar.close = parseNumber(t[5]);
            bar.volume = parseNumber(t[6]);
            if (t.size() > 7) bar.market_cap = parseNumber(t[7]);
            if (t.size() > 8) bar.listed_shares = parseNumber(t[8]);

            if (config_.check_data_integrity && !bar.validate()) {
                Logger::warning("Skipping inconsistent bar for " + t[1] + " on " + t[0]);
                return false;
            }
            target.addBar(t[1], bar);
            return true;
        });
        Logger::info("Loaded " + std::to_string(stats.rows_loaded) + " price rows from " + filepath);
        return stats;
    }

    // stock_code,available_date,net_income,total_equity,total_assets,total_liabilities,
    // revenue,operating_income[,gross_profit[,operating_cash_flow]]
    LoadStats loadFundamentals(const std::string& filepath, InMemoryDataAccess& target) const {
        auto stats = forEachRow(filepath, 8, [&](const std::vector<std::string>& t) {
            FundamentalRecord record;
            record.stock_code = t[0];
            record.available_date = Date::parse(t[1]);
            record.net_income = parseNumber(t[2]);
            record.total_equity = parseNumber(t[3]);
            record.total_assets = parseNumber(t[4]);
            record.total_liabilities = parseNumber(t[5]);
            record.revenue = parseNumber(t[6]);
            record.operating_income = parseNumber(t[7]);
            if (t.size() > 8) record.gross_profit = parseNumber(t[8]);
            if (t.size() > 9) record.operating_cash_flow = parseNumber(t[9]);
            target.addFundamental(record);
            return true;
        });
        Logger::info("Loaded " + std::to_string(stats.rows_loaded) + " fundamental rows from " + filepath);
        return stats;
    }

    // stock_code,universe,theme[,valid_from[,valid_to]]
    LoadStats loadMemberships(const std::string& filepath, InMemoryDataAccess& target) const {
        auto stats = forEachRow(filepath, 3, [&](const std::vector<std::string>& t) {
            MembershipRecord record;
            record.stock_code = t[0];
            record.universe = t[1];
            record.theme = t[2];
            if (t.size() > 3) record.valid_from = parseOptionalDate(t[3]);
            if (t.size() > 4) record.valid_to = parseOptionalDate(t[4]);
            target.addMembership(record);
            return true;
        });
        Logger::info("Loaded " + std::to_string(stats.rows_loaded) + " membership rows from " + filepath);
        return stats;
    }
};

} // namespace equitybt
