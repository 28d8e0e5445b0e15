// factor_panel.hpp
// Cross-sectional factor table for one trading day
// Columnar storage; every cell carries a defined / undefined / not-applicable marker

#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>
#include "../core/date.hpp"
#include "../core/exceptions.hpp"

namespace equitybt {

enum class ValueState : uint8_t {
    Defined = 0,
    Undefined = 1,      // missing data or insufficient lookback
    NotApplicable = 2   // mathematically meaningless, e.g. non-positive denominator
};

struct FactorValue {
    double value = std::numeric_limits<double>::quiet_NaN();
    ValueState state = ValueState::Undefined;

    static FactorValue defined(double v) { return {v, ValueState::Defined}; }
    static FactorValue undefined() { return {std::numeric_limits<double>::quiet_NaN(), ValueState::Undefined}; }
    static FactorValue notApplicable() { return {std::numeric_limits<double>::quiet_NaN(), ValueState::NotApplicable}; }

    bool isDefined() const { return state == ValueState::Defined; }
};

// ============================================================================
// Factor Panel
// ============================================================================

class FactorPanel {
private:
    Date date_;
    std::vector<std::string> stock_codes_;   // ascending, unique
    std::vector<std::string> factor_names_;  // ascending, unique
    std::vector<std::vector<double>> values_;
    std::vector<std::vector<ValueState>> states_;

public:
    FactorPanel(Date date, std::vector<std::string> stock_codes, std::vector<std::string> factor_names)
        : date_(date)
        , stock_codes_(std::move(stock_codes))
        , factor_names_(std::move(factor_names)) {
        std::sort(stock_codes_.begin(), stock_codes_.end());
        stock_codes_.erase(std::unique(stock_codes_.begin(), stock_codes_.end()), stock_codes_.end());
        std::sort(factor_names_.begin(), factor_names_.end());
        factor_names_.erase(std::unique(factor_names_.begin(), factor_names_.end()), factor_names_.end());

        const size_t rows = stock_codes_.size();
        values_.assign(factor_names_.size(),
                       std::vector<double>(rows, std::numeric_limits<double>::quiet_NaN()));
        states_.assign(factor_names_.size(), std::vector<ValueState>(rows, ValueState::Undefined));
    }

    Date date() const { return date_; }
    size_t rowCount() const { return stock_codes_.size(); }
    size_t columnCount() const { return factor_names_.size(); }
    const std::vector<std::string>& stockCodes() const { return stock_codes_; }
    const std::vector<std::string>& factorNames() const { return factor_names_; }
    const std::string& stockCode(size_t row) const { return stock_codes_[row]; }

    std::optional<size_t> columnIndex(const std::string& factor) const {
        auto it = std::lower_bound(factor_names_.begin(), factor_names_.end(), factor);
        if (it == factor_names_.end() || *it != factor) return std::nullopt;
        return static_cast<size_t>(it - factor_names_.begin());
    }

    std::optional<size_t> rowIndex(const std::string& stock_code) const {
        auto it = std::lower_bound(stock_codes_.begin(), stock_codes_.end(), stock_code);
        if (it == stock_codes_.end() || *it != stock_code) return std::nullopt;
        return static_cast<size_t>(it - stock_codes_.begin());
    }

    bool hasFactor(const std::string& factor) const { return columnIndex(factor).has_value(); }

    size_t requireColumn(const std::string& factor) const {
        auto col = columnIndex(factor);
        if (!col) throw BacktestException("Factor '" + factor + "' is not part of this panel");
        return *col;
    }

    const std::vector<double>& values(size_t col) const { return values_[col]; }
    const std::vector<ValueState>& states(size_t col) const { return states_[col]; }

    void set(size_t row, size_t col, const FactorValue& v) {
        values_[col][row] = v.value;
        states_[col][row] = v.state;
    }

    FactorValue get(size_t row, size_t col) const {
        return {values_[col][row], states_[col][row]};
    }

    // Cell lookup by name; undefined when the row or column is absent
    FactorValue get(const std::string& stock_code, const std::string& factor) const {
        auto row = rowIndex(stock_code);
        auto col = columnIndex(factor);
        if (!row || !col) return FactorValue::undefined();
        return get(*row, *col);
    }
};

} // namespace equitybt
