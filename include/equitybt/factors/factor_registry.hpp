// factor_registry.hpp
// Catalogue of computable factors with their history requirements
// Price factors read the bar history; fundamental factors read the latest published statement

#pragma once

#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../core/exceptions.hpp"
#include "../data/market_data.hpp"
#include "../math/rolling_statistics.hpp"
#include "../math/simd_math.hpp"
#include "factor_panel.hpp"

namespace equitybt {

// Everything a factor may read for one stock on one day
struct FactorInput {
    const StockHistory& history;
    size_t bar_index;                         // today's bar
    const FundamentalRecord* fundamentals;    // latest statement available today, may be null

    const Bar& today() const { return history.bars[bar_index]; }
    size_t availableBars() const { return bar_index + 1; }
};

enum class FactorFamily {
    PRICE,
    FUNDAMENTAL,
    RANK
};

struct FactorDefinition {
    std::string name;
    FactorFamily family = FactorFamily::PRICE;
    size_t min_history = 1;        // bars required up to and including today
    bool higher_is_better = true;  // rank direction
    std::string base_factor;       // RANK family only
    std::function<FactorValue(const FactorInput&)> compute;
};

// ============================================================================
// Factor Kernels
// ============================================================================

namespace factor_kernels {

inline bool finite(double v) { return std::isfinite(v); }

inline double marketCap(const FactorInput& in) {
    const Bar& bar = in.today();
    if (finite(bar.market_cap) && bar.market_cap > 0.0) return bar.market_cap;
    if (finite(bar.listed_shares) && bar.listed_shares > 0.0) return bar.close * bar.listed_shares;
    return std::numeric_limits<double>::quiet_NaN();
}

// Closes of the trailing window ending today; empty if any close in it is missing
inline bool trailingCloses(const FactorInput& in, size_t window, std::vector<double>& out) {
    out.clear();
    if (in.availableBars() < window) return false;
    const size_t first = in.bar_index + 1 - window;
    for (size_t i = first; i <= in.bar_index; ++i) {
        const Bar& bar = in.history.bars[i];
        if (!bar.hasValidClose()) return false;
        out.push_back(bar.close);
    }
    return true;
}

inline FactorValue momentum(const FactorInput& in, size_t lag) {
    if (in.availableBars() < lag + 1) return FactorValue::undefined();
    const Bar& past = in.history.bars[in.bar_index - lag];
    if (!past.hasValidClose()) return FactorValue::undefined();
    return FactorValue::defined((in.today().close / past.close - 1.0) * 100.0);
}

inline FactorValue movingAverage(const FactorInput& in, size_t window) {
    std::vector<double> closes;
    if (!trailingCloses(in, window, closes)) return FactorValue::undefined();
    RollingStatistics stats(window);
    for (double c : closes) stats.update(c);
    return FactorValue::defined(stats.getMean());
}

// Annualized stdev of daily returns, in percent
inline FactorValue volatility(const FactorInput& in, size_t window) {
    std::vector<double> closes;
    if (!trailingCloses(in, window + 1, closes)) return FactorValue::undefined();
    std::vector<double> returns(window);
    for (size_t i = 1; i < closes.size(); ++i) {
        returns[i - 1] = closes[i] / closes[i - 1] - 1.0;
    }
    const double mean = simd::VectorOps::mean(returns.data(), window);
    const double sd = simd::VectorOps::sample_std_dev(returns.data(), window, mean);
    return FactorValue::defined(sd * std::sqrt(252.0) * 100.0);
}

inline FactorValue rsi(const FactorInput& in, size_t period) {
    std::vector<double> closes;
    if (!trailingCloses(in, period + 1, closes)) return FactorValue::undefined();
    double gains = 0.0;
    double losses = 0.0;
    for (size_t i = 1; i < closes.size(); ++i) {
        double delta = closes[i] - closes[i - 1];
        if (delta > 0) gains += delta; else losses -= delta;
    }
    if (gains == 0.0 && losses == 0.0) return FactorValue::defined(50.0);
    if (losses == 0.0) return FactorValue::defined(100.0);
    double rs = gains / losses;
    return FactorValue::defined(100.0 - 100.0 / (1.0 + rs));
}

// Position of today's close inside the 2-sigma band, 0 = lower, 1 = upper
inline FactorValue bollingerPosition(const FactorInput& in, size_t window) {
    std::vector<double> closes;
    if (!trailingCloses(in, window, closes)) return FactorValue::undefined();
    // A flat window has no band, whatever rounding leaves in the deviation
    auto [lowest, highest] = std::minmax_element(closes.begin(), closes.end());
    if (*lowest == *highest) return FactorValue::notApplicable();
    const double mean = simd::VectorOps::mean(closes.data(), closes.size());
    const double sd = simd::VectorOps::sample_std_dev(closes.data(), closes.size(), mean);
    if (sd <= 0.0) return FactorValue::notApplicable();
    const double lower = mean - 2.0 * sd;
    const double upper = mean + 2.0 * sd;
    return FactorValue::defined((in.today().close - lower) / (upper - lower));
}

inline FactorValue stochastic(const FactorInput& in, size_t window) {
    if (in.availableBars() < window) return FactorValue::undefined();
    double lowest = std::numeric_limits<double>::max();
    double highest = std::numeric_limits<double>::lowest();
    for (size_t i = in.bar_index + 1 - window; i <= in.bar_index; ++i) {
        const Bar& bar = in.history.bars[i];
        if (!bar.hasValidClose()) return FactorValue::undefined();
        lowest = std::min(lowest, bar.low);
        highest = std::max(highest, bar.high);
    }
    if (highest - lowest <= 0.0) return FactorValue::notApplicable();
    return FactorValue::defined((in.today().close - lowest) / (highest - lowest) * 100.0);
}

inline FactorValue distanceFromHigh(const FactorInput& in, size_t window) {
    if (in.availableBars() < window) return FactorValue::undefined();
    double highest = 0.0;
    for (size_t i = in.bar_index + 1 - window; i <= in.bar_index; ++i) {
        highest = std::max(highest, in.history.bars[i].high);
    }
    if (highest <= 0.0) return FactorValue::notApplicable();
    return FactorValue::defined((in.today().close / highest - 1.0) * 100.0);
}

inline FactorValue distanceFromLow(const FactorInput& in, size_t window) {
    if (in.availableBars() < window) return FactorValue::undefined();
    double lowest = std::numeric_limits<double>::max();
    for (size_t i = in.bar_index + 1 - window; i <= in.bar_index; ++i) {
        const double low = in.history.bars[i].low;
        if (low > 0.0) lowest = std::min(lowest, low);
    }
    if (lowest == std::numeric_limits<double>::max()) return FactorValue::notApplicable();
    return FactorValue::defined((in.today().close / lowest - 1.0) * 100.0);
}

inline FactorValue avgTradingValue(const FactorInput& in, size_t window) {
    if (in.availableBars() < window) return FactorValue::undefined();
    RollingStatistics stats(window);
    for (size_t i = in.bar_index + 1 - window; i <= in.bar_index; ++i) {
        const Bar& bar = in.history.bars[i];
        if (!bar.hasValidClose() || !finite(bar.volume)) return FactorValue::undefined();
        stats.update(bar.close * bar.volume);
    }
    return FactorValue::defined(stats.getMean());
}

// numerator / denominator * scale; a non-positive denominator is not applicable
inline FactorValue ratio(double numerator, double denominator, double scale = 1.0) {
    if (!finite(numerator) || !finite(denominator)) return FactorValue::undefined();
    if (denominator <= 0.0) return FactorValue::notApplicable();
    return FactorValue::defined(numerator / denominator * scale);
}

// Valuation multiple market_cap / item
inline FactorValue valuation(const FactorInput& in, double FundamentalRecord::*item) {
    if (!in.fundamentals) return FactorValue::undefined();
    return ratio(marketCap(in), in.fundamentals->*item);
}

inline FactorValue fundamentalRatio(const FactorInput& in,
                                    double FundamentalRecord::*numerator,
                                    double FundamentalRecord::*denominator) {
    if (!in.fundamentals) return FactorValue::undefined();
    return ratio(in.fundamentals->*numerator, in.fundamentals->*denominator, 100.0);
}

} // namespace factor_kernels

// ============================================================================
// Factor Registry
// ============================================================================

class FactorRegistry {
private:
    std::map<std::string, FactorDefinition> definitions_;

    void add(const std::string& name, FactorFamily family, size_t min_history, bool higher_is_better,
             std::function<FactorValue(const FactorInput&)> compute) {
        FactorDefinition def;
        def.name = name;
        def.family = family;
        def.min_history = min_history;
        def.higher_is_better = higher_is_better;
        def.compute = std::move(compute);
        definitions_[name] = std::move(def);
    }

    void addPrice(const std::string& name, size_t min_history, bool higher_is_better,
                  std::function<FactorValue(const FactorInput&)> compute) {
        add(name, FactorFamily::PRICE, min_history, higher_is_better, std::move(compute));
    }

    void addFundamental(const std::string& name, bool higher_is_better,
                        std::function<FactorValue(const FactorInput&)> compute) {
        add(name, FactorFamily::FUNDAMENTAL, 1, higher_is_better, std::move(compute));
    }

    FactorRegistry() {
        using namespace factor_kernels;
        using FR = FundamentalRecord;

        addPrice("CLOSE", 1, true, [](const FactorInput& in) {
            return FactorValue::defined(in.today().close);
        });
        addPrice("MARKET_CAP", 1, true, [](const FactorInput& in) {
            double cap = marketCap(in);
            return finite(cap) ? FactorValue::defined(cap) : FactorValue::undefined();
        });

        const std::pair<const char*, size_t> momentum_lags[] = {
            {"MOMENTUM_1M", 20}, {"MOMENTUM_3M", 60}, {"MOMENTUM_6M", 120}, {"MOMENTUM_12M", 240}};
        for (const auto& [name, lag] : momentum_lags) {
            const size_t n = lag;
            addPrice(name, n + 1, true, [n](const FactorInput& in) { return momentum(in, n); });
        }

        for (size_t window : {5u, 20u, 60u, 120u}) {
            const size_t w = window;
            addPrice("MA_" + std::to_string(w), w, true,
                     [w](const FactorInput& in) { return movingAverage(in, w); });
        }

        for (size_t window : {20u, 60u}) {
            const size_t w = window;
            addPrice("VOLATILITY_" + std::to_string(w), w + 1, false,
                     [w](const FactorInput& in) { return volatility(in, w); });
        }

        addPrice("RSI_14", 15, true, [](const FactorInput& in) { return rsi(in, 14); });
        addPrice("BOLLINGER_POSITION", 20, true, [](const FactorInput& in) { return bollingerPosition(in, 20); });
        addPrice("STOCHASTIC_14", 14, true, [](const FactorInput& in) { return stochastic(in, 14); });
        addPrice("DISTANCE_FROM_52W_HIGH", 240, true, [](const FactorInput& in) { return distanceFromHigh(in, 240); });
        addPrice("DISTANCE_FROM_52W_LOW", 240, true, [](const FactorInput& in) { return distanceFromLow(in, 240); });
        addPrice("AVG_TRADING_VALUE_20", 20, true, [](const FactorInput& in) { return avgTradingValue(in, 20); });

        addFundamental("PER", false, [](const FactorInput& in) { return valuation(in, &FR::net_income); });
        addFundamental("PBR", false, [](const FactorInput& in) { return valuation(in, &FR::total_equity); });
        addFundamental("PSR", false, [](const FactorInput& in) { return valuation(in, &FR::revenue); });
        addFundamental("PCR", false, [](const FactorInput& in) { return valuation(in, &FR::operating_cash_flow); });
        addFundamental("EARNINGS_YIELD", true, [](const FactorInput& in) {
            if (!in.fundamentals) return FactorValue::undefined();
            return ratio(in.fundamentals->net_income, marketCap(in), 100.0);
        });
        addFundamental("ROE", true, [](const FactorInput& in) {
            return fundamentalRatio(in, &FR::net_income, &FR::total_equity);
        });
        addFundamental("ROA", true, [](const FactorInput& in) {
            return fundamentalRatio(in, &FR::net_income, &FR::total_assets);
        });
        addFundamental("DEBT_RATIO", false, [](const FactorInput& in) {
            return fundamentalRatio(in, &FR::total_liabilities, &FR::total_equity);
        });
        addFundamental("GPM", true, [](const FactorInput& in) {
            return fundamentalRatio(in, &FR::gross_profit, &FR::revenue);
        });
        addFundamental("OPM", true, [](const FactorInput& in) {
            return fundamentalRatio(in, &FR::operating_income, &FR::revenue);
        });
        addFundamental("NPM", true, [](const FactorInput& in) {
            return fundamentalRatio(in, &FR::net_income, &FR::revenue);
        });
    }

public:
    static constexpr const char* RANK_SUFFIX = "_RANK";

    static const FactorRegistry& instance() {
        static const FactorRegistry registry;
        return registry;
    }

    // Base factors plus their "<NAME>_RANK" companions
    std::optional<FactorDefinition> find(const std::string& name) const {
        auto it = definitions_.find(name);
        if (it != definitions_.end()) return it->second;

        const std::string suffix = RANK_SUFFIX;
        if (name.size() > suffix.size() &&
            name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0) {
            auto base = definitions_.find(name.substr(0, name.size() - suffix.size()));
            if (base == definitions_.end()) return std::nullopt;
            FactorDefinition def;
            def.name = name;
            def.family = FactorFamily::RANK;
            def.min_history = base->second.min_history;
            def.higher_is_better = false;  // rank 1 is best
            def.base_factor = base->first;
            return def;
        }
        return std::nullopt;
    }

    bool contains(const std::string& name) const { return find(name).has_value(); }

    // Sorted, de-duplicated factor list; unknown names are configuration errors
    std::vector<std::string> canonicalize(const std::vector<std::string>& names) const {
        std::set<std::string> unique;
        for (const auto& name : names) {
            if (!contains(name)) {
                throw ConfigurationException("factor", "unknown factor '" + name + "'");
            }
            unique.insert(name);
        }
        return std::vector<std::string>(unique.begin(), unique.end());
    }

    // Longest history any of the names needs
    size_t maxHistory(const std::vector<std::string>& names) const {
        size_t longest = 1;
        for (const auto& name : names) {
            auto def = find(name);
            if (def) longest = std::max(longest, def->min_history);
        }
        return longest;
    }

    std::vector<std::string> names() const {
        std::vector<std::string> out;
        for (const auto& entry : definitions_) out.push_back(entry.first);
        return out;
    }
};

} // namespace equitybt
