// backtest_config.hpp
// Run configuration for one backtest with defaults and up-front validation

#pragma once

#include <cctype>
#include <cmath>
#include <optional>
#include <string>
#include <vector>
#include "../conditions/condition_evaluator.hpp"
#include "../core/date.hpp"
#include "../core/exceptions.hpp"
#include "../data/market_data.hpp"
#include "../execution/price_basis.hpp"
#include "../factors/factor_registry.hpp"
#include "../rules/sell_rule_engine.hpp"

namespace equitybt {

enum class RebalanceFrequency {
    DAILY,
    WEEKLY,     // first trading day of each week
    MONTHLY,    // first trading day of each month
    QUARTERLY   // first trading day of each quarter
};

inline const char* toString(RebalanceFrequency f) {
    switch (f) {
        case RebalanceFrequency::DAILY: return "DAILY";
        case RebalanceFrequency::WEEKLY: return "WEEKLY";
        case RebalanceFrequency::MONTHLY: return "MONTHLY";
        case RebalanceFrequency::QUARTERLY: return "QUARTERLY";
    }
    return "DAILY";
}

inline RebalanceFrequency parseRebalanceFrequency(const std::string& text, const std::string& field) {
    std::string upper = text;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (upper == "DAILY" || upper == "DAY") return RebalanceFrequency::DAILY;
    if (upper == "WEEKLY" || upper == "WEEK") return RebalanceFrequency::WEEKLY;
    if (upper == "MONTHLY" || upper == "MONTH") return RebalanceFrequency::MONTHLY;
    if (upper == "QUARTERLY" || upper == "QUARTER") return RebalanceFrequency::QUARTERLY;
    throw ConfigurationException(field, "unknown rebalance frequency '" + text + "'");
}

struct BuyRuleConfig {
    std::vector<Condition> conditions;
    std::string expression;          // empty: all conditions must hold
    std::string priority_factor;     // empty: stock code order
    bool priority_ascending;
    PriceBasis price_basis;
    double price_offset;             // percent

    BuyRuleConfig()
        : priority_ascending(false)
        , price_basis(PriceBasis::CLOSE)
        , price_offset(0.0) {}
};

// ============================================================================
// Run Configuration
// ============================================================================

struct RunConfig {
    std::string run_id;
    std::optional<Date> start_date;
    std::optional<Date> end_date;
    double initial_capital;

    UniverseFilter universe;
    BuyRuleConfig buy;
    SellRuleConfig sell;

    RebalanceFrequency rebalance_frequency;
    size_t max_positions;           // 0 = unlimited
    double per_stock_ratio;         // percent of total value per new position
    size_t max_daily_stock;         // 0 = unlimited
    std::optional<double> max_buy_value;
    bool allow_additional_buys;
    bool daily_sell_check;          // run sell rules on every trading day

    double commission_rate;         // fraction
    double slippage;                // fraction
    double tax_rate;                // fraction, sells only
    double risk_free_rate;          // annual fraction

    bool normalize_prices;
    double corporate_action_threshold;  // percent
    double progress_interval_pct;
    size_t worker_threads;

    RunConfig()
        : run_id("backtest")
        , initial_capital(0.0)
        , rebalance_frequency(RebalanceFrequency::DAILY)
        , max_positions(10)
        , per_stock_ratio(10.0)
        , max_daily_stock(0)
        , allow_additional_buys(false)
        , daily_sell_check(false)
        , commission_rate(0.00015)
        , slippage(0.001)
        , tax_rate(0.0023)
        , risk_free_rate(0.0)
        , normalize_prices(true)
        , corporate_action_threshold(50.0)
        , progress_interval_pct(10.0)
        , worker_threads(1) {}

    static RunConfig getDefault() {
        return RunConfig();
    }

    // Every factor the buy side needs on its panel
    std::vector<std::string> buyFactors() const {
        std::vector<std::string> factors;
        for (const auto& c : buy.conditions) factors.push_back(c.factor);
        if (!buy.priority_factor.empty()) factors.push_back(buy.priority_factor);
        return factors;
    }

    void validate() const {
        if (!start_date) throw ConfigurationException("start_date", "is required");
        if (!end_date) throw ConfigurationException("end_date", "is required");
        if (*start_date > *end_date) {
            throw ConfigurationException("start_date", "is after end_date (" + start_date->toString() +
                                                       " > " + end_date->toString() + ")");
        }
        if (!(initial_capital > 0.0) || !std::isfinite(initial_capital)) {
            throw ConfigurationException("initial_capital", "must be positive");
        }
        if (buy.conditions.empty()) {
            throw ConfigurationException("buy_conditions", "at least one condition is required");
        }
        if (!buy.priority_factor.empty() && !FactorRegistry::instance().contains(buy.priority_factor)) {
            throw ConfigurationException("priority_factor", "unknown factor '" + buy.priority_factor + "'");
        }
        if (!(buy.price_offset > -100.0)) {
            throw ConfigurationException("buy_price_offset", "must be greater than -100");
        }
        if (!(per_stock_ratio > 0.0 && per_stock_ratio <= 100.0)) {
            throw ConfigurationException("per_stock_ratio", "must be within (0, 100]");
        }
        if (max_buy_value && !(*max_buy_value > 0.0)) {
            throw ConfigurationException("max_buy_value", "must be positive");
        }
        if (!(commission_rate >= 0.0 && commission_rate < 1.0)) {
            throw ConfigurationException("commission_rate", "must be within [0, 1)");
        }
        if (!(slippage >= 0.0 && slippage < 1.0)) {
            throw ConfigurationException("slippage", "must be within [0, 1)");
        }
        if (!(tax_rate >= 0.0 && tax_rate < 1.0)) {
            throw ConfigurationException("tax_rate", "must be within [0, 1)");
        }
        if (!std::isfinite(risk_free_rate)) {
            throw ConfigurationException("risk_free_rate", "must be finite");
        }
        if (!(corporate_action_threshold > 0.0)) {
            throw ConfigurationException("corporate_action_threshold", "must be positive");
        }
        if (!(progress_interval_pct > 0.0 && progress_interval_pct <= 100.0)) {
            throw ConfigurationException("progress_interval_pct", "must be within (0, 100]");
        }
        if (worker_threads == 0) {
            throw ConfigurationException("worker_threads", "must be at least 1");
        }
        sell.validate();
    }
};

} // namespace equitybt
