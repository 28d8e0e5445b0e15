// sell_rule_engine.hpp
// Per-position exit decision with fixed rule priority:
// max-hold, then the min-hold gate, stop-loss, target-gain, conditional sell

#pragma once

#include <cmath>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../conditions/condition_evaluator.hpp"
#include "../core/date.hpp"
#include "../core/exceptions.hpp"
#include "../execution/price_basis.hpp"
#include "../factors/factor_panel.hpp"

namespace equitybt {

enum class SellReason {
    MAX_HOLD,
    STOP_LOSS,
    TARGET_GAIN,
    CONDITIONAL
};

inline const char* toString(SellReason reason) {
    switch (reason) {
        case SellReason::MAX_HOLD: return "max_hold";
        case SellReason::STOP_LOSS: return "stop_loss";
        case SellReason::TARGET_GAIN: return "target_gain";
        case SellReason::CONDITIONAL: return "conditional";
    }
    return "unknown";
}

struct ConditionalSellConfig {
    std::string expression;               // empty: all conditions must hold
    std::vector<Condition> conditions;
    std::optional<PriceBasis> price_basis;  // defaults to the hold-rule basis
    std::optional<double> price_offset;     // percent; defaults to the hold-rule offset
};

struct SellRuleConfig {
    std::optional<double> target_gain_pct;
    std::optional<double> stop_loss_pct;
    int min_hold_days;
    int max_hold_days;        // 0 disables the max-hold rule
    PriceBasis sell_price_basis;
    double sell_price_offset; // percent
    std::optional<ConditionalSellConfig> conditional;

    SellRuleConfig()
        : min_hold_days(0)
        , max_hold_days(0)
        , sell_price_basis(PriceBasis::CLOSE)
        , sell_price_offset(0.0) {}

    static SellRuleConfig getDefault() {
        return SellRuleConfig();
    }

    void validate() const {
        if (target_gain_pct && !(*target_gain_pct > 0.0 && std::isfinite(*target_gain_pct))) {
            throw ConfigurationException("sell.target_gain", "must be a positive percentage");
        }
        if (stop_loss_pct && !(*stop_loss_pct > 0.0 && *stop_loss_pct < 100.0)) {
            throw ConfigurationException("sell.stop_loss", "must be within (0, 100)");
        }
        if (min_hold_days < 0) {
            throw ConfigurationException("sell.min_hold_days", "must not be negative");
        }
        if (max_hold_days < 0) {
            throw ConfigurationException("sell.max_hold_days", "must not be negative");
        }
        if (max_hold_days > 0 && min_hold_days > max_hold_days) {
            throw ConfigurationException("sell.min_hold_days",
                "min_hold_days (" + std::to_string(min_hold_days) + ") exceeds max_hold_days (" +
                std::to_string(max_hold_days) + ")");
        }
        if (!(sell_price_offset > -100.0)) {
            throw ConfigurationException("sell.sell_price_offset", "must be greater than -100");
        }
        if (conditional && conditional->price_offset && !(*conditional->price_offset > -100.0)) {
            throw ConfigurationException("sell.condition_sell.sell_price_offset", "must be greater than -100");
        }
    }
};

struct SellDecision {
    double price;
    SellReason reason;
};

// ============================================================================
// Sell-Rule Engine
// ============================================================================

class SellRuleEngine {
private:
    SellRuleConfig config_;
    std::shared_ptr<const CompiledPredicate> conditional_;

public:
    // Validates the rules and compiles the conditional sell up front
    SellRuleEngine(const SellRuleConfig& config, ConditionEvaluator& evaluator)
        : config_(config) {
        config_.validate();
        if (config_.conditional) {
            conditional_ = evaluator.compile(config_.conditional->expression,
                                             config_.conditional->conditions,
                                             "sell.condition_sell");
        }
    }

    const SellRuleConfig& config() const { return config_; }
    bool hasConditionalSell() const { return conditional_ != nullptr; }

    std::vector<std::string> conditionalFactors() const {
        return conditional_ ? conditional_->requiredFactors() : std::vector<std::string>{};
    }

    // Stocks of `panel` for which the conditional sell expression holds today
    std::set<std::string> conditionalHits(const FactorPanel& panel) const {
        std::set<std::string> hits;
        if (!conditional_) return hits;
        const auto mask = conditional_->evaluate(panel);
        for (size_t row = 0; row < mask.size(); ++row) {
            if (mask[row]) hits.insert(panel.stockCode(row));
        }
        return hits;
    }

    // First matching rule wins; nothing fires on a non-positive average price
    std::optional<SellDecision> evaluate(double avg_buy_price, Date buy_date,
                                         const DayQuote& quote, bool conditional_hit) const {
        if (!(avg_buy_price > 0.0)) return std::nullopt;

        const int hold_days = quote.date - buy_date;

        if (config_.max_hold_days > 0 && hold_days >= config_.max_hold_days) {
            const double price = quote.price(config_.sell_price_basis, config_.sell_price_offset);
            if (!(price > 0.0)) return std::nullopt;
            return SellDecision{price, SellReason::MAX_HOLD};
        }

        if (hold_days < config_.min_hold_days) return std::nullopt;

        if (config_.stop_loss_pct && quote.low > 0.0) {
            const double low_profit_pct = (quote.low / avg_buy_price - 1.0) * 100.0;
            if (low_profit_pct <= -*config_.stop_loss_pct) {
                return SellDecision{avg_buy_price * (1.0 - *config_.stop_loss_pct / 100.0),
                                    SellReason::STOP_LOSS};
            }
        }

        if (config_.target_gain_pct && quote.high > 0.0) {
            const double high_profit_pct = (quote.high / avg_buy_price - 1.0) * 100.0;
            if (high_profit_pct >= *config_.target_gain_pct) {
                return SellDecision{avg_buy_price * (1.0 + *config_.target_gain_pct / 100.0),
                                    SellReason::TARGET_GAIN};
            }
        }

        if (conditional_ && conditional_hit) {
            const auto& cond = *config_.conditional;
            const PriceBasis basis = cond.price_basis ? *cond.price_basis : config_.sell_price_basis;
            const double offset = cond.price_offset ? *cond.price_offset : config_.sell_price_offset;
            const double price = quote.price(basis, offset);
            if (!(price > 0.0)) return std::nullopt;
            return SellDecision{price, SellReason::CONDITIONAL};
        }

        return std::nullopt;
    }
};

} // namespace equitybt
