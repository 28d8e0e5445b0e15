// cost_model.hpp
// Transaction cost model: proportional commission, slippage and sell-side tax
// Turns a reference price into fill quantities and cash flows

#pragma once

#include <cmath>
#include <cstdint>
#include "../core/exceptions.hpp"

namespace equitybt {

// ============================================================================
// Cost Model
// ============================================================================

class CostModel {
public:
    struct CostConfig {
        double commission_rate;  // fraction of traded amount, both sides
        double slippage;         // fraction; buys fill above, sells below the reference
        double tax_rate;         // fraction of sell amount

        CostConfig()
            : commission_rate(0.00015)
            , slippage(0.001)
            , tax_rate(0.0023) {}

        static CostConfig getDefault() {
            return CostConfig();
        }
    };

    struct BuyFill {
        int64_t quantity = 0;
        double exec_price = 0.0;
        double amount = 0.0;
        double commission = 0.0;
        double slippage_cost = 0.0;
        double total_cost = 0.0;   // amount + commission
    };

    struct SellFill {
        double exec_price = 0.0;
        double amount = 0.0;
        double commission = 0.0;
        double tax = 0.0;
        double slippage_cost = 0.0;
        double net_proceeds = 0.0; // amount - commission - tax
    };

private:
    CostConfig config_;

public:
    CostModel() : config_(CostConfig::getDefault()) {}
    explicit CostModel(const CostConfig& config) : config_(config) {}

    const CostConfig& config() const { return config_; }

    // Largest whole quantity whose amount plus commission fits the budget
    BuyFill planBuy(double reference_price, double budget) const {
        BuyFill fill;
        if (!(reference_price > 0.0) || !(budget > 0.0)) return fill;

        fill.exec_price = reference_price * (1.0 + config_.slippage);
        const double unit_cost = fill.exec_price * (1.0 + config_.commission_rate);
        int64_t quantity = static_cast<int64_t>(std::floor(budget / unit_cost));

        // Rounding in amount + commission may overshoot the budget by an ulp
        while (quantity > 0) {
            const double amount = fill.exec_price * static_cast<double>(quantity);
            const double commission = amount * config_.commission_rate;
            if (amount + commission <= budget) {
                fill.quantity = quantity;
                fill.amount = amount;
                fill.commission = commission;
                fill.slippage_cost = (fill.exec_price - reference_price) * static_cast<double>(quantity);
                fill.total_cost = amount + commission;
                return fill;
            }
            --quantity;
        }
        return fill;
    }

    SellFill planSell(double reference_price, int64_t quantity) const {
        SellFill fill;
        if (!(reference_price > 0.0) || quantity <= 0) return fill;

        const double qty = static_cast<double>(quantity);
        fill.exec_price = reference_price * (1.0 - config_.slippage);
        fill.amount = fill.exec_price * qty;
        fill.commission = fill.amount * config_.commission_rate;
        fill.tax = fill.amount * config_.tax_rate;
        fill.slippage_cost = (reference_price - fill.exec_price) * qty;
        fill.net_proceeds = fill.amount - fill.commission - fill.tax;
        return fill;
    }
};

} // namespace equitybt
