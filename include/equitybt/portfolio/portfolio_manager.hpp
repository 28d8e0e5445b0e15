// portfolio_manager.hpp
// Cash and position bookkeeping for one backtest run
// Sizing limits, fills through the cost model, trade records and daily snapshots

#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "../core/date.hpp"
#include "../core/exceptions.hpp"
#include "../core/logger.hpp"
#include "../execution/cost_model.hpp"

namespace equitybt {

enum class TradeSide {
    BUY,
    SELL
};

inline const char* toString(TradeSide side) {
    return side == TradeSide::BUY ? "BUY" : "SELL";
}

struct Position {
    std::string stock_code;
    int64_t quantity = 0;
    double avg_buy_price = 0.0;
    Date buy_date;
    std::string entry_reason;
};

struct Trade {
    Date date;
    std::string stock_code;
    TradeSide side = TradeSide::BUY;
    int64_t quantity = 0;
    double price = 0.0;          // reference price chosen by the rule or the buy basis
    double exec_price = 0.0;     // after slippage
    double amount = 0.0;         // exec_price * quantity
    double commission = 0.0;
    double tax = 0.0;
    double slippage_cost = 0.0;
    double net_cash_flow = 0.0;  // negative for buys
    double avg_buy_price = 0.0;  // cost basis of the position (sells)
    double realized_pnl = 0.0;   // sells
    double profit_rate = 0.0;    // sells, percent versus avg_buy_price
    int hold_days = 0;           // sells, calendar days
    std::string reason;
};

struct PortfolioSnapshot {
    Date date;
    double cash = 0.0;
    double position_value = 0.0;
    double total_value = 0.0;
    double daily_return = 0.0;       // fraction
    double cumulative_return = 0.0;  // fraction versus initial capital
    size_t position_count = 0;
    size_t trade_count = 0;          // trades executed that day
};

// ============================================================================
// Portfolio Manager
// ============================================================================

class PortfolioManager {
public:
    struct PortfolioConfig {
        double initial_capital;
        size_t max_positions;             // 0 = unlimited
        double per_stock_ratio;           // percent of total value per new position
        size_t max_daily_stock;           // new buys per day, 0 = unlimited
        std::optional<double> max_buy_value;
        bool allow_additional_buys;

        PortfolioConfig()
            : initial_capital(100000000.0)
            , max_positions(10)
            , per_stock_ratio(10.0)
            , max_daily_stock(0)
            , allow_additional_buys(false) {}

        static PortfolioConfig getDefault() {
            return PortfolioConfig();
        }
    };

private:
    PortfolioConfig config_;
    CostModel cost_model_;

    double cash_;
    std::map<std::string, Position> positions_;
    std::map<std::string, double> last_prices_;
    std::vector<Trade> trades_;
    std::vector<PortfolioSnapshot> snapshots_;

    // Per-day state
    std::optional<Date> current_date_;
    std::set<std::pair<std::string, TradeSide>> executed_today_;
    std::set<std::string> sold_today_;
    size_t buys_today_ = 0;
    size_t trades_today_ = 0;

    double total_commission_ = 0.0;
    double total_tax_ = 0.0;
    double total_slippage_ = 0.0;

    const Date& today() const {
        if (!current_date_) throw InvariantViolation("portfolio used outside of a trading day");
        return *current_date_;
    }

    void recordTrade(const Trade& trade) {
        if (!executed_today_.emplace(trade.stock_code, trade.side).second) {
            throw InvariantViolation("duplicate " + std::string(toString(trade.side)) + " of " +
                                     trade.stock_code + " on " + trade.date.toString());
        }
        trades_.push_back(trade);
        ++trades_today_;
        total_commission_ += trade.commission;
        total_tax_ += trade.tax;
        total_slippage_ += trade.slippage_cost;
    }

public:
    explicit PortfolioManager(const PortfolioConfig& config = PortfolioConfig::getDefault(),
                              const CostModel& cost_model = CostModel())
        : config_(config)
        , cost_model_(cost_model)
        , cash_(config.initial_capital) {}

    // ========================================================================
    // Day lifecycle
    // ========================================================================

    void beginDay(Date date) {
        if (current_date_ && date <= *current_date_) {
            throw InvariantViolation("trading days must advance: " + date.toString() +
                                     " after " + current_date_->toString());
        }
        current_date_ = date;
        executed_today_.clear();
        sold_today_.clear();
        buys_today_ = 0;
        trades_today_ = 0;
    }

    // Marks a stock at today's close
    void updatePrice(const std::string& stock_code, double close) {
        if (std::isfinite(close) && close > 0.0) last_prices_[stock_code] = close;
    }

    const PortfolioSnapshot& endDay() {
        PortfolioSnapshot snap;
        snap.date = today();
        snap.cash = cash_;
        snap.position_value = positionValue();
        snap.total_value = snap.cash + snap.position_value;
        const double previous = snapshots_.empty() ? config_.initial_capital : snapshots_.back().total_value;
        snap.daily_return = previous > 0.0 ? snap.total_value / previous - 1.0 : 0.0;
        snap.cumulative_return = config_.initial_capital > 0.0
            ? snap.total_value / config_.initial_capital - 1.0 : 0.0;
        snap.position_count = positions_.size();
        snap.trade_count = trades_today_;
        snapshots_.push_back(snap);
        return snapshots_.back();
    }

    // ========================================================================
    // Sizing
    // ========================================================================

    // min(cash, per_stock_ratio% of total value), optionally capped by max_buy_value
    double newPositionBudget() const {
        double budget = std::min(cash_, totalValue() * config_.per_stock_ratio / 100.0);
        if (config_.max_buy_value) budget = std::min(budget, *config_.max_buy_value);
        return std::max(0.0, budget);
    }

    // Daily buy ceiling, plus the open-position ceiling for stocks not yet held
    bool hasBuySlot(const std::string& stock_code) const {
        if (config_.max_daily_stock > 0 && buys_today_ >= config_.max_daily_stock) return false;
        if (positions_.count(stock_code)) return true;
        return config_.max_positions == 0 || positions_.size() < config_.max_positions;
    }

    // Held stocks are only eligible with allow_additional_buys; stocks sold today never are
    bool isBuyCandidate(const std::string& stock_code) const {
        if (sold_today_.count(stock_code)) return false;
        if (positions_.count(stock_code)) return config_.allow_additional_buys;
        return true;
    }

    // ========================================================================
    // Execution
    // ========================================================================

    // Skipped (nullopt) when the budget buys nothing or the cost would overdraw cash
    std::optional<Trade> buy(const std::string& stock_code, double reference_price,
                             double budget, const std::string& reason) {
        const Date date = today();
        if (sold_today_.count(stock_code)) {
            throw InvariantViolation("buy of " + stock_code + " after selling it on " + date.toString());
        }

        const auto fill = cost_model_.planBuy(reference_price, std::min(budget, cash_));
        if (fill.quantity <= 0) return std::nullopt;
        if (fill.total_cost > cash_) return std::nullopt;

        Trade trade;
        trade.date = date;
        trade.stock_code = stock_code;
        trade.side = TradeSide::BUY;
        trade.quantity = fill.quantity;
        trade.price = reference_price;
        trade.exec_price = fill.exec_price;
        trade.amount = fill.amount;
        trade.commission = fill.commission;
        trade.slippage_cost = fill.slippage_cost;
        trade.net_cash_flow = -fill.total_cost;
        trade.reason = reason;
        recordTrade(trade);

        cash_ -= fill.total_cost;

        auto it = positions_.find(stock_code);
        if (it == positions_.end()) {
            Position pos;
            pos.stock_code = stock_code;
            pos.quantity = fill.quantity;
            pos.avg_buy_price = fill.exec_price;
            pos.buy_date = date;
            pos.entry_reason = reason;
            positions_.emplace(stock_code, pos);
        } else {
            Position& pos = it->second;
            const double cost = pos.avg_buy_price * static_cast<double>(pos.quantity) + fill.amount;
            pos.quantity += fill.quantity;
            pos.avg_buy_price = cost / static_cast<double>(pos.quantity);
        }
        ++buys_today_;
        if (!last_prices_.count(stock_code)) updatePrice(stock_code, reference_price);

        Logger::debug("BUY " + stock_code + " x" + std::to_string(fill.quantity) + " @ " +
                      std::to_string(fill.exec_price) + " on " + date.toString());
        return trade;
    }

    // Full liquidation at the rule's reference price
    std::optional<Trade> sell(const std::string& stock_code, double reference_price, const std::string& reason) {
        const Date date = today();
        auto it = positions_.find(stock_code);
        if (it == positions_.end()) {
            throw InvariantViolation("sell of " + stock_code + " without an open position");
        }
        const Position pos = it->second;
        if (pos.buy_date >= date) {
            throw InvariantViolation("position in " + stock_code + " opened on " + pos.buy_date.toString() +
                                     " cannot be sold on " + date.toString());
        }

        const auto fill = cost_model_.planSell(reference_price, pos.quantity);
        if (fill.amount <= 0.0) return std::nullopt;

        Trade trade;
        trade.date = date;
        trade.stock_code = stock_code;
        trade.side = TradeSide::SELL;
        trade.quantity = pos.quantity;
        trade.price = reference_price;
        trade.exec_price = fill.exec_price;
        trade.amount = fill.amount;
        trade.commission = fill.commission;
        trade.tax = fill.tax;
        trade.slippage_cost = fill.slippage_cost;
        trade.net_cash_flow = fill.net_proceeds;
        trade.avg_buy_price = pos.avg_buy_price;
        trade.realized_pnl = fill.net_proceeds - pos.avg_buy_price * static_cast<double>(pos.quantity);
        trade.profit_rate = (reference_price / pos.avg_buy_price - 1.0) * 100.0;
        trade.hold_days = date - pos.buy_date;
        trade.reason = reason;
        recordTrade(trade);

        cash_ += fill.net_proceeds;
        positions_.erase(it);
        sold_today_.insert(stock_code);

        Logger::debug("SELL " + stock_code + " x" + std::to_string(pos.quantity) + " @ " +
                      std::to_string(fill.exec_price) + " (" + reason + ") on " + date.toString());
        return trade;
    }

    // ========================================================================
    // Accessors
    // ========================================================================

    double cash() const { return cash_; }

    // Positions at last known close, cost basis when never priced
    double positionValue() const {
        double value = 0.0;
        for (const auto& [code, pos] : positions_) {
            auto price = last_prices_.find(code);
            const double mark = price != last_prices_.end() ? price->second : pos.avg_buy_price;
            value += mark * static_cast<double>(pos.quantity);
        }
        return value;
    }

    double totalValue() const { return cash_ + positionValue(); }

    const std::map<std::string, Position>& positions() const { return positions_; }
    bool holds(const std::string& stock_code) const { return positions_.count(stock_code) > 0; }
    const std::vector<Trade>& trades() const { return trades_; }
    const std::vector<PortfolioSnapshot>& snapshots() const { return snapshots_; }
    const PortfolioConfig& config() const { return config_; }

    double totalCommission() const { return total_commission_; }
    double totalTax() const { return total_tax_; }
    double totalSlippage() const { return total_slippage_; }
};

} // namespace equitybt
