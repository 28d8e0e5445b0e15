// statistics_engine.hpp
// Performance statistics over the daily value path and the executed trades
// Degenerate inputs yield zeros, never NaN or infinity

#pragma once

#include <algorithm>
#include <cmath>
#include <map>
#include <optional>
#include <vector>
#include "../core/date.hpp"
#include "../math/simd_math.hpp"
#include "../portfolio/portfolio_manager.hpp"

namespace equitybt {

struct PeriodReturn {
    int year = 0;
    unsigned month = 0;          // 0 for yearly rows
    double return_pct = 0.0;
    size_t trade_count = 0;      // sells closed in the period
    double win_rate = 0.0;       // percent
    double avg_hold_days = 0.0;
};

struct DrawdownPeriod {
    Date start;                   // last peak before the decline
    Date trough;
    std::optional<Date> recovery; // first date back at the peak
    double depth_pct = 0.0;       // positive magnitude
    int duration_days = 0;        // start to recovery, or to the last date while active
    int recovery_days = 0;        // trough to recovery
    bool active = false;
};

struct BacktestStatistics {
    double initial_capital = 0.0;
    double final_capital = 0.0;
    double peak_capital = 0.0;

    // Percentages unless noted
    double total_return = 0.0;
    double annualized_return = 0.0;
    double max_drawdown = 0.0;        // positive magnitude
    double volatility = 0.0;
    double downside_volatility = 0.0;
    double sharpe_ratio = 0.0;        // ratio
    double sortino_ratio = 0.0;       // ratio
    double calmar_ratio = 0.0;        // ratio

    size_t buy_count = 0;
    size_t total_trades = 0;          // completed (sell) trades
    size_t winning_trades = 0;
    size_t losing_trades = 0;
    double win_rate = 0.0;
    double avg_win = 0.0;
    double avg_loss = 0.0;
    double profit_loss_ratio = 0.0;   // ratio
    double profit_factor = 0.0;       // ratio
    double avg_hold_days = 0.0;

    size_t trading_days = 0;
    double total_commission = 0.0;
    double total_tax = 0.0;

    std::vector<PeriodReturn> monthly_returns;
    std::vector<PeriodReturn> yearly_returns;
    std::vector<DrawdownPeriod> drawdown_periods;
};

// ============================================================================
// Statistics Engine
// ============================================================================

class StatisticsEngine {
public:
    struct StatsConfig {
        double risk_free_rate;          // annual, fraction
        double trading_days_per_year;
        double days_per_year;           // calendar basis for CAGR

        StatsConfig()
            : risk_free_rate(0.0)
            , trading_days_per_year(252.0)
            , days_per_year(365.25) {}

        static StatsConfig getDefault() {
            return StatsConfig();
        }
    };

private:
    StatsConfig config_;

    static double finiteOrZero(double v) { return std::isfinite(v) ? v : 0.0; }

    struct TradeSummary {
        size_t count = 0;
        size_t wins = 0;
        double hold_days = 0.0;
    };

    static void addSell(TradeSummary& s, const Trade& t) {
        ++s.count;
        if (t.realized_pnl > 0.0) ++s.wins;
        s.hold_days += t.hold_days;
    }

    static void fillTradeFields(PeriodReturn& row, const TradeSummary& s) {
        row.trade_count = s.count;
        row.win_rate = s.count ? static_cast<double>(s.wins) / static_cast<double>(s.count) * 100.0 : 0.0;
        row.avg_hold_days = s.count ? s.hold_days / static_cast<double>(s.count) : 0.0;
    }

    // Returns over consecutive groups of snapshots sharing a key
    template<typename KeyFn, typename RowFn>
    static std::vector<PeriodReturn> periodReturns(const std::vector<PortfolioSnapshot>& snapshots,
                                                   const std::vector<Trade>& trades,
                                                   double initial_capital, KeyFn key, RowFn init_row) {
        std::map<int32_t, TradeSummary> sells;
        for (const auto& t : trades) {
            if (t.side == TradeSide::SELL) addSell(sells[key(t.date)], t);
        }

        std::vector<PeriodReturn> rows;
        double period_start_value = initial_capital;
        for (size_t i = 0; i < snapshots.size(); ++i) {
            const bool last_of_period = i + 1 == snapshots.size() ||
                                        key(snapshots[i + 1].date) != key(snapshots[i].date);
            if (!last_of_period) continue;

            PeriodReturn row;
            init_row(row, snapshots[i].date);
            row.return_pct = period_start_value > 0.0
                ? (snapshots[i].total_value / period_start_value - 1.0) * 100.0 : 0.0;
            auto found = sells.find(key(snapshots[i].date));
            if (found != sells.end()) fillTradeFields(row, found->second);
            rows.push_back(row);
            period_start_value = snapshots[i].total_value;
        }
        return rows;
    }

public:
    StatisticsEngine() : config_(StatsConfig::getDefault()) {}
    explicit StatisticsEngine(const StatsConfig& config) : config_(config) {}

    static std::vector<DrawdownPeriod> drawdownPeriods(const std::vector<PortfolioSnapshot>& snapshots,
                                                       double initial_capital) {
        std::vector<DrawdownPeriod> periods;
        if (snapshots.empty()) return periods;

        double peak = initial_capital;
        Date peak_date = snapshots.front().date;
        std::optional<DrawdownPeriod> current;
        double trough_value = 0.0;

        for (const auto& snap : snapshots) {
            if (snap.total_value >= peak) {
                if (current) {
                    current->recovery = snap.date;
                    current->duration_days = snap.date - current->start;
                    current->recovery_days = snap.date - current->trough;
                    periods.push_back(*current);
                    current.reset();
                }
                peak = snap.total_value;
                peak_date = snap.date;
                continue;
            }
            if (!current) {
                current = DrawdownPeriod{};
                current->start = peak_date;
                current->trough = snap.date;
                trough_value = snap.total_value;
            } else if (snap.total_value < trough_value) {
                trough_value = snap.total_value;
                current->trough = snap.date;
            }
            current->depth_pct = std::max(current->depth_pct,
                                          peak > 0.0 ? (1.0 - snap.total_value / peak) * 100.0 : 0.0);
        }

        if (current) {
            current->active = true;
            current->duration_days = snapshots.back().date - current->start;
            periods.push_back(*current);
        }
        return periods;
    }

    BacktestStatistics compute(const std::vector<PortfolioSnapshot>& snapshots,
                               const std::vector<Trade>& trades,
                               double initial_capital) const {
        BacktestStatistics s;
        s.initial_capital = initial_capital;
        s.final_capital = initial_capital;
        s.peak_capital = initial_capital;
        s.trading_days = snapshots.size();

        for (const auto& t : trades) {
            s.total_commission += t.commission;
            s.total_tax += t.tax;
            if (t.side == TradeSide::BUY) ++s.buy_count;
        }

        // Trade statistics over completed (sell) trades only
        double gross_profit = 0.0;
        double gross_loss = 0.0;
        double win_rate_sum = 0.0;
        double loss_rate_sum = 0.0;
        double hold_sum = 0.0;
        for (const auto& t : trades) {
            if (t.side != TradeSide::SELL) continue;
            ++s.total_trades;
            hold_sum += t.hold_days;
            if (t.realized_pnl > 0.0) {
                ++s.winning_trades;
                gross_profit += t.realized_pnl;
                win_rate_sum += t.profit_rate;
            } else if (t.realized_pnl < 0.0) {
                ++s.losing_trades;
                gross_loss -= t.realized_pnl;
                loss_rate_sum += t.profit_rate;
            }
        }
        if (s.total_trades > 0) {
            s.win_rate = static_cast<double>(s.winning_trades) / static_cast<double>(s.total_trades) * 100.0;
            s.avg_hold_days = hold_sum / static_cast<double>(s.total_trades);
        }
        if (s.winning_trades > 0) s.avg_win = win_rate_sum / static_cast<double>(s.winning_trades);
        if (s.losing_trades > 0) s.avg_loss = loss_rate_sum / static_cast<double>(s.losing_trades);
        if (s.avg_loss != 0.0) s.profit_loss_ratio = std::abs(s.avg_win / s.avg_loss);
        if (gross_loss > 0.0) s.profit_factor = gross_profit / gross_loss;

        if (snapshots.empty() || !(initial_capital > 0.0)) return s;

        // Value path
        s.final_capital = snapshots.back().total_value;
        double peak = initial_capital;
        double max_dd = 0.0;
        std::vector<double> returns;
        returns.reserve(snapshots.size());
        for (const auto& snap : snapshots) {
            peak = std::max(peak, snap.total_value);
            if (peak > 0.0) max_dd = std::max(max_dd, 1.0 - snap.total_value / peak);
            returns.push_back(snap.daily_return);
        }
        s.peak_capital = peak;
        s.max_drawdown = max_dd * 100.0;
        s.total_return = (s.final_capital / initial_capital - 1.0) * 100.0;

        const int elapsed_days = snapshots.back().date - snapshots.front().date;
        if (elapsed_days > 0) {
            const double years = static_cast<double>(elapsed_days) / config_.days_per_year;
            const double growth = s.final_capital / initial_capital;
            s.annualized_return = growth > 0.0 ? (std::pow(growth, 1.0 / years) - 1.0) * 100.0 : -100.0;
        }

        const double annualizer = std::sqrt(config_.trading_days_per_year);
        const auto ms = simd::StatisticalOps::mean_std(returns);
        const double downside = simd::StatisticalOps::downside_std(returns);
        const double excess = ms.mean - config_.risk_free_rate / config_.trading_days_per_year;

        s.volatility = ms.std_dev * annualizer * 100.0;
        s.downside_volatility = downside * annualizer * 100.0;
        if (ms.std_dev > 0.0) s.sharpe_ratio = excess / ms.std_dev * annualizer;
        if (downside > 0.0) s.sortino_ratio = excess / downside * annualizer;
        if (s.max_drawdown > 0.0) s.calmar_ratio = s.annualized_return / s.max_drawdown;

        s.monthly_returns = periodReturns(snapshots, trades, initial_capital,
            [](Date d) { return d.monthKey(); },
            [](PeriodReturn& row, Date d) { row.year = d.year(); row.month = d.month(); });
        s.yearly_returns = periodReturns(snapshots, trades, initial_capital,
            [](Date d) { return static_cast<int32_t>(d.year()); },
            [](PeriodReturn& row, Date d) { row.year = d.year(); row.month = 0; });
        s.drawdown_periods = drawdownPeriods(snapshots, initial_capital);

        for (double* v : {&s.total_return, &s.annualized_return, &s.max_drawdown, &s.volatility,
                          &s.downside_volatility, &s.sharpe_ratio, &s.sortino_ratio, &s.calmar_ratio}) {
            *v = finiteOrZero(*v);
        }
        return s;
    }
};

} // namespace equitybt
