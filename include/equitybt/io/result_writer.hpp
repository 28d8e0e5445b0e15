// result_writer.hpp
// Writes a BacktestResult as CSV tables plus a statistics.json summary (jsoncpp)

#pragma once

#include <filesystem>
#include <fstream>
#include <iomanip>
#include <string>
#include <json/json.h>
#include "../core/exceptions.hpp"
#include "../core/logger.hpp"
#include "../engine/backtest_engine.hpp"

namespace equitybt {

class ResultWriter {
private:
    std::filesystem::path output_dir_;

    std::ofstream open(const std::string& name) const {
        std::ofstream out(output_dir_ / name);
        if (!out.is_open()) {
            throw DataException("cannot write " + (output_dir_ / name).string());
        }
        out << std::setprecision(10);
        return out;
    }

public:
    explicit ResultWriter(std::filesystem::path output_dir)
        : output_dir_(std::move(output_dir)) {}

    static Json::Value statisticsToJson(const BacktestResult& result) {
        const auto& s = result.statistics;
        Json::Value root(Json::objectValue);
        root["run_id"] = result.run_id;
        root["status"] = toString(result.status);
        if (!result.error_message.empty()) root["error_message"] = result.error_message;
        root["days_processed"] = static_cast<Json::UInt64>(result.days_processed);
        root["total_days"] = static_cast<Json::UInt64>(result.total_days);

        Json::Value stats(Json::objectValue);
        stats["initial_capital"] = s.initial_capital;
        stats["final_capital"] = s.final_capital;
        stats["peak_capital"] = s.peak_capital;
        stats["total_return"] = s.total_return;
        stats["annualized_return"] = s.annualized_return;
        stats["max_drawdown"] = s.max_drawdown;
        stats["volatility"] = s.volatility;
        stats["downside_volatility"] = s.downside_volatility;
        stats["sharpe_ratio"] = s.sharpe_ratio;
        stats["sortino_ratio"] = s.sortino_ratio;
        stats["calmar_ratio"] = s.calmar_ratio;
        stats["buy_count"] = static_cast<Json::UInt64>(s.buy_count);
        stats["total_trades"] = static_cast<Json::UInt64>(s.total_trades);
        stats["winning_trades"] = static_cast<Json::UInt64>(s.winning_trades);
        stats["losing_trades"] = static_cast<Json::UInt64>(s.losing_trades);
        stats["win_rate"] = s.win_rate;
        stats["avg_win"] = s.avg_win;
        stats["avg_loss"] = s.avg_loss;
        stats["profit_loss_ratio"] = s.profit_loss_ratio;
        stats["profit_factor"] = s.profit_factor;
        stats["avg_hold_days"] = s.avg_hold_days;
        stats["trading_days"] = static_cast<Json::UInt64>(s.trading_days);
        stats["total_commission"] = s.total_commission;
        stats["total_tax"] = s.total_tax;
        root["statistics"] = stats;

        Json::Value yearly(Json::arrayValue);
        for (const auto& row : s.yearly_returns) {
            Json::Value item(Json::objectValue);
            item["year"] = row.year;
            item["return"] = row.return_pct;
            item["trade_count"] = static_cast<Json::UInt64>(row.trade_count);
            item["win_rate"] = row.win_rate;
            yearly.append(item);
        }
        root["yearly_returns"] = yearly;

        Json::Value drawdowns(Json::arrayValue);
        for (const auto& dd : s.drawdown_periods) {
            Json::Value item(Json::objectValue);
            item["start"] = dd.start.toString();
            item["trough"] = dd.trough.toString();
            item["recovery"] = dd.recovery ? Json::Value(dd.recovery->toString()) : Json::Value();
            item["depth"] = dd.depth_pct;
            item["duration_days"] = dd.duration_days;
            item["recovery_days"] = dd.recovery_days;
            item["active"] = dd.active;
            drawdowns.append(item);
        }
        root["drawdown_periods"] = drawdowns;

        Json::Value holdings(Json::arrayValue);
        for (const auto& pos : result.final_positions) {
            Json::Value item(Json::objectValue);
            item["stock_code"] = pos.stock_code;
            item["quantity"] = static_cast<Json::Int64>(pos.quantity);
            item["avg_buy_price"] = pos.avg_buy_price;
            item["buy_date"] = pos.buy_date.toString();
            holdings.append(item);
        }
        root["final_positions"] = holdings;

        Json::Value cache(Json::objectValue);
        cache["panels_requested"] = static_cast<Json::UInt64>(result.factor_stats.panels_requested);
        cache["panels_computed"] = static_cast<Json::UInt64>(result.factor_stats.panels_computed);
        cache["cache_hits"] = static_cast<Json::UInt64>(result.factor_stats.cache_hits);
        cache["cache_failures"] = static_cast<Json::UInt64>(result.factor_stats.cache_failures);
        root["factor_panels"] = cache;
        return root;
    }

    void writeTrades(const BacktestResult& result) const {
        auto out = open("trades.csv");
        out << "date,stock_code,side,quantity,price,exec_price,amount,commission,tax,"
               "slippage_cost,net_cash_flow,avg_buy_price,realized_pnl,profit_rate,hold_days,reason\n";
        for (const auto& t : result.trades) {
            out << t.date.toString() << ',' << t.stock_code << ',' << toString(t.side) << ','
                << t.quantity << ',' << t.price << ',' << t.exec_price << ',' << t.amount << ','
                << t.commission << ',' << t.tax << ',' << t.slippage_cost << ',' << t.net_cash_flow << ','
                << t.avg_buy_price << ',' << t.realized_pnl << ',' << t.profit_rate << ','
                << t.hold_days << ',' << t.reason << '\n';
        }
    }

    void writeSnapshots(const BacktestResult& result) const {
        auto out = open("snapshots.csv");
        out << "date,cash,position_value,total_value,daily_return,cumulative_return,position_count,trade_count\n";
        for (const auto& s : result.snapshots) {
            out << s.date.toString() << ',' << s.cash << ',' << s.position_value << ',' << s.total_value << ','
                << s.daily_return << ',' << s.cumulative_return << ',' << s.position_count << ','
                << s.trade_count << '\n';
        }
    }

    void writeMonthly(const BacktestResult& result) const {
        auto out = open("monthly.csv");
        out << "year,month,return_pct,trade_count,win_rate,avg_hold_days\n";
        for (const auto& row : result.statistics.monthly_returns) {
            out << row.year << ',' << row.month << ',' << row.return_pct << ',' << row.trade_count << ','
                << row.win_rate << ',' << row.avg_hold_days << '\n';
        }
    }

    void writeStatistics(const BacktestResult& result) const {
        auto out = open("statistics.json");
        Json::StreamWriterBuilder builder;
        builder["indentation"] = "  ";
        out << Json::writeString(builder, statisticsToJson(result)) << '\n';
    }

    void writeAll(const BacktestResult& result) const {
        std::error_code ec;
        std::filesystem::create_directories(output_dir_, ec);
        if (ec) throw DataException("cannot create " + output_dir_.string() + ": " + ec.message());

        writeTrades(result);
        writeSnapshots(result);
        writeMonthly(result);
        writeStatistics(result);
        Logger::info("Results written to " + output_dir_.string());
    }
};

} // namespace equitybt
