// backtest_engine.hpp
// Backtest Engine: loads the run's data, replays trading days and assembles the result
// Sells run before buys each day; cancellation is honored between trading days

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "../conditions/condition_evaluator.hpp"
#include "../core/exceptions.hpp"
#include "../core/logger.hpp"
#include "../data/market_data.hpp"
#include "../data/price_normalizer.hpp"
#include "../execution/cost_model.hpp"
#include "../execution/price_basis.hpp"
#include "../factors/factor_panel_builder.hpp"
#include "../factors/factor_registry.hpp"
#include "../interfaces/data_access.hpp"
#include "../interfaces/factor_cache.hpp"
#include "../portfolio/portfolio_manager.hpp"
#include "../rules/sell_rule_engine.hpp"
#include "../statistics/statistics_engine.hpp"
#include "backtest_config.hpp"
#include "progress.hpp"

namespace equitybt {

enum class RunStatus {
    COMPLETED,
    CANCELLED,
    FAILED
};

inline const char* toString(RunStatus status) {
    switch (status) {
        case RunStatus::COMPLETED: return "COMPLETED";
        case RunStatus::CANCELLED: return "CANCELLED";
        case RunStatus::FAILED: return "FAILED";
    }
    return "FAILED";
}

struct BacktestResult {
    std::string run_id;
    RunStatus status = RunStatus::COMPLETED;
    std::string error_message;

    std::vector<Trade> trades;
    std::vector<PortfolioSnapshot> snapshots;
    BacktestStatistics statistics;
    std::vector<Position> final_positions;

    size_t days_processed = 0;
    size_t total_days = 0;
    std::vector<CorporateActionEvent> corporate_actions;
    FactorPanelBuilder::BuildStats factor_stats;
    double elapsed_seconds = 0.0;
};

// ============================================================================
// Backtest Engine
// ============================================================================

class BacktestEngine {
private:
    std::shared_ptr<IDataAccess> data_access_;
    std::shared_ptr<IFactorCache> factor_cache_;
    ConditionEvaluator evaluator_;

    ProgressCallback progress_callback_;
    ProgressChannel* progress_channel_ = nullptr;

    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    static bool isRebalanceDay(const std::vector<Date>& calendar, size_t i, RebalanceFrequency freq) {
        if (i == 0) return true;
        const Date today = calendar[i];
        const Date prev = calendar[i - 1];
        switch (freq) {
            case RebalanceFrequency::DAILY: return true;
            case RebalanceFrequency::WEEKLY: return today.weekStart() != prev.weekStart();
            case RebalanceFrequency::MONTHLY: return today.monthKey() != prev.monthKey();
            case RebalanceFrequency::QUARTERLY: return today.quarterKey() != prev.quarterKey();
        }
        return true;
    }

    // Calendar days to load before start so the longest factor has its history
    static int32_t lookbackDays(size_t max_history_bars) {
        return static_cast<int32_t>(max_history_bars * 7 / 5 + 30);
    }

    static std::optional<DayQuote> quoteOn(const MarketDataSet& data, const std::string& code, Date date) {
        const StockHistory* history = data.find(code);
        if (!history) return std::nullopt;
        auto idx = history->indexOn(date);
        if (!idx || !history->bars[*idx].hasValidClose()) return std::nullopt;
        const Bar* previous = *idx > 0 ? &history->bars[*idx - 1] : nullptr;
        return DayQuote::fromBars(history->bars[*idx], previous);
    }

    MarketDataSet loadData(Date from, Date to) const {
        MarketDataSet data;
        for (const auto& code : data_access_->listStocks()) {
            StockHistory history;
            history.bars = data_access_->loadPrices(code, from, to);
            if (history.bars.empty()) continue;
            history.fundamentals = data_access_->loadFundamentals(code, to);
            history.memberships = data_access_->loadMemberships(code);
            data.addStock(code, std::move(history));
        }
        return data;
    }

    void publishProgress(const ProgressUpdate& update) {
        if (progress_callback_) progress_callback_(update);
        if (progress_channel_) progress_channel_->try_publish(update);
    }

    void runSells(const MarketDataSet& data, FactorPanelBuilder& builder,
                  const SellRuleEngine& sell_rules, PortfolioManager& portfolio, Date date) {
        if (portfolio.positions().empty()) return;

        std::set<std::string> conditional_hits;
        if (sell_rules.hasConditionalSell()) {
            UniverseFilter everything;
            everything.use_all = true;
            auto panel = builder.build(date, everything, sell_rules.conditionalFactors());
            conditional_hits = sell_rules.conditionalHits(*panel);
        }

        // Copy: selling mutates the position map
        const auto positions = portfolio.positions();
        for (const auto& [code, pos] : positions) {
            if (pos.buy_date >= date) continue;
            auto quote = quoteOn(data, code, date);
            if (!quote) continue;

            auto decision = sell_rules.evaluate(pos.avg_buy_price, pos.buy_date, *quote,
                                                conditional_hits.count(code) > 0);
            if (!decision) continue;
            portfolio.sell(code, decision->price, toString(decision->reason));
        }
    }

    void runBuys(const RunConfig& config, const MarketDataSet& data, FactorPanelBuilder& builder,
                 const CompiledPredicate& predicate, PortfolioManager& portfolio, Date date) {
        auto panel = builder.build(date, config.universe, config.buyFactors());
        const auto mask = predicate.evaluate(*panel);
        const auto ranked = ConditionEvaluator::rank(*panel, mask, config.buy.priority_factor,
                                                     config.buy.priority_ascending);

        for (const auto& code : ranked) {
            if (!portfolio.isBuyCandidate(code)) continue;
            if (!portfolio.hasBuySlot(code)) continue;

            auto quote = quoteOn(data, code, date);
            if (!quote) continue;
            const double reference = quote->price(config.buy.price_basis, config.buy.price_offset);
            if (!(reference > 0.0)) continue;

            const double budget = portfolio.newPositionBudget();
            if (!(budget > 0.0)) break;
            portfolio.buy(code, reference, budget, "buy_signal");
        }
    }

public:
    BacktestEngine() = default;

    explicit BacktestEngine(std::shared_ptr<IDataAccess> data_access,
                            std::shared_ptr<IFactorCache> factor_cache = nullptr)
        : data_access_(std::move(data_access))
        , factor_cache_(std::move(factor_cache)) {}

    void setDataAccess(std::shared_ptr<IDataAccess> data_access) {
        if (running_) throw BacktestException("Cannot change components while running");
        data_access_ = std::move(data_access);
    }

    void setFactorCache(std::shared_ptr<IFactorCache> cache) {
        if (running_) throw BacktestException("Cannot change components while running");
        factor_cache_ = std::move(cache);
    }

    void setProgressCallback(ProgressCallback callback) {
        if (running_) throw BacktestException("Cannot change components while running");
        progress_callback_ = std::move(callback);
    }

    void setProgressChannel(ProgressChannel* channel) {
        if (running_) throw BacktestException("Cannot change components while running");
        progress_channel_ = channel;
    }

    // Takes effect at the next trading-day boundary
    void requestStop() { stop_requested_ = true; }
    bool isRunning() const { return running_; }

    // Configuration errors throw before any day is simulated; later faults
    // end the run with status FAILED and the completed days intact
    BacktestResult run(const RunConfig& config) {
        if (!data_access_) throw BacktestException("Data access must be set before running");

        config.validate();
        auto predicate = evaluator_.compile(config.buy.expression, config.buy.conditions, "buy_expression");
        SellRuleEngine sell_rules(config.sell, evaluator_);

        bool expected = false;
        if (!running_.compare_exchange_strong(expected, true)) {
            throw BacktestException("Engine is already running");
        }
        stop_requested_ = false;

        struct RunningGuard {
            std::atomic<bool>& flag;
            ~RunningGuard() { flag = false; }
        } guard{running_};

        const auto wall_start = std::chrono::steady_clock::now();
        const Date start = *config.start_date;
        const Date end = *config.end_date;

        BacktestResult result;
        result.run_id = config.run_id;

        CostModel::CostConfig cost_config;
        cost_config.commission_rate = config.commission_rate;
        cost_config.slippage = config.slippage;
        cost_config.tax_rate = config.tax_rate;

        PortfolioManager::PortfolioConfig portfolio_config;
        portfolio_config.initial_capital = config.initial_capital;
        portfolio_config.max_positions = config.max_positions;
        portfolio_config.per_stock_ratio = config.per_stock_ratio;
        portfolio_config.max_daily_stock = config.max_daily_stock;
        portfolio_config.max_buy_value = config.max_buy_value;
        portfolio_config.allow_additional_buys = config.allow_additional_buys;
        PortfolioManager portfolio(portfolio_config, CostModel(cost_config));

        size_t committed_trades = 0;

        Logger::info("Backtest " + config.run_id + " started: " + start.toString() + " .. " +
                     end.toString() + ", capital " + std::to_string(config.initial_capital));

        try {
            std::vector<std::string> all_factors = config.buyFactors();
            for (const auto& f : sell_rules.conditionalFactors()) all_factors.push_back(f);
            const size_t max_history = FactorRegistry::instance().maxHistory(all_factors);
            const Date load_from = start.addDays(-lookbackDays(max_history));

            MarketDataSet data = loadData(load_from, end);
            if (data.empty()) Logger::warning("No price data between " + load_from.toString() +
                                              " and " + end.toString());

            auto zero_report = PriceValidator::validateZeroPrices(data);
            if (!zero_report.is_valid) {
                Logger::warning(std::to_string(zero_report.zero_count) + " bar(s) carry a zero price field");
            }

            if (config.normalize_prices) {
                PriceNormalizer::Config norm_config;
                norm_config.threshold_pct = config.corporate_action_threshold;
                result.corporate_actions = PriceNormalizer(norm_config).normalize(data);
            }

            auto continuity = PriceValidator::validatePriceContinuity(data, config.corporate_action_threshold);
            if (!continuity.is_valid) {
                Logger::warning(std::to_string(continuity.abnormal_count) + " unadjusted price jump(s) above " +
                                std::to_string(config.corporate_action_threshold) + "%");
            }

            FactorPanelBuilder::BuilderConfig builder_config;
            builder_config.worker_threads = config.worker_threads;
            builder_config.cache_scope = data_access_->sourceId() + "|" + load_from.toString() + ".." +
                end.toString() + "|" +
                (config.normalize_prices ? "adj" + std::to_string(config.corporate_action_threshold) : "raw");
            FactorPanelBuilder builder(data, builder_config, factor_cache_);

            const auto calendar = data.tradingDates(start, end, config.universe);
            result.total_days = calendar.size();
            ProgressTracker tracker(config.progress_interval_pct);
            size_t buy_count = 0;
            size_t sell_count = 0;

            for (size_t i = 0; i < calendar.size(); ++i) {
                if (stop_requested_) {
                    result.status = RunStatus::CANCELLED;
                    Logger::info("Backtest " + config.run_id + " cancelled after " +
                                 std::to_string(i) + " trading day(s)");
                    break;
                }

                const Date date = calendar[i];
                portfolio.beginDay(date);

                for (const auto& entry : portfolio.positions()) {
                    auto quote = quoteOn(data, entry.first, date);
                    if (quote) portfolio.updatePrice(entry.first, quote->close);
                }

                const bool rebalance = isRebalanceDay(calendar, i, config.rebalance_frequency);
                if (rebalance || config.daily_sell_check) {
                    runSells(data, builder, sell_rules, portfolio, date);
                }
                if (rebalance) {
                    runBuys(config, data, builder, *predicate, portfolio, date);
                }

                for (const auto& entry : portfolio.positions()) {
                    auto quote = quoteOn(data, entry.first, date);
                    if (quote) portfolio.updatePrice(entry.first, quote->close);
                }
                const auto& snap = portfolio.endDay();
                ++result.days_processed;

                for (size_t t = committed_trades; t < portfolio.trades().size(); ++t) {
                    if (portfolio.trades()[t].side == TradeSide::BUY) ++buy_count; else ++sell_count;
                }
                committed_trades = portfolio.trades().size();
                if (snap.trade_count > 0) {
                    Logger::debug(date.toString() + ": " + std::to_string(snap.trade_count) +
                                  " trade(s), value " + std::to_string(snap.total_value));
                }

                if (tracker.shouldEmit(i + 1, calendar.size())) {
                    ProgressUpdate update;
                    update.percent = static_cast<double>(i + 1) / static_cast<double>(calendar.size()) * 100.0;
                    update.current_date = date;
                    update.cumulative_return = snap.cumulative_return * 100.0;
                    update.days_processed = i + 1;
                    update.total_days = calendar.size();
                    update.total_trades = portfolio.trades().size();
                    update.buy_count = buy_count;
                    update.sell_count = sell_count;
                    publishProgress(update);
                }
            }

            result.factor_stats = builder.getStats();
            result.trades = portfolio.trades();
            for (const auto& entry : portfolio.positions()) result.final_positions.push_back(entry.second);
        } catch (const std::exception& e) {
            result.status = RunStatus::FAILED;
            result.error_message = e.what();
            Logger::error("Backtest " + config.run_id + " failed: " + e.what());

            // Only days that closed with a snapshot are reported
            const auto& all = portfolio.trades();
            const size_t keep = std::min(committed_trades, all.size());
            result.trades.assign(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(keep));
        }

        result.snapshots = portfolio.snapshots();
        StatisticsEngine::StatsConfig stats_config;
        stats_config.risk_free_rate = config.risk_free_rate;
        result.statistics = StatisticsEngine(stats_config).compute(result.snapshots, result.trades,
                                                                   config.initial_capital);

        result.elapsed_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - wall_start).count();

        Logger::info("Backtest " + config.run_id + " " + toString(result.status) + ": " +
                     std::to_string(result.days_processed) + " day(s), " +
                     std::to_string(result.trades.size()) + " trade(s), total return " +
                     std::to_string(result.statistics.total_return) + "%");
        return result;
    }
};

} // namespace equitybt
