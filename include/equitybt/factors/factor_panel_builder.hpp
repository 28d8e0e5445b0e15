// factor_panel_builder.hpp
// Builds the per-day cross-sectional factor panel for the admitted universe
// Rows are computed on worker threads into fixed slots; the cache sits in front

#pragma once

#include <algorithm>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "../core/logger.hpp"
#include "../data/market_data.hpp"
#include "../interfaces/factor_cache.hpp"
#include "factor_panel.hpp"
#include "factor_registry.hpp"

namespace equitybt {

// ============================================================================
// Factor Panel Builder
// ============================================================================

class FactorPanelBuilder {
public:
    struct BuilderConfig {
        size_t worker_threads;
        size_t min_rows_per_task;   // below this a chunk is not worth a thread
        std::string cache_scope;

        BuilderConfig()
            : worker_threads(1)
            , min_rows_per_task(64)
            , cache_scope("default") {}

        static BuilderConfig getDefault() {
            return BuilderConfig();
        }
    };

    struct BuildStats {
        uint64_t panels_requested = 0;
        uint64_t panels_computed = 0;
        uint64_t cache_hits = 0;
        uint64_t cache_failures = 0;
    };

private:
    const MarketDataSet& data_;
    BuilderConfig config_;
    std::shared_ptr<IFactorCache> cache_;
    BuildStats stats_;

    void computeRows(FactorPanel& panel, size_t begin, size_t end,
                     const std::vector<std::pair<size_t, FactorDefinition>>& columns) const {
        const Date date = panel.date();
        for (size_t row = begin; row < end; ++row) {
            const StockHistory* history = data_.find(panel.stockCode(row));
            if (!history) continue;
            auto bar_index = history->indexOn(date);
            if (!bar_index) continue;

            FactorInput input{*history, *bar_index, history->fundamentalsAsOf(date)};
            for (const auto& [col, def] : columns) {
                if (input.availableBars() < def.min_history) {
                    panel.set(row, col, FactorValue::undefined());
                } else {
                    panel.set(row, col, def.compute(input));
                }
            }
        }
    }

    // Best value gets rank 1; ties share the better rank; undefined base stays undefined
    static void computeRank(FactorPanel& panel, size_t rank_col, size_t base_col, bool higher_is_better) {
        const auto& values = panel.values(base_col);
        const auto& states = panel.states(base_col);

        std::vector<double> defined;
        for (size_t row = 0; row < panel.rowCount(); ++row) {
            if (states[row] == ValueState::Defined) defined.push_back(values[row]);
        }
        std::sort(defined.begin(), defined.end());

        for (size_t row = 0; row < panel.rowCount(); ++row) {
            if (states[row] != ValueState::Defined) {
                panel.set(row, rank_col, {values[row], states[row]});
                continue;
            }
            size_t better;
            if (higher_is_better) {
                better = static_cast<size_t>(defined.end() -
                    std::upper_bound(defined.begin(), defined.end(), values[row]));
            } else {
                better = static_cast<size_t>(
                    std::lower_bound(defined.begin(), defined.end(), values[row]) - defined.begin());
            }
            panel.set(row, rank_col, FactorValue::defined(static_cast<double>(better + 1)));
        }
    }

public:
    FactorPanelBuilder(const MarketDataSet& data,
                       const BuilderConfig& config = BuilderConfig::getDefault(),
                       std::shared_ptr<IFactorCache> cache = nullptr)
        : data_(data)
        , config_(config)
        , cache_(std::move(cache)) {}

    const BuildStats& getStats() const { return stats_; }
    const BuilderConfig& config() const { return config_; }

    // Admitted by the filter on `date` and carrying a valid close that day
    std::vector<std::string> eligibleStocks(Date date, const UniverseFilter& filter) const {
        std::vector<std::string> codes;
        for (const auto& [code, history] : data_.stocks()) {
            const Bar* bar = history.barOn(date);
            if (!bar || !bar->hasValidClose()) continue;
            if (!history.matches(filter, code, date)) continue;
            codes.push_back(code);
        }
        return codes;
    }

    // Uncached computation. Rank columns bring their base factor along.
    std::shared_ptr<const FactorPanel> compute(Date date, const UniverseFilter& filter,
                                               const std::vector<std::string>& factor_names) const {
        const auto& registry = FactorRegistry::instance();
        auto names = registry.canonicalize(factor_names);

        std::vector<std::string> columns = names;
        for (const auto& name : names) {
            auto def = registry.find(name);
            if (def->family == FactorFamily::RANK) columns.push_back(def->base_factor);
        }

        auto panel = std::make_shared<FactorPanel>(date, eligibleStocks(date, filter), columns);

        std::vector<std::pair<size_t, FactorDefinition>> direct;
        std::vector<FactorDefinition> ranks;
        for (size_t col = 0; col < panel->columnCount(); ++col) {
            auto def = registry.find(panel->factorNames()[col]);
            if (def->family == FactorFamily::RANK) {
                ranks.push_back(*def);
            } else {
                direct.emplace_back(col, *def);
            }
        }

        const size_t rows = panel->rowCount();
        const size_t per_task = std::max<size_t>(1, config_.min_rows_per_task);
        const size_t tasks = std::min(std::max<size_t>(1, config_.worker_threads),
                                      std::max<size_t>(1, rows / per_task));

        if (tasks <= 1) {
            computeRows(*panel, 0, rows, direct);
        } else {
            const size_t chunk = (rows + tasks - 1) / tasks;
            std::vector<std::future<void>> futures;
            for (size_t begin = 0; begin < rows; begin += chunk) {
                const size_t end = std::min(rows, begin + chunk);
                futures.push_back(std::async(std::launch::async, [this, &panel, &direct, begin, end] {
                    computeRows(*panel, begin, end, direct);
                }));
            }
            for (auto& f : futures) f.get();
        }

        for (const auto& rank : ranks) {
            auto base = registry.find(rank.base_factor);
            computeRank(*panel, panel->requireColumn(rank.name),
                        panel->requireColumn(rank.base_factor), base->higher_is_better);
        }
        return panel;
    }

    // Cached build; any cache failure degrades to direct computation
    std::shared_ptr<const FactorPanel> build(Date date, const UniverseFilter& filter,
                                             const std::vector<std::string>& factor_names) {
        ++stats_.panels_requested;

        FactorCacheKey key;
        key.scope = config_.cache_scope;
        key.date = date;
        key.filter = filter.canonical();
        key.factors = FactorRegistry::instance().canonicalize(factor_names);

        if (cache_) {
            try {
                auto hit = cache_->get(key);
                if (hit) {
                    ++stats_.cache_hits;
                    return hit;
                }
            } catch (const std::exception& e) {
                ++stats_.cache_failures;
                Logger::warning(std::string("Factor cache read failed, computing directly: ") + e.what());
            }
        }

        auto panel = compute(date, filter, key.factors);
        ++stats_.panels_computed;

        if (cache_) {
            try {
                cache_->put(key, panel);
            } catch (const std::exception& e) {
                ++stats_.cache_failures;
                Logger::warning(std::string("Factor cache write failed: ") + e.what());
            }
        }
        return panel;
    }
};

} // namespace equitybt
