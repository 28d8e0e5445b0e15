// price_normalizer.hpp
// Corporate-action detection and retroactive OHLC adjustment
// Also hosts the input validation checks run before a backtest

#pragma once

#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include "../core/logger.hpp"
#include "market_data.hpp"

namespace equitybt {

// Suspected split, bonus issue or reverse split
struct CorporateActionEvent {
    std::string stock_code;
    Date date;
    double prev_close = 0.0;
    double close = 0.0;
    double change_pct = 0.0;
    // Multiplier applied to every OHLC field dated strictly before `date`
    double adjustment_factor = 1.0;
};

// ============================================================================
// Price Normalizer
// ============================================================================

class PriceNormalizer {
public:
    struct Config {
        double threshold_pct;  // |close-to-close change| above this is an event

        Config() : threshold_pct(50.0) {}

        static Config getDefault() {
            return Config();
        }
    };

private:
    Config config_;

public:
    PriceNormalizer() : config_(Config::getDefault()) {}
    explicit PriceNormalizer(const Config& config) : config_(config) {}

    const Config& config() const { return config_; }

    // Events in ascending date order; bars without a valid close are skipped
    std::vector<CorporateActionEvent> detectEvents(const std::string& stock_code,
                                                   const std::vector<Bar>& bars) const {
        std::vector<CorporateActionEvent> events;
        const Bar* prev = nullptr;
        for (const auto& bar : bars) {
            if (!bar.hasValidClose()) continue;
            if (prev) {
                double change_pct = (bar.close - prev->close) / prev->close * 100.0;
                if (std::abs(change_pct) > config_.threshold_pct) {
                    CorporateActionEvent event;
                    event.stock_code = stock_code;
                    event.date = bar.date;
                    event.prev_close = prev->close;
                    event.close = bar.close;
                    event.change_pct = change_pct;
                    event.adjustment_factor = bar.close / prev->close;
                    events.push_back(event);
                }
            }
            prev = &bar;
        }
        return events;
    }

    // Adjusts one series in place and returns the events that were applied
    std::vector<CorporateActionEvent> normalize(const std::string& stock_code,
                                                std::vector<Bar>& bars) const {
        auto events = detectEvents(stock_code, bars);

        // Latest event first; each one only rescales bars before its own date
        for (auto it = events.rbegin(); it != events.rend(); ++it) {
            const double factor = it->adjustment_factor;
            for (auto& bar : bars) {
                if (bar.date >= it->date) break;
                bar.open *= factor;
                bar.high *= factor;
                bar.low *= factor;
                bar.close *= factor;
            }

            std::ostringstream msg;
            msg << std::fixed << std::setprecision(2)
                << "Corporate action " << stock_code << " " << it->date.toString()
                << ": " << it->prev_close << " -> " << it->close
                << " (" << std::showpos << it->change_pct << std::noshowpos << "%)"
                << ", factor=" << std::setprecision(4) << factor;
            Logger::debug(msg.str());
        }
        return events;
    }

    // Adjusts every stock in the data set
    std::vector<CorporateActionEvent> normalize(MarketDataSet& data) const {
        std::vector<CorporateActionEvent> all;
        for (auto& [code, history] : data.stocks()) {
            auto events = normalize(code, history.bars);
            all.insert(all.end(), events.begin(), events.end());
        }
        if (!all.empty()) {
            Logger::info("Price normalizer adjusted " + std::to_string(all.size()) +
                         " corporate action event(s)");
        }
        return all;
    }
};

// ============================================================================
// Price Validator
// ============================================================================

class PriceValidator {
public:
    struct ContinuityReport {
        bool is_valid = true;
        size_t abnormal_count = 0;
        std::vector<CorporateActionEvent> abnormal_changes;
    };

    struct ZeroPriceReport {
        bool is_valid = true;
        size_t zero_count = 0;
        std::vector<std::pair<std::string, Date>> occurrences;
    };

    static ContinuityReport validatePriceContinuity(const MarketDataSet& data,
                                                    double threshold_pct = 50.0) {
        PriceNormalizer::Config config;
        config.threshold_pct = threshold_pct;
        PriceNormalizer detector(config);

        ContinuityReport report;
        for (const auto& [code, history] : data.stocks()) {
            auto events = detector.detectEvents(code, history.bars);
            report.abnormal_changes.insert(report.abnormal_changes.end(), events.begin(), events.end());
        }
        report.abnormal_count = report.abnormal_changes.size();
        report.is_valid = report.abnormal_count == 0;
        return report;
    }

    // Any OHLC field equal to zero
    static ZeroPriceReport validateZeroPrices(const MarketDataSet& data) {
        ZeroPriceReport report;
        for (const auto& [code, history] : data.stocks()) {
            for (const auto& bar : history.bars) {
                if (bar.open == 0.0 || bar.high == 0.0 || bar.low == 0.0 || bar.close == 0.0) {
                    report.occurrences.emplace_back(code, bar.date);
                }
            }
        }
        report.zero_count = report.occurrences.size();
        report.is_valid = report.zero_count == 0;
        return report;
    }
};

} // namespace equitybt
