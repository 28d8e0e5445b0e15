// config_loader.hpp
// JSON run configuration (jsoncpp) into RunConfig
// Rates and offsets are written in percent; the loader converts costs to fractions

#pragma once

#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <limits>
#include <set>
#include <sstream>
#include <string>
#include <vector>
#include <json/json.h>
#include "../conditions/condition_evaluator.hpp"
#include "../core/date.hpp"
#include "../core/exceptions.hpp"
#include "../engine/backtest_config.hpp"
#include "../execution/price_basis.hpp"
#include "../rules/sell_rule_engine.hpp"

namespace equitybt {

class ConfigLoader {
private:
    // First present key among snake_case and camelCase spellings
    static const Json::Value* member(const Json::Value& obj, std::initializer_list<const char*> keys) {
        if (!obj.isObject()) return nullptr;
        for (const char* key : keys) {
            const Json::Value* found = obj.find(key, key + std::char_traits<char>::length(key));
            if (found && !found->isNull()) return found;
        }
        return nullptr;
    }

    static double asNumber(const Json::Value& v, const std::string& field) {
        if (!v.isNumeric()) throw ConfigurationException(field, "must be a number");
        return v.asDouble();
    }

    // isUInt64 rejects negatives and out-of-range values without throwing
    static size_t asCount(const Json::Value& v, const std::string& field,
                          uint64_t max = std::numeric_limits<size_t>::max()) {
        if (!v.isUInt64()) throw ConfigurationException(field, "must be a non-negative integer");
        const uint64_t count = v.asUInt64();
        if (count > max) throw ConfigurationException(field, "must not exceed " + std::to_string(max));
        return static_cast<size_t>(count);
    }

    static int asDays(const Json::Value& v, const std::string& field) {
        return static_cast<int>(asCount(v, field, static_cast<uint64_t>(std::numeric_limits<int>::max())));
    }

    static bool asBool(const Json::Value& v, const std::string& field) {
        if (!v.isBool()) throw ConfigurationException(field, "must be true or false");
        return v.asBool();
    }

    static std::string asText(const Json::Value& v, const std::string& field) {
        if (!v.isString()) throw ConfigurationException(field, "must be a string");
        return v.asString();
    }

    static Date asDate(const Json::Value& v, const std::string& field) {
        auto date = Date::tryParse(asText(v, field));
        if (!date) throw ConfigurationException(field, "invalid date '" + v.asString() + "'");
        return *date;
    }

    static std::set<std::string> asStringSet(const Json::Value& v, const std::string& field) {
        if (!v.isArray()) throw ConfigurationException(field, "must be an array of strings");
        std::set<std::string> out;
        for (const auto& item : v) out.insert(asText(item, field));
        return out;
    }

    static std::vector<Condition> parseConditions(const Json::Value& v, const std::string& field) {
        if (!v.isArray()) throw ConfigurationException(field, "must be an array");
        std::vector<Condition> conditions;
        for (Json::ArrayIndex i = 0; i < v.size(); ++i) {
            const Json::Value& item = v[i];
            const std::string at = field + "[" + std::to_string(i) + "]";
            if (!item.isObject()) throw ConfigurationException(at, "must be an object");

            const Json::Value* id = member(item, {"id", "name"});
            const Json::Value* factor = member(item, {"factor", "exp_left_side"});
            const Json::Value* op = member(item, {"operator", "op", "inequality"});
            const Json::Value* value = member(item, {"value", "threshold", "exp_right_side"});
            if (!id) throw ConfigurationException(at + ".id", "is required");
            if (!factor) throw ConfigurationException(at + ".factor", "is required");
            if (!op) throw ConfigurationException(at + ".operator", "is required");
            if (!value) throw ConfigurationException(at + ".value", "is required");

            Condition c;
            c.id = asText(*id, at + ".id");
            c.factor = asText(*factor, at + ".factor");
            c.op = parseCompareOp(asText(*op, at + ".operator"), at + ".operator");
            c.threshold = asNumber(*value, at + ".value");
            conditions.push_back(c);
        }
        return conditions;
    }

    static void parseUniverse(const Json::Value& v, UniverseFilter& filter) {
        if (!v.isObject()) throw ConfigurationException("universe", "must be an object");
        if (auto x = member(v, {"use_all", "useAll"})) filter.use_all = asBool(*x, "universe.use_all");
        if (auto x = member(v, {"universes"})) filter.universes = asStringSet(*x, "universe.universes");
        if (auto x = member(v, {"themes"})) filter.themes = asStringSet(*x, "universe.themes");
        if (auto x = member(v, {"tickers", "target_stocks"})) filter.tickers = asStringSet(*x, "universe.tickers");
    }

    static void parseBuy(const Json::Value& v, BuyRuleConfig& buy) {
        if (!v.isObject()) throw ConfigurationException("buy", "must be an object");
        if (auto x = member(v, {"conditions", "buy_conditions"})) buy.conditions = parseConditions(*x, "buy.conditions");
        if (auto x = member(v, {"expression", "logic", "buy_logic"})) buy.expression = asText(*x, "buy.expression");
        if (auto x = member(v, {"priority_factor", "priorityFactor"})) {
            buy.priority_factor = asText(*x, "buy.priority_factor");
        }
        if (auto x = member(v, {"priority_order", "priorityOrder"})) {
            const std::string order = asText(*x, "buy.priority_order");
            if (order == "asc" || order == "ASC") buy.priority_ascending = true;
            else if (order == "desc" || order == "DESC") buy.priority_ascending = false;
            else throw ConfigurationException("buy.priority_order", "must be 'asc' or 'desc'");
        }
        if (auto x = member(v, {"price_basis", "buy_price_basis"})) {
            buy.price_basis = parsePriceBasis(asText(*x, "buy.price_basis"), "buy.price_basis");
        }
        if (auto x = member(v, {"price_offset", "buy_price_offset"})) {
            buy.price_offset = asNumber(*x, "buy.price_offset");
        }
    }

    static void parseSell(const Json::Value& v, SellRuleConfig& sell) {
        if (!v.isObject()) throw ConfigurationException("sell", "must be an object");

        if (auto tl = member(v, {"target_and_loss", "targetAndLoss"})) {
            if (auto x = member(*tl, {"target_gain"})) sell.target_gain_pct = asNumber(*x, "sell.target_gain");
            if (auto x = member(*tl, {"stop_loss"})) sell.stop_loss_pct = asNumber(*x, "sell.stop_loss");
        }
        if (auto hd = member(v, {"hold_days", "holdDays"})) {
            if (auto x = member(*hd, {"min_hold_days"})) {
                sell.min_hold_days = asDays(*x, "sell.min_hold_days");
            }
            if (auto x = member(*hd, {"max_hold_days"})) {
                sell.max_hold_days = asDays(*x, "sell.max_hold_days");
            }
            if (auto x = member(*hd, {"sell_price_basis"})) {
                sell.sell_price_basis = parsePriceBasis(asText(*x, "sell.sell_price_basis"), "sell.sell_price_basis");
            }
            if (auto x = member(*hd, {"sell_price_offset"})) {
                sell.sell_price_offset = asNumber(*x, "sell.sell_price_offset");
            }
        }
        if (auto cs = member(v, {"condition_sell", "conditionSell"})) {
            ConditionalSellConfig conditional;
            const Json::Value* conds = member(*cs, {"sell_conditions", "conditions"});
            if (!conds) throw ConfigurationException("sell.condition_sell.sell_conditions", "is required");
            conditional.conditions = parseConditions(*conds, "sell.condition_sell.sell_conditions");
            if (auto x = member(*cs, {"sell_logic", "expression"})) {
                conditional.expression = asText(*x, "sell.condition_sell.sell_logic");
            }
            if (auto x = member(*cs, {"sell_price_basis"})) {
                conditional.price_basis = parsePriceBasis(asText(*x, "sell.condition_sell.sell_price_basis"),
                                                          "sell.condition_sell.sell_price_basis");
            }
            if (auto x = member(*cs, {"sell_price_offset"})) {
                conditional.price_offset = asNumber(*x, "sell.condition_sell.sell_price_offset");
            }
            sell.conditional = conditional;
        }
    }

public:
    static RunConfig fromJson(const Json::Value& root) {
        if (!root.isObject()) throw ConfigurationException("config", "top level must be a JSON object");

        RunConfig config = RunConfig::getDefault();
        if (auto x = member(root, {"run_id", "runId"})) config.run_id = asText(*x, "run_id");
        if (auto x = member(root, {"start_date", "startDate"})) config.start_date = asDate(*x, "start_date");
        if (auto x = member(root, {"end_date", "endDate"})) config.end_date = asDate(*x, "end_date");
        if (auto x = member(root, {"initial_capital", "initialCapital"})) {
            config.initial_capital = asNumber(*x, "initial_capital");
        }

        if (auto x = member(root, {"universe"})) parseUniverse(*x, config.universe);
        if (auto x = member(root, {"buy"})) parseBuy(*x, config.buy);
        if (auto x = member(root, {"sell"})) parseSell(*x, config.sell);

        if (auto x = member(root, {"rebalance_frequency", "rebalanceFrequency"})) {
            config.rebalance_frequency = parseRebalanceFrequency(asText(*x, "rebalance_frequency"),
                                                                 "rebalance_frequency");
        }
        if (auto x = member(root, {"max_positions", "maxPositions"})) {
            config.max_positions = asCount(*x, "max_positions");
        }
        if (auto x = member(root, {"per_stock_ratio", "perStockRatio"})) {
            config.per_stock_ratio = asNumber(*x, "per_stock_ratio");
        }
        if (auto x = member(root, {"max_daily_stock", "maxDailyStock"})) {
            config.max_daily_stock = asCount(*x, "max_daily_stock");
        }
        if (auto x = member(root, {"max_buy_value", "maxBuyValue"})) {
            config.max_buy_value = asNumber(*x, "max_buy_value");
        }
        if (auto x = member(root, {"allow_additional_buys", "allowAdditionalBuys"})) {
            config.allow_additional_buys = asBool(*x, "allow_additional_buys");
        }
        if (auto x = member(root, {"daily_sell_check", "dailySellCheck"})) {
            config.daily_sell_check = asBool(*x, "daily_sell_check");
        }

        // Percent in the file, fractions in RunConfig
        if (auto x = member(root, {"commission_rate", "commissionRate"})) {
            config.commission_rate = asNumber(*x, "commission_rate") / 100.0;
        }
        if (auto x = member(root, {"slippage"})) config.slippage = asNumber(*x, "slippage") / 100.0;
        if (auto x = member(root, {"tax_rate", "taxRate"})) config.tax_rate = asNumber(*x, "tax_rate") / 100.0;
        if (auto x = member(root, {"risk_free_rate", "riskFreeRate"})) {
            config.risk_free_rate = asNumber(*x, "risk_free_rate") / 100.0;
        }

        if (auto x = member(root, {"normalize_prices", "normalizePrices"})) {
            config.normalize_prices = asBool(*x, "normalize_prices");
        }
        if (auto x = member(root, {"corporate_action_threshold", "corporateActionThreshold"})) {
            config.corporate_action_threshold = asNumber(*x, "corporate_action_threshold");
        }
        if (auto x = member(root, {"progress_interval_pct", "progressIntervalPct"})) {
            config.progress_interval_pct = asNumber(*x, "progress_interval_pct");
        }
        if (auto x = member(root, {"worker_threads", "workerThreads"})) {
            config.worker_threads = asCount(*x, "worker_threads");
        }
        return config;
    }

    static RunConfig fromString(const std::string& text) {
        std::istringstream in(text);
        return fromStream(in, "<string>");
    }

    static RunConfig fromFile(const std::string& path) {
        std::ifstream in(path);
        if (!in.is_open()) throw ConfigurationException("config", "cannot open " + path);
        return fromStream(in, path);
    }

private:
    static RunConfig fromStream(std::istream& in, const std::string& source) {
        Json::CharReaderBuilder builder;
        Json::Value root;
        std::string errs;
        if (!Json::parseFromStream(builder, in, &root, &errs)) {
            throw ConfigurationException("config", "invalid JSON in " + source + ": " + errs);
        }
        return fromJson(root);
    }
};

} // namespace equitybt
