// test_io.cpp
// JSON run configuration, CSV market data loading and result file output

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include <json/json.h>

#include "test_support.hpp"
#include "../include/equitybt/data/csv_data_loader.hpp"
#include "../include/equitybt/io/config_loader.hpp"
#include "../include/equitybt/io/result_writer.hpp"

using namespace equitybt;
using namespace equitybt::testing;

namespace fs = std::filesystem;

namespace {

const char* kFullConfig = R"({
    "run_id": "value-momentum",
    "start_date": "2024-01-02",
    "end_date": "2024-06-28",
    "initial_capital": 50000000,
    "universe": {"universes": ["KOSPI"], "target_stocks": ["005930"]},
    "buy": {
        "buy_conditions": [
            {"name": "A", "exp_left_side": "PER", "inequality": "<", "exp_right_side": 10},
            {"id": "B", "factor": "ROE", "operator": ">=", "value": 12.5}
        ],
        "buy_logic": "A and B",
        "priority_factor": "ROE",
        "priority_order": "desc",
        "price_basis": "시가",
        "price_offset": 1
    },
    "sell": {
        "target_and_loss": {"target_gain": 20, "stop_loss": 10},
        "hold_days": {"min_hold_days": 2, "max_hold_days": 30, "sell_price_basis": "CLOSE"},
        "condition_sell": {
            "sell_conditions": [{"id": "S", "factor": "RSI_14", "operator": ">", "value": 70}],
            "sell_logic": "S",
            "sell_price_basis": "PREV_CLOSE",
            "sell_price_offset": -0.5
        }
    },
    "rebalance_frequency": "weekly",
    "max_positions": 15,
    "per_stock_ratio": 5,
    "maxBuyValue": 5000000,
    "daily_sell_check": true,
    "commission_rate": 0.015,
    "slippage": 0.1,
    "tax_rate": 0.23,
    "risk_free_rate": 3.5,
    "worker_threads": 4
})";

// Field named by the ConfigurationException `fn` throws
template<typename Fn>
std::string failingField(Fn fn) {
    try {
        fn();
    } catch (const ConfigurationException& e) {
        return e.field();
    }
    throw std::runtime_error("expected a configuration error");
}

fs::path scratchDir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() / ("equitybt_test_io_" + name);
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void writeFile(const fs::path& path, const std::string& text) {
    std::ofstream out(path);
    if (!out.is_open()) throw std::runtime_error("cannot write " + path.string());
    out << text;
}

size_t lineCount(const fs::path& path) {
    std::ifstream in(path);
    size_t lines = 0;
    std::string line;
    while (std::getline(in, line)) ++lines;
    return lines;
}

} // namespace

// ============================================================================
// Config Loader
// ============================================================================

void test_full_config() {
    auto config = ConfigLoader::fromString(kFullConfig);

    assert(config.run_id == "value-momentum");
    assert(*config.start_date == d("2024-01-02"));
    assert(*config.end_date == d("2024-06-28"));
    assert(near(config.initial_capital, 50000000.0));
    assert(config.universe.universes.count("KOSPI"));
    assert(config.universe.tickers.count("005930"));

    assert(config.buy.conditions.size() == 2);
    assert(config.buy.conditions[0].id == "A");
    assert(config.buy.conditions[0].factor == "PER");
    assert(config.buy.conditions[0].op == CompareOp::LT);
    assert(config.buy.conditions[1].op == CompareOp::GE);
    assert(near(config.buy.conditions[1].threshold, 12.5));
    assert(config.buy.expression == "A and B");
    assert(config.buy.priority_factor == "ROE");
    assert(!config.buy.priority_ascending);
    assert(config.buy.price_basis == PriceBasis::OPEN);
    assert(near(config.buy.price_offset, 1.0));

    assert(near(*config.sell.target_gain_pct, 20.0));
    assert(near(*config.sell.stop_loss_pct, 10.0));
    assert(config.sell.min_hold_days == 2);
    assert(config.sell.max_hold_days == 30);
    assert(config.sell.conditional);
    assert(config.sell.conditional->expression == "S");
    assert(*config.sell.conditional->price_basis == PriceBasis::PREV_CLOSE);
    assert(near(*config.sell.conditional->price_offset, -0.5));

    assert(config.rebalance_frequency == RebalanceFrequency::WEEKLY);
    assert(config.max_positions == 15);
    assert(near(*config.max_buy_value, 5000000.0));
    assert(config.daily_sell_check);
    assert(config.worker_threads == 4);

    // Percent in the file, fractions in memory
    assert(near(config.commission_rate, 0.00015));
    assert(near(config.slippage, 0.001));
    assert(near(config.tax_rate, 0.0023));
    assert(near(config.risk_free_rate, 0.035));

    config.validate();
}

void test_defaults_fill_missing_keys() {
    auto config = ConfigLoader::fromString(R"({"start_date": "2024-01-02", "end_date": "2024-02-01"})");
    auto defaults = RunConfig::getDefault();
    assert(config.max_positions == defaults.max_positions);
    assert(near(config.commission_rate, defaults.commission_rate));
    assert(config.universe.admitsAll());
    assert(!config.sell.conditional);
}

void test_config_errors_name_the_field() {
    assert(failingField([] { ConfigLoader::fromString("{ not json"); }) == "config");
    assert(failingField([] { ConfigLoader::fromString("[1, 2]"); }) == "config");
    assert(failingField([] { ConfigLoader::fromString(R"({"start_date": "2024-13-01"})"); }) == "start_date");
    assert(failingField([] { ConfigLoader::fromString(R"({"max_positions": -1})"); }) == "max_positions");
    assert(failingField([] { ConfigLoader::fromString(R"({"rebalance_frequency": "hourly"})"); }) ==
           "rebalance_frequency");
    assert(failingField([] {
        ConfigLoader::fromString(R"({"buy": {"conditions": [{"id": "A", "operator": "<", "value": 1}]}})");
    }) == "buy.conditions[0].factor");
    assert(failingField([] {
        ConfigLoader::fromString(R"({"buy": {"conditions": [{"id": "A", "factor": "PER", "operator": "~", "value": 1}]}})");
    }) == "buy.conditions[0].operator");
    assert(failingField([] {
        ConfigLoader::fromString(R"({"sell": {"condition_sell": {"sell_logic": "S"}}})");
    }) == "sell.condition_sell.sell_conditions");
    assert(failingField([] {
        ConfigLoader::fromString(R"({"buy": {"price_basis": "VWAP"}})");
    }) == "buy.price_basis");
    assert(throws<ConfigurationException>([] { ConfigLoader::fromFile("/nonexistent/equitybt.json"); }));

    // Integers beyond the target type are reported against their field
    assert(failingField([] {
        ConfigLoader::fromString(R"({"max_positions": 18446744073709551616})");
    }) == "max_positions");
    assert(failingField([] {
        ConfigLoader::fromString(R"({"max_daily_stock": 1.5})");
    }) == "max_daily_stock");
    assert(failingField([] {
        ConfigLoader::fromString(R"({"sell": {"hold_days": {"max_hold_days": 3000000000}}})");
    }) == "sell.max_hold_days");
    assert(failingField([] {
        ConfigLoader::fromString(R"({"sell": {"hold_days": {"min_hold_days": 9223372036854775808}}})");
    }) == "sell.min_hold_days");
}

void test_config_file() {
    auto dir = scratchDir("config");
    writeFile(dir / "run.json", kFullConfig);
    auto config = ConfigLoader::fromFile((dir / "run.json").string());
    assert(config.run_id == "value-momentum");
    fs::remove_all(dir);
}

// ============================================================================
// CSV Loader
// ============================================================================

void test_csv_prices() {
    auto dir = scratchDir("prices");
    writeFile(dir / "prices.csv",
              "date,stock_code,open,high,low,close,volume,market_cap\n"
              "2024-01-02,A,100,110,95,105,1000,5000\n"
              "2024-01-03,A,105,108,101,107,1200,\n"
              "2024-01-02,B,50,40,45,48,300,900\n"
              "\n"
              "2024-01-02,C,10,11,9,10,100\r\n");

    InMemoryDataAccess data;
    auto stats = CsvDataLoader().loadPrices((dir / "prices.csv").string(), data);
    assert(stats.rows_loaded == 3);
    assert(stats.rows_skipped == 1);

    auto bars = data.loadPrices("A", d("2024-01-01"), d("2024-01-31"));
    assert(bars.size() == 2);
    assert(near(bars[0].close, 105.0));
    assert(near(bars[0].market_cap, 5000.0));
    assert(std::isnan(bars[1].market_cap));
    assert(data.loadPrices("B", d("2024-01-01"), d("2024-01-31")).empty());
    assert((data.listStocks() == std::vector<std::string>{"A", "C"}));
    fs::remove_all(dir);
}

void test_csv_errors_carry_location() {
    auto dir = scratchDir("bad");
    writeFile(dir / "prices.csv",
              "date,stock_code,open,high,low,close,volume\n"
              "2024-01-02,A,100,110,95,105,1000\n"
              "2024-01-03,A,abc,110,95,105,1000\n");
    InMemoryDataAccess data;
    try {
        CsvDataLoader().loadPrices((dir / "prices.csv").string(), data);
        throw std::runtime_error("expected a data error");
    } catch (const DataException& e) {
        assert(std::string(e.what()).find("prices.csv:3") != std::string::npos);
    }

    writeFile(dir / "short.csv", "stock_code,universe\nA,KOSPI\n");
    assert(throws<DataException>([&] { CsvDataLoader().loadMemberships((dir / "short.csv").string(), data); }));
    assert(throws<DataException>([&] { CsvDataLoader().loadPrices((dir / "missing.csv").string(), data); }));
    fs::remove_all(dir);
}

void test_csv_fundamentals_and_memberships() {
    auto dir = scratchDir("fundamentals");
    writeFile(dir / "fundamentals.csv",
              "stock_code,available_date,net_income,total_equity,total_assets,total_liabilities,"
              "revenue,operating_income,gross_profit\n"
              "A,2024-03-15,100,1000,2000,1000,5000,120,\n"
              "A,2024-05-15,130,1100,2100,1000,5200,150,900\n");
    writeFile(dir / "membership.csv",
              "stock_code,universe,theme,valid_from,valid_to\n"
              "A,KOSPI,semis,2024-01-01,\n");

    InMemoryDataAccess data;
    CsvDataLoader loader;
    loader.loadFundamentals((dir / "fundamentals.csv").string(), data);
    loader.loadMemberships((dir / "membership.csv").string(), data);

    auto early = data.loadFundamentals("A", d("2024-04-01"));
    assert(early.size() == 1);
    assert(std::isnan(early[0].gross_profit));
    assert(data.loadFundamentals("A", d("2024-06-01")).size() == 2);

    auto members = data.loadMemberships("A");
    assert(members.size() == 1);
    assert(members[0].theme == "semis");
    assert(members[0].valid_from && *members[0].valid_from == d("2024-01-01"));
    assert(!members[0].valid_to);
    fs::remove_all(dir);
}

// ============================================================================
// Result Writer
// ============================================================================

void test_result_files() {
    BacktestResult result;
    result.run_id = "writer";
    result.status = RunStatus::CANCELLED;
    result.days_processed = 2;
    result.total_days = 5;

    Trade buy;
    buy.date = d("2024-01-02");
    buy.stock_code = "A";
    buy.quantity = 10;
    buy.price = 100.0;
    buy.reason = "buy_signal";
    result.trades.push_back(buy);

    PortfolioSnapshot snap;
    snap.date = d("2024-01-02");
    snap.total_value = 1000.0;
    result.snapshots = {snap, snap};
    result.statistics.initial_capital = 1000.0;
    result.statistics.final_capital = 1000.0;

    auto dir = scratchDir("writer");
    const fs::path out = dir / "nested" / "run";
    ResultWriter(out).writeAll(result);

    assert(lineCount(out / "trades.csv") == 2);
    assert(lineCount(out / "snapshots.csv") == 3);
    assert(fs::exists(out / "monthly.csv"));

    std::ifstream in(out / "statistics.json");
    Json::CharReaderBuilder builder;
    Json::Value root;
    std::string errs;
    assert(Json::parseFromStream(builder, in, &root, &errs));
    assert(root["run_id"].asString() == "writer");
    assert(root["status"].asString() == "CANCELLED");
    assert(root["days_processed"].asUInt64() == 2);
    assert(near(root["statistics"]["final_capital"].asDouble(), 1000.0));
    assert(root["final_positions"].isArray());
    fs::remove_all(dir);
}

// ============================================================================
// Logging
// ============================================================================

void test_sink_may_log_from_inside() {
    std::vector<std::string> seen;
    bool forwarding = false;
    Logger::setLevel(LogLevel::INFO);
    Logger::setSink([&](LogLevel level, const std::string& message) {
        seen.push_back(std::string(Logger::levelToString(level)) + " " + message);
        if (!forwarding) {
            forwarding = true;
            Logger::info("forwarded: " + message);
            forwarding = false;
        }
    });

    Logger::warning("disk almost full");
    Logger::debug("below the level");

    Logger::setSink(nullptr);
    quietLogs();

    assert(seen.size() == 2);
    assert(seen[0] == "WARN disk almost full");
    assert(seen[1] == "INFO forwarded: disk almost full");
}

int main() {
    quietLogs();
    std::cout << "\n=== I/O Test Suite ===" << std::endl;
    std::cout << "======================\n" << std::endl;

    TestReporter reporter;

    std::cout << "Config Loader Tests:" << std::endl;
    reporter.test("Full Config", test_full_config);
    reporter.test("Defaults", test_defaults_fill_missing_keys);
    reporter.test("Field Errors", test_config_errors_name_the_field);
    reporter.test("Config File", test_config_file);

    std::cout << "\nCSV Loader Tests:" << std::endl;
    reporter.test("Prices", test_csv_prices);
    reporter.test("Error Location", test_csv_errors_carry_location);
    reporter.test("Fundamentals and Memberships", test_csv_fundamentals_and_memberships);

    std::cout << "\nResult Writer Tests:" << std::endl;
    reporter.test("Result Files", test_result_files);

    std::cout << "\nLogging Tests:" << std::endl;
    reporter.test("Reentrant Sink", test_sink_may_log_from_inside);

    return reporter.report();
}
