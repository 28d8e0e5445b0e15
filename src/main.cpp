// main.cpp
// Equity factor backtester command line
// Loads CSV market data and a JSON run configuration, runs one backtest and writes the results

#include <iostream>
#include <memory>
#include <string>
#include <iomanip>

#include "equitybt/core/exceptions.hpp"
#include "equitybt/core/logger.hpp"
#include "equitybt/data/csv_data_loader.hpp"
#include "equitybt/data/in_memory_data_access.hpp"
#include "equitybt/engine/backtest_engine.hpp"
#include "equitybt/factors/factor_cache.hpp"
#include "equitybt/io/config_loader.hpp"
#include "equitybt/io/result_writer.hpp"

using namespace equitybt;

// ============================================================================
// Command Line Options
// ============================================================================

struct CliOptions {
    std::string config_file;
    std::string prices_file = "data/prices.csv";
    std::string fundamentals_file;
    std::string membership_file;
    std::string output_dir = "results";

    // Overrides applied on top of the JSON configuration
    std::string start_date;
    std::string end_date;
    double capital = 0.0;
    size_t threads = 0;

    bool verbose = false;
    bool quiet = false;
    bool show_trades = false;
    bool help = false;
};

void printUsage(const char* program_name) {
    std::cout << "Equity Factor Backtester\n";
    std::cout << "========================\n\n";
    std::cout << "Usage: " << program_name << " --config FILE [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        JSON run configuration (required)\n";
    std::cout << "  -p, --prices FILE        Daily price CSV (default: data/prices.csv)\n";
    std::cout << "  -f, --fundamentals FILE  Fundamental statements CSV\n";
    std::cout << "  -m, --membership FILE    Universe/theme membership CSV\n";
    std::cout << "  -o, --output DIR         Output directory (default: results)\n";
    std::cout << "  --start YYYY-MM-DD       Override start date\n";
    std::cout << "  --end YYYY-MM-DD         Override end date\n";
    std::cout << "  --capital AMOUNT         Override initial capital\n";
    std::cout << "  -t, --threads N          Factor computation threads\n";
    std::cout << "  --verbose                Debug logging\n";
    std::cout << "  --quiet                  Warnings and errors only\n";
    std::cout << "  --show-trades            Print every trade\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program_name << " -c strategy.json -p data/prices.csv -f data/fundamentals.csv\n";
    std::cout << "  " << program_name << " -c strategy.json --start 2022-01-03 --end 2023-12-28 -t 4\n";
}

bool parseArguments(int argc, char* argv[], CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            options.help = true;
            return false;
        }
        else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            options.config_file = argv[++i];
        }
        else if ((arg == "-p" || arg == "--prices") && i + 1 < argc) {
            options.prices_file = argv[++i];
        }
        else if ((arg == "-f" || arg == "--fundamentals") && i + 1 < argc) {
            options.fundamentals_file = argv[++i];
        }
        else if ((arg == "-m" || arg == "--membership") && i + 1 < argc) {
            options.membership_file = argv[++i];
        }
        else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
            options.output_dir = argv[++i];
        }
        else if (arg == "--start" && i + 1 < argc) {
            options.start_date = argv[++i];
        }
        else if (arg == "--end" && i + 1 < argc) {
            options.end_date = argv[++i];
        }
        else if (arg == "--capital" && i + 1 < argc) {
            options.capital = std::stod(argv[++i]);
        }
        else if ((arg == "-t" || arg == "--threads") && i + 1 < argc) {
            options.threads = std::stoull(argv[++i]);
        }
        else if (arg == "--verbose") {
            options.verbose = true;
        }
        else if (arg == "--quiet") {
            options.quiet = true;
        }
        else if (arg == "--show-trades") {
            options.show_trades = true;
        }
        else {
            std::cerr << "Unknown argument: " << arg << std::endl;
            return false;
        }
    }

    if (options.config_file.empty()) {
        std::cerr << "Missing --config" << std::endl;
        return false;
    }
    return true;
}

void applyOverrides(const CliOptions& options, RunConfig& config) {
    if (!options.start_date.empty()) config.start_date = Date::parse(options.start_date);
    if (!options.end_date.empty()) config.end_date = Date::parse(options.end_date);
    if (options.capital > 0.0) config.initial_capital = options.capital;
    if (options.threads > 0) config.worker_threads = options.threads;
}

// ============================================================================
// Reporting
// ============================================================================

void printTrades(const BacktestResult& result) {
    std::cout << "Trades:\n";
    for (const auto& t : result.trades) {
        std::cout << "  " << t.date.toString() << "  " << std::left << std::setw(5) << toString(t.side)
                  << std::setw(10) << t.stock_code << std::right << std::setw(10) << t.quantity
                  << " @ " << std::fixed << std::setprecision(2) << std::setw(12) << t.exec_price;
        if (t.side == TradeSide::SELL) {
            std::cout << "  " << std::showpos << t.profit_rate << "%" << std::noshowpos
                      << "  " << t.hold_days << "d  " << t.reason;
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

void printSummary(const RunConfig& config, const BacktestResult& result) {
    const auto& s = result.statistics;

    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              BACKTEST RESULTS SUMMARY                        ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";
    std::cout << "\n";

    std::cout << "Configuration:\n";
    std::cout << "  Run:             " << config.run_id << "\n";
    std::cout << "  Period:          " << config.start_date->toString() << " .. "
              << config.end_date->toString() << "\n";
    std::cout << "  Rebalance:       " << toString(config.rebalance_frequency) << "\n";
    std::cout << "  Initial Capital: " << std::fixed << std::setprecision(0) << s.initial_capital << "\n";
    std::cout << "  Status:          " << toString(result.status);
    if (!result.error_message.empty()) std::cout << " (" << result.error_message << ")";
    std::cout << "\n\n";

    std::cout << "Performance:\n";
    std::cout << "  Final Value:     " << std::fixed << std::setprecision(0) << s.final_capital << "\n";
    std::cout << "  Total Return:    " << std::showpos << std::setprecision(2) << s.total_return
              << "%\n" << std::noshowpos;
    std::cout << "  CAGR:            " << std::showpos << s.annualized_return << "%\n" << std::noshowpos;
    std::cout << "  Max Drawdown:    " << s.max_drawdown << "%\n";
    std::cout << "  Volatility:      " << s.volatility << "%\n";
    std::cout << "  Sharpe Ratio:    " << std::setprecision(3) << s.sharpe_ratio << "\n";
    std::cout << "  Sortino Ratio:   " << s.sortino_ratio << "\n";
    std::cout << "  Calmar Ratio:    " << s.calmar_ratio << "\n";
    std::cout << "\n";

    std::cout << "Trading:\n";
    std::cout << "  Buys:            " << s.buy_count << "\n";
    std::cout << "  Closed Trades:   " << s.total_trades << " (" << s.winning_trades << " won, "
              << s.losing_trades << " lost)\n";
    std::cout << "  Win Rate:        " << std::setprecision(2) << s.win_rate << "%\n";
    std::cout << "  Avg Win / Loss:  " << s.avg_win << "% / " << s.avg_loss << "%\n";
    std::cout << "  Profit Factor:   " << std::setprecision(3) << s.profit_factor << "\n";
    std::cout << "  Avg Hold:        " << std::setprecision(1) << s.avg_hold_days << " days\n";
    std::cout << "  Commission/Tax:  " << std::setprecision(0) << s.total_commission << " / "
              << s.total_tax << "\n";
    std::cout << "  Open Positions:  " << result.final_positions.size() << "\n";
    std::cout << "\n";

    std::cout << "Execution:\n";
    std::cout << "  Trading Days:    " << result.days_processed << " / " << result.total_days << "\n";
    std::cout << "  Factor Panels:   " << result.factor_stats.panels_computed << " computed, "
              << result.factor_stats.cache_hits << " cached\n";
    std::cout << "  Time Elapsed:    " << std::setprecision(3) << result.elapsed_seconds << " seconds\n";
    std::cout << "\n";
}

// ============================================================================
// Main Function
// ============================================================================

int main(int argc, char* argv[]) {
    CliOptions options;
    try {
        if (!parseArguments(argc, argv, options)) {
            printUsage(argv[0]);
            return options.help ? 0 : 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument value: " << e.what() << std::endl;
        return 1;
    }

    if (options.verbose) Logger::setLevel(LogLevel::DEBUG);
    else if (options.quiet) Logger::setLevel(LogLevel::WARNING);

    try {
        RunConfig config = ConfigLoader::fromFile(options.config_file);
        applyOverrides(options, config);

        auto data = std::make_shared<InMemoryDataAccess>("csv:" + options.prices_file);
        CsvDataLoader loader;
        auto price_stats = loader.loadPrices(options.prices_file, *data);
        if (price_stats.rows_skipped > 0) {
            Logger::warning(std::to_string(price_stats.rows_skipped) + " inconsistent price row(s) skipped");
        }
        if (!options.fundamentals_file.empty()) loader.loadFundamentals(options.fundamentals_file, *data);
        if (!options.membership_file.empty()) loader.loadMemberships(options.membership_file, *data);

        BacktestEngine engine(data, std::make_shared<InMemoryFactorCache>());
        if (!options.quiet) {
            engine.setProgressCallback([](const ProgressUpdate& p) {
                std::cout << "  [" << std::fixed << std::setprecision(0) << std::setw(3) << p.percent << "%] "
                          << p.current_date.toString() << "  return " << std::showpos
                          << std::setprecision(2) << p.cumulative_return << "%" << std::noshowpos
                          << "  trades " << p.total_trades << "\n";
            });
        }

        BacktestResult result = engine.run(config);

        if (options.show_trades) printTrades(result);
        printSummary(config, result);

        ResultWriter(options.output_dir).writeAll(result);
        std::cout << "Results saved to: " << options.output_dir << "\n";

        return result.status == RunStatus::FAILED ? 2 : 0;

    } catch (const ConfigurationException& e) {
        std::cerr << "\n❌ " << e.what() << std::endl;
        return 1;
    } catch (const BacktestException& e) {
        std::cerr << "\n❌ Backtest Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "\n❌ Error: " << e.what() << std::endl;
        return 1;
    }
}
