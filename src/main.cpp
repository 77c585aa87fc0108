#include "common/Logger.h"
#include "common/Config.h"
#include "common/PathUtils.h"
#include "backtest/BacktestEngine.h"
#include "core/state/Ledger.h"
#include "core/state/LedgerStoreJson.h"
#include "core/state/OrderEventLog.h"
#include "execution/SimulatedExecutionClient.h"
#include "strategy/StrategyFactory.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

using namespace candlebot;

namespace {

void printUsage() {
    std::cout << "Usage: candlebot --backtest <candles.csv|candles.json> [options]\n"
              << "  --strategy <rsi|grid>     strategy to run (default: config trading.strategy)\n"
              << "  --initial-quote <amount>  starting quote balance\n"
              << "  --initial-base <amount>   starting base balance\n"
              << "  --state <ledger.json>     resume from / persist the ledger to this file\n"
              << "  --out <rows.csv>          write one performance row per candle\n"
              << "  --json                    print the summary as JSON\n";
}

double parseAmount(const std::string& flag, const std::string& value) {
    try {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed == value.size() && parsed >= 0.0) {
            return parsed;
        }
    } catch (const std::exception&) {
        // reported below
    }
    throw std::invalid_argument("Invalid " + flag + " value: " + value);
}

// 실행 기록(JSONL)은 매 백테스트마다 새로 시작
std::shared_ptr<core::OrderEventLog> openBacktestEventLog(const std::string& log_dir) {
    const auto path = utils::PathUtils::resolveRelativePath(log_dir) / "execution_updates_backtest.jsonl";
    return std::make_shared<core::OrderEventLog>(path, core::OrderEventLog::OpenMode::TRUNCATE);
}

void printResult(const backtest::BacktestEngine::Result& result) {
    std::cout << "\nBacktest Result\n";
    std::cout << "---------------------------------------------\n";
    std::cout << "Strategy:        " << result.strategy_name << "\n";
    std::cout << "Candles:         " << result.candles << "\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "Start value:     " << result.start_value << "\n";
    std::cout << "Final value:     " << result.final_value << "\n";
    std::cout << "Total return:    " << (result.total_return * 100.0) << "%\n";
    std::cout << "Buy & hold:      " << (result.hodl_return * 100.0) << "%\n";
    std::cout << "MDD:             " << (result.max_drawdown * 100.0) << "%\n";
    std::cout << "Transactions:    " << result.number_of_transactions << "\n";
    std::cout << "Orders:          filled=" << result.filled_orders
              << " cancelled=" << result.cancelled_orders
              << " open=" << result.open_orders << "\n";
    std::cout << "---------------------------------------------\n";
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        if (argc < 3 || std::string(argv[1]) != "--backtest") {
            printUsage();
            return 1;
        }

        auto& config = Config::getInstance();
        config.load("config/config.json");

        const std::string data_path = argv[2];
        bool json_mode = false;
        std::string out_path;

        for (int i = 3; i < argc; ++i) {
            const std::string arg = argv[i];
            const bool has_value = (i + 1 < argc);
            if (arg == "--json") {
                json_mode = true;
            } else if (arg == "--strategy" && has_value) {
                config.setStrategy(argv[++i]);
            } else if (arg == "--initial-quote" && has_value) {
                config.setInitialQuote(parseAmount(arg, argv[++i]));
            } else if (arg == "--initial-base" && has_value) {
                config.setInitialBase(parseAmount(arg, argv[++i]));
            } else if (arg == "--state" && has_value) {
                config.setStateFile(argv[++i]);
            } else if (arg == "--out" && has_value) {
                out_path = argv[++i];
            } else {
                std::cerr << "Unknown or incomplete argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }

        Logger::getInstance().initialize(
            config.getLogDir(), config.getLogLevel(),
            json_mode ? Logger::ConsoleStream::STDERR : Logger::ConsoleStream::STDOUT
        );

        if (!json_mode) {
            std::cout << "\n";
            std::cout << "=============================================\n";
            std::cout << "       CandleBot Backtester v1.0\n";
            std::cout << "=============================================\n\n";
        }

        if (!std::filesystem::exists(data_path)) {
            std::cerr << "Backtest file not found: " << data_path << "\n";
            return 1;
        }

        const auto engine_config = config.getEngineConfig();
        if (engine_config.mode == engine::TradingMode::LIVE) {
            // LiveExecutionClient needs an IExchangeGateway; none ships with this binary
            std::cerr << "trading.mode LIVE is not available from the CLI; use BACKTEST\n";
            return 1;
        }
        LOG_INFO("Starting Backtest Mode with file: {}", data_path);

        // Ledger: resumed from the state file when one exists, otherwise fresh
        std::unique_ptr<core::LedgerStoreJson> store;
        std::shared_ptr<core::Ledger> ledger;
        if (!engine_config.state_file.empty()) {
            store = std::make_unique<core::LedgerStoreJson>(engine_config.state_file);
            if (auto loaded = store->load()) {
                if (loaded->base() != engine_config.base) {
                    throw std::invalid_argument(
                        "State file base " + loaded->base() + " does not match configured base " + engine_config.base
                    );
                }
                ledger = std::make_shared<core::Ledger>(std::move(*loaded));
                LOG_INFO("Ledger resumed from {}", store->path().string());
            }
        }
        if (!ledger) {
            ledger = std::make_shared<core::Ledger>(
                engine_config.base, engine_config.initial_base, engine_config.initial_quote
            );
        }

        auto executor = std::make_shared<execution::SimulatedExecutionClient>(
            ledger, engine_config.fee_limit_order, engine_config.fee_market_order
        );
        executor->setEventLog(openBacktestEventLog(config.getLogDir()));

        auto bot_strategy = strategy::createStrategy(engine_config.strategy, config, executor);

        backtest::BacktestEngine bt_engine;
        bt_engine.loadData(data_path);
        bt_engine.run(*bot_strategy);

        if (store && !store->save(*ledger)) {
            LOG_ERROR("Failed to persist ledger to {}", store->path().string());
            std::cerr << "Failed to persist ledger to " << store->path() << "\n";
            return 1;
        }
        if (!out_path.empty() && !bt_engine.writeCsv(out_path)) {
            std::cerr << "Failed to write result rows to " << out_path << "\n";
            return 1;
        }

        const auto result = bt_engine.getResult();
        if (json_mode) {
            nlohmann::json j = backtest::BacktestEngine::resultToJson(result);
            j["ledger"] = {
                {"base", ledger->base()},
                {"total_base", ledger->totalBase()},
                {"total_quote", ledger->totalQuote()},
                {"quote_available", ledger->quoteAvailable()},
                {"base_available", ledger->baseAvailable()}
            };
            std::cout << j.dump() << "\n";
            return 0;
        }

        printResult(result);
        LOG_INFO("Program terminated");
        return 0;
    } catch (const std::exception& e) {
        LOG_ERROR("Fatal error: {}", e.what());
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
