#include "strategy/GridTradingStrategy.h"
#include "strategy/RsiStrategy.h"
#include "strategy/StrategyFactory.h"
#include "execution/SimulatedExecutionClient.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace candlebot;

namespace {
std::vector<Candle> closesToCandles(const std::vector<double>& closes) {
    std::vector<Candle> out;
    long long ts = 0;
    for (double c : closes) {
        out.emplace_back(c, c, c, c, 1.0, ts);
        ts += kMillisPerMinute;
    }
    return out;
}

void step(execution::SimulatedExecutionClient& client, strategy::Strategy& strategy,
          const std::vector<Candle>& window) {
    client.setCurrentCandle(window.back());
    strategy.run(window);
}
}

int main() {
    // RSI: cross below lower buys all quote, cross above upper sells all base
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto client = std::make_shared<execution::SimulatedExecutionClient>(ledger, 0.0015, 0.0025);

        strategy::RsiStrategyConfig config;
        config.period = 3;
        config.window_minutes = 10;
        strategy::RsiStrategy rsi(client, config);
        assert(rsi.analysisWindowMinutes() == 10);

        // Too short to evaluate: nothing happens
        step(*client, rsi, closesToCandles({100, 90}));
        assert(ledger->numberOfTransactions() == 0);

        // Steady rise: RSI pinned at 100, no signal
        step(*client, rsi, closesToCandles({100, 101, 102, 103, 104}));
        assert(ledger->numberOfTransactions() == 0);

        // Sharp drop: RSI 100 -> 12.5
        step(*client, rsi, closesToCandles({100, 101, 102, 103, 104, 90}));
        assert(ledger->numberOfTransactions() == 1);
        assert(ledger->quoteAvailable() == 0.0);
        assert(std::abs(ledger->totalBase() - 1000.0 / 90.0 * (1.0 - 0.0025)) < 1e-9);

        // Rebound: RSI 12.5 -> ~77
        step(*client, rsi, closesToCandles({100, 101, 102, 103, 104, 90, 120}));
        assert(ledger->numberOfTransactions() == 2);
        assert(std::abs(ledger->totalBase()) < 1e-12);
        assert(ledger->totalQuote() > 1000.0);
        assert(ledger->isConsistent());

        assert(rsi.paramsToJson().at("period").get<int>() == 3);
    }

    // Grid: ladder below the close, sell one spacing above each filled buy
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto client = std::make_shared<execution::SimulatedExecutionClient>(ledger, 0.001, 0.002);

        strategy::GridTradingStrategyConfig config;
        config.levels = 3;
        config.spacing_pct = 0.01;
        config.order_size_quote = 100.0;
        strategy::GridTradingStrategy grid(client, config);

        step(*client, grid, {Candle(100, 100, 100, 100, 1, 0)});
        auto buys = ledger->buyOrders();
        assert(buys.size() == 3);
        assert(std::abs(*buys[0].limit_price - 99.0) < 1e-9);
        assert(std::abs(*buys[2].limit_price - 97.0) < 1e-9);
        assert(std::abs(ledger->quoteAvailable() - 700.0) < 1e-9);

        // Dip fills the first level only
        step(*client, grid, {Candle(99.5, 99.8, 98.5, 99.0, 1, 60000)});
        assert(ledger->filledOrders().size() == 1);
        auto sells = ledger->sellOrders();
        assert(sells.size() == 1);
        assert(std::abs(*sells[0].limit_price - 99.99) < 1e-9);
        assert(std::abs(sells[0].on_hold - 100.0 / 99.0 * (1.0 - 0.001)) < 1e-12);
        assert(ledger->buyOrders().size() == 2);

        // Same candle again: the filled buy is not answered twice
        step(*client, grid, {Candle(99.5, 99.8, 98.5, 99.0, 1, 120000)});
        assert(ledger->sellOrders().size() == 1);

        // Rally fills the sell
        step(*client, grid, {Candle(99.5, 100.5, 99.2, 100.2, 1, 180000)});
        assert(ledger->sellOrders().empty());
        assert(ledger->numberOfTransactions() == 2);
        assert(ledger->isConsistent());
    }

    // Grid config whose deepest level would sit at or below zero is refused up front
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 10000.0);
        auto client = std::make_shared<execution::SimulatedExecutionClient>(ledger, 0.001, 0.002);

        strategy::GridTradingStrategyConfig config;
        config.levels = 10;
        config.spacing_pct = 0.15;
        config.order_size_quote = 100.0;

        bool thrown = false;
        try {
            strategy::GridTradingStrategy grid(client, config);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        // Largest ladder that still fits: every price stays positive
        config.levels = 6;
        strategy::GridTradingStrategy grid(client, config);
        step(*client, grid, {Candle(100, 100, 100, 100, 1, 0)});
        const auto buys = ledger->buyOrders();
        assert(buys.size() == 6);
        assert(std::abs(*buys[5].limit_price - 10.0) < 1e-9);
        assert(ledger->isConsistent());
    }

    // Factory
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto client = std::make_shared<execution::SimulatedExecutionClient>(ledger, 0.0015, 0.0025);
        const auto& config = Config::getInstance();

        assert(strategy::createStrategy("RSI", config, client)->name() == "rsi");
        auto grid = strategy::createStrategy("grid", config, client);
        assert(grid->name() == "grid_trading");
        assert(grid->getInfo().analysis_window_minutes == config.getGridTradingConfig().window_minutes);

        bool thrown = false;
        try {
            strategy::createStrategy("martingale", config, client);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        // Resume wiring: a replacement client must wrap the same ledger
        auto other = std::make_shared<execution::SimulatedExecutionClient>(
            std::make_shared<core::Ledger>("BTC", 0.0, 1.0), 0.0015, 0.0025);
        thrown = false;
        try {
            grid->setExecutor(other);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
        grid->setExecutor(std::make_shared<execution::SimulatedExecutionClient>(ledger, 0.0015, 0.0025));
        assert(&grid->state() == ledger.get());
    }

    std::cout << "[TEST] Strategies PASSED\n";
    return 0;
}
