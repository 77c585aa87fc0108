#include "backtest/BacktestEngine.h"
#include "common/Errors.h"
#include "execution/LiveExecutionClient.h"
#include "execution/SimulatedExecutionClient.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace candlebot;

namespace {
constexpr long long kHour = 60LL * kMillisPerMinute;

// Records what it was shown; optionally places one limit buy on its first step
class RecordingStrategy : public strategy::Strategy {
public:
    RecordingStrategy(std::shared_ptr<execution::IExecutionClient> executor, int window_minutes)
        : Strategy(std::move(executor)), window_minutes_(window_minutes) {}

    int analysisWindowMinutes() const override { return window_minutes_; }
    std::string name() const override { return "recording"; }
    nlohmann::json paramsToJson() const override { return {{"window_minutes", window_minutes_}}; }

    std::vector<std::vector<Candle>> seen;
    double buy_limit = 0.0;
    bool fail = false;

protected:
    void execute(const std::vector<Candle>& window) override {
        seen.push_back(window);
        if (fail) {
            throw std::runtime_error("decision failed");
        }
        if (buy_limit > 0.0 && seen.size() == 1) {
            executor().placeLimitBuyOrder(state().base(), buy_limit, 500.0);
        }
    }

private:
    int window_minutes_;
};

class NullGateway : public network::IExchangeGateway {
public:
    std::string name() const override { return "null"; }
    network::GatewayOrderReport placeOrder(const network::GatewayOrderRequest&) override {
        throw ExchangeGatewayError("offline");
    }
    network::GatewayOrderReport cancelOrder(const std::string&, const std::string&) override {
        throw ExchangeGatewayError("offline");
    }
    network::GatewayOrderReport getOrder(const std::string&, const std::string&) override {
        throw ExchangeGatewayError("offline");
    }
};

std::vector<Candle> hourlySeries(size_t n, double start_price) {
    std::vector<Candle> out;
    for (size_t i = 0; i < n; ++i) {
        const double open = start_price + static_cast<double>(i);
        out.emplace_back(open, open + 2.0, open - 2.0, open + 1.0, 5.0, 1700000000000LL + static_cast<long long>(i) * kHour);
    }
    return out;
}

template <typename Error, typename Fn>
bool throwsAs(Fn&& fn) {
    try {
        fn();
    } catch (const Error&) {
        return true;
    }
    return false;
}
}

int main() {
    // Window bounds never reach past the current candle
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto client = std::make_shared<execution::SimulatedExecutionClient>(ledger, 0.0015, 0.0025);
        RecordingStrategy strategy(client, 120);

        const auto data = hourlySeries(10, 100.0);
        backtest::BacktestEngine engine;
        const auto& rows = engine.run(strategy, data);

        // start_time = first + 2h => 8 simulated candles
        assert(rows.size() == 8);
        assert(strategy.seen.size() == 8);
        for (size_t i = 0; i < rows.size(); ++i) {
            const auto& window = strategy.seen[i];
            const long long t = rows[i].time;
            assert(!window.empty());
            assert(window.back().timestamp == t);
            assert(window.front().timestamp >= t - 2 * kHour);
            for (const auto& c : window) {
                assert(c.timestamp <= t);
            }
            assert(window.size() == 3);
        }
        assert(rows.front().time == data[2].timestamp);
        assert(client->currentCandle()->timestamp == data.back().timestamp);

        const auto result = engine.getResult();
        assert(result.candles == 8);
        assert(result.strategy_name == "recording");
        assert(std::abs(result.start_value - 1000.0) < 1e-9);
        assert(std::abs(result.total_return) < 1e-12);
        assert(std::abs(result.hodl_return - (data.back().open / data[2].open - 1.0)) < 1e-12);
        assert(result.max_drawdown == 0.0);
    }

    // Candles sharing a timestamp: all of them are visible at that time, nothing later is
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto client = std::make_shared<execution::SimulatedExecutionClient>(ledger, 0.0015, 0.0025);
        RecordingStrategy strategy(client, 60);

        auto data = hourlySeries(6, 100.0);
        data[4].timestamp = data[3].timestamp;
        data[5].timestamp = data[3].timestamp + kHour;

        backtest::BacktestEngine engine;
        const auto& rows = engine.run(strategy, data);

        // start_time = first + 1h => candles 1..5, both duplicates simulated
        assert(rows.size() == 5);
        assert(rows[2].time == rows[3].time);
        assert(std::abs(rows[2].open - data[3].open) < 1e-12);
        assert(std::abs(rows[3].open - data[4].open) < 1e-12);

        for (size_t step = 2; step <= 3; ++step) {
            const auto& window = strategy.seen[step];
            assert(window.size() == 3);
            assert(window.front().timestamp == data[2].timestamp);
            // the second candle at this time is already in the window at the first one
            assert(std::abs(window.back().open - data[4].open) < 1e-12);
            for (const auto& c : window) {
                assert(c.timestamp <= data[3].timestamp);
            }
        }

        const auto& last = strategy.seen[4];
        assert(last.size() == 3);
        assert(last.front().timestamp == data[3].timestamp);
        assert(last.back().timestamp == data[5].timestamp);
    }

    // Orders placed in one step fill on a later candle's reconciliation
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto client = std::make_shared<execution::SimulatedExecutionClient>(ledger, 0.001, 0.002);
        RecordingStrategy strategy(client, 60);
        strategy.buy_limit = 103.0;

        const auto data = hourlySeries(8, 100.0);
        backtest::BacktestEngine engine;
        const auto& rows = engine.run(strategy, data);

        assert(rows.size() == 7);
        // Placed at step 0 (candle index 1, low 99): not reconciled until the next step
        assert(rows[0].open_orders == 1);
        assert(rows[0].number_of_transactions == 0);
        // Candle index 2 has low 100 <= 103, so it fills there
        assert(rows[1].number_of_transactions == 1);
        assert(rows[1].open_orders == 0);
        assert(std::abs(rows[1].total_base - 500.0 / 103.0 * (1.0 - 0.001)) < 1e-12);

        const auto result = engine.getResult();
        assert(result.filled_orders == 1);
        assert(result.number_of_transactions == 1);
        assert(ledger->isConsistent());
    }

    // Validation
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto sim = std::make_shared<execution::SimulatedExecutionClient>(ledger, 0.0015, 0.0025);
        backtest::BacktestEngine engine;

        RecordingStrategy long_window(sim, 60 * 24);
        assert(throwsAs<InsufficientHistoryError>([&] { engine.run(long_window, hourlySeries(10, 100.0)); }));

        RecordingStrategy ok_window(sim, 60);
        assert(throwsAs<InsufficientHistoryError>([&] { engine.run(ok_window, std::vector<Candle>{}); }));

        auto unordered = hourlySeries(5, 100.0);
        std::swap(unordered[1], unordered[2]);
        assert(throwsAs<InvalidColumnTypeError>([&] { engine.run(ok_window, unordered); }));

        auto live = std::make_shared<execution::LiveExecutionClient>(ledger, std::make_shared<NullGateway>());
        RecordingStrategy live_strategy(live, 60);
        assert(throwsAs<InvalidExecutorError>([&] { engine.run(live_strategy, hourlySeries(5, 100.0)); }));

        // Nothing ran
        assert(ok_window.seen.empty());
        assert(live_strategy.seen.empty());
    }

    // A decision failure aborts the run; the ledger stays consistent
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto client = std::make_shared<execution::SimulatedExecutionClient>(ledger, 0.0015, 0.0025);
        RecordingStrategy strategy(client, 60);
        strategy.fail = true;

        backtest::BacktestEngine engine;
        bool thrown = false;
        try {
            engine.run(strategy, hourlySeries(5, 100.0));
        } catch (const std::runtime_error&) {
            thrown = true;
        }
        assert(thrown);
        assert(strategy.seen.size() == 1);
        assert(ledger->isConsistent());
    }

    std::cout << "[TEST] BacktestEngine PASSED\n";
    return 0;
}
