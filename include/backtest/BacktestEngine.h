#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "common/Types.h"
#include "engine/PerformanceRecorder.h"
#include "strategy/Strategy.h"

namespace candlebot {
namespace backtest {

// Replays a candle series through a strategy wired to a SimulatedExecutionClient.
// At each step the strategy sees only records timestamped in [t - window, t].
class BacktestEngine {
public:
    BacktestEngine() = default;

    // Load historical data (.json or CSV)
    void loadData(const std::string& file_path);
    const std::vector<Candle>& historyData() const { return history_data_; }

    // Run over the loaded data / over an explicit series. Returns one row per simulated candle.
    const std::vector<engine::PerformanceRow>& run(strategy::Strategy& strategy);
    const std::vector<engine::PerformanceRow>& run(strategy::Strategy& strategy, const std::vector<Candle>& data);

    struct Result {
        std::string strategy_name;
        int candles = 0;
        long long start_time = 0;
        long long end_time = 0;

        double start_value = 0.0;
        double final_value = 0.0;
        double total_return = 0.0;
        double hodl_return = 0.0;
        double max_drawdown = 0.0;      // fraction of the running peak

        int number_of_transactions = 0;
        int filled_orders = 0;
        int cancelled_orders = 0;
        int open_orders = 0;
    };
    Result getResult() const { return result_; }
    const std::vector<engine::PerformanceRow>& rows() const { return rows_; }

    bool writeCsv(const std::string& file_path) const;
    static nlohmann::json resultToJson(const Result& result);

private:
    void validate(strategy::Strategy& strategy, const std::vector<Candle>& data) const;

    std::vector<Candle> history_data_;
    std::vector<engine::PerformanceRow> rows_;
    Result result_;
};

} // namespace backtest
} // namespace candlebot
