#include "backtest/BacktestEngine.h"
#include "backtest/DataHistory.h"
#include "common/Errors.h"
#include "common/Logger.h"
#include "execution/SimulatedExecutionClient.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>

namespace candlebot {
namespace backtest {

void BacktestEngine::loadData(const std::string& file_path) {
    history_data_ = DataHistory::load(file_path);
}

const std::vector<engine::PerformanceRow>& BacktestEngine::run(strategy::Strategy& strategy) {
    return run(strategy, history_data_);
}

void BacktestEngine::validate(strategy::Strategy& strategy, const std::vector<Candle>& data) const {
    if (dynamic_cast<execution::SimulatedExecutionClient*>(&strategy.executor()) == nullptr) {
        throw InvalidExecutorError(
            "Backtest requires a SimulatedExecutionClient, got '" + strategy.executor().name() + "'"
        );
    }
    if (data.empty()) {
        throw InsufficientHistoryError("Backtest series is empty");
    }
    for (size_t i = 1; i < data.size(); ++i) {
        if (data[i].timestamp < data[i - 1].timestamp) {
            throw InvalidColumnTypeError(
                "Timestamps must be non-decreasing (record " + std::to_string(i) + ")"
            );
        }
    }

    const long long window_ms = static_cast<long long>(strategy.analysisWindowMinutes()) * kMillisPerMinute;
    const long long span_ms = data.back().timestamp - data.front().timestamp;
    if (span_ms < window_ms) {
        throw InsufficientHistoryError(
            "Series spans " + std::to_string(span_ms / kMillisPerMinute) + " minutes, strategy needs " +
            std::to_string(strategy.analysisWindowMinutes())
        );
    }
}

const std::vector<engine::PerformanceRow>& BacktestEngine::run(strategy::Strategy& strategy,
                                                               const std::vector<Candle>& data) {
    validate(strategy, data);

    rows_.clear();
    result_ = Result{};

    auto& executor = strategy.executor();
    const auto& ledger = strategy.state();
    const long long window_ms = static_cast<long long>(strategy.analysisWindowMinutes()) * kMillisPerMinute;
    const long long start_time = data.front().timestamp + window_ms;

    const auto first = std::lower_bound(data.begin(), data.end(), start_time,
        [](const Candle& c, long long ts) { return c.timestamp < ts; });
    const Candle start_candle = *first;
    const double start_value = ledger.totalValueInQuote(start_candle.open);

    LOG_INFO("Starting Backtest with {} candles ({} simulated), strategy={}, window={}m",
             data.size(), static_cast<size_t>(data.end() - first), strategy.name(),
             strategy.analysisWindowMinutes());

    // Window bounds as indices into data: [lo, hi)
    size_t lo = 0;
    size_t hi = static_cast<size_t>(first - data.begin());
    std::vector<Candle> window;

    for (auto it = first; it != data.end(); ++it) {
        const Candle& candle = *it;
        const long long t = candle.timestamp;

        while (hi < data.size() && data[hi].timestamp <= t) {
            ++hi;
        }
        while (lo < hi && data[lo].timestamp < t - window_ms) {
            ++lo;
        }
        window.assign(data.begin() + static_cast<std::ptrdiff_t>(lo),
                      data.begin() + static_cast<std::ptrdiff_t>(hi));

        executor.setCurrentCandle(candle);
        strategy.run(window);

        rows_.push_back(engine::PerformanceRecorder::snapshot(candle, start_candle, ledger, start_value));
    }

    if (!ledger.isConsistent()) {
        LOG_WARN("Ledger balances drifted from open-order holds after backtest");
    }

    // Summary
    double peak = 0.0;
    for (const auto& row : rows_) {
        peak = std::max(peak, row.total_value_in_quote);
        if (peak > 0.0) {
            result_.max_drawdown = std::max(result_.max_drawdown, (peak - row.total_value_in_quote) / peak);
        }
    }

    const auto& last = rows_.back();
    result_.strategy_name = strategy.name();
    result_.candles = static_cast<int>(rows_.size());
    result_.start_time = rows_.front().time;
    result_.end_time = last.time;
    result_.start_value = start_value;
    result_.final_value = last.total_value_in_quote;
    result_.total_return = last.return_since_start;
    result_.hodl_return = last.hodl_return;
    result_.number_of_transactions = ledger.numberOfTransactions();
    result_.filled_orders = static_cast<int>(ledger.filledOrders().size());
    result_.cancelled_orders = static_cast<int>(ledger.cancelledOrders().size());
    result_.open_orders = last.open_orders;

    LOG_INFO("Backtest Completed.");
    LOG_INFO("Final Value: {:.8f} (return {:.4f}%, hodl {:.4f}%, max drawdown {:.4f}%)",
             result_.final_value, result_.total_return * 100.0,
             result_.hodl_return * 100.0, result_.max_drawdown * 100.0);
    return rows_;
}

bool BacktestEngine::writeCsv(const std::string& file_path) const {
    const std::filesystem::path path(file_path);
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        LOG_ERROR("Failed to open result file: {}", file_path);
        return false;
    }

    out << "time,open,high,low,close,volume,total_value_in_quote,return_since_start,hodl_return,"
           "total_base,total_quote,number_of_transactions,open_orders\n";
    out << std::setprecision(12);
    for (const auto& row : rows_) {
        out << row.time << ','
            << row.open << ',' << row.high << ',' << row.low << ',' << row.close << ',' << row.volume << ','
            << row.total_value_in_quote << ',' << row.return_since_start << ',' << row.hodl_return << ','
            << row.total_base << ',' << row.total_quote << ','
            << row.number_of_transactions << ',' << row.open_orders << '\n';
    }

    LOG_INFO("Wrote {} result rows to {}", rows_.size(), file_path);
    return static_cast<bool>(out);
}

nlohmann::json BacktestEngine::resultToJson(const Result& result) {
    nlohmann::json j;
    j["strategy"] = result.strategy_name;
    j["candles"] = result.candles;
    j["start_time"] = result.start_time;
    j["end_time"] = result.end_time;
    j["start_value"] = result.start_value;
    j["final_value"] = result.final_value;
    j["total_return"] = result.total_return;
    j["hodl_return"] = result.hodl_return;
    j["max_drawdown"] = result.max_drawdown;
    j["number_of_transactions"] = result.number_of_transactions;
    j["filled_orders"] = result.filled_orders;
    j["cancelled_orders"] = result.cancelled_orders;
    j["open_orders"] = result.open_orders;
    return j;
}

} // namespace backtest
} // namespace candlebot
