#include "engine/PerformanceRecorder.h"

namespace candlebot {
namespace engine {

PerformanceRow PerformanceRecorder::snapshot(const Candle& candle,
                                             const Candle& start_candle,
                                             const core::Ledger& ledger,
                                             double start_value_in_quote) {
    PerformanceRow row;
    row.time = candle.timestamp;
    row.open = candle.open;
    row.high = candle.high;
    row.low = candle.low;
    row.close = candle.close;
    row.volume = candle.volume;

    row.total_value_in_quote = ledger.totalValueInQuote(candle.open);
    row.return_since_start = (start_value_in_quote > 0.0)
        ? (row.total_value_in_quote / start_value_in_quote - 1.0)
        : 0.0;
    row.hodl_return = (start_candle.open > 0.0)
        ? (candle.open / start_candle.open - 1.0)
        : 0.0;

    row.total_base = ledger.totalBase();
    row.total_quote = ledger.totalQuote();
    row.number_of_transactions = ledger.numberOfTransactions();
    row.open_orders = static_cast<int>(ledger.buyOrders().size() + ledger.sellOrders().size());
    return row;
}

nlohmann::json PerformanceRecorder::toJson(const PerformanceRow& row) {
    return {
        {"time", row.time},
        {"open", row.open},
        {"high", row.high},
        {"low", row.low},
        {"close", row.close},
        {"volume", row.volume},
        {"total_value_in_quote", row.total_value_in_quote},
        {"return_since_start", row.return_since_start},
        {"hodl_return", row.hodl_return},
        {"total_base", row.total_base},
        {"total_quote", row.total_quote},
        {"number_of_transactions", row.number_of_transactions},
        {"open_orders", row.open_orders}
    };
}

} // namespace engine
} // namespace candlebot
