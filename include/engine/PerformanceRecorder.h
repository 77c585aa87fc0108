#pragma once

#include "common/Types.h"
#include "core/state/Ledger.h"
#include <nlohmann/json.hpp>

namespace candlebot {
namespace engine {

// One row per simulated candle
struct PerformanceRow {
    long long time = 0;
    double open = 0.0;
    double high = 0.0;
    double low = 0.0;
    double close = 0.0;
    double volume = 0.0;

    double total_value_in_quote = 0.0;
    double return_since_start = 0.0;
    double hodl_return = 0.0;           // buy-and-hold from the start candle's open

    double total_base = 0.0;
    double total_quote = 0.0;
    int number_of_transactions = 0;
    int open_orders = 0;
};

// Turns ledger + candle into a result row. No state is kept between calls.
class PerformanceRecorder {
public:
    static PerformanceRow snapshot(const Candle& candle,
                                   const Candle& start_candle,
                                   const core::Ledger& ledger,
                                   double start_value_in_quote);

    static nlohmann::json toJson(const PerformanceRow& row);
};

} // namespace engine
} // namespace candlebot
