#pragma once

#include <string>
#include <vector>
#include "common/Types.h"

namespace candlebot {
namespace backtest {

class DataHistory {
public:
    // Load candles from a CSV file with a header row.
    // Required columns (any order, case-insensitive): time|timestamp, open, high, low, close, volume
    // Throws MissingColumnError / InvalidColumnTypeError.
    static std::vector<Candle> loadCSV(const std::string& file_path);

    // Load candles from a JSON array of objects.
    // Keys: time|timestamp|t, open|o, high|h, low|l, close|c, volume|v
    static std::vector<Candle> loadJSON(const std::string& file_path);

    // Picks the loader by file extension (.json, otherwise CSV)
    static std::vector<Candle> load(const std::string& file_path);

    // Epoch seconds, epoch milliseconds or ISO-8601 (YYYY-MM-DD[ T]HH:MM[:SS][Z|+HH:MM]) -> epoch ms
    static long long parseTimestamp(const std::string& text);

    // Epoch seconds are promoted to milliseconds
    static long long toMsTimestamp(long long ts);
};

} // namespace backtest
} // namespace candlebot
