#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "common/Types.h"

namespace candlebot {
namespace core {

// Append-only JSONL record of what happened to each order during a run.
// One line per event: {"seq", "ts_ms", "event", "price", "received", "order": {...}}
class OrderEventLog {
public:
    enum class OpenMode { APPEND, TRUNCATE };

    // Throws std::runtime_error if the file cannot be opened.
    OrderEventLog(std::filesystem::path file_path, OpenMode mode);

    bool append(long long ts_ms, const std::string& event, const Order& order, double price, double received);

    const std::filesystem::path& path() const { return file_path_; }
    std::uint64_t eventsWritten() const { return seq_; }

private:
    std::filesystem::path file_path_;
    std::ofstream out_;
    std::uint64_t seq_ = 0;
};

} // namespace core
} // namespace candlebot
