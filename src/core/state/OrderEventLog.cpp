#include "core/state/OrderEventLog.h"
#include "core/execution/OrderSchema.h"

#include <nlohmann/json.hpp>

#include <stdexcept>

namespace candlebot {
namespace core {

OrderEventLog::OrderEventLog(std::filesystem::path file_path, OpenMode mode)
    : file_path_(std::move(file_path)) {
    if (file_path_.has_parent_path()) {
        std::filesystem::create_directories(file_path_.parent_path());
    }
    const auto flags = std::ios::binary | (mode == OpenMode::TRUNCATE ? std::ios::trunc : std::ios::app);
    out_.open(file_path_, flags);
    if (!out_.is_open()) {
        throw std::runtime_error("Cannot open order event log: " + file_path_.string());
    }
}

bool OrderEventLog::append(long long ts_ms, const std::string& event, const Order& order,
                           double price, double received) {
    nlohmann::json line;
    line["seq"] = seq_ + 1;
    line["ts_ms"] = ts_ms;
    line["event"] = event;
    line["price"] = price;
    line["received"] = received;
    line["order"] = execution::toJson(order);

    // flush per line so an aborted run still leaves every event before the failure
    out_ << line.dump() << '\n';
    out_.flush();
    if (!out_) {
        return false;
    }
    ++seq_;
    return true;
}

} // namespace core
} // namespace candlebot
