#include "strategy/Strategy.h"

#include <stdexcept>

namespace candlebot {
namespace strategy {

Strategy::Strategy(std::shared_ptr<execution::IExecutionClient> executor)
    : executor_(std::move(executor)) {
    if (!executor_) {
        throw std::invalid_argument("Strategy requires an execution client");
    }
}

void Strategy::run(const std::vector<Candle>& window) {
    executor_->updateState();
    execute(window);
}

StrategyInfo Strategy::getInfo() const {
    StrategyInfo info;
    info.name = name();
    info.description = paramsToJson().dump();
    info.analysis_window_minutes = analysisWindowMinutes();
    return info;
}

void Strategy::setExecutor(std::shared_ptr<execution::IExecutionClient> executor) {
    if (!executor) {
        throw std::invalid_argument("Strategy requires an execution client");
    }
    if (&executor->state() != &executor_->state()) {
        throw std::invalid_argument("Replacement execution client must wrap the strategy's ledger");
    }
    executor_ = std::move(executor);
}

} // namespace strategy
} // namespace candlebot
