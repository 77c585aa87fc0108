#pragma once

#include "strategy/Strategy.h"
#include "strategy/StrategyConfig.h"

namespace candlebot {
namespace strategy {

// RSI threshold-crossing strategy (market orders only).
//  - RSI crosses below lower_threshold: buy with all available quote
//  - RSI crosses above upper_threshold: sell all available base
class RsiStrategy : public Strategy {
public:
    RsiStrategy(std::shared_ptr<execution::IExecutionClient> executor,
                const RsiStrategyConfig& config);

    int analysisWindowMinutes() const override { return config_.window_minutes; }
    std::string name() const override { return "rsi"; }
    nlohmann::json paramsToJson() const override;

    const RsiStrategyConfig& config() const { return config_; }

protected:
    void execute(const std::vector<Candle>& window) override;

private:
    RsiStrategyConfig config_;
};

} // namespace strategy
} // namespace candlebot
