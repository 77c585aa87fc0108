#pragma once

#include "strategy/Strategy.h"
#include "strategy/StrategyConfig.h"

#include <set>
#include <string>

namespace candlebot {
namespace strategy {

// Fixed-spacing grid on limit orders.
// With no open buys, a ladder of `levels` buys is laid below the last close;
// every filled grid buy is answered by one sell `spacing_pct` above its price.
class GridTradingStrategy : public Strategy {
public:
    GridTradingStrategy(std::shared_ptr<execution::IExecutionClient> executor,
                        const GridTradingStrategyConfig& config);

    int analysisWindowMinutes() const override { return config_.window_minutes; }
    std::string name() const override { return "grid_trading"; }
    nlohmann::json paramsToJson() const override;

    const GridTradingStrategyConfig& config() const { return config_; }

protected:
    void execute(const std::vector<Candle>& window) override;

private:
    void placeTakeProfitSells();
    void layBuyLadder(double reference_price);

    GridTradingStrategyConfig config_;
    std::set<std::string> answered_buys_;   // filled buy ids that already have a sell
};

} // namespace strategy
} // namespace candlebot
