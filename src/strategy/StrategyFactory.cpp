#include "strategy/StrategyFactory.h"
#include "strategy/GridTradingStrategy.h"
#include "strategy/RsiStrategy.h"
#include "common/Logger.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace candlebot {
namespace strategy {

std::unique_ptr<Strategy> createStrategy(const std::string& name,
                                         const Config& config,
                                         std::shared_ptr<execution::IExecutionClient> executor) {
    std::string key = name;
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::unique_ptr<Strategy> strategy;
    if (key == "rsi") {
        strategy = std::make_unique<RsiStrategy>(std::move(executor), config.getRsiConfig());
    } else if (key == "grid" || key == "grid_trading") {
        strategy = std::make_unique<GridTradingStrategy>(std::move(executor), config.getGridTradingConfig());
    } else {
        throw std::invalid_argument("Unknown strategy: " + name);
    }

    LOG_INFO("Strategy created: {} {}", strategy->name(), strategy->paramsToJson().dump());
    return strategy;
}

} // namespace strategy
} // namespace candlebot
