#pragma once

#include "strategy/Strategy.h"
#include "common/Config.h"

#include <memory>
#include <string>

namespace candlebot {
namespace strategy {

// Builds a strategy by name ("rsi", "grid" / "grid_trading") from the loaded configuration.
// Unknown names throw std::invalid_argument.
std::unique_ptr<Strategy> createStrategy(const std::string& name,
                                         const Config& config,
                                         std::shared_ptr<execution::IExecutionClient> executor);

} // namespace strategy
} // namespace candlebot
