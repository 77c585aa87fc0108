#include "strategy/RsiStrategy.h"
#include "analytics/TechnicalIndicators.h"
#include "common/Logger.h"

#include <stdexcept>

namespace candlebot {
namespace strategy {

RsiStrategy::RsiStrategy(std::shared_ptr<execution::IExecutionClient> executor,
                         const RsiStrategyConfig& config)
    : Strategy(std::move(executor))
    , config_(config) {
    if (config_.period <= 0) {
        throw std::invalid_argument("RSI period must be positive");
    }
    if (config_.lower_threshold >= config_.upper_threshold) {
        throw std::invalid_argument("RSI lower_threshold must be below upper_threshold");
    }
}

nlohmann::json RsiStrategy::paramsToJson() const {
    nlohmann::json j;
    j["lower_threshold"] = config_.lower_threshold;
    j["upper_threshold"] = config_.upper_threshold;
    j["period"] = config_.period;
    j["window_minutes"] = config_.window_minutes;
    return j;
}

void RsiStrategy::execute(const std::vector<Candle>& window) {
    // 직전 캔들과 현재 캔들의 RSI가 모두 필요
    if (window.size() < static_cast<size_t>(config_.period + 2)) {
        return;
    }

    auto closes = analytics::TechnicalIndicators::extractClosePrices(window);
    const double current_rsi = analytics::TechnicalIndicators::calculateRSI(closes, config_.period);
    closes.pop_back();
    const double previous_rsi = analytics::TechnicalIndicators::calculateRSI(closes, config_.period);

    const auto& ledger = state();

    const bool buy_signal = previous_rsi > config_.lower_threshold && current_rsi < config_.lower_threshold;
    if (buy_signal && ledger.quoteAvailable() > 0.0) {
        LOG_INFO("RSI buy signal: prev={:.2f}, curr={:.2f}, quote_available={:.8f}",
                 previous_rsi, current_rsi, ledger.quoteAvailable());
        executor().placeMarketBuyOrder(ledger.base(), ledger.quoteAvailable());
    }

    const bool sell_signal = previous_rsi < config_.upper_threshold && current_rsi > config_.upper_threshold;
    if (sell_signal && ledger.baseAvailable() > 0.0) {
        LOG_INFO("RSI sell signal: prev={:.2f}, curr={:.2f}, base_available={:.8f}",
                 previous_rsi, current_rsi, ledger.baseAvailable());
        executor().placeMarketSellOrder(ledger.base(), ledger.baseAvailable());
    }
}

} // namespace strategy
} // namespace candlebot
