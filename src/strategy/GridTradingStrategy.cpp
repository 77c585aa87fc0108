#include "strategy/GridTradingStrategy.h"
#include "common/Logger.h"

#include <algorithm>
#include <stdexcept>
#include <string>

namespace candlebot {
namespace strategy {

GridTradingStrategy::GridTradingStrategy(std::shared_ptr<execution::IExecutionClient> executor,
                                         const GridTradingStrategyConfig& config)
    : Strategy(std::move(executor))
    , config_(config) {
    if (config_.levels <= 0) {
        throw std::invalid_argument("Grid levels must be positive");
    }
    if (!(config_.spacing_pct > 0.0 && config_.spacing_pct < 1.0)) {
        throw std::invalid_argument("Grid spacing_pct must be in (0, 1)");
    }
    // 가장 깊은 매수 가격도 양수여야 함
    if (!(config_.levels * config_.spacing_pct < 1.0)) {
        throw std::invalid_argument(
            "Grid levels * spacing_pct must be below 1 (levels=" + std::to_string(config_.levels) +
            ", spacing_pct=" + std::to_string(config_.spacing_pct) + ")"
        );
    }
    if (!(config_.order_size_quote > 0.0)) {
        throw std::invalid_argument("Grid order_size_quote must be positive");
    }

    // Buys filled before this instance existed are not paired again on resume
    for (const auto& order : state().filledOrders()) {
        if (order.side == OrderSide::BUY) {
            answered_buys_.insert(order.order_id);
        }
    }
}

nlohmann::json GridTradingStrategy::paramsToJson() const {
    nlohmann::json j;
    j["levels"] = config_.levels;
    j["spacing_pct"] = config_.spacing_pct;
    j["order_size_quote"] = config_.order_size_quote;
    j["window_minutes"] = config_.window_minutes;
    return j;
}

void GridTradingStrategy::execute(const std::vector<Candle>& window) {
    if (window.empty()) {
        return;
    }

    placeTakeProfitSells();

    if (state().buyOrders().empty()) {
        layBuyLadder(window.back().close);
    }
}

// ===== Sell side =====

void GridTradingStrategy::placeTakeProfitSells() {
    const auto& ledger = state();

    for (const auto& order : ledger.filledOrders()) {
        if (order.side != OrderSide::BUY || !order.limit_price) {
            continue;
        }
        if (!answered_buys_.insert(order.order_id).second) {
            continue;
        }

        const double bought = order.on_hold / *order.limit_price;
        const double amount = std::min(bought, ledger.baseAvailable());
        if (amount <= 0.0) {
            LOG_WARN("Grid buy {} filled but no base is available for its sell", order.order_id);
            continue;
        }

        const double sell_price = *order.limit_price * (1.0 + config_.spacing_pct);
        executor().placeLimitSellOrder(ledger.base(), sell_price, amount);
        LOG_INFO("Grid sell placed for buy {}: price={:.8f}, amount={:.8f}",
                 order.order_id, sell_price, amount);
    }
}

// ===== Buy side =====

void GridTradingStrategy::layBuyLadder(double reference_price) {
    const auto& ledger = state();
    int placed = 0;

    for (int level = 1; level <= config_.levels; ++level) {
        const double amount = std::min(config_.order_size_quote, ledger.quoteAvailable());
        if (amount <= 0.0) {
            break;
        }
        const double price = reference_price * (1.0 - level * config_.spacing_pct);
        executor().placeLimitBuyOrder(ledger.base(), price, amount);
        ++placed;
    }

    if (placed > 0) {
        LOG_INFO("Grid ladder laid below {:.8f}: {} buy order(s)", reference_price, placed);
    }
}

} // namespace strategy
} // namespace candlebot
