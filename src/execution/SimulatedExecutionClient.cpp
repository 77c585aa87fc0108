#include "execution/SimulatedExecutionClient.h"

#include "common/Errors.h"
#include "common/Logger.h"
#include "core/execution/OrderSchema.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace candlebot {
namespace execution {

SimulatedExecutionClient::SimulatedExecutionClient(std::shared_ptr<core::Ledger> ledger,
                                                   double fee_limit_order,
                                                   double fee_market_order)
    : ledger_(std::move(ledger))
    , fee_limit_order_(fee_limit_order)
    , fee_market_order_(fee_market_order) {
    if (!ledger_) {
        throw std::invalid_argument("SimulatedExecutionClient requires a ledger");
    }
    order_seq_ = static_cast<long long>(ledger_->orders().size());
}

Order SimulatedExecutionClient::placeLimitBuyOrder(const std::string& base, double limit_price, double amount_in_quote) {
    return placeLimitOrder(base, OrderSide::BUY, limit_price, amount_in_quote);
}

Order SimulatedExecutionClient::placeLimitSellOrder(const std::string& base, double limit_price, double amount_in_base) {
    return placeLimitOrder(base, OrderSide::SELL, limit_price, amount_in_base);
}

Order SimulatedExecutionClient::placeMarketBuyOrder(const std::string& base, double amount_in_quote) {
    return placeMarketOrder(base, OrderSide::BUY, amount_in_quote);
}

Order SimulatedExecutionClient::placeMarketSellOrder(const std::string& base, double amount_in_base) {
    return placeMarketOrder(base, OrderSide::SELL, amount_in_base);
}

Order SimulatedExecutionClient::placeLimitOrder(const std::string& base, OrderSide side,
                                                double limit_price, double amount) {
    requireMarket(base);

    const double available = (side == OrderSide::BUY) ? ledger_->quoteAvailable() : ledger_->baseAvailable();
    // NaN fails every comparison, so the checks are written as what must hold
    const bool price_ok = limit_price > 0.0 && std::isfinite(limit_price);
    if (!price_ok || !(amount > 0.0 && amount <= available)) {
        throw InsufficientBalanceError(
            std::string("Limit ") + core::execution::orderSideToString(side) +
            " rejected: amount=" + std::to_string(amount) +
            ", available=" + std::to_string(available) +
            ", limit_price=" + std::to_string(limit_price)
        );
    }

    Order order;
    order.order_id = nextOrderId();
    order.exchange = name();
    order.market = base;
    order.side = side;
    order.limit_price = limit_price;
    order.on_hold = amount;
    order.status = OrderStatus::OPEN;
    order.time_created = now();
    order.is_taker = false;

    ledger_->insertOpenOrder(order);
    record(order, "placed", limit_price, 0.0);
    return order;
}

Order SimulatedExecutionClient::placeMarketOrder(const std::string& base, OrderSide side, double amount) {
    requireMarket(base);

    if (!current_candle_ || !(current_candle_->open > 0.0)) {
        throw NoCurrentCandleError("Market order needs a current candle with a positive open price");
    }

    const double available = (side == OrderSide::BUY) ? ledger_->quoteAvailable() : ledger_->baseAvailable();
    if (!(amount > 0.0 && amount <= available)) {
        throw InsufficientBalanceError(
            std::string("Market ") + core::execution::orderSideToString(side) +
            " rejected: amount=" + std::to_string(amount) +
            ", available=" + std::to_string(available)
        );
    }

    Order order;
    order.order_id = nextOrderId();
    order.exchange = name();
    order.market = base;
    order.side = side;
    order.on_hold = amount;
    order.status = OrderStatus::FILLED;
    order.time_created = now();
    order.is_taker = true;

    const double price = current_candle_->open;
    const double fee = feeFor(order);
    double received = 0.0;
    if (side == OrderSide::BUY) {
        received = amount / price * (1.0 - fee);
        ledger_->recordImmediateFill(order, received, -amount);
    } else {
        received = amount * price * (1.0 - fee);
        ledger_->recordImmediateFill(order, -amount, received);
    }

    record(order, "filled", price, received);
    return order;
}

Order SimulatedExecutionClient::cancelOrder(const Order& order) {
    const Order* stored = ledger_->findOrder(order.order_id);
    if (stored == nullptr) {
        throw OrderNotFoundError("Unknown order id: " + order.order_id);
    }
    if (!stored->isOpen()) {
        throw OrderNotCancellableError(
            "Order " + order.order_id + " is " + core::execution::orderStatusToString(stored->status)
        );
    }

    ledger_->releaseOrder(order.order_id);
    const Order& cancelled = *ledger_->findOrder(order.order_id);
    record(cancelled, "cancelled", cancelled.limit_price.value_or(0.0), 0.0);
    return cancelled;
}

Order SimulatedExecutionClient::getOrderInfo(const Order& order) const {
    const Order* stored = ledger_->findOrder(order.order_id);
    if (stored == nullptr) {
        throw OrderNotFoundError("Unknown order id: " + order.order_id);
    }
    return *stored;
}

void SimulatedExecutionClient::setCurrentCandle(const Candle& candle) {
    current_candle_ = candle;
}

void SimulatedExecutionClient::updateState() {
    if (!current_candle_) {
        return;
    }
    const Candle& candle = *current_candle_;

    // openOrders() is in insertion order; stable sort keeps it as the tie-breaker.
    std::vector<Order> open_orders = ledger_->openOrders();
    std::stable_sort(open_orders.begin(), open_orders.end(), [](const Order& a, const Order& b) {
        return a.time_created < b.time_created;
    });

    int fills = 0;
    for (const auto& order : open_orders) {
        if (!order.limit_price) {
            continue;
        }
        const double limit_price = *order.limit_price;
        const double fee = feeFor(order);

        double received = 0.0;
        if (order.side == OrderSide::BUY) {
            if (candle.low > limit_price) {
                continue;
            }
            received = order.on_hold / limit_price * (1.0 - fee);
        } else {
            if (candle.high < limit_price) {
                continue;
            }
            received = order.on_hold * limit_price * (1.0 - fee);
        }

        ledger_->settleFill(order.order_id, received);
        record(*ledger_->findOrder(order.order_id), "filled", limit_price, received);
        ++fills;
    }

    if (fills > 0) {
        LOG_DEBUG("Reconciled candle ts={}: {} fill(s), {} order(s) still open",
                  candle.timestamp, fills, open_orders.size() - static_cast<size_t>(fills));
    }
}

void SimulatedExecutionClient::requireMarket(const std::string& base) const {
    if (base != ledger_->base()) {
        throw std::invalid_argument("Market " + base + " does not match ledger base " + ledger_->base());
    }
}

double SimulatedExecutionClient::feeFor(const Order& order) const {
    return order.is_taker ? fee_market_order_ : fee_limit_order_;
}

std::string SimulatedExecutionClient::nextOrderId() {
    std::string id;
    do {
        id = "bt-" + std::to_string(++order_seq_);
    } while (ledger_->findOrder(id) != nullptr);
    return id;
}

long long SimulatedExecutionClient::now() const {
    return current_candle_ ? current_candle_->timestamp : 0LL;
}

void SimulatedExecutionClient::record(const Order& order, const char* event, double price, double received) {
    const std::string event_name(event);
    const char* side = core::execution::orderSideToString(order.side);

    LOG_INFO(
        "Execution lifecycle: source={}, event={}, order_id={}, market={}, side={}, status={}, price={:.8f}, on_hold={:.8f}, received={:.8f}",
        name(),
        event_name,
        order.order_id,
        order.market,
        side,
        core::execution::orderStatusToString(order.status),
        price,
        order.on_hold,
        received
    );

    if (event_name == "filled") {
        Logger::getInstance().logFill(now(), order.market, side, price, order.on_hold, feeFor(order));
    }

    if (event_log_ && !event_log_->append(now(), event_name, order, price, received)) {
        LOG_WARN("Order event log append failed: order_id={}, path={}", order.order_id, event_log_->path().string());
    }
}

} // namespace execution
} // namespace candlebot
