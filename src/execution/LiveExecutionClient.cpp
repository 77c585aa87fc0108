#include "execution/LiveExecutionClient.h"

#include "common/Errors.h"
#include "common/Logger.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include "core/execution/OrderSchema.h"

#include <cmath>
#include <stdexcept>
#include <vector>

namespace candlebot {
namespace execution {

using core::execution::OrderLifecycleStateMachine;

LiveExecutionClient::LiveExecutionClient(std::shared_ptr<core::Ledger> ledger,
                                         std::shared_ptr<network::IExchangeGateway> gateway)
    : ledger_(std::move(ledger))
    , gateway_(std::move(gateway)) {
    if (!ledger_ || !gateway_) {
        throw std::invalid_argument("LiveExecutionClient requires a ledger and a gateway");
    }
}

Order LiveExecutionClient::placeLimitBuyOrder(const std::string& base, double limit_price, double amount_in_quote) {
    return placeLimitOrder(base, OrderSide::BUY, limit_price, amount_in_quote);
}

Order LiveExecutionClient::placeLimitSellOrder(const std::string& base, double limit_price, double amount_in_base) {
    return placeLimitOrder(base, OrderSide::SELL, limit_price, amount_in_base);
}

Order LiveExecutionClient::placeMarketBuyOrder(const std::string& base, double amount_in_quote) {
    return placeMarketOrder(base, OrderSide::BUY, amount_in_quote);
}

Order LiveExecutionClient::placeMarketSellOrder(const std::string& base, double amount_in_base) {
    return placeMarketOrder(base, OrderSide::SELL, amount_in_base);
}

Order LiveExecutionClient::placeLimitOrder(const std::string& base, OrderSide side,
                                           double limit_price, double amount) {
    if (!(limit_price > 0.0 && std::isfinite(limit_price))) {
        throw InsufficientBalanceError("Limit price must be positive: " + std::to_string(limit_price));
    }
    requireAvailable(base, side, amount);

    network::GatewayOrderRequest request;
    request.market = base;
    request.side = side;
    request.limit_price = limit_price;
    request.amount = amount;

    const auto report = gateway_->placeOrder(request);
    // Validate the acknowledged status before the ledger is touched.
    const auto transitioned = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, report.status);

    const Order order = makeOrder(base, side, limit_price, amount, report);
    ledger_->insertOpenOrder(order);
    LOG_INFO("Live limit order placed: exchange={}, id={}, side={}, limit={:.8f}, on_hold={:.8f}",
             gateway_->name(), order.order_id, core::execution::orderSideToString(side), limit_price, amount);

    if (transitioned.changed) {
        applyReport(order, report);
    }
    return *ledger_->findOrder(order.order_id);
}

Order LiveExecutionClient::placeMarketOrder(const std::string& base, OrderSide side, double amount) {
    requireAvailable(base, side, amount);

    network::GatewayOrderRequest request;
    request.market = base;
    request.side = side;
    request.amount = amount;

    const auto report = gateway_->placeOrder(request);
    const auto transitioned = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, report.status);
    if (transitioned.status != OrderStatus::FILLED) {
        throw ExchangeGatewayError("Market order " + report.order_id + " was not filled (status=" + report.status + ")");
    }

    Order order = makeOrder(base, side, std::nullopt, amount, report);
    order.status = OrderStatus::FILLED;

    if (side == OrderSide::BUY) {
        const double spent = (report.filled_quote > 0.0) ? report.filled_quote : amount;
        ledger_->recordImmediateFill(order, report.filled_base, -spent);
    } else {
        const double sold = (report.filled_base > 0.0) ? report.filled_base : amount;
        ledger_->recordImmediateFill(order, -sold, report.filled_quote);
    }

    LOG_INFO("Live market order filled: exchange={}, id={}, side={}, base={:.8f}, quote={:.8f}",
             gateway_->name(), order.order_id, core::execution::orderSideToString(side),
             report.filled_base, report.filled_quote);
    return order;
}

Order LiveExecutionClient::cancelOrder(const Order& order) {
    const Order* stored = ledger_->findOrder(order.order_id);
    if (stored == nullptr) {
        throw OrderNotFoundError("Unknown order id: " + order.order_id);
    }
    if (!stored->isOpen()) {
        throw OrderNotCancellableError(
            "Order " + order.order_id + " is " + core::execution::orderStatusToString(stored->status)
        );
    }

    const auto report = gateway_->cancelOrder(stored->market, order.order_id);
    const auto transitioned = OrderLifecycleStateMachine::transition(OrderStatus::OPEN, report.status);

    if (transitioned.status == OrderStatus::OPEN) {
        throw ExchangeGatewayError("Cancel of " + order.order_id + " not confirmed (status=" + report.status + ")");
    }

    applyReport(*stored, report);
    if (transitioned.status == OrderStatus::FILLED) {
        // Filled on the exchange before the cancel arrived; the fill is kept.
        throw OrderNotCancellableError("Order " + order.order_id + " filled before it could be cancelled");
    }

    LOG_INFO("Live order cancelled: exchange={}, id={}", gateway_->name(), order.order_id);
    return *ledger_->findOrder(order.order_id);
}

Order LiveExecutionClient::getOrderInfo(const Order& order) const {
    const Order* stored = ledger_->findOrder(order.order_id);
    if (stored == nullptr) {
        throw OrderNotFoundError("Unknown order id: " + order.order_id);
    }
    return *stored;
}

void LiveExecutionClient::setCurrentCandle(const Candle& candle) {
    current_candle_ = candle;
}

void LiveExecutionClient::updateState() {
    const std::vector<Order> open_orders = ledger_->openOrders();
    for (const auto& order : open_orders) {
        const auto report = gateway_->getOrder(order.market, order.order_id);
        applyReport(order, report);
    }
}

void LiveExecutionClient::requireAvailable(const std::string& base, OrderSide side, double amount) const {
    if (base != ledger_->base()) {
        throw std::invalid_argument("Market " + base + " does not match ledger base " + ledger_->base());
    }
    const double available = (side == OrderSide::BUY) ? ledger_->quoteAvailable() : ledger_->baseAvailable();
    if (!(amount > 0.0 && amount <= available)) {
        throw InsufficientBalanceError(
            std::string("Order rejected: amount=") + std::to_string(amount) +
            ", available=" + std::to_string(available)
        );
    }
}

void LiveExecutionClient::applyReport(const Order& order, const network::GatewayOrderReport& report) {
    const Order* stored = ledger_->findOrder(order.order_id);
    if (stored == nullptr) {
        throw OrderNotFoundError("Unknown order id: " + order.order_id);
    }

    const auto transitioned = OrderLifecycleStateMachine::transition(stored->status, report.status);
    if (!transitioned.changed) {
        return;
    }

    if (transitioned.status == OrderStatus::FILLED) {
        const double received = (stored->side == OrderSide::BUY) ? report.filled_base : report.filled_quote;
        ledger_->settleFill(order.order_id, received);
        Logger::getInstance().logFill(
            report.time_created, stored->market, core::execution::orderSideToString(stored->side),
            stored->limit_price.value_or(0.0), stored->on_hold, 0.0
        );
    } else if (transitioned.status == OrderStatus::CANCELLED) {
        ledger_->releaseOrder(order.order_id);
    }
}

Order LiveExecutionClient::makeOrder(const std::string& base, OrderSide side, std::optional<double> limit_price,
                                     double amount, const network::GatewayOrderReport& report) const {
    if (report.order_id.empty()) {
        throw ExchangeGatewayError("Gateway acknowledged an order without an id");
    }

    Order order;
    order.order_id = report.order_id;
    order.exchange = gateway_->name();
    order.market = base;
    order.side = side;
    order.limit_price = limit_price;
    order.on_hold = amount;
    order.status = OrderStatus::OPEN;
    order.time_created = (report.time_created > 0)
        ? report.time_created
        : (current_candle_ ? current_candle_->timestamp : 0LL);
    order.is_taker = report.is_taker;
    return order;
}

} // namespace execution
} // namespace candlebot
