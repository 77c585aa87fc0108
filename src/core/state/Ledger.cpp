#include "core/state/Ledger.h"
#include "core/execution/OrderLifecycleStateMachine.h"
#include "core/execution/OrderSchema.h"
#include "common/Errors.h"
#include "common/Logger.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <unordered_set>

namespace candlebot {
namespace core {

namespace {
constexpr int kLedgerSchemaVersion = 1;

nlohmann::json idsToJson(const std::vector<std::string>& ids) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& id : ids) {
        out.push_back(id);
    }
    return out;
}
}

Ledger::Ledger(std::string base, double total_base, double total_quote)
    : base_(std::move(base))
    , total_base_(total_base)
    , total_quote_(total_quote)
    , quote_available_(total_quote)
    , base_available_(total_base) {}

std::vector<Order> Ledger::buyOrders() const {
    return collect(buy_order_ids_);
}

std::vector<Order> Ledger::sellOrders() const {
    return collect(sell_order_ids_);
}

std::vector<Order> Ledger::openOrders() const {
    std::vector<Order> out;
    out.reserve(buy_order_ids_.size() + sell_order_ids_.size());
    for (const auto& order : orders_) {
        if (order.isOpen()) {
            out.push_back(order);
        }
    }
    return out;
}

std::vector<Order> Ledger::filledOrders() const {
    return collect(filled_order_ids_);
}

std::vector<Order> Ledger::cancelledOrders() const {
    return collect(cancelled_order_ids_);
}

const Order* Ledger::findOrder(const std::string& order_id) const {
    auto it = index_.find(order_id);
    if (it == index_.end()) {
        return nullptr;
    }
    return &orders_[it->second];
}

bool Ledger::isConsistent(double tolerance) const {
    double held_quote = 0.0;
    double held_base = 0.0;
    for (const auto& order : orders_) {
        if (!order.isOpen()) {
            continue;
        }
        if (order.side == OrderSide::BUY) {
            held_quote += order.on_hold;
        } else {
            held_base += order.on_hold;
        }
    }
    const double quote_scale = std::max(1.0, std::abs(total_quote_));
    const double base_scale = std::max(1.0, std::abs(total_base_));
    return std::abs(quote_available_ + held_quote - total_quote_) <= tolerance * quote_scale &&
           std::abs(base_available_ + held_base - total_base_) <= tolerance * base_scale;
}

void Ledger::addOrder(const Order& order) {
    insertOpenOrder(order);
    LOG_INFO("Seeded open order: id={}, side={}, on_hold={:.8f}",
             order.order_id, execution::orderSideToString(order.side), order.on_hold);
}

void Ledger::insertOpenOrder(const Order& order) {
    if (order.order_id.empty()) {
        throw std::invalid_argument("Order id must not be empty");
    }
    if (index_.count(order.order_id) > 0) {
        throw std::invalid_argument("Duplicate order id: " + order.order_id);
    }
    if (!order.isOpen()) {
        throw std::invalid_argument("Only open orders can be inserted: " + order.order_id);
    }
    if (!order.limit_price || !(*order.limit_price > 0.0) || !std::isfinite(*order.limit_price)) {
        throw InsufficientBalanceError("Open order requires a positive limit price: " + order.order_id);
    }

    const double available = (order.side == OrderSide::BUY) ? quote_available_ : base_available_;
    if (!(order.on_hold > 0.0 && order.on_hold <= available)) {
        throw InsufficientBalanceError(
            "Order " + order.order_id + " holds " + std::to_string(order.on_hold) +
            " but only " + std::to_string(available) + " is available"
        );
    }

    // Checks done; reservation and insertion below cannot fail halfway.
    orders_.push_back(order);
    index_[order.order_id] = orders_.size() - 1;
    if (order.side == OrderSide::BUY) {
        quote_available_ -= order.on_hold;
        buy_order_ids_.push_back(order.order_id);
    } else {
        base_available_ -= order.on_hold;
        sell_order_ids_.push_back(order.order_id);
    }
}

void Ledger::recordImmediateFill(const Order& order, double base_delta, double quote_delta) {
    if (index_.count(order.order_id) > 0) {
        throw std::invalid_argument("Duplicate order id: " + order.order_id);
    }

    orders_.push_back(order);
    orders_.back().status = OrderStatus::FILLED;
    index_[order.order_id] = orders_.size() - 1;
    filled_order_ids_.push_back(order.order_id);

    total_base_ += base_delta;
    base_available_ += base_delta;
    total_quote_ += quote_delta;
    quote_available_ += quote_delta;
    ++number_of_transactions_;
}

void Ledger::settleFill(const std::string& order_id, double received) {
    Order& order = orderAt(order_id);
    const auto transitioned = execution::OrderLifecycleStateMachine::transition(order.status, "filled");

    if (order.side == OrderSide::BUY) {
        total_quote_ -= order.on_hold;
        total_base_ += received;
        base_available_ += received;
        eraseId(buy_order_ids_, order_id);
    } else {
        total_base_ -= order.on_hold;
        total_quote_ += received;
        quote_available_ += received;
        eraseId(sell_order_ids_, order_id);
    }

    order.status = transitioned.status;
    filled_order_ids_.push_back(order_id);
    ++number_of_transactions_;
}

void Ledger::releaseOrder(const std::string& order_id) {
    Order& order = orderAt(order_id);
    const auto transitioned = execution::OrderLifecycleStateMachine::transition(order.status, "cancelled");

    if (order.side == OrderSide::BUY) {
        quote_available_ += order.on_hold;
        eraseId(buy_order_ids_, order_id);
    } else {
        base_available_ += order.on_hold;
        eraseId(sell_order_ids_, order_id);
    }

    order.status = transitioned.status;
    cancelled_order_ids_.push_back(order_id);
}

Order& Ledger::orderAt(const std::string& order_id) {
    auto it = index_.find(order_id);
    if (it == index_.end()) {
        throw OrderNotFoundError("Unknown order id: " + order_id);
    }
    return orders_[it->second];
}

std::vector<Order> Ledger::collect(const std::vector<std::string>& ids) const {
    std::vector<Order> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        out.push_back(orders_[index_.at(id)]);
    }
    return out;
}

void Ledger::eraseId(std::vector<std::string>& ids, const std::string& order_id) {
    ids.erase(std::remove(ids.begin(), ids.end(), order_id), ids.end());
}

nlohmann::json Ledger::toJson() const {
    nlohmann::json raw;
    raw["schema_version"] = kLedgerSchemaVersion;
    raw["base"] = base_;
    raw["total_base"] = total_base_;
    raw["total_quote"] = total_quote_;
    raw["number_of_transactions"] = number_of_transactions_;

    raw["orders"] = nlohmann::json::array();
    for (const auto& order : orders_) {
        raw["orders"].push_back(execution::toJson(order));
    }
    raw["buy_orders"] = idsToJson(buy_order_ids_);
    raw["sell_orders"] = idsToJson(sell_order_ids_);
    raw["filled_orders"] = idsToJson(filled_order_ids_);
    raw["cancelled_orders"] = idsToJson(cancelled_order_ids_);
    return raw;
}

Ledger Ledger::fromJson(const nlohmann::json& raw) {
    const int schema_version = raw.value("schema_version", kLedgerSchemaVersion);
    if (schema_version != kLedgerSchemaVersion) {
        throw std::invalid_argument("Unsupported ledger schema version: " + std::to_string(schema_version));
    }

    Ledger ledger(
        raw.at("base").get<std::string>(),
        raw.value("total_base", 0.0),
        raw.value("total_quote", 0.0)
    );
    ledger.number_of_transactions_ = raw.value("number_of_transactions", 0);

    for (const auto& line : raw.value("orders", nlohmann::json::array())) {
        Order order = execution::orderFromJson(line);
        if (ledger.index_.count(order.order_id) > 0) {
            throw std::invalid_argument("Duplicate order id in ledger file: " + order.order_id);
        }
        ledger.orders_.push_back(order);
        ledger.index_[order.order_id] = ledger.orders_.size() - 1;
    }

    std::unordered_set<std::string> listed;
    auto restore_ids = [&](const char* key, std::vector<std::string>& ids, OrderStatus expected,
                           const OrderSide* side) {
        for (const auto& id_json : raw.value(key, nlohmann::json::array())) {
            const auto id = id_json.get<std::string>();
            const Order* order = ledger.findOrder(id);
            if (order == nullptr || order->status != expected || (side && order->side != *side)) {
                throw std::invalid_argument(std::string("Inconsistent ledger collection '") + key + "': " + id);
            }
            if (!listed.insert(id).second) {
                throw std::invalid_argument(std::string("Order id listed twice in ledger collection '") + key + "': " + id);
            }
            ids.push_back(id);
        }
    };
    const OrderSide buy = OrderSide::BUY;
    const OrderSide sell = OrderSide::SELL;
    restore_ids("buy_orders", ledger.buy_order_ids_, OrderStatus::OPEN, &buy);
    restore_ids("sell_orders", ledger.sell_order_ids_, OrderStatus::OPEN, &sell);
    restore_ids("filled_orders", ledger.filled_order_ids_, OrderStatus::FILLED, nullptr);
    restore_ids("cancelled_orders", ledger.cancelled_order_ids_, OrderStatus::CANCELLED, nullptr);

    // 모든 open 주문은 buy_orders/sell_orders 중 하나에 있어야 함
    for (const auto& order : ledger.orders_) {
        if (order.isOpen() && listed.count(order.order_id) == 0) {
            throw std::invalid_argument("Open order missing from buy_orders/sell_orders: " + order.order_id);
        }
    }

    // Available balances are derived, never trusted from disk.
    ledger.quote_available_ = ledger.total_quote_;
    ledger.base_available_ = ledger.total_base_;
    for (const auto& id : ledger.buy_order_ids_) {
        ledger.quote_available_ -= ledger.findOrder(id)->on_hold;
    }
    for (const auto& id : ledger.sell_order_ids_) {
        ledger.base_available_ -= ledger.findOrder(id)->on_hold;
    }
    if (!(ledger.quote_available_ >= 0.0) || !(ledger.base_available_ >= 0.0)) {
        throw std::invalid_argument(
            "Ledger file holds more than its totals: quote_available=" + std::to_string(ledger.quote_available_) +
            ", base_available=" + std::to_string(ledger.base_available_)
        );
    }
    return ledger;
}

} // namespace core
} // namespace candlebot
