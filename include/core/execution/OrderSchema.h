#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace candlebot {
namespace core {
namespace execution {

inline const char* orderStatusToString(OrderStatus status) {
    switch (status) {
        case OrderStatus::OPEN: return "open";
        case OrderStatus::FILLED: return "filled";
        case OrderStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

inline const char* orderSideToString(OrderSide side) {
    return (side == OrderSide::BUY) ? "buy" : "sell";
}

inline OrderStatus orderStatusFromString(const std::string& value) {
    if (value == "filled") return OrderStatus::FILLED;
    if (value == "cancelled") return OrderStatus::CANCELLED;
    return OrderStatus::OPEN;
}

inline OrderSide orderSideFromString(const std::string& value) {
    return (value == "sell") ? OrderSide::SELL : OrderSide::BUY;
}

inline nlohmann::json toJson(const Order& order) {
    nlohmann::json line;
    line["order_id"] = order.order_id;
    line["exchange"] = order.exchange;
    line["market"] = order.market;
    line["side"] = orderSideToString(order.side);
    if (order.limit_price) {
        line["limit_price"] = *order.limit_price;
    } else {
        line["limit_price"] = nullptr;
    }
    line["on_hold"] = order.on_hold;
    line["status"] = orderStatusToString(order.status);
    line["time_created"] = order.time_created;
    line["is_taker"] = order.is_taker;
    return line;
}

inline Order orderFromJson(const nlohmann::json& line) {
    Order order;
    order.order_id = line.at("order_id").get<std::string>();
    order.exchange = line.value("exchange", std::string());
    order.market = line.value("market", std::string());
    order.side = orderSideFromString(line.value("side", std::string("buy")));
    if (line.contains("limit_price") && !line["limit_price"].is_null()) {
        order.limit_price = line["limit_price"].get<double>();
    }
    order.on_hold = line.value("on_hold", 0.0);
    order.status = orderStatusFromString(line.value("status", std::string("open")));
    order.time_created = line.value("time_created", 0LL);
    order.is_taker = line.value("is_taker", false);
    return order;
}

} // namespace execution
} // namespace core
} // namespace candlebot
