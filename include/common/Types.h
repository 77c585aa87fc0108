#pragma once

#include <string>
#include <vector>
#include <optional>

namespace candlebot {

using Price = double;
using Amount = double;

enum class OrderSide { BUY, SELL };
enum class OrderStatus { OPEN, FILLED, CANCELLED };

// 주문 기록 - on_hold 는 생성 시점에 고정, status 만 변경됨
struct Order {
    std::string order_id;
    std::string exchange;
    std::string market;                 // base symbol (e.g. "BTC")
    OrderSide side = OrderSide::BUY;
    std::optional<Price> limit_price;   // nullopt => market order
    Amount on_hold = 0.0;               // quote for BUY, base for SELL
    OrderStatus status = OrderStatus::OPEN;
    long long time_created = 0;
    bool is_taker = false;

    bool isLimit() const { return limit_price.has_value(); }
    bool isOpen() const { return status == OrderStatus::OPEN; }
};

struct Candle {
    double open;
    double high;
    double low;
    double close;
    double volume;
    long long timestamp;    // epoch milliseconds

    Candle() : open(0), high(0), low(0), close(0), volume(0), timestamp(0) {}

    Candle(double o, double h, double l, double c, double v, long long t)
        : open(o), high(h), low(l), close(c), volume(v), timestamp(t) {}
};

constexpr long long kMillisPerMinute = 60LL * 1000LL;

} // namespace candlebot
