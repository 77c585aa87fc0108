#pragma once

#include <memory>
#include <optional>
#include <string>

#include "execution/IExecutionClient.h"
#include "core/state/OrderEventLog.h"

namespace candlebot {
namespace execution {

// Deterministic in-memory fill engine driven by OHLCV candles.
//  - limit BUY fills when candle.low  <= limit_price
//  - limit SELL fills when candle.high >= limit_price
//  - market orders fill at the current candle's open
// Fee is taken from the acquired asset: fee_market_order for taker orders, fee_limit_order otherwise.
class SimulatedExecutionClient : public IExecutionClient {
public:
    SimulatedExecutionClient(std::shared_ptr<core::Ledger> ledger,
                             double fee_limit_order,
                             double fee_market_order);

    std::string name() const override { return "backtest"; }
    const core::Ledger& state() const override { return *ledger_; }

    Order placeLimitBuyOrder(const std::string& base, double limit_price, double amount_in_quote) override;
    Order placeLimitSellOrder(const std::string& base, double limit_price, double amount_in_base) override;
    Order placeMarketBuyOrder(const std::string& base, double amount_in_quote) override;
    Order placeMarketSellOrder(const std::string& base, double amount_in_base) override;
    Order cancelOrder(const Order& order) override;
    Order getOrderInfo(const Order& order) const override;
    void setCurrentCandle(const Candle& candle) override;
    void updateState() override;

    // Optional placed/filled/cancelled record (JSONL artifact)
    void setEventLog(std::shared_ptr<core::OrderEventLog> event_log) { event_log_ = std::move(event_log); }

    double feeLimitOrder() const { return fee_limit_order_; }
    double feeMarketOrder() const { return fee_market_order_; }
    const std::optional<Candle>& currentCandle() const { return current_candle_; }

private:
    Order placeLimitOrder(const std::string& base, OrderSide side, double limit_price, double amount);
    Order placeMarketOrder(const std::string& base, OrderSide side, double amount);
    void requireMarket(const std::string& base) const;
    double feeFor(const Order& order) const;
    std::string nextOrderId();
    long long now() const;
    void record(const Order& order, const char* event, double price, double received);

    std::shared_ptr<core::Ledger> ledger_;
    double fee_limit_order_;
    double fee_market_order_;
    std::optional<Candle> current_candle_;
    std::shared_ptr<core::OrderEventLog> event_log_;
    long long order_seq_ = 0;
};

} // namespace execution
} // namespace candlebot
