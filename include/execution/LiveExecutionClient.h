#pragma once

#include <memory>
#include <optional>
#include <string>

#include "execution/IExecutionClient.h"
#include "network/IExchangeGateway.h"

namespace candlebot {
namespace execution {

// Forwards orders to an exchange gateway and mirrors the acknowledged results
// into the ledger. The gateway is always contacted before the ledger is touched,
// so a gateway failure leaves balances unchanged.
class LiveExecutionClient : public IExecutionClient {
public:
    LiveExecutionClient(std::shared_ptr<core::Ledger> ledger,
                        std::shared_ptr<network::IExchangeGateway> gateway);

    std::string name() const override { return gateway_->name(); }
    const core::Ledger& state() const override { return *ledger_; }

    Order placeLimitBuyOrder(const std::string& base, double limit_price, double amount_in_quote) override;
    Order placeLimitSellOrder(const std::string& base, double limit_price, double amount_in_base) override;
    Order placeMarketBuyOrder(const std::string& base, double amount_in_quote) override;
    Order placeMarketSellOrder(const std::string& base, double amount_in_base) override;
    Order cancelOrder(const Order& order) override;
    Order getOrderInfo(const Order& order) const override;
    void setCurrentCandle(const Candle& candle) override;
    void updateState() override;

private:
    Order placeLimitOrder(const std::string& base, OrderSide side, double limit_price, double amount);
    Order placeMarketOrder(const std::string& base, OrderSide side, double amount);
    void requireAvailable(const std::string& base, OrderSide side, double amount) const;
    void applyReport(const Order& order, const network::GatewayOrderReport& report);
    Order makeOrder(const std::string& base, OrderSide side, std::optional<double> limit_price,
                    double amount, const network::GatewayOrderReport& report) const;

    std::shared_ptr<core::Ledger> ledger_;
    std::shared_ptr<network::IExchangeGateway> gateway_;
    std::optional<Candle> current_candle_;
};

} // namespace execution
} // namespace candlebot
