#pragma once

#include <string>

#include "common/Types.h"
#include "core/state/Ledger.h"

namespace candlebot {
namespace execution {

// Capability set shared by the simulated and the live backend.
// Strategies depend on this interface only; the backend is picked at construction time.
class IExecutionClient {
public:
    virtual ~IExecutionClient() = default;

    // Exchange tag stamped on every order ("backtest" for the simulator)
    virtual std::string name() const = 0;

    // Read-only view of the ledger this client mutates
    virtual const core::Ledger& state() const = 0;

    virtual Order placeLimitBuyOrder(const std::string& base, double limit_price, double amount_in_quote) = 0;
    virtual Order placeLimitSellOrder(const std::string& base, double limit_price, double amount_in_base) = 0;
    virtual Order placeMarketBuyOrder(const std::string& base, double amount_in_quote) = 0;
    virtual Order placeMarketSellOrder(const std::string& base, double amount_in_base) = 0;

    // Returns the stored record after cancellation
    virtual Order cancelOrder(const Order& order) = 0;

    // Resolves by id; the result reflects the latest stored status even for a stale handle
    virtual Order getOrderInfo(const Order& order) const = 0;

    virtual void setCurrentCandle(const Candle& candle) = 0;

    // Reconciles open orders against the current candle / exchange
    virtual void updateState() = 0;
};

} // namespace execution
} // namespace candlebot
