#pragma once

#include <optional>
#include <string>

#include "common/Types.h"

namespace candlebot {
namespace network {

struct GatewayOrderRequest {
    std::string market;
    OrderSide side = OrderSide::BUY;
    std::optional<double> limit_price;  // nullopt => market order
    double amount = 0.0;                // quote for BUY, base for SELL
};

struct GatewayOrderReport {
    std::string order_id;
    std::string status;         // exchange status ("new", "filled", "cancelled", ...)
    long long time_created = 0;
    bool is_taker = false;

    // Settled amounts, net of exchange fees. Only meaningful once filled.
    double filled_base = 0.0;   // base bought (BUY) or sold (SELL)
    double filled_quote = 0.0;  // quote spent (BUY) or received (SELL)
};

// Boundary to a real exchange. Implementations own their own transport,
// authentication, timeouts and retries, and report failures as ExchangeGatewayError.
class IExchangeGateway {
public:
    virtual ~IExchangeGateway() = default;

    virtual std::string name() const = 0;

    virtual GatewayOrderReport placeOrder(const GatewayOrderRequest& request) = 0;
    virtual GatewayOrderReport cancelOrder(const std::string& market, const std::string& order_id) = 0;
    virtual GatewayOrderReport getOrder(const std::string& market, const std::string& order_id) = 0;
};

} // namespace network
} // namespace candlebot
