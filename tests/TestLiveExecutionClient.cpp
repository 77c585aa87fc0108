#include "execution/LiveExecutionClient.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <map>
#include <memory>

using namespace candlebot;

namespace {
bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

// Scripted exchange: every call returns whatever the test queued for it
class FakeGateway : public network::IExchangeGateway {
public:
    std::string name() const override { return "fake"; }

    network::GatewayOrderReport placeOrder(const network::GatewayOrderRequest& request) override {
        ++place_calls;
        last_request = request;
        if (fail_next) {
            fail_next = false;
            throw ExchangeGatewayError("connection reset");
        }
        network::GatewayOrderReport report = next_place;
        report.order_id = "ex-" + std::to_string(place_calls);
        return report;
    }

    network::GatewayOrderReport cancelOrder(const std::string&, const std::string& order_id) override {
        network::GatewayOrderReport report = next_cancel;
        report.order_id = order_id;
        return report;
    }

    network::GatewayOrderReport getOrder(const std::string&, const std::string& order_id) override {
        auto it = polled.find(order_id);
        if (it != polled.end()) {
            return it->second;
        }
        network::GatewayOrderReport report;
        report.order_id = order_id;
        report.status = "wait";
        return report;
    }

    int place_calls = 0;
    bool fail_next = false;
    network::GatewayOrderRequest last_request;
    network::GatewayOrderReport next_place;
    network::GatewayOrderReport next_cancel;
    std::map<std::string, network::GatewayOrderReport> polled;
};
}

int main() {
    // Limit buy acknowledged open, later reported filled
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto gateway = std::make_shared<FakeGateway>();
        execution::LiveExecutionClient client(ledger, gateway);
        assert(client.name() == "fake");

        gateway->next_place.status = "wait";
        gateway->next_place.time_created = 42;
        const Order order = client.placeLimitBuyOrder("BTC", 20000.0, 400.0);
        assert(order.status == OrderStatus::OPEN);
        assert(order.exchange == "fake");
        assert(order.time_created == 42);
        assert(gateway->last_request.limit_price.has_value());
        assert(near(ledger->quoteAvailable(), 600.0));
        assert(ledger->isConsistent());

        // Still open on the exchange
        client.updateState();
        assert(ledger->numberOfTransactions() == 0);

        network::GatewayOrderReport filled;
        filled.order_id = order.order_id;
        filled.status = "done";
        filled.filled_base = 0.01995;
        filled.filled_quote = 400.0;
        gateway->polled[order.order_id] = filled;

        client.updateState();
        assert(client.getOrderInfo(order).status == OrderStatus::FILLED);
        assert(near(ledger->totalBase(), 0.01995));
        assert(near(ledger->totalQuote(), 600.0));
        assert(ledger->numberOfTransactions() == 1);
        assert(ledger->isConsistent());
    }

    // Gateway failure leaves the ledger unchanged
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto gateway = std::make_shared<FakeGateway>();
        execution::LiveExecutionClient client(ledger, gateway);

        gateway->fail_next = true;
        bool thrown = false;
        try {
            client.placeLimitBuyOrder("BTC", 20000.0, 400.0);
        } catch (const ExchangeGatewayError&) {
            thrown = true;
        }
        assert(thrown);
        assert(ledger->orders().empty());
        assert(ledger->quoteAvailable() == 1000.0);

        // Balance is checked before the exchange is contacted
        thrown = false;
        try {
            client.placeLimitBuyOrder("BTC", 20000.0, 2000.0);
        } catch (const InsufficientBalanceError&) {
            thrown = true;
        }
        assert(thrown);

        // NaN amounts and prices fail the same check
        const double nan = std::nan("");
        auto expectInsufficient = [&](auto&& call) {
            bool rejected = false;
            try {
                call();
            } catch (const InsufficientBalanceError&) {
                rejected = true;
            }
            assert(rejected);
        };
        expectInsufficient([&] { client.placeLimitBuyOrder("BTC", 20000.0, nan); });
        expectInsufficient([&] { client.placeLimitBuyOrder("BTC", nan, 100.0); });
        expectInsufficient([&] { client.placeLimitSellOrder("BTC", 20000.0, nan); });
        expectInsufficient([&] { client.placeMarketBuyOrder("BTC", nan); });
        expectInsufficient([&] { client.placeMarketSellOrder("BTC", nan); });
        assert(gateway->place_calls == 1);
        assert(ledger->quoteAvailable() == 1000.0);
    }

    // Market order mirrors the reported amounts
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 0.0, 1000.0);
        auto gateway = std::make_shared<FakeGateway>();
        execution::LiveExecutionClient client(ledger, gateway);

        gateway->next_place.status = "filled";
        gateway->next_place.is_taker = true;
        gateway->next_place.filled_base = 0.0498;
        gateway->next_place.filled_quote = 1000.0;
        const Order order = client.placeMarketBuyOrder("BTC", 1000.0);
        assert(order.status == OrderStatus::FILLED);
        assert(!order.limit_price.has_value());
        assert(near(ledger->totalBase(), 0.0498));
        assert(near(ledger->totalQuote(), 0.0));
        assert(ledger->numberOfTransactions() == 1);

        // A market order the exchange leaves open is an error
        gateway->next_place.status = "wait";
        bool thrown = false;
        try {
            client.placeMarketSellOrder("BTC", 0.01);
        } catch (const ExchangeGatewayError&) {
            thrown = true;
        }
        assert(thrown);
        assert(ledger->orders().size() == 1);
    }

    // Cancel: confirmed, and filled-before-cancel
    {
        auto ledger = std::make_shared<core::Ledger>("BTC", 1.0, 0.0);
        auto gateway = std::make_shared<FakeGateway>();
        execution::LiveExecutionClient client(ledger, gateway);

        gateway->next_place.status = "new";
        const Order first = client.placeLimitSellOrder("BTC", 30000.0, 0.4);
        const Order second = client.placeLimitSellOrder("BTC", 31000.0, 0.4);
        assert(near(ledger->baseAvailable(), 0.2));

        gateway->next_cancel.status = "cancel";
        const Order cancelled = client.cancelOrder(first);
        assert(cancelled.status == OrderStatus::CANCELLED);
        assert(near(ledger->baseAvailable(), 0.6));

        gateway->next_cancel.status = "done";
        gateway->next_cancel.filled_base = 0.4;
        gateway->next_cancel.filled_quote = 12400.0;
        bool thrown = false;
        try {
            client.cancelOrder(second);
        } catch (const OrderNotCancellableError&) {
            thrown = true;
        }
        assert(thrown);
        assert(client.getOrderInfo(second).status == OrderStatus::FILLED);
        assert(near(ledger->totalBase(), 0.6));
        assert(near(ledger->totalQuote(), 12400.0));
        assert(ledger->isConsistent());
    }

    std::cout << "[TEST] LiveExecutionClient PASSED\n";
    return 0;
}
