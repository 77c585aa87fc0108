#include "core/state/Ledger.h"
#include "common/Errors.h"

#include <cassert>
#include <cmath>
#include <iostream>
#include <stdexcept>

using namespace candlebot;

namespace {
bool near(double a, double b) {
    return std::abs(a - b) < 1e-9;
}

Order openOrder(const std::string& id, OrderSide side, double limit_price, double on_hold) {
    Order order;
    order.order_id = id;
    order.exchange = "bitvavo";
    order.market = "BTC";
    order.side = side;
    order.limit_price = limit_price;
    order.on_hold = on_hold;
    order.status = OrderStatus::OPEN;
    order.time_created = 1700000000000LL;
    return order;
}
}

int main() {
    // Fresh ledger: everything available
    {
        core::Ledger ledger("BTC", 0.1, 10000.0);
        assert(ledger.base() == "BTC");
        assert(near(ledger.quoteAvailable(), 10000.0));
        assert(near(ledger.baseAvailable(), 0.1));
        assert(ledger.openOrders().empty());
        assert(ledger.numberOfTransactions() == 0);
        assert(near(ledger.totalValueInQuote(50000.0), 15000.0));
        assert(ledger.isConsistent());
    }

    // addOrder reserves on_hold from the matching side
    {
        core::Ledger ledger("BTC", 0.1, 10000.0);
        ledger.addOrder(openOrder("buy-1", OrderSide::BUY, 20000.0, 2500.0));
        ledger.addOrder(openOrder("sell-1", OrderSide::SELL, 90000.0, 0.01));

        assert(near(ledger.quoteAvailable(), 7500.0));
        assert(near(ledger.totalQuote(), 10000.0));
        assert(near(ledger.baseAvailable(), 0.09));
        assert(near(ledger.totalBase(), 0.1));
        assert(ledger.buyOrders().size() == 1);
        assert(ledger.sellOrders().size() == 1);
        assert(ledger.openOrders().size() == 2);
        assert(ledger.orders().size() == 2);
        assert(ledger.isConsistent());

        const Order* found = ledger.findOrder("sell-1");
        assert(found != nullptr);
        assert(found->side == OrderSide::SELL);
        assert(ledger.findOrder("nope") == nullptr);
    }

    // Rejections leave the ledger unchanged
    {
        core::Ledger ledger("BTC", 0.0, 1000.0);
        ledger.addOrder(openOrder("buy-1", OrderSide::BUY, 20000.0, 400.0));

        bool thrown = false;
        try {
            ledger.addOrder(openOrder("buy-1", OrderSide::BUY, 20000.0, 100.0));
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            ledger.addOrder(openOrder("buy-2", OrderSide::BUY, 20000.0, 700.0));
        } catch (const InsufficientBalanceError&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            ledger.addOrder(openOrder("sell-1", OrderSide::SELL, 20000.0, 0.5));
        } catch (const InsufficientBalanceError&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        Order filled = openOrder("buy-3", OrderSide::BUY, 20000.0, 10.0);
        filled.status = OrderStatus::FILLED;
        try {
            ledger.addOrder(filled);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);

        assert(near(ledger.quoteAvailable(), 600.0));
        assert(ledger.orders().size() == 1);
        assert(ledger.isConsistent());
    }

    // JSON round trip
    {
        core::Ledger ledger("BTC", 0.1, 10000.0);
        ledger.addOrder(openOrder("buy-1", OrderSide::BUY, 20000.0, 2500.0));
        ledger.addOrder(openOrder("sell-1", OrderSide::SELL, 90000.0, 0.01));

        const auto restored = core::Ledger::fromJson(ledger.toJson());
        assert(restored.base() == "BTC");
        assert(near(restored.totalQuote(), 10000.0));
        assert(near(restored.quoteAvailable(), 7500.0));
        assert(near(restored.baseAvailable(), 0.09));
        assert(restored.buyOrders().size() == 1);
        assert(restored.sellOrders().size() == 1);
        assert(restored.orders().size() == 2);
        assert(restored.findOrder("buy-1")->limit_price.has_value());
        assert(near(*restored.findOrder("buy-1")->limit_price, 20000.0));
        assert(restored.isConsistent());
    }

    // A collection that disagrees with the order records is rejected
    {
        core::Ledger ledger("BTC", 0.1, 10000.0);
        ledger.addOrder(openOrder("buy-1", OrderSide::BUY, 20000.0, 2500.0));
        auto raw = ledger.toJson();
        raw["sell_orders"].push_back("buy-1");

        bool thrown = false;
        try {
            core::Ledger::fromJson(raw);
        } catch (const std::invalid_argument&) {
            thrown = true;
        }
        assert(thrown);
    }

    // Restored open orders must be exactly buy_orders + sell_orders, each listed once
    {
        core::Ledger ledger("BTC", 0.0, 1000.0);
        ledger.addOrder(openOrder("buy-1", OrderSide::BUY, 20000.0, 400.0));
        ledger.addOrder(openOrder("buy-2", OrderSide::BUY, 19000.0, 300.0));
        const auto raw = ledger.toJson();

        auto expect_rejected = [](const nlohmann::json& bad) {
            bool thrown = false;
            try {
                core::Ledger::fromJson(bad);
            } catch (const std::invalid_argument&) {
                thrown = true;
            }
            assert(thrown);
        };

        // open buy that is not listed in buy_orders
        auto unlisted = raw;
        unlisted["buy_orders"] = nlohmann::json::array({"buy-2"});
        expect_rejected(unlisted);

        // same id listed twice would reserve its on_hold twice
        auto repeated = raw;
        repeated["buy_orders"].push_back("buy-1");
        expect_rejected(repeated);

        // holds larger than the total
        auto overdrawn = raw;
        overdrawn["total_quote"] = 500.0;
        expect_rejected(overdrawn);

        const auto restored = core::Ledger::fromJson(raw);
        assert(near(restored.quoteAvailable(), 300.0));
        assert(restored.openOrders().size() == 2);
        assert(restored.isConsistent());
    }

    // NaN or infinite amounts and prices never reach the balances
    {
        core::Ledger ledger("BTC", 0.0, 1000.0);
        const double nan = std::nan("");

        bool thrown = false;
        try {
            ledger.addOrder(openOrder("buy-nan", OrderSide::BUY, 20000.0, nan));
        } catch (const InsufficientBalanceError&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            ledger.addOrder(openOrder("buy-nan-price", OrderSide::BUY, nan, 100.0));
        } catch (const InsufficientBalanceError&) {
            thrown = true;
        }
        assert(thrown);

        thrown = false;
        try {
            ledger.addOrder(openOrder("buy-inf-price", OrderSide::BUY, HUGE_VAL, 100.0));
        } catch (const InsufficientBalanceError&) {
            thrown = true;
        }
        assert(thrown);

        assert(near(ledger.quoteAvailable(), 1000.0));
        assert(ledger.orders().empty());
        assert(ledger.isConsistent());
    }

    std::cout << "[TEST] Ledger PASSED\n";
    return 0;
}
