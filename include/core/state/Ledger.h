#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.h"

namespace candlebot {

namespace execution {
class SimulatedExecutionClient;
class LiveExecutionClient;
}

namespace core {

// Balances and order book-keeping for one base/quote pair.
//
// Invariant (checked by isConsistent):
//   quote_available + sum(on_hold of open BUY)  == total_quote
//   base_available  + sum(on_hold of open SELL) == total_base
//
// Only addOrder is public; every other mutation goes through an execution client.
class Ledger {
public:
    Ledger(std::string base, double total_base, double total_quote);

    const std::string& base() const { return base_; }
    double totalBase() const { return total_base_; }
    double totalQuote() const { return total_quote_; }
    double quoteAvailable() const { return quote_available_; }
    double baseAvailable() const { return base_available_; }
    int numberOfTransactions() const { return number_of_transactions_; }

    // Snapshots, in insertion order (filled/cancelled: in the order they became terminal)
    std::vector<Order> buyOrders() const;
    std::vector<Order> sellOrders() const;
    std::vector<Order> openOrders() const;
    std::vector<Order> filledOrders() const;
    std::vector<Order> cancelledOrders() const;
    const std::vector<Order>& orders() const { return orders_; }

    const Order* findOrder(const std::string& order_id) const;

    double totalValueInQuote(double price) const {
        return total_quote_ + total_base_ * price;
    }

    bool isConsistent(double tolerance = 1e-9) const;

    // Seeds an already-open order (e.g. one restored from the exchange) and reserves its on_hold.
    void addOrder(const Order& order);

    nlohmann::json toJson() const;
    static Ledger fromJson(const nlohmann::json& j);

private:
    friend class ::candlebot::execution::SimulatedExecutionClient;
    friend class ::candlebot::execution::LiveExecutionClient;

    void insertOpenOrder(const Order& order);
    void recordImmediateFill(const Order& order, double base_delta, double quote_delta);
    void settleFill(const std::string& order_id, double received);
    void releaseOrder(const std::string& order_id);

    Order& orderAt(const std::string& order_id);
    std::vector<Order> collect(const std::vector<std::string>& ids) const;
    static void eraseId(std::vector<std::string>& ids, const std::string& order_id);

    std::string base_;
    double total_base_;
    double total_quote_;
    double quote_available_;
    double base_available_;
    int number_of_transactions_ = 0;

    std::vector<Order> orders_;                         // append-only
    std::unordered_map<std::string, size_t> index_;     // order_id -> position in orders_
    std::vector<std::string> buy_order_ids_;
    std::vector<std::string> sell_order_ids_;
    std::vector<std::string> filled_order_ids_;
    std::vector<std::string> cancelled_order_ids_;
};

} // namespace core
} // namespace candlebot
