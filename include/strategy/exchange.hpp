#pragma once

#include "strategy/types.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace strategy {

// A business-level rejection or an unusable response from the exchange.
class ExchangeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Everything the quoting engine needs from the venue. Implementations are called
// concurrently from one worker per market and must be thread-safe.
class Exchange {
public:
    virtual ~Exchange() = default;

    virtual OrderBookLevels get_order_book(const std::string& token_id) = 0;
    virtual double get_tick_size(const std::string& token_id) = 0;
    virtual std::vector<OwnOrder> get_open_orders(const std::string& market_id) = 0;

    virtual void cancel_order(const std::string& order_id) = 0;
    // Returns the exchange order id.
    virtual std::string create_order(const std::string& token_id,
                                     OrderSide side,
                                     double price,
                                     double size) = 0;

    // std::nullopt when nothing is held.
    virtual std::optional<Position> get_position(const std::string& market_id,
                                                 const std::string& token_id) = 0;
    virtual std::vector<Holding> get_holdings() = 0;
    virtual double get_free_cash() = 0;
};

} // namespace strategy
