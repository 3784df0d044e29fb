#pragma once

#include "clob/client_base.hpp"

#include <optional>
#include <string>

namespace clob {

// Thin REST wrapper over the central limit order book API. Every call returns the
// raw response body; decoding lives with the caller.
class ClobClient : public ClientBase {
public:
    ClobClient(Credentials credentials,
               const HttpClient& http_client,
               std::string base_url = "https://clob.polymarket.com");

    std::string order_book(const std::string& token_id) const;
    std::string tick_size(const std::string& token_id) const;

    std::string open_orders(const std::string& market_id,
                            const std::string& next_cursor = "") const;
    std::string cancel_order(const std::string& order_id) const;
    std::string post_order(const std::string& signed_order) const;

    std::string collateral_balance(int signature_type = 2) const;
};

// Holdings come from the separate data API, which needs no authentication.
class DataClient : public ClientBase {
public:
    explicit DataClient(const HttpClient& http_client,
                        std::string base_url = "https://data-api.polymarket.com");

    std::string positions(const std::string& user,
                          std::optional<std::string> market_id = std::nullopt) const;
};

} // namespace clob
