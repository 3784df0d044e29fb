#include "clob/clob_client.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace clob {

ClobClient::ClobClient(Credentials credentials, const HttpClient& http_client, std::string base_url)
    : ClientBase(std::move(credentials), std::move(base_url), http_client) {}

std::string ClobClient::order_book(const std::string& token_id) const {
    QueryParams params = {{"token_id", token_id}};
    return public_request("GET", "/book", params).body;
}

std::string ClobClient::tick_size(const std::string& token_id) const {
    QueryParams params = {{"token_id", token_id}};
    return public_request("GET", "/tick-size", params).body;
}

std::string ClobClient::open_orders(const std::string& market_id, const std::string& next_cursor) const {
    QueryParams params = {
        {"market", market_id},
        {"next_cursor", next_cursor}
    };
    return authenticated_request("GET", "/data/orders", params).body;
}

std::string ClobClient::cancel_order(const std::string& order_id) const {
    nlohmann::json body;
    body["orderID"] = order_id;
    return authenticated_request("DELETE", "/order", {}, body.dump()).body;
}

std::string ClobClient::post_order(const std::string& signed_order) const {
    return authenticated_request("POST", "/order", {}, signed_order).body;
}

std::string ClobClient::collateral_balance(int signature_type) const {
    QueryParams params = {
        {"asset_type", "COLLATERAL"},
        {"signature_type", std::to_string(signature_type)}
    };
    return authenticated_request("GET", "/balance-allowance", params).body;
}

DataClient::DataClient(const HttpClient& http_client, std::string base_url)
    : ClientBase(Credentials{}, std::move(base_url), http_client) {}

std::string DataClient::positions(const std::string& user, std::optional<std::string> market_id) const {
    QueryParams params = {{"user", user}};
    if (market_id) {
        params.emplace_back("market", *market_id);
    }
    return public_request("GET", "/positions", params).body;
}

} // namespace clob
