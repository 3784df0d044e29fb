#pragma once

#include "clob/clob_client.hpp"
#include "clob/order_signer.hpp"
#include "strategy/exchange.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace strategy {

struct OpenOrdersPage {
    std::vector<OwnOrder> orders;
    std::string next_cursor;
};

struct PositionRecord {
    std::string asset_id;
    std::string condition_id;
    std::string title;
    Position position;
};

// Response decoding. Malformed entries are dropped (and logged) here, at the
// ingestion boundary; mandatory fields that are missing raise ExchangeError.
OrderBookLevels parse_order_book(const nlohmann::json& json);
double parse_tick_size(const nlohmann::json& json);
OpenOrdersPage parse_open_orders(const nlohmann::json& json);
std::vector<PositionRecord> parse_positions(const nlohmann::json& json);
double parse_collateral_balance(const nlohmann::json& json);
std::string parse_posted_order_id(const nlohmann::json& json);
void check_cancel_response(const nlohmann::json& json, const std::string& order_id);

// Order sizes are sent in whole hundredths of a contract.
double floor_order_size(double size);

// Exchange adapter over the CLOB REST API and the data API. Without a signer it
// runs dry: every read is live, cancels and creates are only logged.
class ClobExchange : public Exchange {
public:
    ClobExchange(const clob::ClobClient& clob,
                 const clob::DataClient& data,
                 std::string funder_address,
                 const clob::OrderSigner* signer);

    OrderBookLevels get_order_book(const std::string& token_id) override;
    double get_tick_size(const std::string& token_id) override;
    std::vector<OwnOrder> get_open_orders(const std::string& market_id) override;

    void cancel_order(const std::string& order_id) override;
    std::string create_order(const std::string& token_id,
                             OrderSide side,
                             double price,
                             double size) override;

    std::optional<Position> get_position(const std::string& market_id,
                                         const std::string& token_id) override;
    std::vector<Holding> get_holdings() override;
    double get_free_cash() override;

    [[nodiscard]] bool dry_run() const noexcept { return signer_ == nullptr; }

private:
    const clob::ClobClient& clob_;
    const clob::DataClient& data_;
    std::string funder_address_;
    const clob::OrderSigner* signer_;
    std::atomic<std::uint64_t> dry_run_counter_{0};
};

} // namespace strategy
