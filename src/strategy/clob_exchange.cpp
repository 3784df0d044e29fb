#include "strategy/clob_exchange.hpp"

#include "clob/util.hpp"
#include "strategy/json_util.hpp"
#include "strategy/log.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <utility>

namespace strategy {
namespace {

constexpr const char* kEndCursor = "LTE=";
constexpr int kMaxOrderPages = 20;
constexpr double kMinHoldingSize = 0.01;

std::vector<BookLevel> parse_book_side(const nlohmann::json& json, const char* key) {
    std::vector<BookLevel> levels;
    if (!json.contains(key) || !json.at(key).is_array()) {
        return levels;
    }

    for (const auto& entry : json.at(key)) {
        const auto price = get_double(entry, "price");
        const auto size = get_double(entry, "size");
        if (!price || !size || *price <= 0.0 || *size < 0.0) {
            log_error("Exchange") << "Dropping malformed " << key << " level: " << entry.dump();
            continue;
        }
        if (*size == 0.0) {
            continue;
        }
        levels.push_back(BookLevel{*price, *size});
    }
    return levels;
}

std::optional<OwnOrder> parse_own_order(const nlohmann::json& entry) {
    OwnOrder order;
    order.id = get_string_optional(entry, "id");
    order.asset_id = get_string_optional(entry, "asset_id");
    const auto side = clob::to_upper_copy(get_string_optional(entry, "side"));
    const auto price = get_double(entry, "price");
    const auto original_size = get_double(entry, "original_size");
    const auto size_matched = get_double(entry, "size_matched");

    if (order.id.empty() || (side != "BUY" && side != "SELL") || !price || *price <= 0.0 ||
        !original_size || *original_size < 0.0) {
        return std::nullopt;
    }

    order.side = side == "BUY" ? OrderSide::Buy : OrderSide::Sell;
    order.price = *price;
    order.original_size = *original_size;
    order.size_matched = std::max(0.0, size_matched.value_or(0.0));
    order.created_at = get_id_optional(entry, "created_at", 0);
    return order;
}

} // namespace

OrderBookLevels parse_order_book(const nlohmann::json& json) {
    if (!json.is_object()) {
        throw ExchangeError("Order book response is not an object");
    }
    OrderBookLevels book;
    book.bids = parse_book_side(json, "bids");
    book.asks = parse_book_side(json, "asks");
    return book;
}

double parse_tick_size(const nlohmann::json& json) {
    std::optional<double> tick;
    if (json.is_object()) {
        tick = get_double(json, "minimum_tick_size");
    } else {
        tick = parse_double(json);
    }
    if (!tick || *tick <= 0.0 || *tick >= 1.0) {
        throw ExchangeError("Invalid tick size response: " + json.dump());
    }
    return *tick;
}

OpenOrdersPage parse_open_orders(const nlohmann::json& json) {
    OpenOrdersPage page;
    const nlohmann::json* entries = &json;
    if (json.is_object()) {
        if (!json.contains("data") || !json.at("data").is_array()) {
            throw ExchangeError("Open orders response missing data array");
        }
        entries = &json.at("data");
        page.next_cursor = get_string_optional(json, "next_cursor");
    } else if (!json.is_array()) {
        throw ExchangeError("Open orders response is neither an array nor a page");
    }

    for (const auto& entry : *entries) {
        auto order = parse_own_order(entry);
        if (!order) {
            log_error("Exchange") << "Dropping malformed open order: " << entry.dump();
            continue;
        }
        page.orders.push_back(std::move(*order));
    }
    return page;
}

std::vector<PositionRecord> parse_positions(const nlohmann::json& json) {
    if (!json.is_array()) {
        throw ExchangeError("Positions response is not an array");
    }

    std::vector<PositionRecord> records;
    for (const auto& entry : json) {
        const auto size = get_double(entry, "size");
        if (!size) {
            log_error("Exchange") << "Dropping position without size: " << entry.dump();
            continue;
        }
        PositionRecord record;
        record.asset_id = get_string_optional(entry, "asset");
        record.condition_id = get_string_optional(entry, "conditionId");
        record.title = get_string_optional(entry, "title");
        if (record.title.empty()) {
            record.title = record.condition_id;
        }
        record.position.size = *size;
        record.position.avg_price = get_double(entry, "avgPrice").value_or(0.0);
        record.position.current_value = get_double(entry, "currentValue").value_or(0.0);
        records.push_back(std::move(record));
    }
    return records;
}

double parse_collateral_balance(const nlohmann::json& json) {
    const auto raw = get_double(json, "balance");
    if (!raw) {
        throw ExchangeError("Balance response missing balance: " + json.dump());
    }
    // Collateral is reported in 6-decimal base units.
    return std::max(0.0, *raw / 1e6);
}

std::string parse_posted_order_id(const nlohmann::json& json) {
    const bool success = get_bool_optional(json, "success", true);
    const auto error = get_string_optional(json, "errorMsg");
    const auto order_id = get_string_optional(json, "orderID");
    if (!success || !error.empty() || order_id.empty()) {
        throw ExchangeError("Order rejected: " + (error.empty() ? json.dump() : error));
    }
    return order_id;
}

void check_cancel_response(const nlohmann::json& json, const std::string& order_id) {
    if (json.is_object() && json.contains("not_canceled") && json.at("not_canceled").is_object()) {
        const auto& refused = json.at("not_canceled");
        if (refused.contains(order_id)) {
            throw ExchangeError("Cancel of " + order_id + " refused: " + parse_string_optional(refused.at(order_id)));
        }
    }
}

double floor_order_size(double size) {
    return std::floor(size * 100.0 + 1e-9) / 100.0;
}

ClobExchange::ClobExchange(const clob::ClobClient& clob,
                           const clob::DataClient& data,
                           std::string funder_address,
                           const clob::OrderSigner* signer)
    : clob_(clob),
      data_(data),
      funder_address_(std::move(funder_address)),
      signer_(signer) {}

OrderBookLevels ClobExchange::get_order_book(const std::string& token_id) {
    return parse_order_book(nlohmann::json::parse(clob_.order_book(token_id)));
}

double ClobExchange::get_tick_size(const std::string& token_id) {
    return parse_tick_size(nlohmann::json::parse(clob_.tick_size(token_id)));
}

std::vector<OwnOrder> ClobExchange::get_open_orders(const std::string& market_id) {
    std::vector<OwnOrder> orders;
    std::string cursor;
    for (int page_count = 0; page_count < kMaxOrderPages; ++page_count) {
        auto page = parse_open_orders(nlohmann::json::parse(clob_.open_orders(market_id, cursor)));
        orders.insert(orders.end(),
                      std::make_move_iterator(page.orders.begin()),
                      std::make_move_iterator(page.orders.end()));
        if (page.next_cursor.empty() || page.next_cursor == kEndCursor || page.next_cursor == cursor) {
            return orders;
        }
        cursor = page.next_cursor;
    }
    throw ExchangeError("Open orders for " + market_id + " exceed " + std::to_string(kMaxOrderPages) + " pages");
}

void ClobExchange::cancel_order(const std::string& order_id) {
    if (dry_run()) {
        log_info("DryRun") << "cancel " << order_id;
        return;
    }
    try {
        check_cancel_response(nlohmann::json::parse(clob_.cancel_order(order_id)), order_id);
    } catch (const clob::HttpError& ex) {
        throw ExchangeError("Cancel of " + order_id + " failed: " + ex.what());
    } catch (const nlohmann::json::exception& ex) {
        throw ExchangeError("Cancel of " + order_id + " returned malformed JSON: " + ex.what());
    }
}

std::string ClobExchange::create_order(const std::string& token_id,
                                       OrderSide side,
                                       double price,
                                       double size) {
    const double rounded_size = floor_order_size(size);
    if (price <= 0.0 || price >= 1.0 || rounded_size <= 0.0) {
        throw ExchangeError("Refusing order with price " + std::to_string(price) +
                            " and size " + std::to_string(size));
    }

    if (dry_run()) {
        const auto id = "dry-" + std::to_string(dry_run_counter_.fetch_add(1, std::memory_order_relaxed) + 1);
        log_info("DryRun") << "create " << to_string(side) << " " << rounded_size << " @ " << price << " -> " << id;
        return id;
    }

    try {
        const clob::OrderRequest request{token_id, to_string(side), price, rounded_size};
        const auto signed_order = signer_->sign(request);
        return parse_posted_order_id(nlohmann::json::parse(clob_.post_order(signed_order)));
    } catch (const clob::HttpError& ex) {
        throw ExchangeError(std::string("Order placement failed: ") + ex.what());
    } catch (const nlohmann::json::exception& ex) {
        throw ExchangeError(std::string("Order placement returned malformed JSON: ") + ex.what());
    }
}

std::optional<Position> ClobExchange::get_position(const std::string& market_id,
                                                   const std::string& token_id) {
    const auto records = parse_positions(nlohmann::json::parse(data_.positions(funder_address_, market_id)));
    for (const auto& record : records) {
        if (record.asset_id == token_id) {
            return record.position;
        }
    }
    return std::nullopt;
}

std::vector<Holding> ClobExchange::get_holdings() {
    std::vector<Holding> holdings;
    for (const auto& record : parse_positions(nlohmann::json::parse(data_.positions(funder_address_)))) {
        if (record.position.size <= kMinHoldingSize) {
            continue;
        }
        holdings.push_back(Holding{record.title, record.asset_id, record.position.size, record.position.current_value});
    }
    return holdings;
}

double ClobExchange::get_free_cash() {
    return parse_collateral_balance(nlohmann::json::parse(clob_.collateral_balance()));
}

} // namespace strategy
