#include "strategy/config.hpp"

#include "strategy/json_util.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <utility>

namespace strategy {
namespace {

std::string trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

std::string require_env(const char* name) {
    const auto value = env_or(name, "");
    if (value.empty()) {
        throw ConfigError(std::string("Missing required environment variable ") + name);
    }
    return value;
}

double env_double(const char* name, double fallback, double min_value) {
    const auto text = env_or(name, "");
    if (text.empty()) {
        return fallback;
    }
    const auto value = parse_double(nlohmann::json(text));
    if (!value || *value < min_value) {
        throw ConfigError(std::string("Invalid value for ") + name + ": " + text);
    }
    return *value;
}

long env_long(const char* name, long fallback, long min_value) {
    const auto text = env_or(name, "");
    if (text.empty()) {
        return fallback;
    }
    try {
        std::size_t consumed = 0;
        const long value = std::stol(text, &consumed);
        if (consumed != text.size() || value < min_value) {
            throw ConfigError(std::string("Invalid value for ") + name + ": " + text);
        }
        return value;
    } catch (const std::logic_error&) {
        throw ConfigError(std::string("Invalid value for ") + name + ": " + text);
    }
}

MarketConfig parse_market_entry(const nlohmann::json& entry, std::size_t index) {
    const auto where = "markets[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        throw ConfigError(where + " is not an object");
    }

    MarketConfig market;
    market.enabled = get_bool_optional(entry, "enabled", false);
    market.market_id = get_string_optional(entry, "market_id");
    market.name = get_string_optional(entry, "name");
    market.yes_token_id = get_string_optional(entry, "yes_token_id");
    market.no_token_id = get_string_optional(entry, "no_token_id");

    const auto side = get_string_optional(entry, "trade_side");
    if (side.empty() || side == "no" || side == "NO") {
        market.trade_side = Outcome::No;
    } else if (side == "yes" || side == "YES") {
        market.trade_side = Outcome::Yes;
    } else {
        throw ConfigError(where + ": unknown trade_side '" + side + "'");
    }

    if (entry.contains("max_position_value")) {
        const auto max_value = parse_double(entry.at("max_position_value"));
        if (!max_value || *max_value < 0.0) {
            throw ConfigError(where + ": max_position_value must be a non-negative number");
        }
        market.max_position_value = *max_value;
    }

    if (market.market_id.empty()) {
        throw ConfigError(where + ": market_id is required");
    }
    if (market.token_id().empty()) {
        throw ConfigError(where + ": token id for trade_side '" + to_string(market.trade_side) + "' is required");
    }
    if (market.name.empty()) {
        market.name = market.market_id.substr(0, 16);
    }
    return market;
}

} // namespace

void load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, pos));
        auto value = trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
        }
    }
}

EngineConfig load_engine_config_from_env() {
    EngineConfig config;
    config.clob_host = env_or("CLOB_HOST", config.clob_host);
    config.data_api_host = env_or("DATA_API_HOST", config.data_api_host);
    config.proxy_address = require_env("PROXY_ADDRESS");
    config.api_key = require_env("CLOB_API_KEY");
    config.api_secret = require_env("CLOB_API_SECRET");
    config.api_passphrase = require_env("CLOB_API_PASSPHRASE");
    config.signer_url = env_or("ORDER_SIGNER_URL", "");
    config.markets_config_path = env_or("MARKETS_CONFIG", config.markets_config_path);

    config.scan_interval_sec = static_cast<int>(env_long("SCAN_INTERVAL_SEC", config.scan_interval_sec, 1));
    config.alert_after_failures = static_cast<int>(env_long("ALERT_AFTER_FAILURES", config.alert_after_failures, 1));
    config.http_max_retries = static_cast<int>(env_long("HTTP_MAX_RETRIES", config.http_max_retries, 0));
    config.http_pool_size = env_long("HTTP_POOL_SIZE", config.http_pool_size, 1);

    config.quoting.min_profit = env_double("MIN_PROFIT", config.quoting.min_profit, 0.0);
    config.quoting.min_order_value = env_double("MIN_ORDER_VALUE", config.quoting.min_order_value, 0.01);
    config.quoting.max_buy_order_value =
        env_double("MAX_BUY_ORDER_VALUE", config.quoting.max_buy_order_value, config.quoting.min_order_value);
    return config;
}

std::vector<MarketConfig> parse_markets_config(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("markets") || !document.at("markets").is_array()) {
        throw ConfigError("markets config must be an object with a 'markets' array");
    }

    std::vector<MarketConfig> markets;
    const auto& entries = document.at("markets");
    for (std::size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries.at(i);
        // Disabled entries are not validated; a half-filled draft must not stop the rest.
        if (entry.is_object() && !get_bool_optional(entry, "enabled", false)) {
            continue;
        }
        markets.push_back(parse_market_entry(entry, i));
    }
    return markets;
}

JsonMarketsConfig::JsonMarketsConfig(std::filesystem::path path)
    : path_(std::move(path)) {}

std::vector<MarketConfig> JsonMarketsConfig::load_enabled_markets() {
    std::ifstream input(path_);
    if (!input.is_open()) {
        throw ConfigError("Cannot open markets config " + path_.string());
    }

    nlohmann::json document;
    try {
        input >> document;
    } catch (const nlohmann::json::parse_error& ex) {
        throw ConfigError("Malformed markets config " + path_.string() + ": " + ex.what());
    }

    return parse_markets_config(document);
}

} // namespace strategy
