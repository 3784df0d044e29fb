#pragma once

#include "strategy/quote_sizing.hpp"
#include "strategy/types.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace strategy {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct EngineConfig {
    std::string clob_host = "https://clob.polymarket.com";
    std::string data_api_host = "https://data-api.polymarket.com";
    std::string proxy_address;
    std::string api_key;
    std::string api_secret;
    std::string api_passphrase;
    std::string signer_url;            // empty: dry-run, no order mutations are sent
    std::string markets_config_path = "markets_config.json";
    int scan_interval_sec = 10;
    int alert_after_failures = 50;
    int http_max_retries = 3;
    long http_pool_size = 50;
    QuotingParams quoting;

    [[nodiscard]] bool dry_run() const { return signer_url.empty(); }
};

// KEY=VALUE lines, '#' comments, optional surrounding double quotes. Existing
// environment variables are overwritten. A missing file is not an error.
void load_env_file(const std::string& path);

// Throws ConfigError for missing credentials or malformed numeric settings.
EngineConfig load_engine_config_from_env();

// Source of the market list, consulted at the start of every round.
class MarketConfigSource {
public:
    virtual ~MarketConfigSource() = default;
    virtual std::vector<MarketConfig> load_enabled_markets() = 0;
};

// Returns the enabled entries of {"markets": [...]}. Disabled entries are skipped
// unvalidated; throws ConfigError on the first bad enabled one.
std::vector<MarketConfig> parse_markets_config(const nlohmann::json& document);

class JsonMarketsConfig : public MarketConfigSource {
public:
    explicit JsonMarketsConfig(std::filesystem::path path);

    std::vector<MarketConfig> load_enabled_markets() override;

private:
    std::filesystem::path path_;
};

} // namespace strategy
