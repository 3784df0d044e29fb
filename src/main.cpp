#include "clob/clob_client.hpp"
#include "clob/http_client.hpp"
#include "clob/order_signer.hpp"
#include "strategy/clob_exchange.hpp"
#include "strategy/config.hpp"
#include "strategy/fill_tracker.hpp"
#include "strategy/log.hpp"
#include "strategy/market_maker.hpp"
#include "strategy/notifier.hpp"
#include "strategy/scheduler.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_signal(int) {
    g_stop_requested.store(true);
}

} // namespace

int main() {
    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    strategy::load_env_file(".env");

    strategy::EngineConfig config;
    try {
        config = strategy::load_engine_config_from_env();
    } catch (const strategy::ConfigError& ex) {
        std::cerr << "[Config] " << ex.what() << std::endl;
        return 1;
    }

    clob::HttpClientOptions http_options;
    http_options.pool_size = config.http_pool_size;
    http_options.retry.max_retries = config.http_max_retries;
    http_options.on_retry = [](const std::string& line) { strategy::log_error("Http") << line; };
    clob::HttpClient http{http_options};

    const clob::Credentials credentials{config.proxy_address, config.api_key, config.api_secret, config.api_passphrase};
    clob::ClobClient clob_client{credentials, http, config.clob_host};
    clob::DataClient data_client{http, config.data_api_host};

    std::unique_ptr<clob::RemoteOrderSigner> signer;
    if (!config.dry_run()) {
        signer = std::make_unique<clob::RemoteOrderSigner>(http, config.signer_url);
    } else {
        std::cout << "[Config] ORDER_SIGNER_URL not set, running dry: orders are logged, not sent" << std::endl;
    }

    strategy::ClobExchange exchange{clob_client, data_client, config.proxy_address, signer.get()};

    try {
        const double cash = exchange.get_free_cash();
        const auto timings = clob_client.last_request_timings();
        std::cout << "CLOB connectivity check -> free cash: $" << cash << std::endl;
        std::cout << "REST latency: total=" << timings.total_ms << " ms"
                  << ", connect=" << timings.connect_ms << " ms"
                  << ", tls=" << timings.app_connect_ms << " ms" << std::endl;
    } catch (const std::exception& ex) {
        std::cerr << "[Config] Connectivity check failed: " << ex.what() << std::endl;
        return 1;
    }

    strategy::LogNotifier notifier;
    strategy::FillTracker fills;
    strategy::MarketMaker market_maker{exchange, notifier, fills, config.quoting};
    strategy::JsonMarketsConfig markets{config.markets_config_path};

    strategy::SchedulerOptions options;
    options.interval = std::chrono::seconds(config.scan_interval_sec);
    options.alert_after_failures = config.alert_after_failures;
    options.wallet = config.proxy_address;

    strategy::MarketScheduler scheduler{markets, market_maker, notifier, options};
    scheduler.run(&g_stop_requested);

    return 0;
}
