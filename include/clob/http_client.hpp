#pragma once

#include <curl/curl.h>

#include <array>
#include <chrono>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace clob {

struct RequestTimings {
    double name_lookup_ms = 0.0;
    double connect_ms = 0.0;
    double app_connect_ms = 0.0;
    double pre_transfer_ms = 0.0;
    double start_transfer_ms = 0.0;
    double total_ms = 0.0;
};

struct HttpResponse {
    long status_code;
    std::string body;
    RequestTimings timings;
};

class HttpError : public std::runtime_error {
public:
    explicit HttpError(const std::string& message, long status_code = 0, bool transient = false)
        : std::runtime_error(message), status_code_(status_code), transient_(transient) {}

    [[nodiscard]] long status_code() const noexcept { return status_code_; }

    // Timeouts, dropped connections, 429 and the 5xx gateway family.
    [[nodiscard]] bool transient() const noexcept { return transient_; }

    // Requests made before giving up, retries included.
    [[nodiscard]] int attempts() const noexcept { return attempts_; }
    void set_attempts(int attempts) noexcept { attempts_ = attempts; }

private:
    long status_code_;
    bool transient_;
    int attempts_ = 1;
};

struct RetryPolicy {
    int max_retries = 3;
    std::chrono::milliseconds initial_backoff{500};
    double multiplier = 2.0;
    std::chrono::milliseconds max_backoff{4000};

    // Delay before retry number `retry` (1-based).
    [[nodiscard]] std::chrono::milliseconds backoff_for(int retry) const;
};

[[nodiscard]] bool is_retryable_status(long status_code);
[[nodiscard]] bool is_retryable_transport_error(CURLcode code);
[[nodiscard]] bool is_idempotent_method(const std::string& method);

// Receives one formatted line per scheduled retry. Unset means retries are silent.
using RetryLogger = std::function<void(const std::string&)>;

struct HttpClientOptions {
    RetryPolicy retry;
    RetryLogger on_retry;
    long pool_size = 50;
    long timeout_ms = 10000;
    long connect_timeout_ms = 5000;
};

// Thread-safe libcurl transport. Every request gets its own easy handle but all of
// them draw from one shared connection cache, DNS cache and TLS session cache.
class HttpClient {
public:
    explicit HttpClient(HttpClientOptions options = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    HttpClient(HttpClient&&) noexcept = delete;
    HttpClient& operator=(HttpClient&&) noexcept = delete;

    HttpResponse request(
        const std::string& method,
        const std::string& url,
        const std::vector<std::pair<std::string, std::string>>& headers = {},
        const std::string& body = ""
    ) const;

    [[nodiscard]] const HttpClientOptions& options() const noexcept { return options_; }

private:
    HttpResponse perform_once(
        const std::string& method,
        const std::string& url,
        const std::vector<std::pair<std::string, std::string>>& headers,
        const std::string& body) const;

    RequestTimings collect_timings(CURL* handle) const;

    static void lock_shared_data(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void unlock_shared_data(CURL* handle, curl_lock_data data, void* userptr);

    HttpClientOptions options_;
    bool global_initialized_;
    CURLSH* share_;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> share_mutexes_;
};

} // namespace clob
