#include "clob/http_client.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <thread>
#include <utility>

namespace clob {
namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* buffer = static_cast<std::string*>(userp);
    buffer->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

} // namespace

std::chrono::milliseconds RetryPolicy::backoff_for(int retry) const {
    if (retry <= 0) {
        return std::chrono::milliseconds{0};
    }
    const double scaled = static_cast<double>(initial_backoff.count()) * std::pow(multiplier, retry - 1);
    const double capped = std::min(scaled, static_cast<double>(max_backoff.count()));
    return std::chrono::milliseconds{static_cast<long long>(capped)};
}

bool is_retryable_status(long status_code) {
    return status_code == 429 || status_code == 500 || status_code == 502 ||
           status_code == 503 || status_code == 504;
}

bool is_retryable_transport_error(CURLcode code) {
    switch (code) {
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_COULDNT_CONNECT:
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
            return true;
        default:
            return false;
    }
}

bool is_idempotent_method(const std::string& method) {
    return method == "GET" || method == "DELETE";
}

HttpClient::HttpClient(HttpClientOptions options)
    : options_(std::move(options)),
      global_initialized_(false),
      share_(nullptr) {
    const auto code = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (code != CURLE_OK) {
        throw HttpError("Failed to initialize libcurl: " + std::string(curl_easy_strerror(code)));
    }
    global_initialized_ = true;

    share_ = curl_share_init();
    if (!share_) {
        curl_global_cleanup();
        throw HttpError("Failed to create CURL share handle");
    }
    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &HttpClient::lock_shared_data);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &HttpClient::unlock_shared_data);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
}

HttpClient::~HttpClient() {
    if (share_) {
        curl_share_cleanup(share_);
    }
    if (global_initialized_) {
        curl_global_cleanup();
    }
}

void HttpClient::lock_shared_data(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    auto* self = static_cast<HttpClient*>(userptr);
    self->share_mutexes_.at(static_cast<std::size_t>(data)).lock();
}

void HttpClient::unlock_shared_data(CURL*, curl_lock_data data, void* userptr) {
    auto* self = static_cast<HttpClient*>(userptr);
    self->share_mutexes_.at(static_cast<std::size_t>(data)).unlock();
}

RequestTimings HttpClient::collect_timings(CURL* handle) const {
    RequestTimings timings;
    double value = 0.0;

    if (curl_easy_getinfo(handle, CURLINFO_NAMELOOKUP_TIME, &value) == CURLE_OK) {
        timings.name_lookup_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME, &value) == CURLE_OK) {
        timings.connect_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_APPCONNECT_TIME, &value) == CURLE_OK) {
        timings.app_connect_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_PRETRANSFER_TIME, &value) == CURLE_OK) {
        timings.pre_transfer_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_STARTTRANSFER_TIME, &value) == CURLE_OK) {
        timings.start_transfer_ms = value * 1000.0;
    }
    if (curl_easy_getinfo(handle, CURLINFO_TOTAL_TIME, &value) == CURLE_OK) {
        timings.total_ms = value * 1000.0;
    }

    return timings;
}

HttpResponse HttpClient::request(
    const std::string& method,
    const std::string& url,
    const std::vector<std::pair<std::string, std::string>>& headers,
    const std::string& body) const {
    const bool may_retry = is_idempotent_method(method);
    int retry = 0;

    while (true) {
        try {
            return perform_once(method, url, headers, body);
        } catch (HttpError& ex) {
            ex.set_attempts(retry + 1);
            if (!may_retry || !ex.transient() || retry >= options_.retry.max_retries) {
                throw;
            }
            ++retry;
            const auto delay = options_.retry.backoff_for(retry);
            if (options_.on_retry) {
                std::ostringstream line;
                line << method << ' ' << url << " failed (" << ex.what()
                     << "); retry " << retry << '/' << options_.retry.max_retries
                     << " in " << delay.count() << " ms";
                options_.on_retry(line.str());
            }
            std::this_thread::sleep_for(delay);
        }
    }
}

HttpResponse HttpClient::perform_once(
    const std::string& method,
    const std::string& url,
    const std::vector<std::pair<std::string, std::string>>& headers,
    const std::string& body) const {
    CURL* handle = curl_easy_init();
    if (!handle) {
        throw HttpError("Failed to create CURL easy handle");
    }

    std::string response_body;
    curl_easy_setopt(handle, CURLOPT_SHARE, share_);
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, options_.timeout_ms);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, options_.connect_timeout_ms);
    curl_easy_setopt(handle, CURLOPT_MAXCONNECTS, options_.pool_size);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPIDLE, 30L);
    curl_easy_setopt(handle, CURLOPT_TCP_KEEPINTVL, 15L);
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);

    struct curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, (header.first + ": " + header.second).c_str());
    }

    if (header_list) {
        curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);
    }

    if (!body.empty()) {
        curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    const auto perform_code = curl_easy_perform(handle);

    if (header_list) {
        curl_slist_free_all(header_list);
    }

    long status_code = 0;
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &status_code);

    if (perform_code != CURLE_OK) {
        curl_easy_cleanup(handle);
        throw HttpError("libcurl request failed: " + std::string(curl_easy_strerror(perform_code)),
                        0, is_retryable_transport_error(perform_code));
    }

    if (status_code >= 400) {
        curl_easy_cleanup(handle);
        throw HttpError("HTTP " + std::to_string(status_code) + ": " + response_body,
                        status_code, is_retryable_status(status_code));
    }

    HttpResponse response{status_code, std::move(response_body), collect_timings(handle)};
    curl_easy_cleanup(handle);
    return response;
}

} // namespace clob
