#pragma once

#include "clob/http_client.hpp"
#include "clob/util.hpp"

#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace clob {

// Level-2 API credentials plus the funder (proxy wallet) address they act for.
struct Credentials {
    std::string address;
    std::string api_key;
    std::string api_secret;
    std::string passphrase;

    [[nodiscard]] bool complete() const {
        return !address.empty() && !api_key.empty() && !api_secret.empty() && !passphrase.empty();
    }
};

using Headers = std::vector<std::pair<std::string, std::string>>;

// url-safe base64 of HMAC-SHA256(base64-decoded secret, timestamp + method + path + body).
std::string build_l2_signature(const std::string& secret,
                               long long timestamp,
                               const std::string& method,
                               const std::string& request_path,
                               const std::string& body);

class ClientBase {
public:
    ClientBase(Credentials credentials, std::string base_url, const HttpClient& http_client);

    [[nodiscard]] RequestTimings last_request_timings() const;
    [[nodiscard]] const std::string& base_url() const noexcept { return base_url_; }

protected:
    HttpResponse public_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {}) const;

    // The signature covers the path only; query parameters travel unsigned.
    HttpResponse authenticated_request(
        const std::string& method,
        const std::string& path,
        const QueryParams& params = {},
        const std::string& body = "") const;

    [[nodiscard]] const Credentials& credentials() const noexcept { return credentials_; }

private:
    Headers l2_headers(const std::string& method,
                       const std::string& path,
                       const std::string& body) const;
    std::string build_url(const std::string& path, const QueryParams& params) const;
    void remember_timings(const RequestTimings& timings) const;

    Credentials credentials_;
    std::string base_url_;
    const HttpClient& http_client_;
    mutable RequestTimings last_timings_;
    mutable std::mutex request_mutex_;
};

} // namespace clob
