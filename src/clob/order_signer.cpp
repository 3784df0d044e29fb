#include "clob/order_signer.hpp"

#include <nlohmann/json.hpp>

#include <utility>

namespace clob {

RemoteOrderSigner::RemoteOrderSigner(const HttpClient& http_client, std::string url)
    : http_client_(http_client),
      url_(std::move(url)) {}

std::string RemoteOrderSigner::sign(const OrderRequest& request) const {
    nlohmann::json payload;
    payload["token_id"] = request.token_id;
    payload["side"] = request.side;
    payload["price"] = request.price;
    payload["size"] = request.size;

    const std::vector<std::pair<std::string, std::string>> headers = {
        {"Content-Type", "application/json"}
    };
    auto response = http_client_.request("POST", url_, headers, payload.dump());
    if (response.body.empty()) {
        throw HttpError("Order signer returned an empty payload", response.status_code);
    }
    return std::move(response.body);
}

} // namespace clob
