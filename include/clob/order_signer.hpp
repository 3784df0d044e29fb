#pragma once

#include "clob/http_client.hpp"

#include <string>

namespace clob {

struct OrderRequest {
    std::string token_id;
    std::string side;   // "BUY" or "SELL"
    double price = 0.0;
    double size = 0.0;
};

// Produces the signed order payload accepted by POST /order. Signing keys never
// enter this process; implementations delegate to whatever holds them.
class OrderSigner {
public:
    virtual ~OrderSigner() = default;
    virtual std::string sign(const OrderRequest& request) const = 0;
};

// Delegates to a signing sidecar over HTTP: POST {token_id, side, price, size},
// response body is the signed payload verbatim.
class RemoteOrderSigner : public OrderSigner {
public:
    RemoteOrderSigner(const HttpClient& http_client, std::string url);

    std::string sign(const OrderRequest& request) const override;

private:
    const HttpClient& http_client_;
    std::string url_;
};

} // namespace clob
