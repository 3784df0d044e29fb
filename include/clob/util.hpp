#pragma once

#include <string>
#include <utility>
#include <vector>

namespace clob {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

std::string url_encode(const std::string& value);

QueryParams filter_empty(const QueryParams& params);

std::string build_query_string(const QueryParams& params);

std::string to_upper_copy(std::string value);

// Standard (RFC 4648 section 4) base64 through OpenSSL's EVP block codec.
std::string base64_encode(const std::string& data);
std::string base64_decode(const std::string& encoded);

// Translates between the standard and the url-safe alphabet ('+/' <-> '-_'), padding kept.
std::string to_url_safe_base64(std::string encoded);
std::string from_url_safe_base64(std::string encoded);

} // namespace clob
