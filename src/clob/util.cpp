#include "clob/util.hpp"

#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace clob {

std::string url_encode(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            escaped.push_back(static_cast<char>(c));
        } else {
            escaped.push_back('%');
            constexpr char hex_chars[] = "0123456789ABCDEF";
            escaped.push_back(hex_chars[(c >> 4) & 0x0F]);
            escaped.push_back(hex_chars[c & 0x0F]);
        }
    }
    return escaped;
}

QueryParams filter_empty(const QueryParams& params) {
    QueryParams filtered;
    filtered.reserve(params.size());
    for (const auto& [key, value] : params) {
        if (!value.empty()) {
            filtered.emplace_back(key, value);
        }
    }
    return filtered;
}

std::string build_query_string(const QueryParams& params) {
    const auto filtered = filter_empty(params);
    std::ostringstream oss;
    for (std::size_t i = 0; i < filtered.size(); ++i) {
        if (i != 0) {
            oss << '&';
        }
        oss << url_encode(filtered[i].first) << '=' << url_encode(filtered[i].second);
    }
    return oss.str();
}

std::string to_upper_copy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    return value;
}

std::string base64_encode(const std::string& data) {
    if (data.empty()) {
        return {};
    }
    std::string encoded(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("base64 encoding failed");
    }
    encoded.resize(static_cast<std::size_t>(written));
    return encoded;
}

std::string base64_decode(const std::string& encoded) {
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("base64 input length must be a multiple of 4");
    }
    std::string decoded(3 * encoded.size() / 4, '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(decoded.data()),
                                        reinterpret_cast<const unsigned char*>(encoded.data()),
                                        static_cast<int>(encoded.size()));
    if (written < 0) {
        throw std::invalid_argument("invalid base64 input");
    }

    // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
    std::size_t length = static_cast<std::size_t>(written);
    if (encoded[encoded.size() - 1] == '=') {
        --length;
    }
    if (encoded[encoded.size() - 2] == '=') {
        --length;
    }
    decoded.resize(length);
    return decoded;
}

std::string to_url_safe_base64(std::string encoded) {
    for (auto& ch : encoded) {
        if (ch == '+') {
            ch = '-';
        } else if (ch == '/') {
            ch = '_';
        }
    }
    return encoded;
}

std::string from_url_safe_base64(std::string encoded) {
    for (auto& ch : encoded) {
        if (ch == '-') {
            ch = '+';
        } else if (ch == '_') {
            ch = '/';
        }
    }
    while (encoded.size() % 4 != 0) {
        encoded.push_back('=');
    }
    return encoded;
}

} // namespace clob
