#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace strategy {

// Lenient readers for exchange payloads that encode numbers as either JSON
// numbers or decimal strings. Unparseable input yields std::nullopt / defaults.
std::optional<double> parse_double(const nlohmann::json& value);
long long parse_id_optional(const nlohmann::json& value);
std::string parse_string_optional(const nlohmann::json& value);

std::string get_string_optional(const nlohmann::json& obj, const char* key);
std::optional<double> get_double(const nlohmann::json& obj, const char* key);
bool get_bool_optional(const nlohmann::json& obj, const char* key, bool default_value = false);
long long get_id_optional(const nlohmann::json& obj, const char* key, long long default_value = 0);

} // namespace strategy
