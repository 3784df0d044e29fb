#include "strategy/json_util.hpp"

#include <cmath>
#include <stdexcept>

namespace strategy {

std::optional<double> parse_double(const nlohmann::json& value) {
    if (value.is_number()) {
        const double number = value.get<double>();
        return std::isfinite(number) ? std::optional<double>(number) : std::nullopt;
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        try {
            std::size_t consumed = 0;
            const double number = std::stod(text, &consumed);
            if (consumed != text.size() || !std::isfinite(number)) {
                return std::nullopt;
            }
            return number;
        } catch (const std::logic_error&) {
            return std::nullopt;
        }
    }
    return std::nullopt;
}

long long parse_id_optional(const nlohmann::json& value) {
    if (value.is_null()) {
        return 0;
    }
    if (value.is_string()) {
        try {
            return std::stoll(value.get<std::string>());
        } catch (const std::logic_error&) {
            return 0;
        }
    }
    if (value.is_number_integer()) {
        return value.get<long long>();
    }
    if (value.is_number_float()) {
        return static_cast<long long>(value.get<double>());
    }
    return 0;
}

std::string parse_string_optional(const nlohmann::json& value) {
    if (value.is_null()) {
        return {};
    }
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number_float()) {
        return std::to_string(value.get<double>());
    }
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return {};
}

std::string get_string_optional(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) {
        return {};
    }
    return parse_string_optional(obj.at(key));
}

std::optional<double> get_double(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) {
        return std::nullopt;
    }
    return parse_double(obj.at(key));
}

bool get_bool_optional(const nlohmann::json& obj, const char* key, bool default_value) {
    if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null()) {
        return default_value;
    }
    const auto& value = obj.at(key);
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_number_integer()) {
        return value.get<int>() != 0;
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        return text == "true" || text == "1";
    }
    return default_value;
}

long long get_id_optional(const nlohmann::json& obj, const char* key, long long default_value) {
    if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null()) {
        return default_value;
    }
    return parse_id_optional(obj.at(key));
}

} // namespace strategy
