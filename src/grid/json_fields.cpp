#include "grid/json_fields.hpp"

namespace grid {

double parse_double_optional(const nlohmann::json& value) {
    if (value.is_null()) {
        return 0.0;
    }
    if (value.is_string()) {
        try {
            return std::stod(value.get<std::string>());
        } catch (...) {
            return 0.0;
        }
    }
    if (value.is_number()) {
        return value.get<double>();
    }
    return 0.0;
}

long long parse_id_optional(const nlohmann::json& value) {
    if (value.is_null()) {
        return 0;
    }
    if (value.is_string()) {
        try {
            return std::stoll(value.get<std::string>());
        } catch (...) {
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
    if (value.is_number_integer()) {
        return std::to_string(value.get<long long>());
    }
    if (value.is_number_float()) {
        return std::to_string(value.get<double>());
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return {};
}

double get_double_optional(const nlohmann::json& obj, const char* key, double default_value) {
    if (!obj.is_object() || !obj.contains(key) || obj.at(key).is_null()) {
        return default_value;
    }
    return parse_double_optional(obj.at(key));
}

std::string get_string_optional(const nlohmann::json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) {
        return {};
    }
    return parse_string_optional(obj.at(key));
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

} // namespace grid
