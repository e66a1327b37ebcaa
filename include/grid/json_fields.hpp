#pragma once

#include <nlohmann/json.hpp>

#include <string>

namespace grid {

// Lenient field readers for exchange payloads that send numbers as strings.
// Missing or malformed values fall back to a neutral default.
double parse_double_optional(const nlohmann::json& value);
long long parse_id_optional(const nlohmann::json& value);
std::string parse_string_optional(const nlohmann::json& value);

double get_double_optional(const nlohmann::json& obj, const char* key, double default_value = 0.0);
std::string get_string_optional(const nlohmann::json& obj, const char* key);
bool get_bool_optional(const nlohmann::json& obj, const char* key, bool default_value = false);
long long get_id_optional(const nlohmann::json& obj, const char* key, long long default_value = 0);

} // namespace grid
