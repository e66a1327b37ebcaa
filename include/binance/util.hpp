#pragma once

#include <string>
#include <utility>
#include <vector>

namespace binance {

using QueryParams = std::vector<std::pair<std::string, std::string>>;

std::string url_encode(const std::string& value);

QueryParams filter_empty(const QueryParams& params);

std::string build_query_string(const QueryParams& params);

std::string to_upper_copy(std::string value);
std::string to_lower_copy(std::string value);

// Number of decimals implied by an exchange step such as "0.0010".
int precision_from_step(double step);

// Rounds to the nearest multiple of step; step <= 0 returns value unchanged.
double round_to_step(double value, double step);
double floor_to_step(double value, double step);

std::string format_decimal(double value, int precision);

} // namespace binance
