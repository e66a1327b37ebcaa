#include "grid/protection_state_store.hpp"

#include <nlohmann/json.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace grid {
namespace {

nlohmann::json optional_time(const std::optional<TimePoint>& time) {
    return time ? nlohmann::json(format_iso8601(*time)) : nlohmann::json(nullptr);
}

std::optional<TimePoint> read_time(const nlohmann::json& json, const char* key) {
    if (!json.contains(key) || !json[key].is_string()) {
        return std::nullopt;
    }
    return parse_iso8601(json[key].get<std::string>());
}

template <typename T>
T json_value_or(const nlohmann::json& j, const char* key, T fallback) {
    if (!j.contains(key) || j[key].is_null()) {
        return fallback;
    }
    try {
        return j[key].get<T>();
    } catch (...) {
        return fallback;
    }
}

} // namespace

std::string format_iso8601(TimePoint time) {
    const std::time_t seconds = Clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<TimePoint> parse_iso8601(const std::string& text) {
    std::tm utc{};
    std::istringstream iss(text);
    iss >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) {
        return std::nullopt;
    }
    const std::time_t seconds = timegm(&utc);
    if (seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(seconds);
}

ProtectionStateStore::ProtectionStateStore(std::filesystem::path path)
    : path_(std::move(path)) {}

std::optional<ProtectionState> ProtectionStateStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(path_, ec)) {
        return std::nullopt;
    }

    std::ifstream input(path_);
    if (!input.good()) {
        std::cerr << "[Protection] Cannot open state file " << path_ << std::endl;
        return std::nullopt;
    }

    nlohmann::json json;
    try {
        input >> json;
    } catch (const nlohmann::json::exception& ex) {
        std::cerr << "[Protection] Corrupt state file " << path_ << ": " << ex.what() << std::endl;
        return std::nullopt;
    }

    ProtectionState state;
    state.protection_active = json_value_or<bool>(json, "protection_active", false);
    state.hibernation_start = read_time(json, "hibernation_start_time");
    const double baseline = json_value_or<double>(json, "baseline_atr", 0.0);
    if (baseline > 0.0) {
        state.baseline_volatility = baseline;
    }
    state.direction = parse_trend_direction(json_value_or<std::string>(json, "consecutive_trend_direction", "neutral"));
    state.consecutive_bars = json_value_or<int>(json, "consecutive_kline_count", 0);
    state.cumulative_change_pct = json_value_or<double>(json, "cumulative_change_percent", 0.0);
    state.run_start_time = read_time(json, "consecutive_trend_start_time");
    state.run_start_price = json_value_or<double>(json, "consecutive_trend_start_price", 0.0);
    state.last_update = read_time(json, "last_update");
    return state;
}

bool ProtectionStateStore::save(const ProtectionState& state) const {
    nlohmann::json json;
    json["protection_active"] = state.protection_active;
    json["hibernation_start_time"] = optional_time(state.hibernation_start);
    json["baseline_atr"] = state.baseline_volatility ? nlohmann::json(*state.baseline_volatility)
                                                     : nlohmann::json(nullptr);
    json["consecutive_trend_direction"] = to_string(state.direction);
    json["consecutive_kline_count"] = state.consecutive_bars;
    json["cumulative_change_percent"] = state.cumulative_change_pct;
    json["consecutive_trend_start_time"] = optional_time(state.run_start_time);
    json["consecutive_trend_start_price"] = state.run_start_price;
    json["last_update"] = optional_time(state.last_update);

    std::error_code ec;
    const auto dir = path_.parent_path();
    if (!dir.empty()) {
        std::filesystem::create_directories(dir, ec);
        if (ec) {
            std::cerr << "[Protection] Failed to create " << dir << ": " << ec.message() << std::endl;
            return false;
        }
    }

    const auto tmp_path = path_.string() + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out) {
            std::cerr << "[Protection] Failed to open temp file " << tmp_path << std::endl;
            return false;
        }
        out << json.dump(2);
        out.close();
        if (out.fail()) {
            std::cerr << "[Protection] Failed to write state to " << tmp_path << std::endl;
            return false;
        }
    }

    const int fd = ::open(tmp_path.c_str(), O_WRONLY);
    if (fd >= 0) {
        ::fsync(fd);
        ::close(fd);
    }

    std::filesystem::rename(tmp_path, path_, ec);
    if (ec) {
        std::cerr << "[Protection] Failed to replace " << path_ << ": " << ec.message() << std::endl;
        return false;
    }
    return true;
}

} // namespace grid
