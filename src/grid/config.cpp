#include "grid/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <stdexcept>

namespace grid {
namespace {

std::string trim(std::string value) {
    const auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
    value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
    return value;
}

const char* env_raw(const char* name) {
    const char* value = std::getenv(name);
    return (value && *value) ? value : nullptr;
}

void read_string(const char* name, std::string& target) {
    if (const char* value = env_raw(name)) {
        target = trim(value);
    }
}

void read_double(const char* name, double& target) {
    const char* value = env_raw(name);
    if (!value) {
        return;
    }
    std::size_t consumed = 0;
    try {
        const double parsed = std::stod(value, &consumed);
        if (trim(std::string(value).substr(consumed)).empty()) {
            target = parsed;
            return;
        }
    } catch (const std::exception&) {
    }
    throw std::invalid_argument(std::string("Invalid number for ") + name + ": " + value);
}

void read_int(const char* name, int& target) {
    const char* value = env_raw(name);
    if (!value) {
        return;
    }
    std::size_t consumed = 0;
    try {
        const int parsed = std::stoi(value, &consumed);
        if (trim(std::string(value).substr(consumed)).empty()) {
            target = parsed;
            return;
        }
    } catch (const std::exception&) {
    }
    throw std::invalid_argument(std::string("Invalid integer for ") + name + ": " + value);
}

void require(bool condition, const std::string& message) {
    if (!condition) {
        throw std::invalid_argument(message);
    }
}

} // namespace

void load_env_file(const std::string& path) {
    std::ifstream env_file(path);
    if (!env_file.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(env_file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }

        const auto pos = line.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, pos));
        auto value = trim(line.substr(pos + 1));

        if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
            value = value.substr(1, value.size() - 2);
        }

        if (!key.empty()) {
            setenv(key.c_str(), value.c_str(), 1);
        }
    }
}

BotConfig load_config_from_env() {
    BotConfig config;

    read_string("BINANCE_API_KEY", config.api_key);
    read_string("BINANCE_API_SECRET", config.api_secret);

    auto& grid = config.grid;
    read_string("GRID_COIN", grid.coin);
    read_string("GRID_QUOTE", grid.quote);
    read_double("GRID_SPACING", grid.grid_spacing);
    read_double("GRID_BASE_QTY", grid.base_quantity);
    read_int("GRID_LEVERAGE", grid.leverage);
    read_double("GRID_POSITION_THRESHOLD", grid.position_threshold);
    read_double("GRID_POSITION_LIMIT", grid.position_limit);
    read_int("GRID_ORDER_FIRST_TIME_S", grid.order_first_time_s);
    read_string("GRID_LEDGER_PATH", grid.ledger_path);

    auto& protection = config.protection;
    read_string("GRID_STATE_PATH", protection.state_path);
    read_double("PROTECTION_THRESHOLD_PCT", protection.extreme_threshold_pct);
    read_double("PROTECTION_HIBERNATION_HOURS", protection.hibernation_hours);
    read_double("PROTECTION_RECOVERY_MULTIPLIER", protection.recovery_multiplier);
    read_int("PROTECTION_CLOSE_TIMEOUT_S", protection.close_timeout_s);

    read_string("BINANCE_REST_URL", config.stream.rest_url);
    read_string("BINANCE_WS_URL", config.stream.ws_url);

    std::transform(grid.coin.begin(), grid.coin.end(), grid.coin.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    std::transform(grid.quote.begin(), grid.quote.end(), grid.quote.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });

    validate_config(config);
    return config;
}

void validate_config(const BotConfig& config) {
    const auto& grid = config.grid;
    require(!grid.coin.empty() && !grid.quote.empty(), "Instrument coin and quote must be set");
    require(grid.grid_spacing > 0.0 && grid.grid_spacing < 1.0, "Grid spacing must be within (0, 1)");
    require(grid.base_quantity > 0.0, "Base quantity must be positive");
    require(grid.leverage >= 1 && grid.leverage <= 125, "Leverage must be within [1, 125]");
    require(grid.position_limit > 0.0, "Position limit must be positive");
    require(grid.position_threshold >= grid.position_limit,
            "Position threshold must not be below the position limit");
    require(grid.order_first_time_s >= 0, "Entry gating interval must not be negative");
    require(grid.tick_interval_ms >= 0, "Tick interval must not be negative");
    require(!grid.ledger_path.empty(), "Trade ledger path must be set");

    const auto& protection = config.protection;
    require(protection.extreme_threshold_pct > 0.0, "Extreme threshold must be positive");
    require(protection.hibernation_hours >= 0.0, "Hibernation hours must not be negative");
    require(protection.recovery_multiplier > 0.0, "Recovery multiplier must be positive");
    require(protection.close_timeout_s > 0, "Close timeout must be positive");
    require(protection.volatility_period > 0, "Volatility period must be positive");
    require(protection.price_buffer_size > protection.volatility_period,
            "Price buffer must hold more samples than the volatility period");
    require(protection.volatility_history_size >= protection.baseline_samples,
            "Volatility history must hold at least the baseline sample count");
    require(!protection.state_path.empty(), "Protection state path must be set");

    const auto& signal = config.signal;
    require(signal.ema_short > 0 && signal.ema_short < signal.ema_medium && signal.ema_medium < signal.ema_long,
            "EMA periods must be increasing");
    require(signal.adx_period > 0, "ADX period must be positive");
    require(signal.kline_limit >= signal.min_bars(), "Kline limit must cover the long EMA warm-up");
    require(signal.counter_trend_multiplier > 0.0, "Counter-trend multiplier must be positive");
}

} // namespace grid
