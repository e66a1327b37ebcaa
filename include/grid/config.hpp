#pragma once

#include <string>

namespace grid {

struct GridConfig {
    std::string coin = "XRP";
    std::string quote = "USDC";
    double grid_spacing = 0.001;          // fraction of price
    double base_quantity = 3.0;
    int leverage = 15;
    double position_threshold = 500.0;    // conservative mode above this
    double position_limit = 200.0;        // take-profit size doubles above this
    int order_first_time_s = 10;          // min gap between entry orders per side
    int tick_interval_ms = 1000;
    int position_sync_interval_s = 30;
    int order_sync_interval_s = 60;
    double reduce_fraction = 0.5;
    double reduce_offset = 0.001;         // 0.1% through the touch
    std::string ledger_path = "data/trade_ledger.jsonl";

    std::string symbol() const { return coin + quote; }
};

struct ProtectionConfig {
    double extreme_threshold_pct = 11.0;
    double hibernation_hours = 24.0;
    double recovery_multiplier = 1.5;
    double bar_noise_threshold_pct = 0.1;
    int close_timeout_s = 30;
    int fill_poll_interval_ms = 1000;
    double close_offset = 0.005;          // 0.5% through the touch
    int volatility_period = 14;
    int baseline_samples = 20;
    int price_buffer_size = 100;
    int volatility_history_size = 50;
    int watchdog_interval_s = 60;
    std::string state_path = "data/extreme_protection_state.json";
};

struct SignalConfig {
    int ema_short = 20;
    int ema_medium = 50;
    int ema_long = 200;
    int adx_period = 14;
    double adx_threshold = 25.0;
    std::string timeframe = "1h";
    int kline_limit = 300;
    int refresh_interval_s = 3600;
    double counter_trend_multiplier = 2.0;

    int min_bars() const { return ema_long + 50; }
};

struct StreamConfig {
    std::string rest_url = "https://fapi.binance.com";
    std::string ws_url = "wss://fstream.binance.com/ws";
    int reconnect_delay_ms = 5000;
    int listen_key_renew_s = 1800;
    int listen_key_check_s = 60;
    double max_price_jump = 0.10;
};

struct BotConfig {
    std::string api_key;
    std::string api_secret;
    GridConfig grid;
    ProtectionConfig protection;
    SignalConfig signal;
    StreamConfig stream;
};

// KEY=VALUE lines into the process environment; a missing file is not an error.
void load_env_file(const std::string& path);

// Defaults overridden by environment variables; throws std::invalid_argument
// for malformed numbers or out-of-range values.
BotConfig load_config_from_env();

void validate_config(const BotConfig& config);

} // namespace grid
