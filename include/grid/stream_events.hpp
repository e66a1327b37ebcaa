#pragma once

#include "grid/types.hpp"

#include <string>
#include <variant>

namespace grid {

struct BookTickerEvent {
    std::string symbol;
    double best_bid = 0.0;
    double best_ask = 0.0;
    int64_t event_time_ms = 0;
};

struct KlineEvent {
    std::string symbol;
    std::string interval;
    Candle candle;
    bool closed = false;
};

struct ListenKeyExpiredEvent {
    int64_t event_time_ms = 0;
};

using StreamEvent = std::variant<std::monostate,
                                 BookTickerEvent,
                                 KlineEvent,
                                 OrderUpdate,
                                 ListenKeyExpiredEvent>;

// Decodes one frame from the market or user-data stream. Subscription acks,
// foreign symbols, one-way-mode updates and malformed frames come back as
// std::monostate. Combined-stream envelopes ({"stream":..,"data":..}) are unwrapped.
StreamEvent decode_stream_message(const std::string& message, const std::string& symbol);

} // namespace grid
