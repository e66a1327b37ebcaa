#pragma once

#include <functional>
#include <memory>
#include <string>

namespace binance {

enum class WsConnectionState {
    Disconnected,
    Connecting,
    Connected
};

using WsMessageCallback = std::function<void(const std::string& message)>;
using WsErrorCallback = std::function<void(const std::string& error)>;
using WsStateCallback = std::function<void(WsConnectionState state)>;

struct WsEndpoint {
    std::string host;
    std::string path;
    int port = 443;
    bool ssl = true;
};

// Splits ws:// and wss:// URLs; returns false for any other scheme.
bool parse_ws_url(const std::string& url, WsEndpoint& endpoint);

// Single text-frame connection serviced on its own worker thread. Reconnection
// is left to the owner: after a Disconnected state, call connect() again.
class WsClient {
public:
    explicit WsClient(std::string url);
    ~WsClient();

    WsClient(const WsClient&) = delete;
    WsClient& operator=(const WsClient&) = delete;
    WsClient(WsClient&&) noexcept = delete;
    WsClient& operator=(WsClient&&) noexcept = delete;

    bool connect();
    void disconnect();
    bool send(const std::string& message);
    bool is_connected() const noexcept;

    void set_message_callback(WsMessageCallback callback);
    void set_error_callback(WsErrorCallback callback);
    void set_state_callback(WsStateCallback callback);

    WsConnectionState state() const noexcept;

    // Public for callback access (implementation detail)
    struct Impl;

private:
    std::unique_ptr<Impl> pimpl_;
};

} // namespace binance
