#include "binance/ws_client.hpp"

#include <libwebsockets.h>

#include <atomic>
#include <cstring>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace binance {

struct WsClient::Impl {
    std::string url;
    WsEndpoint endpoint;
    ::lws_context* context = nullptr;
    ::lws* wsi = nullptr;
    std::thread worker_thread;
    std::atomic<bool> should_stop{false};
    std::atomic<bool> connected{false};
    std::atomic<WsConnectionState> state{WsConnectionState::Disconnected};

    WsMessageCallback message_callback;
    WsErrorCallback error_callback;
    WsStateCallback state_callback;

    std::mutex callbacks_mutex;
    std::mutex send_mutex;
    std::queue<std::string> send_queue;
    std::string message_buffer;

    void notify_state(WsConnectionState next) {
        state = next;
        std::lock_guard<std::mutex> lock(callbacks_mutex);
        if (state_callback) {
            state_callback(next);
        }
    }

    void notify_error(const std::string& error) {
        std::lock_guard<std::mutex> lock(callbacks_mutex);
        if (error_callback) {
            error_callback(error);
        }
    }
};

} // namespace binance

namespace {

int callback_ws_client(struct lws* wsi, enum lws_callback_reasons reason,
                       void* /*user*/, void* in, size_t len) {
    auto* impl = static_cast<binance::WsClient::Impl*>(lws_get_opaque_user_data(wsi));
    if (!impl) {
        impl = static_cast<binance::WsClient::Impl*>(lws_context_user(lws_get_context(wsi)));
        if (!impl) {
            return 0;
        }
        lws_set_opaque_user_data(wsi, impl);
    }

    switch (reason) {
        case LWS_CALLBACK_CLIENT_ESTABLISHED:
            impl->connected = true;
            impl->notify_state(binance::WsConnectionState::Connected);
            break;

        case LWS_CALLBACK_CLIENT_CONNECTION_ERROR: {
            impl->connected = false;
            const char* error_msg = in ? static_cast<const char*>(in) : "Connection error";
            impl->notify_error(in ? std::string(error_msg, len) : std::string(error_msg));
            impl->notify_state(binance::WsConnectionState::Disconnected);
            break;
        }

        case LWS_CALLBACK_CLIENT_CLOSED:
        case LWS_CALLBACK_CLOSED:
            impl->connected = false;
            impl->notify_state(binance::WsConnectionState::Disconnected);
            break;

        case LWS_CALLBACK_CLIENT_RECEIVE:
            if (in && len > 0 && !lws_frame_is_binary(wsi)) {
                impl->message_buffer.append(static_cast<const char*>(in), len);
                if (lws_is_final_fragment(wsi)) {
                    std::lock_guard<std::mutex> lock(impl->callbacks_mutex);
                    if (impl->message_callback) {
                        impl->message_callback(impl->message_buffer);
                    }
                    impl->message_buffer.clear();
                }
            }
            break;

        case LWS_CALLBACK_CLIENT_WRITEABLE: {
            std::string message;
            bool more = false;
            {
                std::lock_guard<std::mutex> lock(impl->send_mutex);
                if (impl->send_queue.empty()) {
                    break;
                }
                message = std::move(impl->send_queue.front());
                impl->send_queue.pop();
                more = !impl->send_queue.empty();
            }

            std::vector<unsigned char> buf(LWS_PRE + message.size());
            std::memcpy(buf.data() + LWS_PRE, message.data(), message.size());
            const int n = lws_write(wsi, buf.data() + LWS_PRE, message.size(), LWS_WRITE_TEXT);
            if (n < 0) {
                impl->notify_error("Failed to send WebSocket message");
            } else if (more) {
                lws_callback_on_writable(wsi);
            }
            break;
        }

        case LWS_CALLBACK_EVENT_WAIT_CANCELLED: {
            // send() wakes the service loop; request writability from here.
            std::lock_guard<std::mutex> lock(impl->send_mutex);
            if (!impl->send_queue.empty() && impl->wsi && impl->connected) {
                lws_callback_on_writable(impl->wsi);
            }
            break;
        }

        default:
            break;
    }

    return 0;
}

const struct lws_protocols protocols[] = {
    {
        "ws-client",
        callback_ws_client,
        0,
        65536, // rx_buffer_size
    },
    {nullptr, nullptr, 0, 0}
};

} // anonymous namespace

namespace binance {

bool parse_ws_url(const std::string& url, WsEndpoint& endpoint) {
    std::size_t start = 0;
    if (url.rfind("wss://", 0) == 0) {
        endpoint.ssl = true;
        endpoint.port = 443;
        start = 6;
    } else if (url.rfind("ws://", 0) == 0) {
        endpoint.ssl = false;
        endpoint.port = 80;
        start = 5;
    } else {
        return false;
    }

    const auto slash = url.find('/', start);
    std::string host = (slash == std::string::npos) ? url.substr(start) : url.substr(start, slash - start);
    endpoint.path = (slash == std::string::npos) ? "/" : url.substr(slash);

    const auto colon = host.find(':');
    if (colon != std::string::npos) {
        try {
            endpoint.port = std::stoi(host.substr(colon + 1));
        } catch (...) {
            return false;
        }
        host = host.substr(0, colon);
    }
    endpoint.host = host;
    return !endpoint.host.empty();
}

WsClient::WsClient(std::string url)
    : pimpl_(std::make_unique<Impl>()) {
    pimpl_->url = std::move(url);
}

WsClient::~WsClient() {
    disconnect();
}

bool WsClient::connect() {
    if (pimpl_->connected) {
        return true;
    }
    if (pimpl_->state == WsConnectionState::Connecting) {
        return false;
    }

    // Tear down whatever a previous session left behind.
    disconnect();

    if (!parse_ws_url(pimpl_->url, pimpl_->endpoint)) {
        pimpl_->notify_error("Unsupported WebSocket URL: " + pimpl_->url);
        return false;
    }

    pimpl_->notify_state(WsConnectionState::Connecting);

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = CONTEXT_PORT_NO_LISTEN;
    info.protocols = protocols;
    info.gid = -1;
    info.uid = -1;
    info.options = LWS_SERVER_OPTION_DO_SSL_GLOBAL_INIT;
    info.user = pimpl_.get();

    pimpl_->context = lws_create_context(&info);
    if (!pimpl_->context) {
        pimpl_->notify_state(WsConnectionState::Disconnected);
        return false;
    }

    const auto& endpoint = pimpl_->endpoint;
    struct lws_client_connect_info ccinfo;
    std::memset(&ccinfo, 0, sizeof(ccinfo));
    ccinfo.context = pimpl_->context;
    ccinfo.address = endpoint.host.c_str();
    ccinfo.port = endpoint.port;
    ccinfo.path = endpoint.path.c_str();
    ccinfo.host = endpoint.host.c_str();
    ccinfo.origin = endpoint.host.c_str();
    ccinfo.protocol = protocols[0].name;
    ccinfo.ssl_connection = endpoint.ssl ? LCCSCF_USE_SSL : 0;
    ccinfo.opaque_user_data = pimpl_.get();

    pimpl_->wsi = lws_client_connect_via_info(&ccinfo);
    if (!pimpl_->wsi) {
        lws_context_destroy(pimpl_->context);
        pimpl_->context = nullptr;
        pimpl_->notify_state(WsConnectionState::Disconnected);
        return false;
    }

    pimpl_->should_stop = false;
    pimpl_->worker_thread = std::thread([impl = pimpl_.get()]() {
        while (!impl->should_stop) {
            lws_service(impl->context, 50);
        }
    });

    return true;
}

void WsClient::disconnect() {
    pimpl_->should_stop = true;

    if (pimpl_->context) {
        lws_cancel_service(pimpl_->context);
    }
    if (pimpl_->worker_thread.joinable()) {
        pimpl_->worker_thread.join();
    }
    if (pimpl_->context) {
        lws_context_destroy(pimpl_->context);
        pimpl_->context = nullptr;
    }

    pimpl_->wsi = nullptr;
    pimpl_->connected = false;
    pimpl_->state = WsConnectionState::Disconnected;
    pimpl_->message_buffer.clear();

    std::lock_guard<std::mutex> lock(pimpl_->send_mutex);
    std::queue<std::string>().swap(pimpl_->send_queue);
}

bool WsClient::send(const std::string& message) {
    if (!pimpl_->connected || !pimpl_->wsi) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(pimpl_->send_mutex);
        pimpl_->send_queue.push(message);
    }

    lws_cancel_service(pimpl_->context);
    return true;
}

bool WsClient::is_connected() const noexcept {
    return pimpl_->connected;
}

void WsClient::set_message_callback(WsMessageCallback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callbacks_mutex);
    pimpl_->message_callback = std::move(callback);
}

void WsClient::set_error_callback(WsErrorCallback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callbacks_mutex);
    pimpl_->error_callback = std::move(callback);
}

void WsClient::set_state_callback(WsStateCallback callback) {
    std::lock_guard<std::mutex> lock(pimpl_->callbacks_mutex);
    pimpl_->state_callback = std::move(callback);
}

WsConnectionState WsClient::state() const noexcept {
    return pimpl_->state;
}

} // namespace binance
