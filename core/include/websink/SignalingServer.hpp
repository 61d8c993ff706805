#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "websink/Config.hpp"
#include "websink/SessionManager.hpp"

namespace rtc {
class WebSocket;
class WebSocketServer;
}

namespace websink {

// WebSocket signaling endpoint: each accepted socket is one signaling channel
// handed to the SessionManager.
class SignalingServer {
public:
    SignalingServer(const WebSinkConfig& cfg, SessionManager& manager);
    ~SignalingServer();

    // Binds bind_address:ws_port; throws std::runtime_error if that fails
    void start();
    // Stops accepting and closes open sockets. Idempotent.
    void stop();

    uint16_t port() const;
    size_t connectionCount() const;

private:
    void onClient(std::shared_ptr<rtc::WebSocket> ws);

    WebSinkConfig cfg_;
    SessionManager& manager_;
    std::unique_ptr<rtc::WebSocketServer> server_;

    struct Connection {
        std::shared_ptr<rtc::WebSocket> ws;
        std::shared_ptr<SignalingChannel> channel;
    };
    mutable std::mutex mutex_;
    std::unordered_map<rtc::WebSocket*, Connection> connections_;
    std::vector<Connection> closed_;
};

} // namespace websink
