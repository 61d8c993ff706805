#include "websink/SignalingServer.hpp"
#include "websink/Log.hpp"
#include "websink/SignalingMessage.hpp"

#include <rtc/rtc.hpp>
#include <stdexcept>
#include <variant>

namespace websink {

namespace {

class WebSocketChannel : public SignalingChannel {
public:
    explicit WebSocketChannel(std::weak_ptr<rtc::WebSocket> ws) : ws_(std::move(ws)) {}

    void send(const std::string& text) override {
        auto ws = ws_.lock();
        if (!ws || !ws->isOpen()) return;
        try {
            ws->send(text);
        } catch (const std::exception& e) {
            logf(WEBSINK_LOG_WARN, "WebSocket send failed: %s", e.what());
        }
    }

    void close() override {
        auto ws = ws_.lock();
        if (!ws || ws->isClosed()) return;
        try {
            ws->close();
        } catch (const std::exception& e) {
            logf(WEBSINK_LOG_WARN, "WebSocket close failed: %s", e.what());
        }
    }

private:
    std::weak_ptr<rtc::WebSocket> ws_;
};

} // namespace

SignalingServer::SignalingServer(const WebSinkConfig& cfg, SessionManager& manager)
    : cfg_(cfg), manager_(manager) {}

SignalingServer::~SignalingServer() {
    stop();
}

void SignalingServer::start() {
    if (server_) return;

    rtc::WebSocketServer::Configuration config;
    config.port = cfg_.ws_port;
    config.enableTls = false;
    if (!cfg_.bind_address.empty()) config.bindAddress = cfg_.bind_address;

    try {
        server_ = std::make_unique<rtc::WebSocketServer>(config);
    } catch (const std::exception& e) {
        throw std::runtime_error("cannot listen on " + cfg_.bind_address + ":" + std::to_string(cfg_.ws_port) +
                                 ": " + e.what());
    }

    server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) { onClient(std::move(ws)); });
    logf(WEBSINK_LOG_INFO, "Signaling server listening on %s:%u", cfg_.bind_address.c_str(),
         static_cast<unsigned>(server_->port()));
}

void SignalingServer::stop() {
    if (!server_) return;
    server_->stop();

    std::unordered_map<rtc::WebSocket*, Connection> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connections.swap(connections_);
        closed_.clear();
    }
    for (auto& [key, conn] : connections) {
        conn.ws->resetCallbacks();
        conn.channel->close();
    }
    server_.reset();
    logf(WEBSINK_LOG_INFO, "Signaling server stopped");
}

void SignalingServer::onClient(std::shared_ptr<rtc::WebSocket> ws) {
    auto channel = std::make_shared<WebSocketChannel>(ws);
    rtc::WebSocket* key = ws.get();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Sockets that closed since the last accept can go now, outside their own callbacks
        closed_.clear();
        connections_[key] = Connection{ws, channel};
    }

    if (auto addr = ws->remoteAddress()) {
        logf(WEBSINK_LOG_DEBUG, "Signaling connection from %s", addr->c_str());
    }

    std::weak_ptr<SignalingChannel> weakChannel = channel;
    ws->onOpen([this, weakChannel]() {
        if (auto ch = weakChannel.lock()) manager_.openSession(ch);
    });

    ws->onMessage([this, weakChannel](rtc::message_variant data) {
        auto ch = weakChannel.lock();
        if (!ch) return;
        if (std::holds_alternative<std::string>(data)) {
            manager_.handleMessage(ch, std::get<std::string>(data));
        } else {
            ch->send(encodeError("", "binary messages are not supported"));
        }
    });

    ws->onError([](std::string error) {
        logf(WEBSINK_LOG_WARN, "Signaling WebSocket error: %s", error.c_str());
    });

    ws->onClosed([this, key, weakChannel]() {
        if (auto ch = weakChannel.lock()) manager_.channelClosed(ch);
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(key);
        if (it != connections_.end()) {
            closed_.push_back(std::move(it->second));
            connections_.erase(it);
        }
    });
}

uint16_t SignalingServer::port() const {
    return server_ ? server_->port() : cfg_.ws_port;
}

size_t SignalingServer::connectionCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

} // namespace websink
