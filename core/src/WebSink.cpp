#include "websink/WebSink.hpp"
#include "websink/Log.hpp"
#include "websink/RtcPeerTransport.hpp"

#include <rtc/rtc.hpp>

namespace websink {

WebSink::WebSink(const WebSinkConfig& cfg, PeerTransportFactory factory)
    : cfg_(cfg),
      engine_(registry_, std::chrono::milliseconds(cfg.keyframe_request_interval_ms)),
      adapter_([this](const std::shared_ptr<const AccessUnit>& unit) { engine_.broadcast(unit); },
               cfg.inject_parameter_sets),
      manager_(cfg, registry_, engine_, factory ? std::move(factory) : RtcPeerTransport::factory(cfg)) {}

WebSink::~WebSink() {
    stop();
}

void WebSink::start(bool listen) {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (running_) return;

    manager_.start();
    if (listen) {
        rtc::InitLogger(rtc::LogLevel::Warning);
        auto server = std::make_unique<SignalingServer>(cfg_, manager_);
        try {
            server->start();
        } catch (const std::exception&) {
            manager_.stop();
            throw;
        }
        server_ = std::move(server);
    }
    running_ = true;
    logf(WEBSINK_LOG_INFO, "WebSink started (max_clients=%d, mtu=%zu, payload_type=%u)",
         cfg_.max_clients, cfg_.mtu, static_cast<unsigned>(cfg_.payload_type));
}

void WebSink::stop() {
    std::lock_guard<std::mutex> lock(lifecycleMutex_);
    if (!running_) return;
    running_ = false;

    // Refuse new sessions and close the existing ones before the listener goes away
    manager_.stop();
    if (server_) {
        server_->stop();
        server_.reset();
    }
    logf(WEBSINK_LOG_INFO, "WebSink stopped");
}

bool WebSink::ingest(const uint8_t* payload, size_t size, uint64_t captureUsec, bool keyframeHint) {
    return adapter_.ingest(payload, size, captureUsec, keyframeHint);
}

void WebSink::setKeyframeRequester(BroadcastEngine::KeyframeRequester requester) {
    engine_.setKeyframeRequester(std::move(requester));
}

uint16_t WebSink::signalingPort() const {
    return server_ ? server_->port() : cfg_.ws_port;
}

WebSinkStats WebSink::stats() const {
    WebSinkStats s;
    s.clients = registry_.size();
    s.adapter = adapter_.stats();
    s.broadcast = engine_.stats();
    s.sessions = manager_.stats();
    return s;
}

} // namespace websink
