#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include "websink/BroadcastEngine.hpp"
#include "websink/ClientRegistry.hpp"
#include "websink/Config.hpp"
#include "websink/FrameSourceAdapter.hpp"
#include "websink/PeerTransport.hpp"
#include "websink/SessionManager.hpp"
#include "websink/SignalingServer.hpp"

namespace websink {

struct WebSinkStats {
    size_t clients = 0;
    AdapterStats adapter;
    BroadcastStats broadcast;
    SessionManagerStats sessions;
};

// Owns the whole fan-out engine for one H264 stream: registry, broadcast engine,
// frame source adapter, session manager and the WebSocket signaling server.
class WebSink {
public:
    // An empty factory selects the libdatachannel transport
    explicit WebSink(const WebSinkConfig& cfg, PeerTransportFactory factory = {});
    ~WebSink();

    WebSink(const WebSink&) = delete;
    WebSink& operator=(const WebSink&) = delete;

    // listen=false skips the WebSocket server; sessions are then opened through sessions().
    // Throws std::runtime_error if the signaling port cannot be bound.
    void start(bool listen = true);
    // Stops signaling and closes every session. Idempotent.
    void stop();

    // See FrameSourceAdapter::ingest
    bool ingest(const uint8_t* payload, size_t size, uint64_t captureUsec, bool keyframeHint);

    // Receives throttled keyframe requests meant for the upstream encoder
    void setKeyframeRequester(BroadcastEngine::KeyframeRequester requester);

    bool running() const { return running_; }
    size_t clientCount() const { return registry_.size(); }
    uint16_t signalingPort() const;
    WebSinkStats stats() const;

    const WebSinkConfig& config() const { return cfg_; }
    SessionManager& sessions() { return manager_; }
    ClientRegistry& registry() { return registry_; }

private:
    WebSinkConfig cfg_;
    ClientRegistry registry_;
    BroadcastEngine engine_;
    FrameSourceAdapter adapter_;
    SessionManager manager_;
    std::unique_ptr<SignalingServer> server_;

    std::mutex lifecycleMutex_;
    std::atomic<bool> running_{false};
};

} // namespace websink
