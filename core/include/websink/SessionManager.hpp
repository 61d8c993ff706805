#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "websink/BroadcastEngine.hpp"
#include "websink/ClientRegistry.hpp"
#include "websink/Config.hpp"
#include "websink/PeerTransport.hpp"

namespace websink {

// One browser's signaling connection
class SignalingChannel {
public:
    virtual ~SignalingChannel() = default;
    virtual void send(const std::string& text) = 0;
    virtual void close() = 0;
};

struct SessionManagerStats {
    uint64_t opened = 0;
    uint64_t refused = 0;           // full, stopping or transport creation failed
    uint64_t removed = 0;
    uint64_t negotiationTimeouts = 0;
    uint64_t stalledEvictions = 0;
    uint64_t protocolErrors = 0;
    uint64_t peerKeyframeRequests = 0;   // PLI/FIR from browsers
    uint64_t detachedWriters = 0;
};

// Transport-neutral half of the signaling endpoint: binds channels to sessions,
// dispatches signaling messages and reaps terminated sessions.
class SessionManager {
public:
    // Lifecycle events are published on this EventBus channel
    static constexpr const char* kEventChannel = "websink.session";

    SessionManager(const WebSinkConfig& cfg, ClientRegistry& registry, BroadcastEngine& engine,
                   PeerTransportFactory factory);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    // Starts the housekeeping thread
    void start();
    // Refuses new sessions, closes all sessions and joins housekeeping. Idempotent.
    void stop();

    // Creates, registers and starts a session bound to the channel (sends the offer).
    // Returns the session id, or "" if the session was refused.
    std::string openSession(const std::shared_ptr<SignalingChannel>& channel);

    void handleMessage(const std::shared_ptr<SignalingChannel>& channel, const std::string& text);

    // Closes the sessions bound to the channel
    void channelClosed(const std::shared_ptr<SignalingChannel>& channel);

    // One housekeeping pass: negotiation timeouts and stalled sessions
    void sweep();

    // Join and release sessions that terminated since the last call
    void reapTerminated();

    size_t sessionCount() const { return registry_.size(); }
    SessionManagerStats stats() const;

private:
    std::shared_ptr<ClientSession> lookup(const std::shared_ptr<SignalingChannel>& channel,
                                          const std::string& sessionId);
    void onSessionState(ClientSession& session, SessionState from, SessionState to, uint64_t seq);
    void onSessionTerminated(const std::shared_ptr<ClientSession>& session);
    void housekeepingLoop();
    void publishEvent(const std::string& json);

    WebSinkConfig cfg_;
    ClientRegistry& registry_;
    BroadcastEngine& engine_;
    PeerTransportFactory factory_;
    SessionOptions options_;

    // Serialises the capacity check with registration
    std::mutex openMutex_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unordered_map<std::string, std::weak_ptr<SignalingChannel>> bindings_;
    std::vector<std::shared_ptr<ClientSession>> retired_;
    bool stopHousekeeping_ = false;
    std::thread housekeeping_;

    std::atomic<bool> accepting_{true};
    std::atomic<bool> stopped_{false};

    std::atomic<uint64_t> opened_{0};
    std::atomic<uint64_t> refused_{0};
    std::atomic<uint64_t> removed_{0};
    std::atomic<uint64_t> timeouts_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> protocolErrors_{0};
    std::atomic<uint64_t> peerKeyframeRequests_{0};
    std::atomic<uint64_t> detachedWriters_{0};
};

} // namespace websink
