#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include "websink/ClientRegistry.hpp"
#include "websink/H264.hpp"

namespace websink {

// Per-call fan-out summary
struct BroadcastResult {
    size_t delivered = 0;   // queued for a session's writer
    size_t skipped = 0;     // session waiting for a keyframe
    size_t dropped = 0;     // session overloaded
};

struct BroadcastStats {
    uint64_t units = 0;
    uint64_t delivered = 0;
    uint64_t skipped = 0;
    uint64_t dropped = 0;
    uint64_t keyframeRequests = 0;
};

// Fans each access unit out to every connected session. Never blocks on a transport.
class BroadcastEngine {
public:
    using KeyframeRequester = std::function<void()>;

    BroadcastEngine(ClientRegistry& registry, std::chrono::milliseconds keyframeRequestInterval);

    BroadcastResult broadcast(const std::shared_ptr<const AccessUnit>& unit);

    // Where keyframe requests go (the upstream source); may be empty
    void setKeyframeRequester(KeyframeRequester requester);

    // Throttled to one per interval; true if the request was forwarded
    bool requestKeyframe();

    // A session reached Connected; asks upstream for a keyframe if it needs one
    void onSessionConnected(const ClientSession& session);

    BroadcastStats stats() const;

private:
    ClientRegistry& registry_;
    const std::chrono::milliseconds keyframeRequestInterval_;

    std::mutex requestMutex_;
    KeyframeRequester requester_;
    bool requestedOnce_ = false;
    std::chrono::steady_clock::time_point lastRequest_;

    std::atomic<uint64_t> units_{0};
    std::atomic<uint64_t> delivered_{0};
    std::atomic<uint64_t> skipped_{0};
    std::atomic<uint64_t> dropped_{0};
    std::atomic<uint64_t> keyframeRequests_{0};
};

} // namespace websink
