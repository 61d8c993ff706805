#include "websink/BroadcastEngine.hpp"
#include "websink/Log.hpp"

namespace websink {

BroadcastEngine::BroadcastEngine(ClientRegistry& registry, std::chrono::milliseconds keyframeRequestInterval)
    : registry_(registry), keyframeRequestInterval_(keyframeRequestInterval) {}

BroadcastResult BroadcastEngine::broadcast(const std::shared_ptr<const AccessUnit>& unit) {
    BroadcastResult result;
    if (!unit) return result;
    ++units_;

    // Sessions removed meanwhile stay alive through the snapshot
    for (const auto& session : registry_.snapshot()) {
        if (session->state() != SessionState::Connected) continue;

        if (!unit->isKeyframe() && session->needsKeyframe()) {
            session->recordSkipped();
            ++result.skipped;
            continue;
        }

        switch (session->enqueue(unit)) {
            case EnqueueResult::Queued:
                ++result.delivered;
                break;
            case EnqueueResult::Dropped:
                ++result.dropped;
                break;
            case EnqueueResult::Rejected:
                break;
        }
    }

    delivered_ += result.delivered;
    skipped_ += result.skipped;
    dropped_ += result.dropped;
    // Overloaded sessions resync on the next keyframe
    if (result.dropped) requestKeyframe();
    return result;
}

void BroadcastEngine::setKeyframeRequester(KeyframeRequester requester) {
    std::lock_guard<std::mutex> lock(requestMutex_);
    requester_ = std::move(requester);
}

bool BroadcastEngine::requestKeyframe() {
    KeyframeRequester requester;
    {
        std::lock_guard<std::mutex> lock(requestMutex_);
        if (!requester_) return false;
        const auto now = std::chrono::steady_clock::now();
        if (requestedOnce_ && now - lastRequest_ < keyframeRequestInterval_) return false;
        requestedOnce_ = true;
        lastRequest_ = now;
        requester = requester_;
    }
    ++keyframeRequests_;
    logf(WEBSINK_LOG_DEBUG, "Requesting keyframe from source");
    requester();
    return true;
}

void BroadcastEngine::onSessionConnected(const ClientSession& session) {
    if (session.needsKeyframe()) {
        requestKeyframe();
    }
}

BroadcastStats BroadcastEngine::stats() const {
    BroadcastStats s;
    s.units = units_;
    s.delivered = delivered_;
    s.skipped = skipped_;
    s.dropped = dropped_;
    s.keyframeRequests = keyframeRequests_;
    return s;
}

} // namespace websink
