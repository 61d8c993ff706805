#include "websink/ClientSession.hpp"
#include "websink/Log.hpp"
#include "websink/SignalingMessage.hpp"

#include <condition_variable>
#include <cstdio>
#include <deque>
#include <random>

namespace websink {

// Everything the writer thread touches. A writer stuck inside the transport keeps
// only this and the transport alive, never the session.
struct ClientSession::Outbound {
    Outbound(std::string sessionId, std::shared_ptr<PeerTransport> t, size_t cap, Clock::time_point now)
        : id(std::move(sessionId)), transport(std::move(t)), capacity(cap ? cap : 1),
          lastActivity(now.time_since_epoch().count()) {}

    void touch() { lastActivity = Clock::now().time_since_epoch().count(); }
    bool deliver(const AccessUnit& unit);

    const std::string id;
    const std::shared_ptr<PeerTransport> transport;
    const size_t capacity;

    // Guarded by mutex
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::shared_ptr<const AccessUnit>> queue;
    bool stopping = false;
    bool exited = false;

    std::atomic<Clock::rep> lastActivity;
    std::atomic<uint64_t> framesSent{0};
    std::atomic<uint64_t> bytesSent{0};
    std::atomic<uint64_t> framesDropped{0};
    std::atomic<uint64_t> consecutiveDrops{0};
    std::atomic<uint64_t> writeErrors{0};
};

const char* toString(SessionState state) {
    switch (state) {
        case SessionState::New: return "new";
        case SessionState::OfferSent: return "offer-sent";
        case SessionState::AnswerReceived: return "answer-received";
        case SessionState::Negotiating: return "negotiating";
        case SessionState::Connected: return "connected";
        case SessionState::Closed: return "closed";
        case SessionState::Failed: return "failed";
    }
    return "unknown";
}

const char* toString(TransportState state) {
    switch (state) {
        case TransportState::Checking: return "checking";
        case TransportState::Connected: return "connected";
        case TransportState::Disconnected: return "disconnected";
        case TransportState::Failed: return "failed";
        case TransportState::Closed: return "closed";
    }
    return "unknown";
}

std::string ClientSession::newSessionId() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    char buf[33];
    snprintf(buf, sizeof(buf), "%016llx%016llx",
             static_cast<unsigned long long>(gen()), static_cast<unsigned long long>(gen()));
    return buf;
}

std::shared_ptr<ClientSession> ClientSession::create(std::string id,
                                                     std::unique_ptr<PeerTransport> transport,
                                                     const SessionOptions& options,
                                                     SessionCallbacks callbacks) {
    std::shared_ptr<ClientSession> session(
        new ClientSession(std::move(id), std::move(transport), options, std::move(callbacks)));

    // Transport callbacks must not keep the session alive
    std::weak_ptr<ClientSession> weak = session;
    PeerTransportEvents events;
    events.localDescription = [weak](const std::string& sdp) {
        if (auto s = weak.lock()) s->onLocalDescription(sdp);
    };
    events.localCandidate = [weak](const std::string& candidate, const std::string& mid) {
        if (auto s = weak.lock()) s->onLocalCandidate(candidate, mid);
    };
    events.stateChanged = [weak](TransportState state) {
        if (auto s = weak.lock()) s->onTransportState(state);
    };
    events.keyframeRequested = [weak]() {
        if (auto s = weak.lock()) s->onKeyframeRequested();
    };
    session->transport_->setEventHandler(std::move(events));
    return session;
}

ClientSession::ClientSession(std::string id, std::unique_ptr<PeerTransport> transport,
                             const SessionOptions& options, SessionCallbacks callbacks)
    : id_(std::move(id)),
      transport_(std::move(transport)),
      writerJoinTimeout_(options.writerJoinTimeout),
      callbacks_(std::move(callbacks)),
      createdAt_(Clock::now()) {
    outbound_ = std::make_shared<Outbound>(id_, transport_, options.queueCapacity, createdAt_);
}

ClientSession::~ClientSession() {
    stopWriter();
    join();
}

void ClientSession::start() {
    {
        std::lock_guard<std::mutex> lock(outbound_->mutex);
        if (!writer_.joinable() && !outbound_->stopping) {
            writer_ = std::thread(&ClientSession::writerLoop, outbound_, weak_from_this());
        }
    }
    if (state() != SessionState::New) return;

    try {
        transport_->createOffer();
    } catch (const std::exception& e) {
        fail(ErrorKind::NegotiationFailed, std::string("offer creation failed: ") + e.what());
    }
}

void ClientSession::onLocalDescription(const std::string& sdp) {
    std::vector<std::pair<std::string, std::string>> candidates;
    uint64_t seq;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::New) {
            logf(WEBSINK_LOG_DEBUG, "Session %s: ignoring local description in state %s",
                 id_.c_str(), toString(state_.load()));
            return;
        }
        state_ = SessionState::OfferSent;
        seq = ++transitions_;
        candidates.swap(pendingLocalCandidates_);
    }
    touch();

    if (callbacks_.sendSignal) {
        callbacks_.sendSignal(encodeOffer(id_, sdp));
        for (const auto& c : candidates) {
            callbacks_.sendSignal(encodeIceCandidate(id_, c.first, c.second));
        }
    }
    transition(SessionState::New, SessionState::OfferSent, seq);
}

void ClientSession::onLocalCandidate(const std::string& candidate, const std::string& mid) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (isTerminal(state_)) return;
        // The offer goes out first
        if (state_ == SessionState::New) {
            pendingLocalCandidates_.emplace_back(candidate, mid);
            return;
        }
    }
    if (callbacks_.sendSignal) {
        callbacks_.sendSignal(encodeIceCandidate(id_, candidate, mid));
    }
}

void ClientSession::onKeyframeRequested() {
    if (state() != SessionState::Connected) return;
    logf(WEBSINK_LOG_DEBUG, "Session %s: peer requested a keyframe", id_.c_str());
    if (callbacks_.onKeyframeRequest) callbacks_.onKeyframeRequest(*this);
}

bool ClientSession::applyAnswer(const std::string& sdp) {
    uint64_t seq;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const SessionState s = state_;
        if (isTerminal(s)) return false;
        if (s != SessionState::OfferSent) {
            throw SignalingError(ErrorKind::SignalingProtocolError,
                                 std::string("unexpected answer in state ") + toString(s), id_);
        }
        state_ = SessionState::AnswerReceived;
        seq = ++transitions_;
    }
    touch();
    transition(SessionState::OfferSent, SessionState::AnswerReceived, seq);

    try {
        transport_->setRemoteAnswer(sdp);
    } catch (const std::exception& e) {
        fail(ErrorKind::NegotiationFailed, std::string("answer rejected: ") + e.what());
        throw SignalingError(ErrorKind::NegotiationFailed, "answer rejected", id_);
    }

    std::vector<std::pair<std::string, std::string>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remoteDescriptionSet_ = true;
        pending.swap(pendingRemoteCandidates_);
    }
    for (const auto& c : pending) {
        try {
            transport_->addRemoteCandidate(c.first, c.second);
        } catch (const std::exception& e) {
            logf(WEBSINK_LOG_WARN, "Session %s: buffered candidate rejected: %s", id_.c_str(), e.what());
        }
    }
    if (!pending.empty()) {
        logf(WEBSINK_LOG_DEBUG, "Session %s: applied %zu buffered candidates", id_.c_str(), pending.size());
    }
    return true;
}

bool ClientSession::addRemoteCandidate(const std::string& candidate, const std::string& mid) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (isTerminal(state_)) return false;
        // end-of-candidates
        if (candidate.empty()) return true;
        if (!remoteDescriptionSet_) {
            pendingRemoteCandidates_.emplace_back(candidate, mid);
            return true;
        }
    }
    touch();
    try {
        transport_->addRemoteCandidate(candidate, mid);
    } catch (const std::exception& e) {
        throw SignalingError(ErrorKind::SignalingProtocolError,
                             std::string("invalid ICE candidate: ") + e.what(), id_);
    }
    return true;
}

void ClientSession::onTransportState(TransportState ts) {
    logf(WEBSINK_LOG_DEBUG, "Session %s: transport %s", id_.c_str(), toString(ts));

    switch (ts) {
        case TransportState::Checking: {
            uint64_t seq;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (state_ != SessionState::AnswerReceived) return;
                state_ = SessionState::Negotiating;
                seq = ++transitions_;
            }
            transition(SessionState::AnswerReceived, SessionState::Negotiating, seq);
            break;
        }
        case TransportState::Connected: {
            bool skippedChecking = false;
            uint64_t seq;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                const SessionState s = state_;
                if (s == SessionState::AnswerReceived) {
                    skippedChecking = true;
                } else if (s != SessionState::Negotiating) {
                    return;
                }
                state_ = SessionState::Connected;
                // Negotiating is passed through when Checking was never reported
                if (skippedChecking) ++transitions_;
                seq = ++transitions_;
            }
            touch();
            if (skippedChecking) {
                transition(SessionState::AnswerReceived, SessionState::Negotiating, seq - 1);
            }
            transition(SessionState::Negotiating, SessionState::Connected, seq);
            break;
        }
        case TransportState::Disconnected:
        case TransportState::Closed: {
            const SessionState s = state();
            if (isTerminal(s)) return;
            if (s == SessionState::Connected) {
                close("transport closed");
            } else {
                fail(ErrorKind::NegotiationFailed, "transport closed during negotiation");
            }
            break;
        }
        case TransportState::Failed: {
            const SessionState s = state();
            if (isTerminal(s)) return;
            fail(s == SessionState::Connected ? ErrorKind::TransportClosed : ErrorKind::NegotiationFailed,
                 "ICE connectivity failed");
            break;
        }
    }
}

EnqueueResult ClientSession::enqueue(const std::shared_ptr<const AccessUnit>& unit) {
    if (!unit || state() != SessionState::Connected) return EnqueueResult::Rejected;

    const bool key = unit->isKeyframe();
    Outbound& out = *outbound_;
    std::lock_guard<std::mutex> lock(out.mutex);
    if (out.stopping) return EnqueueResult::Rejected;

    if (out.queue.size() >= out.capacity) {
        // Newest frame wins: discard the backlog, resync on a keyframe
        uint64_t discarded = out.queue.size() + (key ? 0 : 1);
        out.queue.clear();
        out.framesDropped += discarded;
        const uint64_t before = out.consecutiveDrops.fetch_add(discarded);
        logf(before == 0 ? WEBSINK_LOG_WARN : WEBSINK_LOG_DEBUG,
             "Session %s: %s, dropped %llu frames", id_.c_str(), toString(ErrorKind::IngestOverload),
             static_cast<unsigned long long>(discarded));
        if (!key) {
            needsKeyframe_ = true;
            return EnqueueResult::Dropped;
        }
    }

    out.queue.push_back(unit);
    if (key) needsKeyframe_ = false;
    out.cv.notify_one();
    return EnqueueResult::Queued;
}

void ClientSession::recordSkipped() {
    ++framesSkipped_;
}

void ClientSession::writerLoop(std::shared_ptr<Outbound> out, std::weak_ptr<ClientSession> owner) {
    for (;;) {
        std::shared_ptr<const AccessUnit> unit;
        {
            std::unique_lock<std::mutex> lock(out->mutex);
            out->cv.wait(lock, [&out] { return out->stopping || !out->queue.empty(); });
            if (out->stopping) break;
            unit = std::move(out->queue.front());
            out->queue.pop_front();
        }
        if (!out->deliver(*unit)) {
            // May drop the last reference; only `out` is used after this
            if (auto session = owner.lock()) session->close("outbound write failed");
            break;
        }
    }

    {
        std::lock_guard<std::mutex> lock(out->mutex);
        out->exited = true;
    }
    out->cv.notify_all();
}

bool ClientSession::Outbound::deliver(const AccessUnit& unit) {
    std::string error;
    try {
        if (!transport->sendFrame(unit)) error = "track not writable";
    } catch (const std::exception& e) {
        error = e.what();
    }

    if (!error.empty()) {
        ++writeErrors;
        logf(WEBSINK_LOG_INFO, "Session %s: %s on write: %s", id.c_str(),
             toString(ErrorKind::TransportClosed), error.c_str());
        return false;
    }

    ++framesSent;
    bytesSent += unit.payload().size();
    consecutiveDrops = 0;
    touch();
    return true;
}

void ClientSession::close(const std::string& reason) {
    terminate(SessionState::Closed, reason);
}

void ClientSession::fail(ErrorKind kind, const std::string& reason) {
    if (isTerminal(state())) return;
    logf(kind == ErrorKind::TransportClosed ? WEBSINK_LOG_INFO : WEBSINK_LOG_WARN,
         "Session %s failed (%s): %s", id_.c_str(), toString(kind), reason.c_str());
    terminate(SessionState::Failed, reason);
}

void ClientSession::terminate(SessionState target, const std::string& reason) {
    SessionState from;
    uint64_t seq;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        if (isTerminal(from)) return;
        state_ = target;
        seq = ++transitions_;
        closeReason_ = reason;
        pendingRemoteCandidates_.clear();
        pendingLocalCandidates_.clear();
    }
    stopWriter();

    // Outside the session lock: the transport may call straight back into us
    try {
        transport_->close();
    } catch (const std::exception& e) {
        logf(WEBSINK_LOG_WARN, "Session %s: error closing transport: %s", id_.c_str(), e.what());
    }

    if (target == SessionState::Closed) {
        logf(WEBSINK_LOG_INFO, "Session %s closed: %s", id_.c_str(), reason.c_str());
    }
    transition(from, target, seq);

    if (callbacks_.onTerminated) {
        if (auto self = weak_from_this().lock()) {
            callbacks_.onTerminated(self);
        }
    }
}

void ClientSession::stopWriter() {
    {
        std::lock_guard<std::mutex> lock(outbound_->mutex);
        outbound_->stopping = true;
        outbound_->queue.clear();
    }
    outbound_->cv.notify_all();
}

void ClientSession::transition(SessionState from, SessionState to, uint64_t seq) {
    logf(WEBSINK_LOG_DEBUG, "Session %s: %s -> %s", id_.c_str(), toString(from), toString(to));
    if (callbacks_.onStateChange) {
        callbacks_.onStateChange(*this, from, to, seq);
    }
}

bool ClientSession::join() {
    if (!writer_.joinable()) return true;
    if (writer_.get_id() == std::this_thread::get_id()) {
        // Last reference dropped by the writer itself
        writer_.detach();
        return true;
    }

    bool exited;
    {
        std::unique_lock<std::mutex> lock(outbound_->mutex);
        exited = outbound_->cv.wait_for(lock, writerJoinTimeout_, [this] { return outbound_->exited; });
    }
    if (!exited) {
        logf(WEBSINK_LOG_WARN, "Session %s: writer still blocked in the transport after %lld ms, detaching",
             id_.c_str(), static_cast<long long>(writerJoinTimeout_.count()));
        writer_.detach();
        return false;
    }
    writer_.join();
    return true;
}

void ClientSession::touch() {
    outbound_->touch();
}

ClientSession::Clock::time_point ClientSession::lastActivity() const {
    return Clock::time_point(Clock::duration(outbound_->lastActivity.load()));
}

uint64_t ClientSession::consecutiveDrops() const {
    return outbound_->consecutiveDrops.load();
}

SessionStats ClientSession::stats() const {
    SessionStats s;
    s.framesSent = outbound_->framesSent;
    s.bytesSent = outbound_->bytesSent;
    s.framesSkipped = framesSkipped_;
    s.framesDropped = outbound_->framesDropped;
    s.consecutiveDrops = outbound_->consecutiveDrops;
    s.writeErrors = outbound_->writeErrors;
    return s;
}

std::string ClientSession::closeReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closeReason_;
}

} // namespace websink
