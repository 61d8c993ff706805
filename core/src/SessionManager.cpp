#include "websink/SessionManager.hpp"
#include "websink/EventBus.hpp"
#include "websink/Log.hpp"
#include "websink/SignalingMessage.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace websink {

SessionManager::SessionManager(const WebSinkConfig& cfg, ClientRegistry& registry, BroadcastEngine& engine,
                               PeerTransportFactory factory)
    : cfg_(cfg), registry_(registry), engine_(engine), factory_(std::move(factory)) {
    options_.queueCapacity = cfg_.outbound_queue_frames;
    options_.writerJoinTimeout = std::chrono::milliseconds(cfg_.writer_join_timeout_ms);
}

SessionManager::~SessionManager() {
    stop();
}

void SessionManager::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (housekeeping_.joinable() || stopHousekeeping_) return;
    housekeeping_ = std::thread(&SessionManager::housekeepingLoop, this);
}

void SessionManager::stop() {
    if (stopped_.exchange(true)) return;
    accepting_ = false;
    {
        // Wait out any openSession that already passed the accepting check
        std::lock_guard<std::mutex> lock(openMutex_);
    }
    registry_.closeAll("shutdown");

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopHousekeeping_ = true;
    }
    cv_.notify_all();
    if (housekeeping_.joinable()) housekeeping_.join();
    reapTerminated();
    logf(WEBSINK_LOG_INFO, "Session manager stopped");
}

std::string SessionManager::openSession(const std::shared_ptr<SignalingChannel>& channel) {
    if (!channel) return {};

    std::shared_ptr<ClientSession> session;
    {
        std::lock_guard<std::mutex> lock(openMutex_);
        if (!accepting_) {
            ++refused_;
            channel->send(encodeError("", "server shutting down"));
            channel->close();
            return {};
        }
        if (cfg_.max_clients > 0 && registry_.size() >= static_cast<size_t>(cfg_.max_clients)) {
            ++refused_;
            logf(WEBSINK_LOG_WARN, "Refusing client: %zu sessions active (max_clients=%d)",
                 registry_.size(), cfg_.max_clients);
            channel->send(encodeError("", "server full"));
            channel->close();
            return {};
        }

        const std::string id = ClientSession::newSessionId();
        RtpStreamState rtp = RtpStreamState::random();

        std::unique_ptr<PeerTransport> transport;
        try {
            transport = factory_(id, rtp);
        } catch (const std::exception& e) {
            logf(WEBSINK_LOG_ERROR, "Failed to create peer connection for session %s: %s", id.c_str(), e.what());
        }
        if (!transport) {
            ++refused_;
            channel->send(encodeError("", "unable to create peer connection"));
            channel->close();
            return {};
        }

        SessionCallbacks callbacks;
        std::weak_ptr<SignalingChannel> weakChannel = channel;
        callbacks.sendSignal = [weakChannel](const std::string& text) {
            if (auto ch = weakChannel.lock()) ch->send(text);
        };
        callbacks.onStateChange = [this](ClientSession& s, SessionState from, SessionState to, uint64_t seq) {
            onSessionState(s, from, to, seq);
        };
        callbacks.onKeyframeRequest = [this](ClientSession& s) {
            ++peerKeyframeRequests_;
            if (engine_.requestKeyframe()) {
                logf(WEBSINK_LOG_DEBUG, "Session %s: forwarded keyframe request to the source", s.id().c_str());
            }
        };
        callbacks.onTerminated = [this](const std::shared_ptr<ClientSession>& s) {
            onSessionTerminated(s);
        };

        session = ClientSession::create(id, std::move(transport), options_, std::move(callbacks));
        registry_.add(session);
        {
            std::lock_guard<std::mutex> lock2(mutex_);
            bindings_[id] = channel;
        }
    }

    ++opened_;
    logf(WEBSINK_LOG_INFO, "Session %s opened (%zu active)", session->id().c_str(), registry_.size());
    publishEvent(json{{"event", "SessionOpened"}, {"session_id", session->id()}}.dump());

    session->start();
    if (isTerminal(session->state())) return {};
    return session->id();
}

void SessionManager::handleMessage(const std::shared_ptr<SignalingChannel>& channel, const std::string& text) {
    if (!channel) return;

    SignalingMessage msg;
    try {
        msg = parseSignalingMessage(text);
    } catch (const SignalingError& e) {
        ++protocolErrors_;
        logf(WEBSINK_LOG_WARN, "Signaling protocol error: %s", e.what());
        channel->send(encodeError(e.sessionId(), e.what()));
        return;
    }

    switch (msg.type) {
        case SignalType::Offer:
            ++protocolErrors_;
            channel->send(encodeError(msg.sessionId, "client offers are not supported; wait for the server offer"));
            return;
        case SignalType::Error:
            logf(WEBSINK_LOG_WARN, "Client reported error for session %s: %s",
                 msg.sessionId.c_str(), msg.message.c_str());
            return;
        case SignalType::Answer:
        case SignalType::IceCandidate:
            break;
    }

    auto session = lookup(channel, msg.sessionId);
    if (!session) {
        logf(WEBSINK_LOG_WARN, "Discarding %s for unknown session %s", toString(msg.type), msg.sessionId.c_str());
        return;
    }

    try {
        if (msg.type == SignalType::Answer) {
            if (!session->applyAnswer(msg.sdp)) {
                logf(WEBSINK_LOG_WARN, "Discarding answer for %s session %s",
                     toString(session->state()), session->id().c_str());
            }
        } else if (!session->addRemoteCandidate(msg.candidate, msg.sdpMid)) {
            logf(WEBSINK_LOG_DEBUG, "Discarding candidate for %s session %s",
                 toString(session->state()), session->id().c_str());
        }
    } catch (const SignalingError& e) {
        ++protocolErrors_;
        logf(WEBSINK_LOG_WARN, "Session %s: %s (%s)", session->id().c_str(), e.what(), toString(e.kind()));
        channel->send(encodeError(session->id(), e.what()));
    }
}

void SessionManager::channelClosed(const std::shared_ptr<SignalingChannel>& channel) {
    std::vector<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, weak] : bindings_) {
            auto bound = weak.lock();
            if (!bound || bound == channel) ids.push_back(id);
        }
    }
    for (const auto& id : ids) {
        if (auto session = registry_.find(id)) {
            session->close("signaling channel closed");
        }
    }
}

std::shared_ptr<ClientSession> SessionManager::lookup(const std::shared_ptr<SignalingChannel>& channel,
                                                      const std::string& sessionId) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bindings_.find(sessionId);
        if (it == bindings_.end() || it->second.lock() != channel) return nullptr;
    }
    return registry_.find(sessionId);
}

void SessionManager::onSessionState(ClientSession& session, SessionState from, SessionState to, uint64_t seq) {
    publishEvent(json{
        {"event", "SessionStateChanged"},
        {"session_id", session.id()},
        {"from", toString(from)},
        {"state", toString(to)},
        {"seq", seq}
    }.dump());

    if (to == SessionState::Connected) {
        logf(WEBSINK_LOG_INFO, "Session %s connected", session.id().c_str());
        engine_.onSessionConnected(session);
    }
}

void SessionManager::onSessionTerminated(const std::shared_ptr<ClientSession>& session) {
    registry_.remove(session);

    std::shared_ptr<SignalingChannel> channel;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = bindings_.find(session->id());
        if (it != bindings_.end()) {
            channel = it->second.lock();
            bindings_.erase(it);
        }
        // Joined later by housekeeping: this may be the session's own writer thread
        retired_.push_back(session);
    }
    cv_.notify_all();

    if (channel) {
        if (session->state() == SessionState::Failed) {
            channel->send(encodeError(session->id(), session->closeReason()));
        }
        channel->close();
    }
}

void SessionManager::reapTerminated() {
    std::vector<std::shared_ptr<ClientSession>> retired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired.swap(retired_);
    }
    for (const auto& session : retired) {
        // A writer stuck in the transport is detached rather than waited for
        if (!session->join()) ++detachedWriters_;
        ++removed_;

        const SessionStats s = session->stats();
        const std::string reason = session->closeReason();
        logf(WEBSINK_LOG_INFO, "Session %s removed (%s: %s), frames=%llu dropped=%llu",
             session->id().c_str(), toString(session->state()), reason.c_str(),
             static_cast<unsigned long long>(s.framesSent), static_cast<unsigned long long>(s.framesDropped));
        publishEvent(json{
            {"event", "SessionRemoved"},
            {"session_id", session->id()},
            {"state", toString(session->state())},
            {"reason", reason},
            {"frames_sent", s.framesSent},
            {"bytes_sent", s.bytesSent},
            {"frames_dropped", s.framesDropped}
        }.dump());
    }
}

void SessionManager::sweep() {
    const auto now = ClientSession::Clock::now();
    const auto timeout = std::chrono::milliseconds(cfg_.negotiation_timeout_ms);

    for (const auto& session : registry_.snapshot()) {
        const SessionState st = session->state();
        if (isTerminal(st)) continue;

        if (st != SessionState::Connected) {
            if (now - session->createdAt() >= timeout) {
                ++timeouts_;
                session->fail(ErrorKind::NegotiationTimeout,
                              "not connected within " + std::to_string(cfg_.negotiation_timeout_ms) + " ms");
            }
        } else if (cfg_.max_consecutive_drops > 0 &&
                   session->consecutiveDrops() >= static_cast<uint64_t>(cfg_.max_consecutive_drops)) {
            ++evictions_;
            logf(WEBSINK_LOG_WARN, "Session %s stalled after %llu consecutive drops", session->id().c_str(),
                 static_cast<unsigned long long>(session->consecutiveDrops()));
            session->close("stalled");
        }
    }
}

void SessionManager::housekeepingLoop() {
    const auto interval = std::chrono::milliseconds(cfg_.sweep_interval_ms);
    auto nextSweep = std::chrono::steady_clock::now() + interval;

    std::unique_lock<std::mutex> lock(mutex_);
    while (!stopHousekeeping_) {
        cv_.wait_until(lock, nextSweep, [this] { return stopHousekeeping_ || !retired_.empty(); });
        if (stopHousekeeping_) break;
        lock.unlock();

        reapTerminated();
        if (std::chrono::steady_clock::now() >= nextSweep) {
            sweep();
            nextSweep = std::chrono::steady_clock::now() + interval;
        }

        lock.lock();
    }
}

void SessionManager::publishEvent(const std::string& event) {
    EventBus::instance().publish(kEventChannel, event);
}

SessionManagerStats SessionManager::stats() const {
    SessionManagerStats s;
    s.opened = opened_;
    s.refused = refused_;
    s.removed = removed_;
    s.negotiationTimeouts = timeouts_;
    s.stalledEvictions = evictions_;
    s.protocolErrors = protocolErrors_;
    s.peerKeyframeRequests = peerKeyframeRequests_;
    s.detachedWriters = detachedWriters_;
    return s;
}

} // namespace websink
