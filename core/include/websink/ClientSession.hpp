#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include "websink/Errors.hpp"
#include "websink/H264.hpp"
#include "websink/PeerTransport.hpp"

namespace websink {

// New -> OfferSent -> AnswerReceived -> Negotiating -> Connected -> Closed | Failed
enum class SessionState {
    New,
    OfferSent,
    AnswerReceived,
    Negotiating,
    Connected,
    Closed,
    Failed
};

const char* toString(SessionState state);
inline bool isTerminal(SessionState state) {
    return state == SessionState::Closed || state == SessionState::Failed;
}

// Outcome of offering an access unit to a session's outbound queue
enum class EnqueueResult {
    Queued,
    Dropped,       // backlog discarded on overload; the unit was not queued
    Rejected       // session not connected or shutting down
};

struct SessionStats {
    uint64_t framesSent = 0;
    uint64_t bytesSent = 0;
    uint64_t framesSkipped = 0;     // waiting for a keyframe
    uint64_t framesDropped = 0;     // overload
    uint64_t consecutiveDrops = 0;
    uint64_t writeErrors = 0;
};

struct SessionOptions {
    size_t queueCapacity = 8;
    // How long join() waits for a writer stuck inside the transport before detaching it
    std::chrono::milliseconds writerJoinTimeout{1000};
};

class ClientSession;

// Hooks into the owner; invoked without the session lock held
struct SessionCallbacks {
    // Deliver a JSON text frame to this session's signaling channel
    std::function<void(const std::string& text)> sendSignal;
    // seq counts this session's transitions from 1 in the order they happened; two
    // racing transitions may be reported out of order, seq says which came first
    std::function<void(ClientSession& session, SessionState from, SessionState to, uint64_t seq)> onStateChange;
    // The peer asked for a keyframe (RTCP PLI or FIR)
    std::function<void(ClientSession& session)> onKeyframeRequest;
    // Called exactly once, after the session reached Closed or Failed
    std::function<void(const std::shared_ptr<ClientSession>& session)> onTerminated;
};

// One browser peer: negotiation state, its transport and an outbound queue drained
// by a dedicated writer thread.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    using Clock = std::chrono::steady_clock;

    static std::shared_ptr<ClientSession> create(std::string id,
                                                 std::unique_ptr<PeerTransport> transport,
                                                 const SessionOptions& options,
                                                 SessionCallbacks callbacks);
    ~ClientSession();

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    // 128 bit random token, hex encoded
    static std::string newSessionId();

    // Starts the writer thread and asks the transport for an offer (New -> OfferSent)
    void start();

    // Apply the browser's answer. Returns false if the session is already terminal
    // (the answer is discarded). Throws SignalingError with SignalingProtocolError
    // when not in OfferSent, or NegotiationFailed after the transport rejected it
    // (the session is then Failed).
    bool applyAnswer(const std::string& sdp);

    // Buffered until the answer has been applied. Returns false if terminal.
    bool addRemoteCandidate(const std::string& candidate, const std::string& mid);

    void onTransportState(TransportState state);

    // Non-blocking; see EnqueueResult
    EnqueueResult enqueue(const std::shared_ptr<const AccessUnit>& unit);
    void recordSkipped();

    // Idempotent; transport->close() runs exactly once across close() and fail()
    void close(const std::string& reason);
    void fail(ErrorKind kind, const std::string& reason);

    // Join the writer thread; no-op from the writer thread itself. A writer that
    // has not exited within the join timeout is detached and false is returned.
    bool join();

    const std::string& id() const { return id_; }
    SessionState state() const { return state_.load(); }
    bool needsKeyframe() const { return needsKeyframe_.load(); }
    Clock::time_point createdAt() const { return createdAt_; }
    Clock::time_point lastActivity() const;
    uint64_t consecutiveDrops() const;
    SessionStats stats() const;
    std::string closeReason() const;

private:
    struct Outbound;

    ClientSession(std::string id, std::unique_ptr<PeerTransport> transport,
                  const SessionOptions& options, SessionCallbacks callbacks);

    void onLocalDescription(const std::string& sdp);
    void onLocalCandidate(const std::string& candidate, const std::string& mid);
    void onKeyframeRequested();
    void transition(SessionState from, SessionState to, uint64_t seq);
    void terminate(SessionState target, const std::string& reason);
    void stopWriter();
    static void writerLoop(std::shared_ptr<Outbound> out, std::weak_ptr<ClientSession> owner);
    void touch();

    const std::string id_;
    // Shared with the writer thread, which may outlive the session once detached
    std::shared_ptr<PeerTransport> transport_;
    std::shared_ptr<Outbound> outbound_;
    const std::chrono::milliseconds writerJoinTimeout_;
    SessionCallbacks callbacks_;
    const Clock::time_point createdAt_;

    // Signaling state, guarded by mutex_
    mutable std::mutex mutex_;
    std::atomic<SessionState> state_{SessionState::New};
    bool remoteDescriptionSet_ = false;
    std::vector<std::pair<std::string, std::string>> pendingRemoteCandidates_;
    std::vector<std::pair<std::string, std::string>> pendingLocalCandidates_;
    std::string closeReason_;
    uint64_t transitions_ = 0;

    std::thread writer_;
    std::atomic<bool> needsKeyframe_{true};
    std::atomic<uint64_t> framesSkipped_{0};
};

} // namespace websink
