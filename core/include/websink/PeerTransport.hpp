#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include "websink/H264.hpp"
#include "websink/H264MediaChain.hpp"

namespace websink {

// Connectivity reported by a peer transport
enum class TransportState {
    Checking,       // candidate pairs are being checked
    Connected,
    Disconnected,
    Failed,
    Closed
};

const char* toString(TransportState state);

// Callbacks a transport raises; any of them may run on a transport-owned thread
struct PeerTransportEvents {
    std::function<void(const std::string& sdp)> localDescription;
    std::function<void(const std::string& candidate, const std::string& mid)> localCandidate;
    std::function<void(TransportState state)> stateChanged;
    // The browser sent a PLI or FIR for the video track
    std::function<void()> keyframeRequested;
};

// One WebRTC peer connection carrying a single send-only H264 video track.
// Implementations must tolerate sendFrame() and close() racing from different
// threads, and close() must make a pending sendFrame() return. A writer that is
// still blocked after the session's join timeout is detached, not waited for.
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    // Must be called before createOffer()
    virtual void setEventHandler(PeerTransportEvents events) = 0;

    // Build the local offer; the SDP is delivered through localDescription,
    // possibly before this returns. Throws on failure.
    virtual void createOffer() = 0;

    // Throws if the answer is rejected
    virtual void setRemoteAnswer(const std::string& sdp) = 0;

    // Throws if the candidate is rejected
    virtual void addRemoteCandidate(const std::string& candidate, const std::string& mid) = 0;

    // Packetize and write one access unit; false if the media track is not writable
    virtual bool sendFrame(const AccessUnit& unit) = 0;

    virtual void close() = 0;
};

// Creates the transport for a new session with the session's initial RTP state
using PeerTransportFactory =
    std::function<std::unique_ptr<PeerTransport>(const std::string& sessionId, const RtpStreamState& rtp)>;

} // namespace websink
