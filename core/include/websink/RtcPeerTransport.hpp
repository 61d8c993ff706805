#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include "websink/Config.hpp"
#include "websink/PeerTransport.hpp"

namespace rtc {
class PeerConnection;
class Track;
}

namespace websink {

// PeerTransport backed by a libdatachannel PeerConnection. The track's media
// handler is the session's H264MediaChain; sendFrame() hands it Annex-B.
class RtcPeerTransport : public PeerTransport {
public:
    RtcPeerTransport(const WebSinkConfig& cfg, std::string sessionId, const RtpStreamState& rtp);
    ~RtcPeerTransport() override;

    void setEventHandler(PeerTransportEvents events) override;
    void createOffer() override;
    void setRemoteAnswer(const std::string& sdp) override;
    void addRemoteCandidate(const std::string& candidate, const std::string& mid) override;
    bool sendFrame(const AccessUnit& unit) override;
    void close() override;

    // Factory for SessionManager
    static PeerTransportFactory factory(const WebSinkConfig& cfg);

private:
    // The media handler reaches this through a weak reference; cleared on destruction
    struct KeyframeHook {
        std::mutex mutex;
        std::function<void()> callback;
    };

    std::string sessionId_;
    uint32_t ssrc_;
    uint8_t payloadType_;
    std::string fmtp_;

    std::shared_ptr<KeyframeHook> keyframeHook_;
    std::unique_ptr<H264MediaChain> chain_;
    std::shared_ptr<rtc::PeerConnection> pc_;
    std::shared_ptr<rtc::Track> track_;
    std::atomic<bool> closed_{false};
};

} // namespace websink
