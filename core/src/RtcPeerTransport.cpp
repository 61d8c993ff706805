#include "websink/RtcPeerTransport.hpp"
#include "websink/Log.hpp"

#include <rtc/rtc.hpp>

namespace websink {

RtcPeerTransport::RtcPeerTransport(const WebSinkConfig& cfg, std::string sessionId, const RtpStreamState& rtp)
    : sessionId_(std::move(sessionId)),
      ssrc_(rtp.ssrc),
      payloadType_(cfg.payload_type),
      fmtp_(cfg.h264_fmtp),
      keyframeHook_(std::make_shared<KeyframeHook>()) {
    rtc::Configuration config;
    for (const auto& server : cfg.effectiveIceServers()) {
        rtc::IceServer ice(server.url);
        if (!server.username.empty()) {
            ice.username = server.username;
            ice.password = server.credential;
        }
        config.iceServers.push_back(ice);
    }
    if (cfg.ice_port_begin != 0) {
        config.portRangeBegin = cfg.ice_port_begin;
        config.portRangeEnd = cfg.ice_port_end;
    }
    config.mtu = cfg.mtu;
    // The offer is created explicitly once the track is in place
    config.disableAutoNegotiation = true;

    pc_ = std::make_shared<rtc::PeerConnection>(config);

    rtc::Description::Video media("video", rtc::Description::Direction::SendOnly);
    media.addH264Codec(payloadType_, fmtp_);
    media.addSSRC(ssrc_, "websink-" + sessionId_, "websink", "video");
    track_ = pc_->addTrack(media);

    std::weak_ptr<KeyframeHook> hook = keyframeHook_;
    chain_ = std::make_unique<H264MediaChain>(rtp, payloadType_, H264MediaChain::maxFragmentSizeFor(cfg.mtu),
                                              "websink-" + sessionId_, [hook]() {
        auto h = hook.lock();
        if (!h) return;
        std::function<void()> callback;
        {
            std::lock_guard<std::mutex> lock(h->mutex);
            callback = h->callback;
        }
        if (callback) callback();
    });
    track_->setMediaHandler(chain_->packetizer());

    logf(WEBSINK_LOG_DEBUG, "Created peer connection for session %s (ssrc=%u)", sessionId_.c_str(), ssrc_);
}

RtcPeerTransport::~RtcPeerTransport() {
    {
        std::lock_guard<std::mutex> lock(keyframeHook_->mutex);
        keyframeHook_->callback = nullptr;
    }
    pc_->resetCallbacks();
    close();
}

void RtcPeerTransport::setEventHandler(PeerTransportEvents events) {
    auto onDescription = std::move(events.localDescription);
    auto onCandidate = std::move(events.localCandidate);
    auto onState = events.stateChanged;
    auto onIceState = std::move(events.stateChanged);
    {
        std::lock_guard<std::mutex> lock(keyframeHook_->mutex);
        keyframeHook_->callback = std::move(events.keyframeRequested);
    }

    pc_->onLocalDescription([onDescription](rtc::Description description) {
        if (onDescription) onDescription(std::string(description));
    });

    pc_->onLocalCandidate([onCandidate](rtc::Candidate candidate) {
        if (onCandidate) onCandidate(candidate.candidate(), candidate.mid());
    });

    pc_->onIceStateChange([onIceState](rtc::PeerConnection::IceState state) {
        if (onIceState && state == rtc::PeerConnection::IceState::Checking) {
            onIceState(TransportState::Checking);
        }
    });

    pc_->onStateChange([onState](rtc::PeerConnection::State state) {
        if (!onState) return;
        switch (state) {
            case rtc::PeerConnection::State::Connected:
                onState(TransportState::Connected);
                break;
            case rtc::PeerConnection::State::Disconnected:
                onState(TransportState::Disconnected);
                break;
            case rtc::PeerConnection::State::Failed:
                onState(TransportState::Failed);
                break;
            case rtc::PeerConnection::State::Closed:
                onState(TransportState::Closed);
                break;
            default:
                break;
        }
    });
}

void RtcPeerTransport::createOffer() {
    pc_->setLocalDescription(rtc::Description::Type::Offer);
}

void RtcPeerTransport::setRemoteAnswer(const std::string& sdp) {
    pc_->setRemoteDescription(rtc::Description(sdp, rtc::Description::Type::Answer));
}

void RtcPeerTransport::addRemoteCandidate(const std::string& candidate, const std::string& mid) {
    pc_->addRemoteCandidate(rtc::Candidate(candidate, mid.empty() ? std::string("video") : mid));
}

bool RtcPeerTransport::sendFrame(const AccessUnit& unit) {
    if (closed_ || !track_ || !track_->isOpen()) return false;
    chain_->prepareFrame(unit.captureUsec());
    const auto& payload = unit.payload();
    return track_->send(reinterpret_cast<const std::byte*>(payload.data()), payload.size());
}

void RtcPeerTransport::close() {
    if (closed_.exchange(true)) return;
    pc_->close();
}

PeerTransportFactory RtcPeerTransport::factory(const WebSinkConfig& cfg) {
    return [cfg](const std::string& sessionId, const RtpStreamState& rtp) -> std::unique_ptr<PeerTransport> {
        return std::make_unique<RtcPeerTransport>(cfg, sessionId, rtp);
    };
}

} // namespace websink
