#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace rtc {
class RtpPacketizationConfig;
class H264RtpPacketizer;
class RtcpSrReporter;
class RtcpNackResponder;
class PliHandler;
}

namespace websink {

// Per-track RTP counters; owned by exactly one session
struct RtpStreamState {
    uint32_t ssrc = 0;
    uint16_t sequence = 0;         // first sequence number to use
    uint32_t timestampOffset = 0;

    // Random SSRC, initial sequence and timestamp offset
    static RtpStreamState random();
};

// libdatachannel media handlers for one session's H264 track:
// H264RtpPacketizer -> RtcpSrReporter -> RtcpNackResponder -> PliHandler.
// Frames enter as Annex-B; the packetizer owns the sequence counter from here on.
class H264MediaChain {
public:
    static constexpr uint32_t kClockRate = 90000;
    // RTP + UDP + IPv6 headers
    static constexpr size_t kPacketOverhead = 12 + 8 + 40;

    H264MediaChain(const RtpStreamState& state, uint8_t payloadType, uint16_t maxFragmentSize,
                   const std::string& cname, std::function<void()> onKeyframeRequest);

    // Sets the RTP timestamp for the next frame; call before handing it to the track
    void prepareFrame(uint64_t captureUsec);

    static uint32_t rtpTimestamp(uint64_t captureUsec, uint32_t offset);
    static uint16_t maxFragmentSizeFor(size_t mtu);

    // Head of the chain, for Track::setMediaHandler
    std::shared_ptr<rtc::H264RtpPacketizer> packetizer() const { return packetizer_; }
    std::shared_ptr<rtc::PliHandler> pliHandler() const { return pliHandler_; }
    std::shared_ptr<rtc::RtpPacketizationConfig> config() const { return config_; }

private:
    const uint32_t timestampOffset_;
    std::shared_ptr<rtc::RtpPacketizationConfig> config_;
    std::shared_ptr<rtc::H264RtpPacketizer> packetizer_;
    std::shared_ptr<rtc::RtcpSrReporter> srReporter_;
    std::shared_ptr<rtc::RtcpNackResponder> nackResponder_;
    std::shared_ptr<rtc::PliHandler> pliHandler_;
};

} // namespace websink
