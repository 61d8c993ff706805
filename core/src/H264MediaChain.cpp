#include "websink/H264MediaChain.hpp"

#include <random>
#include <rtc/rtc.hpp>

namespace websink {

RtpStreamState RtpStreamState::random() {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint32_t> dis(1, 0xFFFFFFFF);

    RtpStreamState state;
    state.ssrc = dis(gen);
    state.sequence = static_cast<uint16_t>(dis(gen) & 0xFFFF);
    state.timestampOffset = dis(gen);
    return state;
}

H264MediaChain::H264MediaChain(const RtpStreamState& state, uint8_t payloadType, uint16_t maxFragmentSize,
                               const std::string& cname, std::function<void()> onKeyframeRequest)
    : timestampOffset_(state.timestampOffset) {
    config_ = std::make_shared<rtc::RtpPacketizationConfig>(state.ssrc, cname, payloadType, kClockRate);
    config_->sequenceNumber = state.sequence;
    config_->startTimestamp = state.timestampOffset;
    config_->timestamp = state.timestampOffset;

    packetizer_ = std::make_shared<rtc::H264RtpPacketizer>(rtc::NalUnit::Separator::StartSequence, config_,
                                                           maxFragmentSize);
    srReporter_ = std::make_shared<rtc::RtcpSrReporter>(config_);
    nackResponder_ = std::make_shared<rtc::RtcpNackResponder>();
    pliHandler_ = std::make_shared<rtc::PliHandler>(std::move(onKeyframeRequest));

    packetizer_->addToChain(srReporter_);
    packetizer_->addToChain(nackResponder_);
    packetizer_->addToChain(pliHandler_);
}

void H264MediaChain::prepareFrame(uint64_t captureUsec) {
    config_->timestamp = rtpTimestamp(captureUsec, timestampOffset_);
}

uint32_t H264MediaChain::rtpTimestamp(uint64_t captureUsec, uint32_t offset) {
    // 90 kHz clock; wraps modulo 2^32
    const uint64_t ticks = captureUsec / 1000000 * kClockRate + (captureUsec % 1000000) * kClockRate / 1000000;
    return offset + static_cast<uint32_t>(ticks);
}

uint16_t H264MediaChain::maxFragmentSizeFor(size_t mtu) {
    return static_cast<uint16_t>(mtu > kPacketOverhead ? mtu - kPacketOverhead : 1);
}

} // namespace websink
