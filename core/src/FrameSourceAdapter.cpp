#include "websink/FrameSourceAdapter.hpp"
#include "websink/Log.hpp"

namespace websink {

namespace {

bool isSeiOrSlice(uint8_t type) {
    return type == nal::kSei || (type >= nal::kSlice && type <= nal::kIdr);
}

// First SEI or slice, or the first PPS as well when placing an SPS
std::vector<NalUnitView>::iterator firstOf(std::vector<NalUnitView>& nalus, bool stopAtPps) {
    for (auto it = nalus.begin(); it != nalus.end(); ++it) {
        const uint8_t type = it->type();
        if (isSeiOrSlice(type) || (stopAtPps && type == nal::kPps)) return it;
    }
    return nalus.end();
}

} // namespace

FrameSourceAdapter::FrameSourceAdapter(Sink sink, bool injectParameterSets)
    : sink_(std::move(sink)), injectParameterSets_(injectParameterSets) {}

bool FrameSourceAdapter::ingest(const uint8_t* payload, size_t size, uint64_t captureUsec, bool keyframeHint) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<NalUnitView> parsed;
    const NalFraming framing = splitNalUnits(payload, size, parsed);
    if (framing == NalFraming::None) {
        ++stats_.rejected;
        return false;
    }

    std::vector<NalUnitView> nalus;
    nalus.reserve(parsed.size() + 2);
    bool hasSps = false;
    bool hasPps = false;
    for (const auto& n : parsed) {
        switch (n.type()) {
            case nal::kAud:
                continue;
            case nal::kSps:
                hasSps = true;
                sps_.assign(n.data, n.data + n.size);
                break;
            case nal::kPps:
                hasPps = true;
                pps_.assign(n.data, n.data + n.size);
                break;
            default:
                break;
        }
        nalus.push_back(n);
    }
    if (nalus.empty()) {
        ++stats_.rejected;
        return false;
    }

    // The hint only matters when there was nothing to parse
    const bool keyframe = framing == NalFraming::Raw ? (keyframeHint || containsIdr(nalus)) : containsIdr(nalus);

    // Missing parameter sets go right before the first SEI or slice, SPS ahead of PPS
    if (keyframe && injectParameterSets_) {
        if (!hasSps && !sps_.empty()) {
            nalus.insert(firstOf(nalus, true), NalUnitView{sps_.data(), sps_.size()});
        }
        if (!hasPps && !pps_.empty()) {
            nalus.insert(firstOf(nalus, false), NalUnitView{pps_.data(), pps_.size()});
        }
    }

    if (haveTimestamp_ && captureUsec < lastCaptureUsec_) {
        logf(WEBSINK_LOG_DEBUG, "Capture timestamp went backwards (%llu < %llu), clamping",
             static_cast<unsigned long long>(captureUsec), static_cast<unsigned long long>(lastCaptureUsec_));
        captureUsec = lastCaptureUsec_;
        ++stats_.clamped;
    }
    haveTimestamp_ = true;
    lastCaptureUsec_ = captureUsec;

    auto unit = AccessUnit::fromNalUnits(nalus, captureUsec, keyframe);
    ++stats_.ingested;
    if (keyframe) ++stats_.keyframes;

    if (sink_) sink_(unit);
    return true;
}

AdapterStats FrameSourceAdapter::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

} // namespace websink
