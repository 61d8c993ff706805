#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include "websink/H264.hpp"

namespace websink {

struct AdapterStats {
    uint64_t ingested = 0;
    uint64_t keyframes = 0;
    uint64_t rejected = 0;
    uint64_t clamped = 0;     // capture timestamps that went backwards
};

// Entry point for encoded frames. Normalises each payload into an immutable
// Annex-B AccessUnit and hands it to the sink (the broadcast engine).
class FrameSourceAdapter {
public:
    using Sink = std::function<void(const std::shared_ptr<const AccessUnit>&)>;

    explicit FrameSourceAdapter(Sink sink, bool injectParameterSets = true);

    // Returns false for an empty or unusable payload. Serialised across callers;
    // returns once the unit has been queued, never waits on a client.
    bool ingest(const uint8_t* payload, size_t size, uint64_t captureUsec, bool keyframeHint);

    AdapterStats stats() const;

private:
    Sink sink_;
    const bool injectParameterSets_;

    mutable std::mutex mutex_;
    bool haveTimestamp_ = false;
    uint64_t lastCaptureUsec_ = 0;
    std::vector<uint8_t> sps_;
    std::vector<uint8_t> pps_;
    AdapterStats stats_;
};

} // namespace websink
