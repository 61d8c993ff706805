#include "websink/H264.hpp"

#include <cstring>

namespace websink {

namespace {

// Position of the next 00 00 01 at or after `from`, or `size` if none
size_t findStartCode(const uint8_t* data, size_t size, size_t from) {
    for (size_t i = from; i + 3 <= size; ++i) {
        if (data[i] == 0 && data[i + 1] == 0 && data[i + 2] == 1) return i;
    }
    return size;
}

bool hasLeadingStartCode(const uint8_t* data, size_t size) {
    if (size >= 3 && data[0] == 0 && data[1] == 0 && data[2] == 1) return true;
    return size >= 4 && data[0] == 0 && data[1] == 0 && data[2] == 0 && data[3] == 1;
}

} // namespace

bool parseAnnexB(const uint8_t* data, size_t size, std::vector<NalUnitView>& out) {
    size_t pos = findStartCode(data, size, 0);
    if (pos == size) return false;

    while (pos < size) {
        size_t nalStart = pos + 3;
        size_t next = findStartCode(data, size, nalStart);
        size_t nalEnd = next;
        // trailing zeros belong to the next 4 byte start code
        while (nalEnd > nalStart && data[nalEnd - 1] == 0) --nalEnd;
        if (nalEnd > nalStart) {
            out.push_back({data + nalStart, nalEnd - nalStart});
        }
        pos = next;
    }
    return true;
}

bool parseAvcc(const uint8_t* data, size_t size, std::vector<NalUnitView>& out) {
    if (size < 5) return false;

    std::vector<NalUnitView> found;
    size_t offset = 0;
    while (offset + 4 <= size) {
        const uint32_t nalSize = (static_cast<uint32_t>(data[offset]) << 24) |
                                 (static_cast<uint32_t>(data[offset + 1]) << 16) |
                                 (static_cast<uint32_t>(data[offset + 2]) << 8) |
                                 static_cast<uint32_t>(data[offset + 3]);
        offset += 4;
        if (nalSize == 0 || nalSize > size - offset) return false;
        // forbidden_zero_bit set: not a NAL header, so not an AVCC length either
        if (data[offset] & 0x80) return false;
        found.push_back({data + offset, nalSize});
        offset += nalSize;
    }
    if (offset != size || found.empty()) return false;

    out.insert(out.end(), found.begin(), found.end());
    return true;
}

NalFraming splitNalUnits(const uint8_t* data, size_t size, std::vector<NalUnitView>& out) {
    out.clear();
    if (!data || size == 0) return NalFraming::None;

    // A leading start code always means Annex-B; AVCC is only tried without one
    if (hasLeadingStartCode(data, size)) {
        parseAnnexB(data, size, out);
        return out.empty() ? NalFraming::None : NalFraming::AnnexB;
    }
    if (parseAvcc(data, size, out)) return NalFraming::Avcc;
    out.clear();
    if (parseAnnexB(data, size, out) && !out.empty()) return NalFraming::AnnexB;
    out.clear();

    out.push_back({data, size});
    return NalFraming::Raw;
}

bool containsIdr(const std::vector<NalUnitView>& nalus) {
    for (const auto& n : nalus) {
        if (n.type() == nal::kIdr) return true;
    }
    return false;
}

AccessUnit::AccessUnit(std::vector<uint8_t> payload, std::vector<NalSpan> nalus, uint64_t captureUsec, bool keyframe)
    : payload_(std::move(payload)), nalus_(std::move(nalus)), captureUsec_(captureUsec), keyframe_(keyframe) {}

std::shared_ptr<const AccessUnit> AccessUnit::fromNalUnits(const std::vector<NalUnitView>& nalus,
                                                           uint64_t captureUsec, bool keyframe) {
    static const uint8_t kStartCode[4] = {0x00, 0x00, 0x00, 0x01};

    size_t total = 0;
    for (const auto& n : nalus) total += sizeof(kStartCode) + n.size;

    std::vector<uint8_t> payload;
    payload.reserve(total);
    std::vector<NalSpan> spans;
    spans.reserve(nalus.size());
    for (const auto& n : nalus) {
        if (!n.data || n.size == 0) continue;
        payload.insert(payload.end(), kStartCode, kStartCode + sizeof(kStartCode));
        spans.push_back({payload.size(), n.size});
        payload.insert(payload.end(), n.data, n.data + n.size);
    }
    return std::make_shared<const AccessUnit>(std::move(payload), std::move(spans), captureUsec, keyframe);
}

NalUnitView AccessUnit::nalu(size_t index) const {
    const NalSpan& span = nalus_.at(index);
    return {payload_.data() + span.offset, span.size};
}

} // namespace websink
