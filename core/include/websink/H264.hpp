#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace websink {

// H.264 NAL unit types used by the engine
namespace nal {
constexpr uint8_t kSlice = 1;
constexpr uint8_t kIdr = 5;
constexpr uint8_t kSei = 6;
constexpr uint8_t kSps = 7;
constexpr uint8_t kPps = 8;
constexpr uint8_t kAud = 9;
constexpr uint8_t kFuA = 28;
} // namespace nal

inline uint8_t nalType(uint8_t header) { return header & 0x1F; }

// Borrowed view of one NAL unit (header byte included, start code excluded)
struct NalUnitView {
    const uint8_t* data = nullptr;
    size_t size = 0;

    uint8_t type() const { return size ? nalType(data[0]) : 0; }
};

// Location of a NAL unit inside an AccessUnit payload
struct NalSpan {
    size_t offset = 0;
    size_t size = 0;
};

// Split an Annex-B buffer (3 or 4 byte start codes). Returns false if no start code is found.
bool parseAnnexB(const uint8_t* data, size_t size, std::vector<NalUnitView>& out);

// Split an AVCC buffer (4 byte big-endian lengths). Returns false unless the lengths tile the buffer exactly
// and every NAL header has its forbidden_zero_bit clear.
bool parseAvcc(const uint8_t* data, size_t size, std::vector<NalUnitView>& out);

// How splitNalUnits found the NAL unit boundaries
enum class NalFraming {
    None,     // empty buffer
    AnnexB,
    Avcc,
    Raw       // no framing recognised; the whole buffer is one NAL unit
};

// A buffer opening with 00 00 01 or 00 00 00 01 is Annex-B. Otherwise AVCC, then
// Annex-B with leading garbage, then the whole buffer as a single NAL unit.
NalFraming splitNalUnits(const uint8_t* data, size_t size, std::vector<NalUnitView>& out);

bool containsIdr(const std::vector<NalUnitView>& nalus);

// One encoded frame: Annex-B payload, capture time and keyframe tag. Immutable once built.
class AccessUnit {
public:
    AccessUnit(std::vector<uint8_t> payload, std::vector<NalSpan> nalus, uint64_t captureUsec, bool keyframe);

    // Builds an Annex-B access unit from NAL units (4 byte start codes)
    static std::shared_ptr<const AccessUnit> fromNalUnits(const std::vector<NalUnitView>& nalus,
                                                          uint64_t captureUsec, bool keyframe);

    const std::vector<uint8_t>& payload() const { return payload_; }
    const std::vector<NalSpan>& nalus() const { return nalus_; }
    NalUnitView nalu(size_t index) const;
    uint64_t captureUsec() const { return captureUsec_; }
    bool isKeyframe() const { return keyframe_; }

private:
    std::vector<uint8_t> payload_;
    std::vector<NalSpan> nalus_;
    uint64_t captureUsec_;
    bool keyframe_;
};

} // namespace websink
