#include "websink/ShmRing.hpp"

#include <cstring>
#include <limits>
#include <new>
#include <stdexcept>

namespace websink {

namespace bip = boost::interprocess;

ShmRing::ShmRing(const std::string& name, size_t slotCount, size_t slotSize)
    : name_(name), header_(nullptr), buffer_(nullptr) {
    if (slotCount < 2 || slotSize == 0 || slotSize > std::numeric_limits<SlotLength>::max()) {
        throw std::invalid_argument("ShmRing: invalid geometry");
    }
    // Drop a segment left behind by a crashed process
    bip::shared_memory_object::remove(name_.c_str());
    shm_ = bip::shared_memory_object(bip::create_only, name_.c_str(), bip::read_write);

    // Calculate total size: header + slots, each slot prefixed by its length
    const size_t totalSize = sizeof(Header) + slotCount * (sizeof(SlotLength) + slotSize);
    shm_.truncate(static_cast<bip::offset_t>(totalSize));
    region_ = bip::mapped_region(shm_, bip::read_write);

    void* addr = region_.get_address();
    header_ = new (addr) Header;
    buffer_ = static_cast<char*>(addr) + sizeof(Header);
    header_->slotCount = slotCount;
    header_->slotSize = slotSize;
    header_->head.store(0);
    header_->tail.store(0);
}

ShmRing::~ShmRing() {
    bip::shared_memory_object::remove(name_.c_str());
}

bool ShmRing::push(const void* data, size_t size) {
    if (!data || size > header_->slotSize) return false;
    size_t head = header_->head.load(std::memory_order_acquire);
    size_t tail = header_->tail.load(std::memory_order_relaxed);
    size_t next = (tail + 1) % header_->slotCount;
    // ring full
    if (next == head) return false;

    char* dst = slot(tail);
    const SlotLength len = static_cast<SlotLength>(size);
    std::memcpy(dst, &len, sizeof(len));
    std::memcpy(dst + sizeof(len), data, size);
    // publish
    header_->tail.store(next, std::memory_order_release);
    return true;
}

bool ShmRing::tryPop(void* data, size_t capacity, size_t& size) {
    size_t head = header_->head.load(std::memory_order_relaxed);
    size_t tail = header_->tail.load(std::memory_order_acquire);
    if (head == tail) return false;

    const char* src = slot(head);
    SlotLength len = 0;
    std::memcpy(&len, src, sizeof(len));
    const size_t next = (head + 1) % header_->slotCount;
    if (len > capacity) {
        // Caller buffer too small: the frame is consumed and lost
        header_->head.store(next, std::memory_order_release);
        size = 0;
        return false;
    }
    std::memcpy(data, src + sizeof(len), len);
    size = len;
    header_->head.store(next, std::memory_order_release);
    return true;
}

} // namespace websink
