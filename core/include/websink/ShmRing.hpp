#pragma once
#include <cstddef>
#include <cstdint>
#include <atomic>
#include <string>
#include <boost/interprocess/shared_memory_object.hpp>
#include <boost/interprocess/mapped_region.hpp>

namespace websink {

// Lock-free single-producer/single-consumer ring of length-prefixed slots in
// shared memory. Never blocks and never grows: a full ring rejects the push.
class ShmRing {
public:
    // Creates (replacing any stale segment) a shared-memory ring with the given name.
    // Throws boost::interprocess::interprocess_exception on failure.
    ShmRing(const std::string& name, size_t slotCount, size_t slotSize);
    ~ShmRing();

    ShmRing(const ShmRing&) = delete;
    ShmRing& operator=(const ShmRing&) = delete;

    // False if the ring is full or size exceeds the slot size
    bool push(const void* data, size_t size);
    // False if the ring is empty; size receives the pushed length
    bool tryPop(void* data, size_t capacity, size_t& size);

    size_t slotSize() const { return header_->slotSize; }
    // Usable slots: one is kept free to tell full from empty
    size_t capacity() const { return header_->slotCount - 1; }
    const std::string& name() const { return name_; }

private:
    struct Header {
        std::atomic<size_t> head;
        std::atomic<size_t> tail;
        size_t slotCount;
        size_t slotSize;
    };
    using SlotLength = uint32_t;

    char* slot(size_t index) const { return buffer_ + index * (sizeof(SlotLength) + header_->slotSize); }

    std::string name_;
    boost::interprocess::shared_memory_object shm_;
    boost::interprocess::mapped_region region_;
    Header* header_;
    char* buffer_;
};

} // namespace websink
