#include "ElasticBuffer.hpp"

#include "../Config/BufferProfiles.hpp"
#include "../Logging/Logging.hpp"
#include "../Shared/Rings/RingHelpers.hpp"

namespace PCIA::Cdc {
namespace {

uint32_t RoundUpCapacity(uint32_t requested) noexcept {
    if (Config::IsPowerOfTwo(requested)) {
        return requested;
    }
    uint32_t capacity = 1;
    while (capacity < requested && capacity < (1u << 31)) {
        capacity <<= 1;
    }
    PCIA_LOG_ERROR(Cdc, "ElasticBuffer: capacity %u is not a power of two, using %u", requested, capacity);
    return capacity;
}

} // namespace

ElasticBuffer::ElasticBuffer(uint32_t capacityFrames)
    : capacity_(RoundUpCapacity(capacityFrames)) {
    storage_.resize(capacity_);
}

// ----------------------------------------------------------------------------
// Producer domain
// ----------------------------------------------------------------------------

void ElasticBuffer::producerClock() noexcept {
    readIndexSync_.Clock();
}

uint32_t ElasticBuffer::availableSpace() const noexcept {
    return Shared::RingHelpers::FreeSpace(writeIndex_, readIndexSync_.Read(), capacity_);
}

uint32_t ElasticBuffer::producerFillLevel() const noexcept {
    return Shared::RingHelpers::Occupancy(writeIndex_, readIndexSync_.Read());
}

bool ElasticBuffer::push(const Audio::AudioFrame& frame) noexcept {
    if (availableSpace() == 0) {
        overrunCount_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }

    storage_[Shared::RingHelpers::SlotOf(writeIndex_, capacity_)] = frame;
    ++writeIndex_;
    writeIndexSync_.Write(writeIndex_);
    pushedCount_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

// ----------------------------------------------------------------------------
// Consumer domain
// ----------------------------------------------------------------------------

void ElasticBuffer::consumerClock() noexcept {
    writeIndexSync_.Clock();
}

uint32_t ElasticBuffer::fillLevel() const noexcept {
    return Shared::RingHelpers::Occupancy(writeIndexSync_.Read(), readIndex_);
}

const Audio::AudioFrame* ElasticBuffer::peek() const noexcept {
    if (fillLevel() == 0) {
        return nullptr;
    }
    return &storage_[Shared::RingHelpers::SlotOf(readIndex_, capacity_)];
}

bool ElasticBuffer::pop(Audio::AudioFrame& out) noexcept {
    const Audio::AudioFrame* head = peek();
    if (!head) {
        underrunCount_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    out = *head;
    discard();
    return true;
}

void ElasticBuffer::discard() noexcept {
    if (fillLevel() == 0) {
        return;
    }
    ++readIndex_;
    readIndexSync_.Write(readIndex_);
    poppedCount_.fetch_add(1, std::memory_order_relaxed);
}

// ----------------------------------------------------------------------------
// Either domain
// ----------------------------------------------------------------------------

uint32_t ElasticBuffer::occupancy() const noexcept {
    // Read index first: the write index can only be further ahead by the time it is loaded.
    const uint32_t read = readIndexSync_.Source();
    const uint32_t write = writeIndexSync_.Source();
    return Shared::RingHelpers::Occupancy(write, read);
}

void ElasticBuffer::reset() noexcept {
    writeIndex_ = 0;
    readIndex_ = 0;
    readIndexSync_.Reset();
    writeIndexSync_.Reset();
    underrunCount_.store(0, std::memory_order_relaxed);
    overrunCount_.store(0, std::memory_order_relaxed);
    pushedCount_.store(0, std::memory_order_relaxed);
    poppedCount_.store(0, std::memory_order_relaxed);
}

} // namespace PCIA::Cdc
