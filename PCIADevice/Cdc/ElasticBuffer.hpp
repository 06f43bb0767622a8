// ElasticBuffer.hpp
// PCIA - bounded frame FIFO between the transport and audio clock domains
//
// Single producer, single consumer, each on its own clock. Each side owns
// one free-running index and sees the other side's index only through a
// SyncCell it clocks itself, so both views are conservative:
//   - the producer never sees more free space than exists
//   - the consumer never sees more frames than exist
// Data is published with release/acquire ordering, so the two sides may run
// on real threads.

#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#include "../Audio/AudioFormat.hpp"
#include "SyncCell.hpp"

namespace PCIA::Cdc {

class ElasticBuffer {
public:
    /// Capacity in frames, power of two. Storage is allocated here and never again.
    explicit ElasticBuffer(uint32_t capacityFrames);

    ElasticBuffer(const ElasticBuffer&) = delete;
    ElasticBuffer& operator=(const ElasticBuffer&) = delete;

    // ------------------------------------------------------------------
    // Producer domain
    // ------------------------------------------------------------------

    /// Sample the consumer index into the producer's synchronizer.
    void producerClock() noexcept;

    /// Frames the producer may push (conservative).
    [[nodiscard]] uint32_t availableSpace() const noexcept;

    /// Occupancy as the producer sees it (never under-reports).
    [[nodiscard]] uint32_t producerFillLevel() const noexcept;

    /// @return false and counts an overrun when the producer sees the buffer full
    bool push(const Audio::AudioFrame& frame) noexcept;

    // ------------------------------------------------------------------
    // Consumer domain
    // ------------------------------------------------------------------

    /// Sample the producer index into the consumer's synchronizer.
    void consumerClock() noexcept;

    /// Frames the consumer may pop (conservative).
    [[nodiscard]] uint32_t fillLevel() const noexcept;

    /// Oldest frame, or nullptr when the consumer sees the buffer empty.
    [[nodiscard]] const Audio::AudioFrame* peek() const noexcept;

    /// @return false and counts an underrun when the consumer sees the buffer empty
    bool pop(Audio::AudioFrame& out) noexcept;

    /// Drop the oldest frame after a successful peek().
    void discard() noexcept;

    // ------------------------------------------------------------------
    // Either domain
    // ------------------------------------------------------------------

    /// Exact occupancy from the published indices (telemetry only).
    [[nodiscard]] uint32_t occupancy() const noexcept;

    [[nodiscard]] uint32_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool isEmpty() const noexcept { return occupancy() == 0; }
    [[nodiscard]] bool isFull() const noexcept { return occupancy() >= capacity_; }

    [[nodiscard]] uint64_t underrunCount() const noexcept {
        return underrunCount_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t overrunCount() const noexcept {
        return overrunCount_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t pushedCount() const noexcept {
        return pushedCount_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] uint64_t poppedCount() const noexcept {
        return poppedCount_.load(std::memory_order_relaxed);
    }

    /// Drain and clear counters. Both domains quiescent.
    void reset() noexcept;

private:
    std::vector<Audio::AudioFrame> storage_;
    const uint32_t capacity_;

    // Producer-owned
    uint32_t writeIndex_{0};
    SyncCell<uint32_t> readIndexSync_{0};   // written by consumer, clocked by producer

    // Consumer-owned
    uint32_t readIndex_{0};
    SyncCell<uint32_t> writeIndexSync_{0};  // written by producer, clocked by consumer

    std::atomic<uint64_t> underrunCount_{0};
    std::atomic<uint64_t> overrunCount_{0};
    std::atomic<uint64_t> pushedCount_{0};
    std::atomic<uint64_t> poppedCount_{0};
};

} // namespace PCIA::Cdc
