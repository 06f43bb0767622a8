// RingHelpers.hpp - Shared utilities for ring cursors and free-running FIFO indices
//
// DescriptorRing uses the modulo cursor helpers. ElasticBuffer keeps
// free-running 32-bit indices (never masked) so occupancy is a plain
// subtraction that survives wraparound.

#pragma once

#include <cstddef>
#include <cstdint>

namespace PCIA::Shared::RingHelpers {

[[nodiscard]] constexpr inline size_t Advance(size_t index, size_t amount, size_t capacity) noexcept {
    if (capacity == 0) return 0;
    return (index + amount) % capacity;
}

[[nodiscard]] constexpr inline bool IsValidIndex(size_t index, size_t size) noexcept {
    return index < size;
}

// Free-running index variants (capacity must be a power of two)

[[nodiscard]] constexpr inline uint32_t Occupancy(uint32_t writeIndex, uint32_t readIndex) noexcept {
    return writeIndex - readIndex;
}

[[nodiscard]] constexpr inline uint32_t FreeSpace(uint32_t writeIndex, uint32_t readIndex, uint32_t capacity) noexcept {
    const uint32_t used = Occupancy(writeIndex, readIndex);
    return used >= capacity ? 0 : capacity - used;
}

[[nodiscard]] constexpr inline uint32_t SlotOf(uint32_t index, uint32_t capacity) noexcept {
    return index & (capacity - 1);
}

static_assert(Occupancy(2u, 0xFFFF'FFFEu) == 4u, "Occupancy must survive index wraparound");
static_assert(FreeSpace(8u, 0u, 8u) == 0u, "Full buffer has no free space");

} // namespace PCIA::Shared::RingHelpers
