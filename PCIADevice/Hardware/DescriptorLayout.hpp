#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

namespace PCIA::HW {

// Host-visible descriptor record, 24 bytes, little-endian, packed:
//   [0..7]   buffer address
//   [8..11]  length in bytes
//   [12..15] flags
//   [16..23] next descriptor address
// A ring is a contiguous array of records at base + index * 24.

inline constexpr size_t kDescriptorRecordSize = 24;
inline constexpr size_t kDescriptorAddressOffset = 0;
inline constexpr size_t kDescriptorLengthOffset = 8;
inline constexpr size_t kDescriptorFlagsOffset = 12;
inline constexpr size_t kDescriptorNextOffset = 16;

namespace DescriptorFlags {
inline constexpr uint32_t kInterrupt = 1u << 0;
inline constexpr uint32_t kLastInChain = 1u << 1;
inline constexpr uint32_t kWrap = 1u << 2;
inline constexpr uint32_t kHardwareOwned = 1u << 31;
inline constexpr uint32_t kKnownMask = kInterrupt | kLastInChain | kWrap | kHardwareOwned;
} // namespace DescriptorFlags

struct DescriptorRecord {
    uint64_t bufferAddress{0};
    uint32_t length{0};
    uint32_t flags{0};
    uint64_t nextAddress{0};
};

using RecordBytes = std::span<uint8_t, kDescriptorRecordSize>;
using ConstRecordBytes = std::span<const uint8_t, kDescriptorRecordSize>;

[[nodiscard]] constexpr uint32_t LoadLE32(const uint8_t* p) noexcept {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

[[nodiscard]] constexpr uint64_t LoadLE64(const uint8_t* p) noexcept {
    return static_cast<uint64_t>(LoadLE32(p)) |
           (static_cast<uint64_t>(LoadLE32(p + 4)) << 32);
}

constexpr void StoreLE32(uint8_t* p, uint32_t value) noexcept {
    p[0] = static_cast<uint8_t>(value);
    p[1] = static_cast<uint8_t>(value >> 8);
    p[2] = static_cast<uint8_t>(value >> 16);
    p[3] = static_cast<uint8_t>(value >> 24);
}

constexpr void StoreLE64(uint8_t* p, uint64_t value) noexcept {
    StoreLE32(p, static_cast<uint32_t>(value));
    StoreLE32(p + 4, static_cast<uint32_t>(value >> 32));
}

[[nodiscard]] constexpr DescriptorRecord DecodeDescriptor(ConstRecordBytes bytes) noexcept {
    DescriptorRecord record{};
    record.bufferAddress = LoadLE64(bytes.data() + kDescriptorAddressOffset);
    record.length = LoadLE32(bytes.data() + kDescriptorLengthOffset);
    record.flags = LoadLE32(bytes.data() + kDescriptorFlagsOffset);
    record.nextAddress = LoadLE64(bytes.data() + kDescriptorNextOffset);
    return record;
}

constexpr void EncodeDescriptor(const DescriptorRecord& record, RecordBytes bytes) noexcept {
    StoreLE64(bytes.data() + kDescriptorAddressOffset, record.bufferAddress);
    StoreLE32(bytes.data() + kDescriptorLengthOffset, record.length);
    StoreLE32(bytes.data() + kDescriptorFlagsOffset, record.flags);
    StoreLE64(bytes.data() + kDescriptorNextOffset, record.nextAddress);
}

/// Device address of record `index` in a ring at `base`.
[[nodiscard]] constexpr uint64_t DescriptorAddress(uint64_t base, size_t index) noexcept {
    return base + static_cast<uint64_t>(index) * kDescriptorRecordSize;
}

} // namespace PCIA::HW
