#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "../../Common/Error.hpp"
#include "../../Hardware/DescriptorLayout.hpp"
#include "../Memory/IHostMemory.hpp"
#include "RingHelpers.hpp"

namespace PCIA::Shared {

/// Decoded descriptor plus the engine-side bookkeeping for its activation.
struct Descriptor {
    uint64_t bufferAddress{0};
    uint32_t length{0};
    bool interrupt{false};
    bool lastInChain{false};
    bool wrap{false};
    bool hardwareOwned{false};
    uint64_t nextAddress{0};

    bool complete{false};
    bool active{false};      ///< first burst issued, not yet complete
    uint32_t offset{0};      ///< bytes already moved in this activation

    [[nodiscard]] uint32_t Remaining() const noexcept { return length - offset; }

    [[nodiscard]] static Descriptor FromRecord(const HW::DescriptorRecord& record) noexcept;
    [[nodiscard]] HW::DescriptorRecord ToRecord() const noexcept;
};

/**
 * Fixed-capacity descriptor ring owned by one transfer engine.
 *
 * Storage is allocated once at construction; Load() copies records out of
 * host memory into it. Only the owning engine mutates the ring.
 */
class DescriptorRing {
public:
    explicit DescriptorRing(size_t capacity);
    ~DescriptorRing() = default;

    DescriptorRing(const DescriptorRing&) = delete;
    DescriptorRing& operator=(const DescriptorRing&) = delete;

    /// Read `count` records starting at `baseAddress` and reset the cursor.
    [[nodiscard]] Result<void> Load(const IHostMemory& memory, uint64_t baseAddress, size_t count) noexcept;

    /// Install already-decoded descriptors. `baseAddress` is used to resolve next pointers.
    [[nodiscard]] Result<void> Assign(std::span<const Descriptor> descriptors, uint64_t baseAddress) noexcept;

    /// Drop all descriptors (stream close).
    void Clear() noexcept;

    [[nodiscard]] Descriptor* Current() noexcept;
    [[nodiscard]] const Descriptor* Current() const noexcept;
    [[nodiscard]] Descriptor* At(size_t index) noexcept;
    [[nodiscard]] const Descriptor* At(size_t index) const noexcept;

    /// Flag the current descriptor as in flight. No-op if already active or complete.
    void Activate() noexcept;

    /// Account a burst that leaves bytes outstanding on the current descriptor.
    void RecordBurst(uint32_t bytes) noexcept;

    /**
     * Account the final burst of the current descriptor and set `complete`.
     * @return false if the descriptor was already complete (nothing changes)
     */
    [[nodiscard]] bool MarkComplete(uint32_t bytes) noexcept;

    /**
     * Follow `next`; return to 0 after a descriptor flagged wrap or lastInChain.
     *
     * lastInChain ends the pass: descriptors stay complete until Reset().
     * wrap (without lastInChain) re-arms every descriptor so the ring
     * streams continuously; bytesProcessed keeps counting.
     */
    void Advance() noexcept;

    /// Cursor, counters and every complete flag back to the loaded state.
    void Reset() noexcept;

    [[nodiscard]] bool IsLoaded() const noexcept { return count_ != 0; }
    [[nodiscard]] size_t Size() const noexcept { return count_; }
    [[nodiscard]] size_t Capacity() const noexcept { return storage_.size(); }
    [[nodiscard]] size_t CurrentIndex() const noexcept { return currentIndex_; }
    [[nodiscard]] uint32_t ActiveCount() const noexcept { return activeCount_; }
    [[nodiscard]] uint32_t BytesProcessed() const noexcept { return bytesProcessed_; }
    /// Wrap boundaries crossed since the last reset.
    [[nodiscard]] uint64_t Passes() const noexcept { return passes_; }
    [[nodiscard]] uint64_t BaseAddress() const noexcept { return baseAddress_; }
    [[nodiscard]] uint64_t CurrentAddress() const noexcept {
        return HW::DescriptorAddress(baseAddress_, currentIndex_);
    }

private:
    [[nodiscard]] size_t ResolveNext(const Descriptor& descriptor) const noexcept;
    void RearmAll() noexcept;

    std::vector<Descriptor> storage_;
    size_t count_{0};
    size_t currentIndex_{0};
    uint32_t activeCount_{0};
    uint32_t bytesProcessed_{0};
    uint64_t passes_{0};
    uint64_t baseAddress_{0};
};

} // namespace PCIA::Shared
