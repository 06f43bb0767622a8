#include "DescriptorRing.hpp"

#include <array>

#include "../../Logging/LogConfig.hpp"

namespace PCIA::Shared {

Descriptor Descriptor::FromRecord(const HW::DescriptorRecord& record) noexcept {
    Descriptor d{};
    d.bufferAddress = record.bufferAddress;
    d.length = record.length;
    d.interrupt = (record.flags & HW::DescriptorFlags::kInterrupt) != 0;
    d.lastInChain = (record.flags & HW::DescriptorFlags::kLastInChain) != 0;
    d.wrap = (record.flags & HW::DescriptorFlags::kWrap) != 0;
    d.hardwareOwned = (record.flags & HW::DescriptorFlags::kHardwareOwned) != 0;
    d.nextAddress = record.nextAddress;
    return d;
}

HW::DescriptorRecord Descriptor::ToRecord() const noexcept {
    HW::DescriptorRecord record{};
    record.bufferAddress = bufferAddress;
    record.length = length;
    record.flags = (interrupt ? HW::DescriptorFlags::kInterrupt : 0u) |
                   (lastInChain ? HW::DescriptorFlags::kLastInChain : 0u) |
                   (wrap ? HW::DescriptorFlags::kWrap : 0u) |
                   (hardwareOwned ? HW::DescriptorFlags::kHardwareOwned : 0u);
    record.nextAddress = nextAddress;
    return record;
}

DescriptorRing::DescriptorRing(size_t capacity)
    : storage_(capacity) {}

Result<void> DescriptorRing::Load(const IHostMemory& memory, uint64_t baseAddress, size_t count) noexcept {
    if (count == 0 || count > storage_.size()) {
        return PCIA_ERROR_INVALID("Descriptor count outside 1..ring capacity");
    }

    std::array<uint8_t, HW::kDescriptorRecordSize> raw{};
    for (size_t i = 0; i < count; ++i) {
        const uint64_t address = HW::DescriptorAddress(baseAddress, i);
        if (!memory.Read(address, raw.data(), raw.size())) {
            count_ = 0;
            return PCIA_ERROR_INVALID("Descriptor ring lies outside host memory");
        }
        storage_[i] = Descriptor::FromRecord(HW::DecodeDescriptor(HW::ConstRecordBytes(raw)));
        PCIA_LOG_DESCRIPTOR("desc[%zu] addr=0x%llx len=%u irq=%d last=%d wrap=%d next=0x%llx",
                            i, (unsigned long long)storage_[i].bufferAddress, storage_[i].length,
                            storage_[i].interrupt, storage_[i].lastInChain, storage_[i].wrap,
                            (unsigned long long)storage_[i].nextAddress);
    }

    count_ = count;
    baseAddress_ = baseAddress;
    Reset();

    PCIA_LOG_V2(Dma, "DescriptorRing: loaded %zu descriptors from 0x%llx",
                count, (unsigned long long)baseAddress);
    return {};
}

Result<void> DescriptorRing::Assign(std::span<const Descriptor> descriptors, uint64_t baseAddress) noexcept {
    if (descriptors.empty() || descriptors.size() > storage_.size()) {
        return PCIA_ERROR_INVALID("Descriptor count outside 1..ring capacity");
    }

    for (size_t i = 0; i < descriptors.size(); ++i) {
        storage_[i] = descriptors[i];
    }
    count_ = descriptors.size();
    baseAddress_ = baseAddress;
    Reset();
    return {};
}

void DescriptorRing::Clear() noexcept {
    count_ = 0;
    passes_ = 0;
    currentIndex_ = 0;
    activeCount_ = 0;
    bytesProcessed_ = 0;
}

Descriptor* DescriptorRing::Current() noexcept {
    return At(currentIndex_);
}

const Descriptor* DescriptorRing::Current() const noexcept {
    return At(currentIndex_);
}

Descriptor* DescriptorRing::At(size_t index) noexcept {
    return RingHelpers::IsValidIndex(index, count_) ? &storage_[index] : nullptr;
}

const Descriptor* DescriptorRing::At(size_t index) const noexcept {
    return RingHelpers::IsValidIndex(index, count_) ? &storage_[index] : nullptr;
}

void DescriptorRing::Activate() noexcept {
    Descriptor* current = Current();
    if (!current || current->active || current->complete) {
        return;
    }
    current->active = true;
    ++activeCount_;
}

void DescriptorRing::RecordBurst(uint32_t bytes) noexcept {
    Descriptor* current = Current();
    if (!current) {
        return;
    }
    current->offset += bytes;
    bytesProcessed_ += bytes;
}

bool DescriptorRing::MarkComplete(uint32_t bytes) noexcept {
    Descriptor* current = Current();
    if (!current || current->complete) {
        return false;
    }

    current->offset += bytes;
    current->complete = true;
    if (current->active) {
        current->active = false;
        --activeCount_;
    }
    bytesProcessed_ += bytes;
    return true;
}

void DescriptorRing::Advance() noexcept {
    const Descriptor* current = Current();
    if (!current) {
        return;
    }

    if (current->lastInChain) {
        currentIndex_ = 0;
        return;
    }
    if (current->wrap) {
        // Circular ring: crossing the wrap boundary starts the next pass.
        RearmAll();
        currentIndex_ = 0;
        ++passes_;
        return;
    }
    currentIndex_ = ResolveNext(*current);
}

void DescriptorRing::RearmAll() noexcept {
    for (size_t i = 0; i < count_; ++i) {
        storage_[i].complete = false;
        storage_[i].active = false;
        storage_[i].offset = 0;
    }
    activeCount_ = 0;
}

void DescriptorRing::Reset() noexcept {
    RearmAll();
    currentIndex_ = 0;
    bytesProcessed_ = 0;
    passes_ = 0;
}

size_t DescriptorRing::ResolveNext(const Descriptor& descriptor) const noexcept {
    const size_t fallback = RingHelpers::Advance(currentIndex_, 1, count_);

    if (descriptor.nextAddress < baseAddress_) {
        return fallback;
    }
    const uint64_t delta = descriptor.nextAddress - baseAddress_;
    if (delta % HW::kDescriptorRecordSize != 0) {
        return fallback;
    }
    const uint64_t index = delta / HW::kDescriptorRecordSize;
    if (index >= count_) {
        return fallback;
    }
    return static_cast<size_t>(index);
}

} // namespace PCIA::Shared
