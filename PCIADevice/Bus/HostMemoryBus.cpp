#include "HostMemoryBus.hpp"

#include <array>

#include "../Hardware/DescriptorLayout.hpp"
#include "../Logging/Logging.hpp"

namespace PCIA::Bus {

HostMemoryBus::HostMemoryBus(Shared::IHostMemory& memory) noexcept
    : memory_(memory) {}

bool HostMemoryBus::RequestBurst(const BurstRequest& request) noexcept {
    ChannelState& channel = Channel(request.direction);
    if (requestStall_ || channel.busy || channel.error) {
        return false;
    }
    if (request.beatCount == 0 || request.beatBytes == 0) {
        Fault(channel, "empty burst request");
        return false;
    }

    const uint64_t totalBytes = static_cast<uint64_t>(request.beatCount) * request.beatBytes;
    if (!memory_.DeviceToVirt(request.address) ||
        !memory_.DeviceToVirt(request.address + totalBytes - 1)) {
        Fault(channel, "burst outside host memory");
        return false;
    }

    channel.request = request;
    channel.beatsDone = 0;
    channel.busy = true;
    counters_.burstsAccepted.fetch_add(1, std::memory_order_relaxed);
    return true;
}

BeatStatus HostMemoryBus::ReadBeat(std::span<uint8_t> out) noexcept {
    ChannelState& channel = read_;
    if (!channel.busy || beatStall_) {
        return {};
    }
    if (channel.injectedFault || out.size() < channel.request.beatBytes) {
        Fault(channel, channel.injectedFault ? "injected read fault" : "read beat buffer too small");
        return {};
    }

    const uint64_t address = channel.request.address +
                             static_cast<uint64_t>(channel.beatsDone) * channel.request.beatBytes;
    if (!memory_.Read(address, out.data(), channel.request.beatBytes)) {
        Fault(channel, "read outside host memory");
        return {};
    }

    counters_.beatsRead.fetch_add(1, std::memory_order_relaxed);
    ++channel.beatsDone;
    const bool last = channel.beatsDone == channel.request.beatCount;
    if (last) {
        channel.busy = false;
    }
    return BeatStatus{true, last};
}

BeatStatus HostMemoryBus::WriteBeat(std::span<const uint8_t> data) noexcept {
    ChannelState& channel = write_;
    if (!channel.busy || beatStall_) {
        return {};
    }
    if (channel.injectedFault || data.size() < channel.request.beatBytes) {
        Fault(channel, channel.injectedFault ? "injected write fault" : "write beat shorter than burst beat");
        return {};
    }

    const uint64_t address = channel.request.address +
                             static_cast<uint64_t>(channel.beatsDone) * channel.request.beatBytes;
    if (!memory_.Write(address, data.data(), channel.request.beatBytes)) {
        Fault(channel, "write outside host memory");
        return {};
    }

    counters_.beatsWritten.fetch_add(1, std::memory_order_relaxed);
    ++channel.beatsDone;
    const bool last = channel.beatsDone == channel.request.beatCount;
    if (last) {
        channel.busy = false;
    }
    return BeatStatus{true, last};
}

void HostMemoryBus::PostWrite32(BurstDirection direction, uint64_t address, uint32_t value) noexcept {
    std::array<uint8_t, 4> bytes{};
    HW::StoreLE32(bytes.data(), value);
    if (!memory_.Write(address, bytes.data(), bytes.size())) {
        Fault(Channel(direction), "posted write outside host memory");
        return;
    }
    counters_.postedWrites.fetch_add(1, std::memory_order_relaxed);
}

bool HostMemoryBus::ErrorPending(BurstDirection direction) const noexcept {
    return Channel(direction).error;
}

void HostMemoryBus::ClearError(BurstDirection direction) noexcept {
    ChannelState& channel = Channel(direction);
    channel.error = false;
    channel.injectedFault = false;
    channel.busy = false;
    channel.beatsDone = 0;
}

void HostMemoryBus::InjectError(BurstDirection direction) noexcept {
    Channel(direction).injectedFault = true;
}

void HostMemoryBus::Fault(ChannelState& channel, const char* what) noexcept {
    channel.error = true;
    channel.busy = false;
    counters_.faults.fetch_add(1, std::memory_order_relaxed);
    PCIA_LOG_RL(Dma, "bus/fault", 1000, Error, "HostMemoryBus: %s (addr=0x%llx beat=%u/%u)",
                what, (unsigned long long)channel.request.address,
                channel.beatsDone, channel.request.beatCount);
}

} // namespace PCIA::Bus
