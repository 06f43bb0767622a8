#pragma once

#include <atomic>
#include <cstdint>
#include <span>

#include "../Shared/Memory/IHostMemory.hpp"
#include "IHostBus.hpp"

namespace PCIA::Bus {

/**
 * IHostBus over IHostMemory. One beat per tick per channel when not stalled.
 *
 * Stall and fault injection model a congested or faulting interconnect:
 * - SetRequestStall: RequestBurst refuses new bursts
 * - SetBeatStall: outstanding bursts stop moving beats
 * - InjectError: the next beat on that channel faults
 * Any access outside host memory faults as well.
 */
class HostMemoryBus final : public IHostBus {
public:
    struct Counters {
        std::atomic<uint64_t> burstsAccepted{0};
        std::atomic<uint64_t> beatsRead{0};
        std::atomic<uint64_t> beatsWritten{0};
        std::atomic<uint64_t> postedWrites{0};
        std::atomic<uint64_t> faults{0};
    };

    explicit HostMemoryBus(Shared::IHostMemory& memory) noexcept;

    [[nodiscard]] bool RequestBurst(const BurstRequest& request) noexcept override;
    [[nodiscard]] BeatStatus ReadBeat(std::span<uint8_t> out) noexcept override;
    [[nodiscard]] BeatStatus WriteBeat(std::span<const uint8_t> data) noexcept override;
    void PostWrite32(BurstDirection direction, uint64_t address, uint32_t value) noexcept override;
    [[nodiscard]] bool ErrorPending(BurstDirection direction) const noexcept override;
    void ClearError(BurstDirection direction) noexcept override;

    void SetRequestStall(bool stalled) noexcept { requestStall_ = stalled; }
    void SetBeatStall(bool stalled) noexcept { beatStall_ = stalled; }
    void InjectError(BurstDirection direction) noexcept;

    [[nodiscard]] bool BurstOutstanding(BurstDirection direction) const noexcept {
        return Channel(direction).busy;
    }
    [[nodiscard]] const Counters& GetCounters() const noexcept { return counters_; }

private:
    struct ChannelState {
        BurstRequest request{};
        uint32_t beatsDone{0};
        bool busy{false};
        bool error{false};
        bool injectedFault{false};
    };

    ChannelState& Channel(BurstDirection direction) noexcept {
        return direction == BurstDirection::kRead ? read_ : write_;
    }
    const ChannelState& Channel(BurstDirection direction) const noexcept {
        return direction == BurstDirection::kRead ? read_ : write_;
    }

    void Fault(ChannelState& channel, const char* what) noexcept;

    Shared::IHostMemory& memory_;
    ChannelState read_{};
    ChannelState write_{};
    bool requestStall_{false};
    bool beatStall_{false};
    Counters counters_{};
};

} // namespace PCIA::Bus
