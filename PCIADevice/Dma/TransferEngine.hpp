// TransferEngine.hpp
// PCIA - descriptor-ring DMA engine, one instance per direction
//
//   Idle --(enabled, buffer can absorb one burst)--> FetchDescriptor
//   FetchDescriptor --(descriptor not complete, burst accepted)--> MoveData
//   FetchDescriptor --(descriptor already complete)--> Complete
//   MoveData --(last beat / burst counter reached)--> UpdateDescriptor
//   UpdateDescriptor --(lastInChain)--> Complete, otherwise --> Idle
//   Complete --(disabled)--> Idle
//
// One beat per tick; a beat is one Audio Sample Frame. Stalls are waited on
// indefinitely. A bus fault latches DmaError() and parks the engine in Idle
// until it is disabled and its ring reset.

#pragma once

#include <array>
#include <atomic>
#include <cstdint>

#include "../Bus/IHostBus.hpp"
#include "../Cdc/ElasticBuffer.hpp"
#include "../Common/Error.hpp"
#include "../Config/DeviceConfig.hpp"
#include "../Shared/Memory/IHostMemory.hpp"
#include "../Shared/Rings/DescriptorRing.hpp"

namespace PCIA::Dma {

enum class Direction : uint8_t {
    kPlayback,  // host memory -> outbound elastic buffer
    kCapture,   // inbound elastic buffer -> host memory
};

enum class EngineState : uint8_t {
    Idle,
    FetchDescriptor,
    MoveData,
    UpdateDescriptor,
    Complete,
};

[[nodiscard]] constexpr const char* ToString(Direction direction) noexcept {
    return direction == Direction::kPlayback ? "PB" : "CAP";
}

[[nodiscard]] constexpr const char* ToString(EngineState state) noexcept {
    switch (state) {
        case EngineState::Idle:             return "Idle";
        case EngineState::FetchDescriptor:  return "FetchDescriptor";
        case EngineState::MoveData:         return "MoveData";
        case EngineState::UpdateDescriptor: return "UpdateDescriptor";
        case EngineState::Complete:         return "Complete";
    }
    return "Unknown";
}

class TransferEngine {
public:
    struct Counters {
        std::atomic<uint64_t> burstsCompleted{0};
        std::atomic<uint64_t> descriptorsCompleted{0};
        std::atomic<uint64_t> completionEdges{0};
        std::atomic<uint64_t> stallTicks{0};
        std::atomic<uint64_t> dmaErrors{0};
    };

    /// `buffer` is the outbound elastic buffer (playback, producer side) or
    /// the inbound one (capture, consumer side).
    TransferEngine(Direction direction,
                   Bus::IHostBus& bus,
                   Cdc::ElasticBuffer& buffer,
                   const Config::DeviceConfig& config);

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /**
     * Load the descriptor ring and check it against the burst geometry.
     *
     * Rejects: engine enabled (kBusy); bufferSize not a non-zero multiple of
     * the burst size, zero-length descriptors, descriptors of at least one
     * burst that are not whole bursts, shorter descriptors that are not whole
     * frames (kInvalidConfiguration); ring outside host memory or count outside
     * 1..capacity (kBadArgument).
     */
    [[nodiscard]] Result<void> OpenStream(const Shared::IHostMemory& memory,
                                          uint64_t baseAddress,
                                          uint32_t descriptorCount,
                                          uint32_t bufferSize) noexcept;

    void CloseStream() noexcept;

    void SetEnabled(bool enabled) noexcept;

    /// Cursor to 0, complete flags cleared, DMA error released. Requires disabled.
    [[nodiscard]] Result<void> ResetRing() noexcept;

    /// Unconditional return to Idle with the ring rewound (soft reset).
    void ForceReset() noexcept;

    /// One transport clock.
    void Tick() noexcept;

    /// Consume the pending completion edge, if any.
    [[nodiscard]] bool TakeCompletionEdge() noexcept;

    [[nodiscard]] Direction GetDirection() const noexcept { return direction_; }
    [[nodiscard]] EngineState State() const noexcept { return state_; }
    [[nodiscard]] bool IsEnabled() const noexcept { return enabled_; }
    [[nodiscard]] bool IsOpen() const noexcept { return ring_.IsLoaded(); }
    [[nodiscard]] bool DmaError() const noexcept { return dmaError_; }
    [[nodiscard]] bool CompleteSignal() const noexcept {
        return state_ == EngineState::Complete || pendingEdge_;
    }
    [[nodiscard]] uint32_t BurstCounter() const noexcept { return burstCounter_; }
    [[nodiscard]] uint32_t BurstFrames() const noexcept { return burstFrames_; }
    [[nodiscard]] const Shared::DescriptorRing& Ring() const noexcept { return ring_; }
    [[nodiscard]] const Counters& GetCounters() const noexcept { return counters_; }

private:
    void TickIdle() noexcept;
    void TickFetchDescriptor() noexcept;
    void TickMoveData() noexcept;
    void TickUpdateDescriptor() noexcept;
    void TickComplete() noexcept;

    void MovePlaybackBeat() noexcept;
    void MoveCaptureBeat() noexcept;
    void FinishBeat(bool last) noexcept;
    void LatchDmaError(const char* where) noexcept;
    void TransitionTo(EngineState next) noexcept;

    [[nodiscard]] Bus::BurstDirection BusDirection() const noexcept {
        return direction_ == Direction::kPlayback ? Bus::BurstDirection::kRead
                                                  : Bus::BurstDirection::kWrite;
    }

    const Direction direction_;
    Bus::IHostBus& bus_;
    Cdc::ElasticBuffer& buffer_;
    Shared::DescriptorRing ring_;

    const uint32_t channels_;
    const uint32_t frameBytes_;
    const uint32_t burstBytes_;
    const uint32_t burstFrames_;

    EngineState state_{EngineState::Idle};
    bool enabled_{false};
    bool dmaError_{false};
    bool pendingEdge_{false};
    uint32_t burstBeats_{0};
    uint32_t burstCounter_{0};
    std::array<uint8_t, Config::kMaxBeatBytes> beat_{};

    Counters counters_{};
};

} // namespace PCIA::Dma
