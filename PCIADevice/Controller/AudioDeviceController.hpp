// AudioDeviceController.hpp
// PCIA - top-level wiring of the DMA engines, the CDC bridge and the frame processor
//
// Threading: TickTransport() and every register accessor belong to the
// transport domain; TickAudio() belongs to the audio domain. The two may run
// on different threads. Nothing else is shared between them.

#pragma once

#include <atomic>
#include <cstdint>
#include <memory>

#include "../Audio/FrameProcessor.hpp"
#include "../Bus/IHostBus.hpp"
#include "../Cdc/ClockDomainBridge.hpp"
#include "../Common/Error.hpp"
#include "../Config/DeviceConfig.hpp"
#include "../Dma/TransferEngine.hpp"
#include "../Shared/Memory/IHostMemory.hpp"
#include "DeviceRegisters.hpp"
#include "IInterruptSink.hpp"

namespace PCIA::Controller {

class AudioDeviceController {
    struct CreateTag {
        explicit CreateTag() = default;
    };

public:
    struct Counters {
        std::atomic<uint64_t> transportTicks{0};
        std::atomic<uint64_t> audioTicks{0};
        std::atomic<uint64_t> interruptsDelivered{0};
        std::atomic<uint64_t> interruptsMasked{0};
        std::atomic<uint64_t> softResets{0};
        std::atomic<uint64_t> formatChanges{0};
    };

    /// Validates `config` before building anything.
    [[nodiscard]] static Result<std::unique_ptr<AudioDeviceController>> Create(
        const Config::DeviceConfig& config,
        Shared::IHostMemory& memory,
        Bus::IHostBus& bus);

    /// Reachable only through Create().
    AudioDeviceController(CreateTag,
                          const Config::DeviceConfig& config,
                          Shared::IHostMemory& memory,
                          Bus::IHostBus& bus);

    AudioDeviceController(const AudioDeviceController&) = delete;
    AudioDeviceController& operator=(const AudioDeviceController&) = delete;

    // ------------------------------------------------------------------
    // Format control
    // ------------------------------------------------------------------

    /**
     * Validate the format against the device geometry and publish it to the
     * audio domain. Takes effect at the next frame boundary once the control
     * synchronizers have settled. Disabled directions are rewound to
     * descriptor 0; enabled ones keep streaming.
     */
    [[nodiscard]] Result<void> WriteFormatControl(const FormatControl& control);
    [[nodiscard]] FormatControl ReadFormatControl() const noexcept { return format_; }

    // ------------------------------------------------------------------
    // Descriptor rings and direction enables
    // ------------------------------------------------------------------

    /// kBusy while the direction is enabled.
    [[nodiscard]] Result<void> WriteRingRegisters(Dma::Direction direction, const RingRegisters& regs);
    [[nodiscard]] const RingRegisters& ReadRingRegisters(Dma::Direction direction) const noexcept {
        return Slot(direction).regs;
    }

    /// Load the ring described by the direction's ring registers.
    [[nodiscard]] Result<void> OpenStream(Dma::Direction direction);
    /// Logs the direction's transfer statistics first when statistics logging is on.
    void CloseStream(Dma::Direction direction);

    /// Enabling requires an open stream (kNotReady) and no latched DMA error
    /// (kDmaError until ResetDirection or SoftReset).
    [[nodiscard]] Result<void> SetEnabled(Dma::Direction direction, bool enabled);

    /// Rewind one direction's ring and release a latched DMA error. Requires disabled.
    [[nodiscard]] Result<void> ResetDirection(Dma::Direction direction);

    /// Both engines to Idle with cursors at 0, both elastic buffers drained,
    /// every synchronizer back to its default, both directions disabled.
    /// The format register and the loaded rings are kept.
    void SoftReset();

    void SetInterruptSink(IInterruptSink* sink) noexcept { sink_ = sink; }

    // ------------------------------------------------------------------
    // Clocks
    // ------------------------------------------------------------------

    void TickTransport() noexcept;
    void TickAudio() noexcept;

    // ------------------------------------------------------------------
    // Status
    // ------------------------------------------------------------------

    [[nodiscard]] DeviceStatus ReadStatus() const noexcept;

    [[nodiscard]] const Config::DeviceConfig& GetConfig() const noexcept { return config_; }
    [[nodiscard]] const Counters& GetCounters() const noexcept { return counters_; }

    [[nodiscard]] Dma::TransferEngine& Engine(Dma::Direction direction) noexcept {
        return *Slot(direction).engine;
    }
    [[nodiscard]] const Dma::TransferEngine& Engine(Dma::Direction direction) const noexcept {
        return *Slot(direction).engine;
    }
    [[nodiscard]] Cdc::ClockDomainBridge& Bridge() noexcept { return bridge_; }
    [[nodiscard]] Audio::FrameProcessor& Processor() noexcept { return processor_; }
    [[nodiscard]] const Audio::FrameProcessor& Processor() const noexcept { return processor_; }

private:
    struct DirectionSlot {
        std::unique_ptr<Dma::TransferEngine> engine;
        RingRegisters regs{};
    };

    void PublishControl() noexcept;
    void DeliverCompletion(Dma::Direction direction) noexcept;
    [[nodiscard]] DirectionStatus BuildDirectionStatus(Dma::Direction direction, uint32_t level) const noexcept;

    [[nodiscard]] DirectionSlot& Slot(Dma::Direction direction) noexcept {
        return direction == Dma::Direction::kPlayback ? playback_ : capture_;
    }
    [[nodiscard]] const DirectionSlot& Slot(Dma::Direction direction) const noexcept {
        return direction == Dma::Direction::kPlayback ? playback_ : capture_;
    }

    const Config::DeviceConfig config_;
    Shared::IHostMemory& memory_;
    Bus::IHostBus& bus_;

    Cdc::ClockDomainBridge bridge_;
    Audio::FrameProcessor processor_;
    DirectionSlot playback_;
    DirectionSlot capture_;

    FormatControl format_{};
    IInterruptSink* sink_{nullptr};
    Counters counters_{};
};

} // namespace PCIA::Controller
