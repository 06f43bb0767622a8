#include "AudioDeviceController.hpp"

#include <initializer_list>

#include "../Audio/ClockDivider.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace PCIA::Controller {

namespace {

[[nodiscard]] bool SameClocking(const FormatControl& a, const FormatControl& b) noexcept {
    return a.format == b.format && a.family == b.family && a.multiplier == b.multiplier &&
           a.dsdMode == b.dsdMode && a.clockSource == b.clockSource &&
           a.masterMode == b.masterMode && a.tdmSlots == b.tdmSlots &&
           a.slotWidthBits == b.slotWidthBits;
}

} // namespace

Result<std::unique_ptr<AudioDeviceController>> AudioDeviceController::Create(
    const Config::DeviceConfig& config,
    Shared::IHostMemory& memory,
    Bus::IHostBus& bus) {
    PCIA_TRY_LOG(Config::ValidateDeviceConfig(config));

    auto controller = std::make_unique<AudioDeviceController>(CreateTag{}, config, memory, bus);
    PCIA_LOG_V1(Controller, "Device created: %u ch, %u/%u bit, burst %u B, elastic %u frames, ring %u",
                config.channelCount, config.sampleWidthBits, config.slotWidthBits,
                config.burstBytes, config.elasticCapacityFrames, config.descriptorCapacity);
    return controller;
}

AudioDeviceController::AudioDeviceController(CreateTag,
                                             const Config::DeviceConfig& config,
                                             Shared::IHostMemory& memory,
                                             Bus::IHostBus& bus)
    : config_(config),
      memory_(memory),
      bus_(bus),
      bridge_(config_),
      processor_(bridge_, config_) {
    playback_.engine = std::make_unique<Dma::TransferEngine>(
        Dma::Direction::kPlayback, bus_, bridge_.PlaybackBuffer(), config_);
    capture_.engine = std::make_unique<Dma::TransferEngine>(
        Dma::Direction::kCapture, bus_, bridge_.CaptureBuffer(), config_);

    format_.tdmSlots = static_cast<uint8_t>(config_.tdmSlots);
    format_.slotWidthBits = static_cast<uint8_t>(config_.slotWidthBits);
    PublishControl();
}

// ============================================================================
// Format control
// ============================================================================

Result<void> AudioDeviceController::WriteFormatControl(const FormatControl& control) {
    if (!Audio::IsValidFormatCode(static_cast<uint8_t>(control.format))) {
        return PCIA_ERROR_INVALID("Unknown audio format code");
    }

    Audio::FormatParams params{};
    params.format = control.format;
    params.multiplier = control.multiplier;
    params.channels = config_.channelCount;
    params.sampleWidthBits = config_.sampleWidthBits;
    params.slotWidthBits = control.slotWidthBits;
    params.tdmSlots = control.tdmSlots;

    auto timing = Audio::ComputeFrameTiming(params);
    if (!timing) {
        PCIA_LOG_V0(Controller, "Format %s rejected: %s", Audio::ToString(control.format),
                    timing.error().message);
        return std::unexpected(timing.error());
    }

    if (SameClocking(control, format_)) {
        return {};
    }

    PCIA_LOG_V1(Controller, "Format %s -> %s (family=%s x%u, %s, %u slots x %u bit, bclk/%u)",
                Audio::ToString(format_.format), Audio::ToString(control.format),
                Audio::ToString(control.family), 1u << control.multiplier,
                control.masterMode ? "master" : "slave", control.tdmSlots, control.slotWidthBits,
                timing->bitClockDivider);

    format_ = control;
    counters_.formatChanges.fetch_add(1, std::memory_order_relaxed);

    for (DirectionSlot* slot : {&playback_, &capture_}) {
        if (!slot->engine->IsEnabled()) {
            PCIA_TRY(slot->engine->ResetRing());
        }
    }

    PublishControl();
    return {};
}

// ============================================================================
// Descriptor rings and direction enables
// ============================================================================

Result<void> AudioDeviceController::WriteRingRegisters(Dma::Direction direction, const RingRegisters& regs) {
    DirectionSlot& slot = Slot(direction);
    if (slot.engine->IsEnabled()) {
        return PCIA_ERROR_BUSY("Ring registers are read-only while the direction is enabled");
    }
    if (regs.thresholdFrames > config_.elasticCapacityFrames) {
        return PCIA_ERROR_CONFIG("Threshold exceeds elastic buffer capacity");
    }
    slot.regs = regs;
    return {};
}

Result<void> AudioDeviceController::OpenStream(Dma::Direction direction) {
    DirectionSlot& slot = Slot(direction);
    PCIA_TRY_LOG(slot.engine->OpenStream(memory_, slot.regs.baseAddress,
                                         slot.regs.descriptorCount, slot.regs.bufferSize));
    PCIA_LOG_V2(Controller, "%s stream open (irq=%d threshold=%u)", Dma::ToString(direction),
                slot.regs.interruptEnable, slot.regs.thresholdFrames);
    return {};
}

void AudioDeviceController::CloseStream(Dma::Direction direction) {
    Dma::TransferEngine& engine = *Slot(direction).engine;
    if (LogConfig::Shared().IsStatisticsEnabled()) {
        const auto& stats = engine.GetCounters();
        PCIA_LOG_INFO(Controller, "%s stream stats: bytes=%u descriptors=%llu bursts=%llu stalls=%llu dmaErrors=%llu",
                      Dma::ToString(direction), engine.Ring().BytesProcessed(),
                      (unsigned long long)stats.descriptorsCompleted.load(std::memory_order_relaxed),
                      (unsigned long long)stats.burstsCompleted.load(std::memory_order_relaxed),
                      (unsigned long long)stats.stallTicks.load(std::memory_order_relaxed),
                      (unsigned long long)stats.dmaErrors.load(std::memory_order_relaxed));
    }
    engine.CloseStream();
    PublishControl();
}

Result<void> AudioDeviceController::SetEnabled(Dma::Direction direction, bool enabled) {
    Dma::TransferEngine& engine = *Slot(direction).engine;
    if (enabled && !engine.IsOpen()) {
        return PCIA_ERROR_NOT_READY("Direction has no open stream");
    }
    if (enabled && engine.DmaError()) {
        return PCIA_ERROR_DMA("Direction halted on a DMA error until it is reset");
    }
    engine.SetEnabled(enabled);
    PublishControl();
    return {};
}

Result<void> AudioDeviceController::ResetDirection(Dma::Direction direction) {
    PCIA_TRY(Slot(direction).engine->ResetRing());
    PCIA_LOG_V2(Controller, "%s ring reset", Dma::ToString(direction));
    return {};
}

void AudioDeviceController::SoftReset() {
    for (DirectionSlot* slot : {&playback_, &capture_}) {
        slot->engine->SetEnabled(false);
        slot->engine->ForceReset();
    }
    bridge_.Reset();
    processor_.Reset();
    PublishControl();
    counters_.softResets.fetch_add(1, std::memory_order_relaxed);
    PCIA_LOG_V1(Controller, "Soft reset");
}

void AudioDeviceController::PublishControl() noexcept {
    Cdc::ControlState control{};
    control.format = format_.format;
    control.family = format_.family;
    control.multiplier = format_.multiplier;
    control.dsdMode = format_.dsdMode;
    control.clockSource = format_.clockSource;
    control.masterMode = format_.masterMode;
    control.tdmSlots = format_.tdmSlots;
    control.slotWidthBits = format_.slotWidthBits;
    control.playbackEnabled = playback_.engine->IsEnabled();
    control.captureEnabled = capture_.engine->IsEnabled();
    bridge_.WriteControl(control);
}

// ============================================================================
// Clocks
// ============================================================================

void AudioDeviceController::TickTransport() noexcept {
    bridge_.ClockTransportDomain();

    playback_.engine->Tick();
    capture_.engine->Tick();

    DeliverCompletion(Dma::Direction::kPlayback);
    DeliverCompletion(Dma::Direction::kCapture);

    counters_.transportTicks.fetch_add(1, std::memory_order_relaxed);
}

void AudioDeviceController::TickAudio() noexcept {
    bridge_.ClockAudioDomain();
    processor_.Tick();
    counters_.audioTicks.fetch_add(1, std::memory_order_relaxed);
}

void AudioDeviceController::DeliverCompletion(Dma::Direction direction) noexcept {
    DirectionSlot& slot = Slot(direction);
    if (!slot.engine->TakeCompletionEdge()) {
        return;
    }
    if (!slot.regs.interruptEnable || sink_ == nullptr) {
        counters_.interruptsMasked.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    counters_.interruptsDelivered.fetch_add(1, std::memory_order_relaxed);
    sink_->OnTransferComplete(direction);
}

// ============================================================================
// Status
// ============================================================================

DirectionStatus AudioDeviceController::BuildDirectionStatus(Dma::Direction direction,
                                                            uint32_t level) const noexcept {
    const DirectionSlot& slot = Slot(direction);
    const Dma::TransferEngine& engine = *slot.engine;
    const Shared::DescriptorRing& ring = engine.Ring();

    DirectionStatus status{};
    status.state = engine.State();
    status.enabled = engine.IsEnabled();
    status.complete = engine.CompleteSignal();
    status.dmaError = engine.DmaError();
    status.currentIndex = static_cast<uint32_t>(ring.CurrentIndex());
    status.activeCount = ring.ActiveCount();
    status.bytesProcessed = ring.BytesProcessed();
    status.bufferLevel = level;

    const uint32_t threshold = slot.regs.thresholdFrames;
    if (threshold != 0) {
        status.thresholdReached = direction == Dma::Direction::kPlayback ? level <= threshold
                                                                         : level >= threshold;
    }
    return status;
}

DeviceStatus AudioDeviceController::ReadStatus() const noexcept {
    const Cdc::ClockStatus clock = bridge_.ReadStatus();

    DeviceStatus status{};
    status.locked = clock.locked;
    status.measuredRate = clock.measuredRate;
    status.underrun = clock.underrun;
    status.overrun = clock.overrun;
    status.underrunCount = bridge_.PlaybackBuffer().underrunCount();
    status.overrunCount = bridge_.CaptureBuffer().overrunCount();
    status.recoveryMode = bridge_.RecoveryMode();
    status.playback = BuildDirectionStatus(Dma::Direction::kPlayback, clock.playbackLevel);
    status.capture = BuildDirectionStatus(Dma::Direction::kCapture, clock.captureLevel);
    return status;
}

} // namespace PCIA::Controller
