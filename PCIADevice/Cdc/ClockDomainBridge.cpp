#include "ClockDomainBridge.hpp"

#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace PCIA::Cdc {

ClockDomainBridge::ClockDomainBridge(const Config::DeviceConfig& config)
    : playback_(config.elasticCapacityFrames),
      capture_(config.elasticCapacityFrames),
      format_(Audio::AudioFormat::kI2SStandard),
      family_(Audio::SampleRateFamily::k48k),
      multiplier_(0),
      dsdMode_(Audio::DsdMode::kMsbFirst),
      clockSource_(Audio::ClockSource::kAuto),
      masterMode_(false),
      tdmSlots_(static_cast<uint8_t>(config.tdmSlots)),
      slotWidth_(static_cast<uint8_t>(config.slotWidthBits)),
      playbackEnabled_(false),
      captureEnabled_(false),
      locked_(false),
      measuredRate_(0),
      underrun_(false),
      overrun_(false),
      lowWatermark_(playback_.capacity() / 4),
      highWatermark_(playback_.capacity() * 3 / 4) {}

// ============================================================================
// Transport domain
// ============================================================================

void ClockDomainBridge::WriteControl(const ControlState& control) noexcept {
    format_.Write(control.format);
    family_.Write(control.family);
    multiplier_.Write(control.multiplier);
    dsdMode_.Write(control.dsdMode);
    clockSource_.Write(control.clockSource);
    masterMode_.Write(control.masterMode);
    tdmSlots_.Write(control.tdmSlots);
    slotWidth_.Write(control.slotWidthBits);
    playbackEnabled_.Write(control.playbackEnabled);
    captureEnabled_.Write(control.captureEnabled);
}

ControlState ClockDomainBridge::WrittenControl() const noexcept {
    ControlState control{};
    control.format = format_.Source();
    control.family = family_.Source();
    control.multiplier = multiplier_.Source();
    control.dsdMode = dsdMode_.Source();
    control.clockSource = clockSource_.Source();
    control.masterMode = masterMode_.Source();
    control.tdmSlots = tdmSlots_.Source();
    control.slotWidthBits = slotWidth_.Source();
    control.playbackEnabled = playbackEnabled_.Source();
    control.captureEnabled = captureEnabled_.Source();
    return control;
}

void ClockDomainBridge::ClockTransportDomain() noexcept {
    locked_.Clock();
    measuredRate_.Clock();
    underrun_.Clock();
    overrun_.Clock();

    playback_.producerClock();
    capture_.consumerClock();

    UpdateBufferMonitor();
}

ClockStatus ClockDomainBridge::ReadStatus() const noexcept {
    ClockStatus status{};
    status.locked = locked_.Read();
    status.measuredRate = measuredRate_.Read();
    status.underrun = underrun_.Read();
    status.overrun = overrun_.Read();
    status.playbackLevel = playback_.producerFillLevel();
    status.captureLevel = capture_.fillLevel();
    return status;
}

void ClockDomainBridge::UpdateBufferMonitor() noexcept {
    const bool playbackEnabled = playbackEnabled_.Source();
    const bool captureEnabled = captureEnabled_.Source();
    const uint32_t txLevel = playback_.producerFillLevel();
    const uint32_t rxLevel = capture_.fillLevel();

    const bool playbackLow = playbackEnabled && txLevel < lowWatermark_;
    const bool captureHigh = captureEnabled && rxLevel > highWatermark_;

    if (playbackLow && !playbackLow_) {
        ++lowCrossings_;
    }
    if (captureHigh && !captureHigh_) {
        ++highCrossings_;
    }
    playbackLow_ = playbackLow;
    captureHigh_ = captureHigh;

    // Hysteresis: a level sitting exactly on a watermark keeps the current mode.
    bool recovery = recoveryMode_;
    if (!recoveryMode_) {
        recovery = playbackLow || captureHigh;
    } else {
        const bool playbackClear = !playbackEnabled || txLevel > lowWatermark_;
        const bool captureClear = !captureEnabled || rxLevel < highWatermark_;
        recovery = !(playbackClear && captureClear);
    }

    if (recovery != recoveryMode_) {
        recoveryMode_ = recovery;
        PCIA_LOG_V3(Cdc, "Buffer monitor: recovery %s (pb=%u cap=%u low=%u high=%u)",
                    recovery ? "entered" : "cleared",
                    txLevel, rxLevel, lowWatermark_, highWatermark_);
    }
}

// ============================================================================
// Audio domain
// ============================================================================

void ClockDomainBridge::ClockAudioDomain() noexcept {
    format_.Clock();
    family_.Clock();
    multiplier_.Clock();
    dsdMode_.Clock();
    clockSource_.Clock();
    masterMode_.Clock();
    tdmSlots_.Clock();
    slotWidth_.Clock();
    playbackEnabled_.Clock();
    captureEnabled_.Clock();

    playback_.consumerClock();
    capture_.producerClock();

    // Sticky until Reset(): the counters only clear there.
    underrun_.Write(playback_.underrunCount() != 0);
    overrun_.Write(capture_.overrunCount() != 0);
}

ControlState ClockDomainBridge::ReadControl() const noexcept {
    ControlState control{};
    control.format = format_.Read();
    control.family = family_.Read();
    control.multiplier = multiplier_.Read();
    control.dsdMode = dsdMode_.Read();
    control.clockSource = clockSource_.Read();
    control.masterMode = masterMode_.Read();
    control.tdmSlots = tdmSlots_.Read();
    control.slotWidthBits = slotWidth_.Read();
    control.playbackEnabled = playbackEnabled_.Read();
    control.captureEnabled = captureEnabled_.Read();
    return control;
}

void ClockDomainBridge::Reset() noexcept {
    playback_.reset();
    capture_.reset();

    format_.Reset();
    family_.Reset();
    multiplier_.Reset();
    dsdMode_.Reset();
    clockSource_.Reset();
    masterMode_.Reset();
    tdmSlots_.Reset();
    slotWidth_.Reset();
    playbackEnabled_.Reset();
    captureEnabled_.Reset();

    locked_.Reset();
    measuredRate_.Reset();
    underrun_.Reset();
    overrun_.Reset();

    playbackLow_ = false;
    captureHigh_ = false;
    recoveryMode_ = false;
    lowCrossings_ = 0;
    highCrossings_ = 0;

    PCIA_LOG_V2(Cdc, "ClockDomainBridge reset");
}

} // namespace PCIA::Cdc
