// ClockDomainBridge.hpp
// PCIA - everything that crosses between the transport and audio clock domains
//
// Bulk data: one ElasticBuffer per direction (transport produces playback
// frames, audio consumes them; audio produces capture frames, transport
// consumes them).
// Control (transport -> audio) and status (audio -> transport): one SyncCell
// per scalar, each with its own reset default. A control write is visible
// through ReadControl() after kControlLatency audio-domain clocks.

#pragma once

#include <cstdint>

#include "../Audio/AudioFormat.hpp"
#include "../Config/DeviceConfig.hpp"
#include "ElasticBuffer.hpp"
#include "SyncCell.hpp"

namespace PCIA::Cdc {

struct ControlState {
    Audio::AudioFormat format{Audio::AudioFormat::kI2SStandard};
    Audio::SampleRateFamily family{Audio::SampleRateFamily::k48k};
    uint8_t multiplier{0};
    Audio::DsdMode dsdMode{Audio::DsdMode::kMsbFirst};
    Audio::ClockSource clockSource{Audio::ClockSource::kAuto};
    bool masterMode{false};
    uint8_t tdmSlots{Config::kDefaultTdmSlots};
    uint8_t slotWidthBits{Config::kDefaultSlotWidthBits};
    bool playbackEnabled{false};
    bool captureEnabled{false};

    [[nodiscard]] bool operator==(const ControlState&) const noexcept = default;
};

struct ClockStatus {
    bool locked{false};
    uint32_t measuredRate{0};
    bool underrun{false};
    bool overrun{false};
    uint32_t playbackLevel{0};   // transport view of the outbound buffer
    uint32_t captureLevel{0};    // transport view of the inbound buffer
};

class ClockDomainBridge {
public:
    static constexpr uint32_t kControlLatency = Config::kSyncStages;
    static constexpr uint32_t kStatusLatency = Config::kSyncStages;

    explicit ClockDomainBridge(const Config::DeviceConfig& config);

    ClockDomainBridge(const ClockDomainBridge&) = delete;
    ClockDomainBridge& operator=(const ClockDomainBridge&) = delete;

    // ------------------------------------------------------------------
    // Transport domain
    // ------------------------------------------------------------------

    void WriteControl(const ControlState& control) noexcept;

    /// Last control written (not yet necessarily visible to the audio side).
    [[nodiscard]] ControlState WrittenControl() const noexcept;

    /// One transport clock: status synchronizers, buffer index snapshots, buffer monitor.
    void ClockTransportDomain() noexcept;

    [[nodiscard]] ClockStatus ReadStatus() const noexcept;

    // Buffer monitor (transport side)
    [[nodiscard]] bool RecoveryMode() const noexcept { return recoveryMode_; }
    [[nodiscard]] uint32_t LowWatermark() const noexcept { return lowWatermark_; }
    [[nodiscard]] uint32_t HighWatermark() const noexcept { return highWatermark_; }
    [[nodiscard]] uint64_t LowWatermarkCrossings() const noexcept { return lowCrossings_; }
    [[nodiscard]] uint64_t HighWatermarkCrossings() const noexcept { return highCrossings_; }
    [[nodiscard]] uint64_t FramesPushedOutbound() const noexcept { return playback_.pushedCount(); }
    [[nodiscard]] uint64_t FramesPoppedInbound() const noexcept { return capture_.poppedCount(); }

    // ------------------------------------------------------------------
    // Audio domain
    // ------------------------------------------------------------------

    /// One audio clock: control synchronizers, buffer index snapshots, sticky flags.
    void ClockAudioDomain() noexcept;

    [[nodiscard]] ControlState ReadControl() const noexcept;

    void PublishLock(bool locked) noexcept { locked_.Write(locked); }
    void PublishMeasuredRate(uint32_t rate) noexcept { measuredRate_.Write(rate); }

    // ------------------------------------------------------------------

    [[nodiscard]] ElasticBuffer& PlaybackBuffer() noexcept { return playback_; }
    [[nodiscard]] ElasticBuffer& CaptureBuffer() noexcept { return capture_; }
    [[nodiscard]] const ElasticBuffer& PlaybackBuffer() const noexcept { return playback_; }
    [[nodiscard]] const ElasticBuffer& CaptureBuffer() const noexcept { return capture_; }

    /// Drain buffers, restore every synchronizer default. Both domains quiescent.
    void Reset() noexcept;

private:
    void UpdateBufferMonitor() noexcept;

    ElasticBuffer playback_;
    ElasticBuffer capture_;

    // Transport -> audio
    SyncCell<Audio::AudioFormat> format_;
    SyncCell<Audio::SampleRateFamily> family_;
    SyncCell<uint8_t> multiplier_;
    SyncCell<Audio::DsdMode> dsdMode_;
    SyncCell<Audio::ClockSource> clockSource_;
    SyncCell<bool> masterMode_;
    SyncCell<uint8_t> tdmSlots_;
    SyncCell<uint8_t> slotWidth_;
    SyncCell<bool> playbackEnabled_;
    SyncCell<bool> captureEnabled_;

    // Audio -> transport
    SyncCell<bool> locked_;
    SyncCell<uint32_t> measuredRate_;
    SyncCell<bool> underrun_;
    SyncCell<bool> overrun_;

    // Buffer monitor, transport-owned
    uint32_t lowWatermark_;
    uint32_t highWatermark_;
    bool playbackLow_{false};
    bool captureHigh_{false};
    bool recoveryMode_{false};
    uint64_t lowCrossings_{0};
    uint64_t highCrossings_{0};
};

} // namespace PCIA::Cdc
