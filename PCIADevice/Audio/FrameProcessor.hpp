// FrameProcessor.hpp
// PCIA - audio-domain serializer/deserializer for I2S, TDM and DSD
//
// Ticked once per MCLK cycle. In master mode it divides MCLK down to the bit
// clock itself; in slave mode it advances on rising edges of an external bit
// clock and re-aligns to an external frame-start pulse.
//
// Per bit period it drives one bit on every data line (MSB first, DSD bit
// order per DsdMode) and samples one bit from every input line into
// per-channel accumulators. Frame boundaries are where everything changes:
//   - the control state synchronized by the bridge is latched
//   - the next playback frame is taken from the outbound elastic buffer
//     (the previous frame repeats on underrun)
//   - the completed capture frame goes to the inbound elastic buffer
//     (dropped on overrun)

#pragma once

#include <atomic>
#include <cstdint>

#include "../Cdc/ClockDomainBridge.hpp"
#include "../Config/DeviceConfig.hpp"
#include "AudioFormat.hpp"
#include "ClockDivider.hpp"

namespace PCIA::Audio {

/// Logical view of the serial transport signals.
struct TransportPins {
    // Outputs
    bool bitClock{false};       ///< a bit-clock rising edge occurred this tick
    bool wordSelect{false};     ///< I2S: 0 = left slot, 1 = right slot
    bool frameSync{false};      ///< TDM: first bit of slot 0
    uint8_t slotNumber{0};      ///< TDM: slot being transferred
    bool dsdClock{false};       ///< DSD: bit clock
    uint32_t dataOut{0};        ///< bit n drives data line n

    // Inputs
    uint32_t dataIn{0};
    bool externalBitClock{false};
    bool externalFrameSync{false};
};

class FrameProcessor {
public:
    struct Counters {
        std::atomic<uint64_t> framesPlayed{0};
        std::atomic<uint64_t> framesCaptured{0};
        std::atomic<uint64_t> framesRepeated{0};   // outbound underruns
        std::atomic<uint64_t> framesDropped{0};    // inbound overruns
        std::atomic<uint64_t> reconfigurations{0};
        std::atomic<uint64_t> realignments{0};
        std::atomic<uint64_t> lockLosses{0};
    };

    FrameProcessor(Cdc::ClockDomainBridge& bridge, const Config::DeviceConfig& config);

    FrameProcessor(const FrameProcessor&) = delete;
    FrameProcessor& operator=(const FrameProcessor&) = delete;

    /// One MCLK cycle. The caller clocks the bridge's audio domain first.
    void Tick() noexcept;

    /// Back to frame start, unlocked, counters cleared. Audio domain quiescent.
    void Reset() noexcept;

    /// Route each output line back to the matching input line.
    void SetLoopback(bool enabled) noexcept { loopback_ = enabled; }
    void SetDataIn(uint32_t lines) noexcept { pins_.dataIn = lines; }
    void SetExternalClocks(bool bitClock, bool frameSync) noexcept {
        pins_.externalBitClock = bitClock;
        pins_.externalFrameSync = frameSync;
    }

    [[nodiscard]] const TransportPins& Pins() const noexcept { return pins_; }
    [[nodiscard]] const FrameTiming& ActiveTiming() const noexcept { return timing_; }
    [[nodiscard]] const Cdc::ControlState& ActiveControl() const noexcept { return control_; }
    [[nodiscard]] uint32_t BitPosition() const noexcept { return bitPosition_; }
    [[nodiscard]] bool Locked() const noexcept { return locked_; }
    [[nodiscard]] uint32_t MeasuredRate() const noexcept { return measuredRate_; }
    [[nodiscard]] const AudioFrame& CurrentPlaybackFrame() const noexcept { return playbackFrame_; }
    [[nodiscard]] const Counters& GetCounters() const noexcept { return counters_; }

private:
    [[nodiscard]] bool NextBitEdge() noexcept;
    void LatchControl() noexcept;
    void BeginFrame() noexcept;
    void ProcessBit() noexcept;
    void EndFrame() noexcept;
    void UpdateClockMonitor(bool bitEdge) noexcept;
    void DropLock() noexcept;

    /// Bit index inside the channel word for bit-in-slot `k`, or -1 outside the sample.
    [[nodiscard]] int32_t SampleBitIndex(uint32_t bitInSlot) const noexcept;

    Cdc::ClockDomainBridge& bridge_;
    const Config::DeviceConfig config_;

    Cdc::ControlState control_{};
    FrameTiming timing_{};
    uint32_t windowTicks_{0};
    uint32_t sampleMask_{0};

    TransportPins pins_{};
    bool loopback_{false};
    bool previousExternalBitClock_{false};
    bool previousExternalFrameSync_{false};

    uint32_t mclkPhase_{0};
    uint32_t bitPosition_{0};
    AudioFrame playbackFrame_{};
    AudioFrame lastPlaybackFrame_{};
    AudioFrame captureFrame_{};
    bool frameInProgress_{false};

    uint32_t stableEdges_{0};
    bool locked_{false};
    uint32_t windowTickCount_{0};
    uint32_t windowFrames_{0};
    uint32_t measuredRate_{0};

    Counters counters_{};
};

} // namespace PCIA::Audio
