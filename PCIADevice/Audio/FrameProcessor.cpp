#include "FrameProcessor.hpp"

#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace PCIA::Audio {
namespace {

[[nodiscard]] bool SameClocking(const Cdc::ControlState& a, const Cdc::ControlState& b) noexcept {
    return a.format == b.format &&
           a.family == b.family &&
           a.multiplier == b.multiplier &&
           a.dsdMode == b.dsdMode &&
           a.clockSource == b.clockSource &&
           a.masterMode == b.masterMode &&
           a.tdmSlots == b.tdmSlots &&
           a.slotWidthBits == b.slotWidthBits;
}

[[nodiscard]] uint32_t FamilyMclk(const Config::DeviceConfig& config,
                                  const Cdc::ControlState& control) noexcept {
    switch (control.clockSource) {
        case ClockSource::k44k1Oscillator: return config.mclk44k1Hz;
        case ClockSource::k48kOscillator:  return config.mclk48kHz;
        case ClockSource::kAuto:
            break;
    }
    return control.family == SampleRateFamily::k44k1 ? config.mclk44k1Hz : config.mclk48kHz;
}

} // namespace

FrameProcessor::FrameProcessor(Cdc::ClockDomainBridge& bridge, const Config::DeviceConfig& config)
    : bridge_(bridge), config_(config) {
    Reset();
}

void FrameProcessor::Reset() noexcept {
    pins_ = TransportPins{};
    previousExternalBitClock_ = false;
    previousExternalFrameSync_ = false;
    mclkPhase_ = 0;
    bitPosition_ = 0;
    playbackFrame_ = {};
    lastPlaybackFrame_ = {};
    captureFrame_ = {};
    frameInProgress_ = false;

    stableEdges_ = 0;
    locked_ = false;
    windowTickCount_ = 0;
    windowFrames_ = 0;
    measuredRate_ = 0;
    bridge_.PublishLock(false);
    bridge_.PublishMeasuredRate(0);

    counters_.framesPlayed.store(0, std::memory_order_relaxed);
    counters_.framesCaptured.store(0, std::memory_order_relaxed);
    counters_.framesRepeated.store(0, std::memory_order_relaxed);
    counters_.framesDropped.store(0, std::memory_order_relaxed);
    counters_.reconfigurations.store(0, std::memory_order_relaxed);
    counters_.realignments.store(0, std::memory_order_relaxed);
    counters_.lockLosses.store(0, std::memory_order_relaxed);

    const Cdc::ControlState initial = bridge_.ReadControl();
    FormatParams params{};
    params.format = initial.format;
    params.multiplier = initial.multiplier;
    params.channels = config_.channelCount;
    params.sampleWidthBits = config_.sampleWidthBits;
    params.slotWidthBits = initial.slotWidthBits;
    params.tdmSlots = initial.tdmSlots;

    auto timing = ComputeFrameTiming(params);
    if (!timing) {
        // Fall back to left-justified I2S in full-width slots, which every
        // valid DeviceConfig supports.
        timing.error().LogAsWarning();
        params.format = AudioFormat::kI2SLeftJustified;
        params.multiplier = 0;
        params.slotWidthBits = config_.slotWidthBits;
        timing = ComputeFrameTiming(params);
    }
    control_ = initial;
    if (timing) {
        timing_ = *timing;
    }
    sampleMask_ = SampleMask(timing_.sampleWidthBits);
    windowTicks_ = MclkFrequencyHz(FamilyMclk(config_, control_), control_.format) /
                   Config::kRateWindowsPerSecond;
}

// ============================================================================
// Tick
// ============================================================================

void FrameProcessor::Tick() noexcept {
    pins_.bitClock = false;
    pins_.dsdClock = false;

    if (!frameInProgress_) {
        LatchControl();
    }
    if (timing_.bitsPerFrame == 0) {
        return;
    }

    const bool edge = NextBitEdge();
    if (edge) {
        if (!frameInProgress_) {
            BeginFrame();
        }
        ProcessBit();
        if (++bitPosition_ >= timing_.bitsPerFrame) {
            EndFrame();
        }
    }

    UpdateClockMonitor(edge);
}

bool FrameProcessor::NextBitEdge() noexcept {
    if (control_.masterMode) {
        const bool edge = mclkPhase_ == 0;
        mclkPhase_ = (mclkPhase_ + 1) % timing_.bitClockDivider;
        return edge;
    }

    // Slave: follow the external bit clock, re-align on the external frame start.
    const bool bitClock = pins_.externalBitClock;
    const bool frameSync = pins_.externalFrameSync;
    const bool bitEdge = bitClock && !previousExternalBitClock_;
    const bool frameEdge = frameSync && !previousExternalFrameSync_;
    previousExternalBitClock_ = bitClock;
    previousExternalFrameSync_ = frameSync;

    if (bitEdge && frameEdge && frameInProgress_) {
        counters_.realignments.fetch_add(1, std::memory_order_relaxed);
        PCIA_LOG_RL(Audio, "slave/realign", 1000, Default,
                    "Frame re-aligned to external frame start at bit %u/%u",
                    bitPosition_, timing_.bitsPerFrame);
        frameInProgress_ = false;
        bitPosition_ = 0;
        captureFrame_ = {};
        LatchControl();
    }
    return bitEdge;
}

void FrameProcessor::LatchControl() noexcept {
    const Cdc::ControlState next = bridge_.ReadControl();
    if (next == control_) {
        return;
    }

    if (SameClocking(next, control_)) {
        control_.playbackEnabled = next.playbackEnabled;
        control_.captureEnabled = next.captureEnabled;
        return;
    }

    FormatParams params{};
    params.format = next.format;
    params.multiplier = next.multiplier;
    params.channels = config_.channelCount;
    params.sampleWidthBits = config_.sampleWidthBits;
    params.slotWidthBits = next.slotWidthBits;
    params.tdmSlots = next.tdmSlots;

    auto timing = ComputeFrameTiming(params);
    if (!timing) {
        PCIA_LOG_RL(Audio, "latch/rejected", 1000, Error,
                    "Ignoring unsupported control: format=%s slots=%u slotWidth=%u (%s)",
                    ToString(next.format), next.tdmSlots, next.slotWidthBits, timing.error().message);
        control_.playbackEnabled = next.playbackEnabled;
        control_.captureEnabled = next.captureEnabled;
        return;
    }

    control_ = next;
    timing_ = *timing;
    sampleMask_ = SampleMask(timing_.sampleWidthBits);
    windowTicks_ = MclkFrequencyHz(FamilyMclk(config_, control_), control_.format) /
                   Config::kRateWindowsPerSecond;
    windowTickCount_ = 0;
    windowFrames_ = 0;
    mclkPhase_ = 0;
    counters_.reconfigurations.fetch_add(1, std::memory_order_relaxed);
    DropLock();

    PCIA_LOG_V2(Audio, "Latched %s %s x%u master=%d: div=%u bits/frame=%u lines=%u",
                ToString(control_.format), ToString(control_.family), 1u << control_.multiplier,
                control_.masterMode, timing_.bitClockDivider, timing_.bitsPerFrame, timing_.dataLines);
}

// ============================================================================
// Frame boundaries
// ============================================================================

void FrameProcessor::BeginFrame() noexcept {
    frameInProgress_ = true;
    bitPosition_ = 0;
    captureFrame_ = {};

    if (!control_.playbackEnabled) {
        playbackFrame_ = {};
        return;
    }

    AudioFrame next{};
    if (bridge_.PlaybackBuffer().pop(next)) {
        for (uint32_t ch = 0; ch < Config::kMaxChannels; ++ch) {
            next.words[ch] = ch < timing_.channels ? (next.words[ch] & sampleMask_) : 0;
        }
        playbackFrame_ = next;
        lastPlaybackFrame_ = next;
        counters_.framesPlayed.fetch_add(1, std::memory_order_relaxed);
    } else {
        playbackFrame_ = lastPlaybackFrame_;
        counters_.framesRepeated.fetch_add(1, std::memory_order_relaxed);
        PCIA_LOG_RL(Audio, "pb/underrun", 1000, Default,
                    "Playback underrun, repeating last frame (total=%llu)",
                    (unsigned long long)bridge_.PlaybackBuffer().underrunCount());
    }
    PCIA_LOG_FRAME("frame start: ch0=0x%08x", playbackFrame_.words[0]);
}

void FrameProcessor::EndFrame() noexcept {
    frameInProgress_ = false;
    bitPosition_ = 0;
    ++windowFrames_;

    if (!control_.captureEnabled) {
        return;
    }

    if (bridge_.CaptureBuffer().push(captureFrame_)) {
        counters_.framesCaptured.fetch_add(1, std::memory_order_relaxed);
    } else {
        counters_.framesDropped.fetch_add(1, std::memory_order_relaxed);
        PCIA_LOG_RL(Audio, "cap/overrun", 1000, Default,
                    "Capture overrun, frame dropped (total=%llu)",
                    (unsigned long long)bridge_.CaptureBuffer().overrunCount());
    }
}

// ============================================================================
// Bit level
// ============================================================================

int32_t FrameProcessor::SampleBitIndex(uint32_t bitInSlot) const noexcept {
    if (bitInSlot < timing_.dataDelayBits) {
        return -1;
    }
    const uint32_t k = bitInSlot - timing_.dataDelayBits;
    if (k >= timing_.sampleWidthBits) {
        return -1;
    }
    if (IsDsd(timing_.format) && control_.dsdMode == DsdMode::kLsbFirst) {
        return static_cast<int32_t>(k);
    }
    return static_cast<int32_t>(timing_.sampleWidthBits - 1 - k);
}

void FrameProcessor::ProcessBit() noexcept {
    const uint32_t slot = bitPosition_ / timing_.slotWidthBits;
    const uint32_t bitInSlot = bitPosition_ % timing_.slotWidthBits;
    const int32_t bitIndex = SampleBitIndex(bitInSlot);

    uint32_t out = 0;
    if (bitIndex >= 0) {
        for (uint32_t line = 0; line < timing_.dataLines; ++line) {
            const int32_t channel = timing_.ChannelAt(line, slot);
            if (channel < 0) {
                continue;
            }
            const uint32_t bit = (playbackFrame_.words[static_cast<uint32_t>(channel)] >> bitIndex) & 1u;
            out |= bit << line;
        }
    }

    const uint32_t in = loopback_ ? out : pins_.dataIn;
    if (bitIndex >= 0) {
        for (uint32_t line = 0; line < timing_.dataLines; ++line) {
            const int32_t channel = timing_.ChannelAt(line, slot);
            if (channel < 0) {
                continue;
            }
            captureFrame_.words[static_cast<uint32_t>(channel)] |= ((in >> line) & 1u) << bitIndex;
        }
    }

    const bool tdm = timing_.format == AudioFormat::kTdm;
    pins_.bitClock = true;
    pins_.dataOut = out;
    pins_.wordSelect = IsI2S(timing_.format) && slot == 1;
    pins_.frameSync = tdm && bitPosition_ == 0;
    pins_.slotNumber = tdm ? static_cast<uint8_t>(slot) : 0;
    pins_.dsdClock = IsDsd(timing_.format);
}

// ============================================================================
// Clock monitor
// ============================================================================

void FrameProcessor::UpdateClockMonitor(bool bitEdge) noexcept {
    if (bitEdge && stableEdges_ < Config::kLockEdgeCount) {
        ++stableEdges_;
        if (stableEdges_ == Config::kLockEdgeCount && !locked_) {
            locked_ = true;
            bridge_.PublishLock(true);
            PCIA_LOG_V1(Audio, "Clock locked (%s %s)", ToString(control_.format), ToString(control_.family));
        }
    }

    if (windowTicks_ == 0) {
        return;
    }
    if (++windowTickCount_ >= windowTicks_) {
        measuredRate_ = windowFrames_ * Config::kRateWindowsPerSecond;
        bridge_.PublishMeasuredRate(measuredRate_);
        windowTickCount_ = 0;
        windowFrames_ = 0;
    }
}

void FrameProcessor::DropLock() noexcept {
    if (locked_) {
        counters_.lockLosses.fetch_add(1, std::memory_order_relaxed);
        PCIA_LOG_V1(Audio, "Clock lock lost on reconfiguration");
    }
    locked_ = false;
    stableEdges_ = 0;
    bridge_.PublishLock(false);
}

} // namespace PCIA::Audio
