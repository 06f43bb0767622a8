// FrameProcessorTests.cpp
// PCIA - audio-domain serializer/deserializer
//
// The processor runs in loopback: every bit it drives on dataOut is sampled
// back as dataIn, so a playback frame must come back unchanged on capture.
//

#include <gtest/gtest.h>

#include <vector>

#include "Audio/FrameProcessor.hpp"
#include "Cdc/ClockDomainBridge.hpp"
#include "RingTestUtils.hpp"

namespace PCIA::Testing {

using Audio::AudioFormat;
using Audio::AudioFrame;
using Audio::DsdMode;
using Cdc::ClockDomainBridge;
using Cdc::ControlState;

class FrameProcessorTest : public ::testing::Test {
protected:
    Config::DeviceConfig config_{};
    ClockDomainBridge bridge_{config_};
    Audio::FrameProcessor processor_{bridge_, config_};

    static ControlState Master(AudioFormat format, DsdMode dsdMode = DsdMode::kMsbFirst) {
        ControlState control{};
        control.format = format;
        control.dsdMode = dsdMode;
        control.masterMode = true;
        control.playbackEnabled = true;
        control.captureEnabled = true;
        return control;
    }

    void TickAudio(uint32_t ticks) {
        for (uint32_t i = 0; i < ticks; ++i) {
            bridge_.ClockAudioDomain();
            processor_.Tick();
        }
    }

    /// Latch the control, then run exactly `frames` whole frames.
    void RunFrames(uint32_t frames, uint32_t ticksPerFrame) {
        TickAudio(ClockDomainBridge::kControlLatency - 1 + frames * ticksPerFrame);
    }

    void PushPlayback(uint32_t frames) {
        for (uint32_t f = 0; f < frames; ++f) {
            ASSERT_TRUE(bridge_.PlaybackBuffer().push(PatternFrame(f, config_.channelCount)));
        }
    }

    std::vector<AudioFrame> DrainCapture() {
        bridge_.ClockTransportDomain();
        bridge_.ClockTransportDomain();
        std::vector<AudioFrame> frames;
        AudioFrame out{};
        while (bridge_.CaptureBuffer().fillLevel() > 0 && bridge_.CaptureBuffer().pop(out)) {
            frames.push_back(out);
        }
        return frames;
    }

    void SlaveBit(bool frameStart) {
        processor_.SetExternalClocks(true, frameStart);
        TickAudio(1);
        processor_.SetExternalClocks(false, false);
        TickAudio(1);
    }

    void ExpectLoopback(AudioFormat format, DsdMode dsdMode, uint32_t sampleMask) {
        constexpr uint32_t kFrames = 6;
        processor_.SetLoopback(true);
        bridge_.WriteControl(Master(format, dsdMode));
        PushPlayback(kFrames);

        auto timing = Audio::ComputeFrameTiming(Audio::FormatParams{
            format, 0, config_.channelCount, config_.sampleWidthBits,
            config_.slotWidthBits, config_.tdmSlots});
        ASSERT_TRUE(timing.has_value());
        RunFrames(kFrames, timing->TicksPerFrame());

        const std::vector<AudioFrame> captured = DrainCapture();
        ASSERT_EQ(captured.size(), kFrames) << Audio::ToString(format);
        for (uint32_t f = 0; f < kFrames; ++f) {
            AudioFrame expected = PatternFrame(f, config_.channelCount);
            for (auto& word : expected.words) {
                word &= sampleMask;
            }
            EXPECT_EQ(captured[f], expected) << Audio::ToString(format) << " frame " << f;
        }
        EXPECT_EQ(processor_.GetCounters().framesPlayed.load(), kFrames);
        EXPECT_EQ(processor_.GetCounters().framesRepeated.load(), 0u);
    }
};

//==============================================================================
// Round trips
//==============================================================================

TEST_F(FrameProcessorTest, I2SStandardRoundTrip) {
    ExpectLoopback(AudioFormat::kI2SStandard, DsdMode::kMsbFirst, 0x00FF'FFFFu);
}

TEST_F(FrameProcessorTest, I2SLeftJustifiedRoundTrip) {
    ExpectLoopback(AudioFormat::kI2SLeftJustified, DsdMode::kMsbFirst, 0x00FF'FFFFu);
}

TEST_F(FrameProcessorTest, I2SRightJustifiedRoundTrip) {
    ExpectLoopback(AudioFormat::kI2SRightJustified, DsdMode::kMsbFirst, 0x00FF'FFFFu);
}

TEST_F(FrameProcessorTest, TdmRoundTrip) {
    ExpectLoopback(AudioFormat::kTdm, DsdMode::kMsbFirst, 0x00FF'FFFFu);
}

TEST_F(FrameProcessorTest, Dsd64RoundTrip) {
    ExpectLoopback(AudioFormat::kDsd64, DsdMode::kMsbFirst, 0xFFu);
}

TEST_F(FrameProcessorTest, Dsd128RoundTrip) {
    ExpectLoopback(AudioFormat::kDsd128, DsdMode::kMsbFirst, 0xFFu);
}

TEST_F(FrameProcessorTest, Dsd256LsbFirstRoundTrip) {
    ExpectLoopback(AudioFormat::kDsd256, DsdMode::kLsbFirst, 0xFFu);
}

//==============================================================================
// Wire format
//==============================================================================

TEST_F(FrameProcessorTest, I2SStandardDelaysMsbByOneBitClock) {
    bridge_.WriteControl(Master(AudioFormat::kI2SStandard));
    AudioFrame frame{};
    frame.words[0] = 0x0080'0000u;  // MSB of a 24-bit left sample
    frame.words[1] = 0x0080'0000u;  // and of the right one
    ASSERT_TRUE(bridge_.PlaybackBuffer().push(frame));

    std::vector<uint32_t> line0;
    std::vector<bool> wordSelect;
    for (int i = 0; i < 400 && line0.size() < 64; ++i) {
        TickAudio(1);
        if (processor_.Pins().bitClock) {
            line0.push_back(processor_.Pins().dataOut & 1u);
            wordSelect.push_back(processor_.Pins().wordSelect);
        }
    }
    ASSERT_EQ(line0.size(), 64u);
    EXPECT_EQ(line0[0], 0u);
    EXPECT_EQ(line0[1], 1u);
    EXPECT_EQ(line0[2], 0u);
    EXPECT_EQ(line0[33], 1u);
    EXPECT_FALSE(wordSelect[0]);
    EXPECT_FALSE(wordSelect[31]);
    EXPECT_TRUE(wordSelect[32]);
}

TEST_F(FrameProcessorTest, DsdBitOrderFollowsSubMode) {
    for (DsdMode mode : {DsdMode::kMsbFirst, DsdMode::kLsbFirst}) {
        bridge_.Reset();
        processor_.Reset();
        bridge_.WriteControl(Master(AudioFormat::kDsd64, mode));
        AudioFrame frame{};
        frame.words[0] = 0x01;
        ASSERT_TRUE(bridge_.PlaybackBuffer().push(frame));

        uint32_t firstBit = 0xFF;
        for (int i = 0; i < 8 && firstBit == 0xFF; ++i) {
            TickAudio(1);
            if (processor_.Pins().dsdClock) {
                firstBit = processor_.Pins().dataOut & 1u;
            }
        }
        EXPECT_EQ(firstBit, mode == DsdMode::kLsbFirst ? 1u : 0u);
    }
}

TEST_F(FrameProcessorTest, TdmFrameSyncMarksSlotZero) {
    bridge_.WriteControl(Master(AudioFormat::kTdm));
    PushPlayback(4);

    uint32_t syncs = 0;
    for (uint32_t i = 0; i < 1 + 4 * 512; ++i) {
        TickAudio(1);
        const Audio::TransportPins& pins = processor_.Pins();
        if (pins.bitClock && pins.frameSync) {
            ++syncs;
            EXPECT_EQ(pins.slotNumber, 0u);
            EXPECT_EQ(processor_.BitPosition(), 1u);
        }
    }
    EXPECT_EQ(syncs, 4u);
}

//==============================================================================
// Underrun / overrun
//==============================================================================

TEST_F(FrameProcessorTest, UnderrunRepeatsLastFrame) {
    processor_.SetLoopback(true);
    bridge_.WriteControl(Master(AudioFormat::kI2SLeftJustified));
    PushPlayback(1);

    RunFrames(3, 256);

    const std::vector<AudioFrame> captured = DrainCapture();
    ASSERT_EQ(captured.size(), 3u);
    for (const AudioFrame& frame : captured) {
        EXPECT_EQ(frame, PatternFrame(0, config_.channelCount));
    }
    EXPECT_EQ(processor_.GetCounters().framesRepeated.load(), 2u);
    EXPECT_EQ(bridge_.PlaybackBuffer().underrunCount(), 2u);
}

TEST_F(FrameProcessorTest, DisabledPlaybackSendsSilenceWithoutUnderrun) {
    ControlState control = Master(AudioFormat::kI2SStandard);
    control.playbackEnabled = false;
    bridge_.WriteControl(control);

    RunFrames(2, 256);
    EXPECT_EQ(bridge_.PlaybackBuffer().underrunCount(), 0u);
    EXPECT_EQ(processor_.CurrentPlaybackFrame(), AudioFrame{});
}

TEST_F(FrameProcessorTest, CaptureOverrunDropsFrames) {
    Config::DeviceConfig small = config_;
    small.elasticCapacityFrames = 4;
    ClockDomainBridge bridge(small);
    Audio::FrameProcessor processor(bridge, small);
    bridge.WriteControl(Master(AudioFormat::kI2SStandard));

    for (uint32_t i = 0; i < 1 + 6 * 256; ++i) {
        bridge.ClockAudioDomain();
        processor.Tick();
    }
    EXPECT_EQ(processor.GetCounters().framesCaptured.load(), 4u);
    EXPECT_EQ(processor.GetCounters().framesDropped.load(), 2u);
    EXPECT_EQ(bridge.CaptureBuffer().overrunCount(), 2u);
}

//==============================================================================
// Control latching
//==============================================================================

TEST_F(FrameProcessorTest, UnsupportedControlIsIgnored) {
    bridge_.WriteControl(Master(AudioFormat::kI2SStandard));
    TickAudio(4);
    const uint64_t reconfigurations = processor_.GetCounters().reconfigurations.load();

    ControlState bad = Master(AudioFormat::kTdm);
    bad.tdmSlots = 4;  // fewer slots than channels
    bridge_.WriteControl(bad);
    TickAudio(600);

    EXPECT_EQ(processor_.ActiveTiming().format, AudioFormat::kI2SStandard);
    EXPECT_EQ(processor_.GetCounters().reconfigurations.load(), reconfigurations);
}

TEST_F(FrameProcessorTest, FormatChangeTakesEffectAtFrameBoundary) {
    bridge_.WriteControl(Master(AudioFormat::kI2SStandard));
    TickAudio(2 + 100);  // mid-frame
    ASSERT_NE(processor_.BitPosition(), 0u);

    bridge_.WriteControl(Master(AudioFormat::kTdm));
    TickAudio(2);
    EXPECT_EQ(processor_.ActiveTiming().format, AudioFormat::kI2SStandard);

    TickAudio(256);
    EXPECT_EQ(processor_.ActiveTiming().format, AudioFormat::kTdm);
}

//==============================================================================
// Slave mode
//==============================================================================

TEST_F(FrameProcessorTest, SlaveFollowsExternalClocks) {
    processor_.SetLoopback(true);
    ControlState control = Master(AudioFormat::kI2SStandard);
    control.masterMode = false;
    bridge_.WriteControl(control);
    PushPlayback(3);
    TickAudio(ClockDomainBridge::kControlLatency);

    TickAudio(1000);  // no external clock, no bits
    EXPECT_EQ(processor_.GetCounters().framesPlayed.load(), 0u);

    for (uint32_t f = 0; f < 3; ++f) {
        for (uint32_t bit = 0; bit < 64; ++bit) {
            SlaveBit(bit == 0);
        }
    }

    const std::vector<AudioFrame> captured = DrainCapture();
    ASSERT_EQ(captured.size(), 3u);
    for (uint32_t f = 0; f < 3; ++f) {
        EXPECT_EQ(captured[f], PatternFrame(f, config_.channelCount));
    }
    EXPECT_EQ(processor_.GetCounters().realignments.load(), 0u);
}

TEST_F(FrameProcessorTest, SlaveRealignsOnEarlyFrameStart) {
    ControlState control = Master(AudioFormat::kI2SStandard);
    control.masterMode = false;
    bridge_.WriteControl(control);
    TickAudio(ClockDomainBridge::kControlLatency);

    SlaveBit(true);
    for (int i = 0; i < 10; ++i) {
        SlaveBit(false);
    }
    ASSERT_EQ(processor_.BitPosition(), 11u);

    SlaveBit(true);
    EXPECT_EQ(processor_.GetCounters().realignments.load(), 1u);
    EXPECT_EQ(processor_.BitPosition(), 1u);
}

//==============================================================================
// Clock monitor
//==============================================================================

TEST_F(FrameProcessorTest, LocksAfterStableBitClock) {
    bridge_.WriteControl(Master(AudioFormat::kI2SStandard));
    TickAudio(1 + (Config::kLockEdgeCount - 1) * 4);
    EXPECT_FALSE(processor_.Locked());
    TickAudio(4);
    EXPECT_TRUE(processor_.Locked());

    bridge_.ClockTransportDomain();
    bridge_.ClockTransportDomain();
    EXPECT_TRUE(bridge_.ReadStatus().locked);
}

TEST_F(FrameProcessorTest, ReconfigurationDropsLock) {
    bridge_.WriteControl(Master(AudioFormat::kI2SStandard));
    TickAudio(1 + Config::kLockEdgeCount * 4);
    ASSERT_TRUE(processor_.Locked());

    bridge_.WriteControl(Master(AudioFormat::kI2SLeftJustified));
    TickAudio(300);
    EXPECT_FALSE(processor_.Locked());
    EXPECT_EQ(processor_.GetCounters().lockLosses.load(), 1u);
}

TEST_F(FrameProcessorTest, MeasuresFrameRate) {
    bridge_.WriteControl(Master(AudioFormat::kI2SStandard));
    TickAudio(1 + 2 * (Config::kDefaultMclk48kHz / Config::kRateWindowsPerSecond));
    EXPECT_EQ(processor_.MeasuredRate(), 48000u);
}

TEST_F(FrameProcessorTest, ClockSourceOverridesFamily) {
    ControlState control = Master(AudioFormat::kI2SStandard);
    control.clockSource = Audio::ClockSource::k44k1Oscillator;
    bridge_.WriteControl(control);
    TickAudio(1 + 2 * (Config::kDefaultMclk44k1Hz / Config::kRateWindowsPerSecond));
    EXPECT_EQ(processor_.MeasuredRate(), 44100u);
}

TEST_F(FrameProcessorTest, DoubleRateDoublesMeasuredRate) {
    ControlState control = Master(AudioFormat::kI2SStandard);
    control.multiplier = 1;
    bridge_.WriteControl(control);
    TickAudio(1 + 2 * (Config::kDefaultMclk48kHz / Config::kRateWindowsPerSecond));
    EXPECT_EQ(processor_.MeasuredRate(), 96000u);
}

TEST_F(FrameProcessorTest, QuadRateRunsOneMclkPerBit) {
    ControlState control = Master(AudioFormat::kI2SStandard);
    control.multiplier = 2;
    bridge_.WriteControl(control);
    TickAudio(1 + 2 * (Config::kDefaultMclk48kHz / Config::kRateWindowsPerSecond));
    EXPECT_EQ(processor_.ActiveTiming().bitClockDivider, 1u);
    EXPECT_EQ(processor_.MeasuredRate(), 192000u);
}

TEST_F(FrameProcessorTest, UnreachableMultiplierKeepsCurrentTiming) {
    bridge_.WriteControl(Master(AudioFormat::kI2SStandard));
    TickAudio(ClockDomainBridge::kControlLatency + 4);
    const uint64_t reconfigurations = processor_.GetCounters().reconfigurations.load();

    ControlState control = Master(AudioFormat::kI2SStandard);
    control.multiplier = 3;
    bridge_.WriteControl(control);
    TickAudio(1 + 2 * (Config::kDefaultMclk48kHz / Config::kRateWindowsPerSecond));
    EXPECT_EQ(processor_.GetCounters().reconfigurations.load(), reconfigurations);
    EXPECT_EQ(processor_.ActiveTiming().bitClockDivider, 4u);
    EXPECT_EQ(processor_.MeasuredRate(), 48000u);
}

} // namespace PCIA::Testing
