// TransferEngineTests.cpp
// PCIA - descriptor-ring DMA engine against fake host memory
//

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <vector>

#include "PCIADevice/Bus/HostMemoryBus.hpp"
#include "PCIADevice/Dma/TransferEngine.hpp"
#include "PCIADevice/Testing/FakeHostMemory.hpp"
#include "RingTestUtils.hpp"
#include "mocks/MockHostBus.hpp"

namespace PCIA::Testing {

using Dma::Direction;
using Dma::EngineState;
using Dma::TransferEngine;
using HW::DescriptorFlags::kHardwareOwned;
using HW::DescriptorFlags::kInterrupt;
using HW::DescriptorFlags::kLastInChain;
using HW::DescriptorFlags::kWrap;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;

class TransferEngineTest : public ::testing::Test {
protected:
    static constexpr uint32_t kFrameBytes = 32;   // 8 channels x 4 bytes
    static constexpr uint32_t kBurstFrames = 16;  // 512-byte burst

    Config::DeviceConfig config_{};
    FakeHostMemory memory_{256 * 1024};
    Bus::HostMemoryBus bus_{memory_};
    Cdc::ElasticBuffer buffer_{config_.elasticCapacityFrames};
    uint64_t edges_{0};

    void SetUp() override {
        config_.burstBytes = 512;
    }

    std::unique_ptr<TransferEngine> MakeEngine(Direction direction) {
        return std::make_unique<TransferEngine>(direction, bus_, buffer_, config_);
    }

    RingLayout OpenRing(TransferEngine& engine, const std::vector<uint32_t>& flags,
                        uint32_t bytesPerDescriptor = 512) {
        auto layout = BuildRing(memory_, flags, bytesPerDescriptor);
        EXPECT_TRUE(layout.has_value());
        auto opened = engine.OpenStream(memory_, layout->ringBase, layout->count, layout->BufferSize());
        EXPECT_TRUE(opened.has_value());
        return *layout;
    }

    /// One transport clock: buffer index snapshots, then the engine.
    void Tick(TransferEngine& engine, uint32_t ticks = 1) {
        for (uint32_t i = 0; i < ticks; ++i) {
            buffer_.producerClock();
            buffer_.consumerClock();
            engine.Tick();
            if (engine.TakeCompletionEdge()) {
                ++edges_;
            }
        }
    }

    bool TickUntil(TransferEngine& engine, EngineState state, uint32_t limit = 2000) {
        for (uint32_t i = 0; i < limit; ++i) {
            if (engine.State() == state) {
                return true;
            }
            Tick(engine);
        }
        return engine.State() == state;
    }

    std::vector<Audio::AudioFrame> DrainBuffer() {
        buffer_.consumerClock();
        buffer_.consumerClock();
        std::vector<Audio::AudioFrame> frames;
        Audio::AudioFrame out{};
        while (buffer_.fillLevel() > 0 && buffer_.pop(out)) {
            frames.push_back(out);
        }
        return frames;
    }
};

//==============================================================================
// Playback chain
//==============================================================================

TEST_F(TransferEngineTest, FourDescriptorChainRaisesTwoCompletions) {
    auto engine = MakeEngine(Direction::kPlayback);
    const RingLayout layout = OpenRing(*engine, {0, kInterrupt, 0, kInterrupt | kLastInChain});
    FillPattern(memory_, layout.bufferBase, 4 * kBurstFrames, config_.channelCount);

    engine->SetEnabled(true);
    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));
    Tick(*engine, 50);  // parked in Complete while enabled

    EXPECT_EQ(engine->State(), EngineState::Complete);
    EXPECT_TRUE(engine->CompleteSignal());
    EXPECT_EQ(edges_, 2u);
    EXPECT_EQ(engine->Ring().BytesProcessed(), 2048u);
    EXPECT_EQ(engine->Ring().CurrentIndex(), 0u);
    EXPECT_EQ(engine->Ring().ActiveCount(), 0u);
    EXPECT_EQ(engine->GetCounters().descriptorsCompleted.load(), 4u);
    EXPECT_EQ(engine->GetCounters().burstsCompleted.load(), 4u);

    const auto frames = DrainBuffer();
    ASSERT_EQ(frames.size(), 4 * kBurstFrames);
    for (uint32_t f = 0; f < frames.size(); ++f) {
        EXPECT_EQ(frames[f], PatternFrame(f, config_.channelCount)) << "frame " << f;
    }
}

TEST_F(TransferEngineTest, WrapRingStreamsContinuously) {
    auto engine = MakeEngine(Direction::kPlayback);
    const RingLayout layout = OpenRing(*engine, {0, kInterrupt, 0, kInterrupt | kWrap});
    FillPattern(memory_, layout.bufferBase, 4 * kBurstFrames, config_.channelCount);

    engine->SetEnabled(true);
    std::vector<Audio::AudioFrame> frames;
    for (int round = 0; round < 40; ++round) {
        Tick(*engine, 100);
        const auto drained = DrainBuffer();
        frames.insert(frames.end(), drained.begin(), drained.end());
    }

    EXPECT_NE(engine->State(), EngineState::Complete);
    EXPECT_FALSE(engine->CompleteSignal());
    EXPECT_GE(engine->Ring().Passes(), 3u);
    EXPECT_GT(engine->Ring().BytesProcessed(), 3u * 2048u);
    EXPECT_GE(edges_, 2 * engine->Ring().Passes());

    // Every pass replays the same four descriptors in order.
    ASSERT_GT(frames.size(), 3 * 4 * kBurstFrames);
    for (uint32_t f = 0; f < frames.size(); ++f) {
        EXPECT_EQ(frames[f], PatternFrame(f % (4 * kBurstFrames), config_.channelCount)) << "frame " << f;
    }
}

TEST_F(TransferEngineTest, CompleteReturnsToIdleWhenDisabled) {
    auto engine = MakeEngine(Direction::kPlayback);
    OpenRing(*engine, {kLastInChain});
    engine->SetEnabled(true);
    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));

    engine->SetEnabled(false);
    Tick(*engine);
    EXPECT_EQ(engine->State(), EngineState::Idle);
    EXPECT_FALSE(engine->CompleteSignal());
}

TEST_F(TransferEngineTest, RearmAfterResetRunsChainAgain) {
    auto engine = MakeEngine(Direction::kPlayback);
    OpenRing(*engine, {kInterrupt, kInterrupt | kLastInChain});
    engine->SetEnabled(true);
    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));

    engine->SetEnabled(false);
    Tick(*engine);
    ASSERT_TRUE(engine->ResetRing().has_value());
    (void)DrainBuffer();

    engine->SetEnabled(true);
    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));
    EXPECT_EQ(edges_, 4u);
    EXPECT_EQ(engine->Ring().BytesProcessed(), 1024u);
}

TEST_F(TransferEngineTest, MultiBurstDescriptorCompletesOnFinalBurst) {
    auto engine = MakeEngine(Direction::kPlayback);
    OpenRing(*engine, {kInterrupt | kLastInChain}, 1024);
    engine->SetEnabled(true);

    ASSERT_TRUE(TickUntil(*engine, EngineState::UpdateDescriptor));
    Tick(*engine);
    EXPECT_EQ(engine->State(), EngineState::Idle);
    EXPECT_FALSE(engine->Ring().At(0)->complete);
    EXPECT_EQ(engine->Ring().ActiveCount(), 1u);
    EXPECT_EQ(edges_, 0u);

    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));
    EXPECT_TRUE(engine->Ring().At(0)->complete);
    EXPECT_EQ(engine->GetCounters().burstsCompleted.load(), 2u);
    EXPECT_EQ(edges_, 1u);
    EXPECT_EQ(engine->Ring().BytesProcessed(), 1024u);
}

TEST_F(TransferEngineTest, ShortDescriptorsMoveWholeFrames) {
    auto engine = MakeEngine(Direction::kPlayback);
    const RingLayout layout = OpenRing(*engine, {0, kLastInChain}, 8 * kFrameBytes);
    FillPattern(memory_, layout.bufferBase, 16, config_.channelCount);
    engine->SetEnabled(true);
    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));

    EXPECT_EQ(engine->GetCounters().burstsCompleted.load(), 2u);
    const auto frames = DrainBuffer();
    ASSERT_EQ(frames.size(), 16u);
    EXPECT_EQ(frames[8], PatternFrame(8, config_.channelCount));
}

TEST_F(TransferEngineTest, PlaybackWaitsForRoomInElasticBuffer) {
    config_.elasticCapacityFrames = 2 * kBurstFrames;
    Cdc::ElasticBuffer small(config_.elasticCapacityFrames);
    TransferEngine engine(Direction::kPlayback, bus_, small, config_);
    auto layout = BuildRing(memory_, {0, 0, 0, kLastInChain}, 512);
    ASSERT_TRUE(layout.has_value());
    ASSERT_TRUE(engine.OpenStream(memory_, layout->ringBase, 4, layout->BufferSize()).has_value());
    engine.SetEnabled(true);

    for (int i = 0; i < 500; ++i) {
        small.producerClock();
        engine.Tick();
    }
    EXPECT_EQ(engine.State(), EngineState::Idle);
    EXPECT_EQ(engine.GetCounters().descriptorsCompleted.load(), 2u);
    EXPECT_EQ(small.occupancy(), small.capacity());
    EXPECT_EQ(small.overrunCount(), 0u);

    small.consumerClock();
    small.consumerClock();
    Audio::AudioFrame out{};
    for (uint32_t i = 0; i < kBurstFrames; ++i) {
        ASSERT_TRUE(small.pop(out));
    }
    for (int i = 0; i < 100; ++i) {
        small.producerClock();
        engine.Tick();
    }
    EXPECT_EQ(engine.GetCounters().descriptorsCompleted.load(), 3u);
}

//==============================================================================
// Capture chain
//==============================================================================

TEST_F(TransferEngineTest, CaptureWritesFramesToHostMemory) {
    auto engine = MakeEngine(Direction::kCapture);
    const RingLayout layout = OpenRing(*engine, {0, kInterrupt | kLastInChain});

    engine->SetEnabled(true);
    Tick(*engine, 20);
    EXPECT_EQ(engine->State(), EngineState::Idle);  // nothing captured yet

    for (uint32_t f = 0; f < 2 * kBurstFrames; ++f) {
        ASSERT_TRUE(buffer_.push(PatternFrame(f, config_.channelCount)));
    }
    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));

    EXPECT_EQ(edges_, 1u);
    EXPECT_EQ(engine->Ring().BytesProcessed(), 1024u);
    for (uint32_t f = 0; f < 2 * kBurstFrames; ++f) {
        for (uint32_t ch = 0; ch < config_.channelCount; ++ch) {
            const uint64_t at = layout.bufferBase + f * kFrameBytes + ch * 4;
            EXPECT_EQ(ReadWord(memory_, at), PatternSample(f, ch)) << "frame " << f << " ch " << ch;
        }
    }
}

//==============================================================================
// Flow control
//==============================================================================

TEST_F(TransferEngineTest, RequestStallHoldsFetchWithoutLoss) {
    auto engine = MakeEngine(Direction::kPlayback);
    const RingLayout layout = OpenRing(*engine, {kLastInChain});
    FillPattern(memory_, layout.bufferBase, kBurstFrames, config_.channelCount);

    bus_.SetRequestStall(true);
    engine->SetEnabled(true);
    Tick(*engine, 100);
    EXPECT_EQ(engine->State(), EngineState::FetchDescriptor);
    EXPECT_GT(engine->GetCounters().stallTicks.load(), 90u);
    EXPECT_EQ(engine->Ring().ActiveCount(), 0u);

    bus_.SetRequestStall(false);
    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));
    const auto frames = DrainBuffer();
    ASSERT_EQ(frames.size(), kBurstFrames);
    EXPECT_EQ(frames.back(), PatternFrame(kBurstFrames - 1, config_.channelCount));
}

TEST_F(TransferEngineTest, BeatStallHoldsMoveData) {
    auto engine = MakeEngine(Direction::kPlayback);
    const RingLayout layout = OpenRing(*engine, {kLastInChain});
    FillPattern(memory_, layout.bufferBase, kBurstFrames, config_.channelCount);
    engine->SetEnabled(true);

    ASSERT_TRUE(TickUntil(*engine, EngineState::MoveData));
    Tick(*engine, 4);
    const uint32_t progress = engine->BurstCounter();

    bus_.SetBeatStall(true);
    Tick(*engine, 50);
    EXPECT_EQ(engine->State(), EngineState::MoveData);
    EXPECT_EQ(engine->BurstCounter(), progress);

    bus_.SetBeatStall(false);
    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));
    const auto frames = DrainBuffer();
    ASSERT_EQ(frames.size(), kBurstFrames);
    for (uint32_t f = 0; f < frames.size(); ++f) {
        EXPECT_EQ(frames[f], PatternFrame(f, config_.channelCount));
    }
}

TEST_F(TransferEngineTest, DisableMidBurstFinishesBurstThenStops) {
    auto engine = MakeEngine(Direction::kPlayback);
    OpenRing(*engine, {0, 0, 0, kLastInChain});
    engine->SetEnabled(true);

    ASSERT_TRUE(TickUntil(*engine, EngineState::MoveData));
    Tick(*engine, 3);
    engine->SetEnabled(false);

    Tick(*engine, 200);
    EXPECT_EQ(engine->State(), EngineState::Idle);
    EXPECT_TRUE(engine->Ring().At(0)->complete);
    EXPECT_FALSE(engine->Ring().At(1)->complete);
    EXPECT_EQ(engine->Ring().CurrentIndex(), 1u);
    EXPECT_EQ(DrainBuffer().size(), kBurstFrames);
}

//==============================================================================
// DMA errors
//==============================================================================

TEST_F(TransferEngineTest, DmaErrorLatchesUntilRingReset) {
    auto engine = MakeEngine(Direction::kPlayback);
    OpenRing(*engine, {0, kLastInChain});
    engine->SetEnabled(true);

    ASSERT_TRUE(TickUntil(*engine, EngineState::MoveData));
    bus_.InjectError(Bus::BurstDirection::kRead);
    Tick(*engine);

    EXPECT_TRUE(engine->DmaError());
    EXPECT_EQ(engine->State(), EngineState::Idle);
    EXPECT_EQ(engine->GetCounters().dmaErrors.load(), 1u);

    const uint64_t accepted = bus_.GetCounters().burstsAccepted.load();
    Tick(*engine, 100);
    EXPECT_EQ(engine->State(), EngineState::Idle);
    EXPECT_EQ(bus_.GetCounters().burstsAccepted.load(), accepted);

    auto busy = engine->ResetRing();
    ASSERT_FALSE(busy.has_value());
    EXPECT_EQ(busy.error().code, ErrorCode::kBusy);

    engine->SetEnabled(false);
    ASSERT_TRUE(engine->ResetRing().has_value());
    EXPECT_FALSE(engine->DmaError());
    EXPECT_EQ(engine->Ring().CurrentIndex(), 0u);

    (void)DrainBuffer();
    engine->SetEnabled(true);
    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));
    EXPECT_EQ(engine->Ring().BytesProcessed(), 1024u);
}

TEST_F(TransferEngineTest, BurstOutsideHostMemoryIsDmaError) {
    auto engine = MakeEngine(Direction::kCapture);
    const RingLayout layout = OpenRing(*engine, {kLastInChain});

    HW::DescriptorRecord record = ReadRecord(memory_, layout.ringBase, 0);
    record.bufferAddress = 0x40;
    ASSERT_TRUE(WriteRecord(memory_, layout.ringBase, 0, record));
    ASSERT_TRUE(engine->OpenStream(memory_, layout.ringBase, 1, 512).has_value());

    for (uint32_t f = 0; f < kBurstFrames; ++f) {
        ASSERT_TRUE(buffer_.push(PatternFrame(f, config_.channelCount)));
    }
    engine->SetEnabled(true);
    Tick(*engine, 20);
    EXPECT_TRUE(engine->DmaError());
    EXPECT_EQ(engine->Ring().BytesProcessed(), 0u);
}

//==============================================================================
// Descriptor ownership
//==============================================================================

TEST_F(TransferEngineTest, CompletionHandsOwnedDescriptorBackToHost) {
    auto engine = MakeEngine(Direction::kPlayback);
    const RingLayout layout = OpenRing(*engine, {kHardwareOwned | kInterrupt,
                                                 kHardwareOwned | kLastInChain});
    engine->SetEnabled(true);
    ASSERT_TRUE(TickUntil(*engine, EngineState::Complete));

    EXPECT_EQ(ReadRecord(memory_, layout.ringBase, 0).flags, kInterrupt);
    EXPECT_EQ(ReadRecord(memory_, layout.ringBase, 1).flags, kLastInChain);
    EXPECT_EQ(bus_.GetCounters().postedWrites.load(), 2u);
}

//==============================================================================
// Stream open validation
//==============================================================================

TEST_F(TransferEngineTest, OpenRejectsBufferSizeNotMultipleOfBurst) {
    auto engine = MakeEngine(Direction::kPlayback);
    auto layout = BuildRing(memory_, {kLastInChain}, 512);
    ASSERT_TRUE(layout.has_value());

    auto result = engine->OpenStream(memory_, layout->ringBase, 1, 1000);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::kInvalidConfiguration);
    EXPECT_FALSE(engine->IsOpen());
}

TEST_F(TransferEngineTest, OpenRejectsIncompatibleDescriptorLengths) {
    auto engine = MakeEngine(Direction::kPlayback);
    for (uint32_t length : {0u, 100u, 768u}) {
        auto layout = BuildRing(memory_, {kLastInChain}, 512);
        ASSERT_TRUE(layout.has_value());
        HW::DescriptorRecord record = ReadRecord(memory_, layout->ringBase, 0);
        record.length = length;
        ASSERT_TRUE(WriteRecord(memory_, layout->ringBase, 0, record));

        auto result = engine->OpenStream(memory_, layout->ringBase, 1, 512);
        ASSERT_FALSE(result.has_value()) << "length " << length;
        EXPECT_EQ(result.error().code, ErrorCode::kInvalidConfiguration);
        EXPECT_FALSE(engine->IsOpen());
    }
}

TEST_F(TransferEngineTest, OpenRejectsBadRingGeometry) {
    auto engine = MakeEngine(Direction::kPlayback);
    auto layout = BuildRing(memory_, {kLastInChain}, 512);
    ASSERT_TRUE(layout.has_value());

    auto none = engine->OpenStream(memory_, layout->ringBase, 0, 512);
    ASSERT_FALSE(none.has_value());
    EXPECT_EQ(none.error().code, ErrorCode::kBadArgument);

    auto tooMany = engine->OpenStream(memory_, layout->ringBase, config_.descriptorCapacity + 1, 512);
    ASSERT_FALSE(tooMany.has_value());
    EXPECT_EQ(tooMany.error().code, ErrorCode::kBadArgument);

    auto outside = engine->OpenStream(memory_, 0x20, 1, 512);
    ASSERT_FALSE(outside.has_value());
    EXPECT_EQ(outside.error().code, ErrorCode::kBadArgument);
}

TEST_F(TransferEngineTest, OpenWhileEnabledIsBusy) {
    auto engine = MakeEngine(Direction::kPlayback);
    const RingLayout layout = OpenRing(*engine, {kLastInChain});
    engine->SetEnabled(true);

    auto result = engine->OpenStream(memory_, layout.ringBase, 1, 512);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::kBusy);
}

//==============================================================================
// Bus handshake (mocked)
//==============================================================================

class TransferEngineMockBusTest : public ::testing::Test {
protected:
    Config::DeviceConfig config_{};
    FakeHostMemory memory_{64 * 1024};
    NiceMock<MockHostBus> bus_;
    Cdc::ElasticBuffer buffer_{config_.elasticCapacityFrames};
    TransferEngine engine_{Direction::kPlayback, bus_, buffer_, config_};

    void SetUp() override {
        auto layout = BuildRing(memory_, {kHardwareOwned | kLastInChain}, 512);
        ASSERT_TRUE(layout.has_value());
        layout_ = *layout;
        ASSERT_TRUE(engine_.OpenStream(memory_, layout_.ringBase, 1, 512).has_value());
        ON_CALL(bus_, ErrorPending(_)).WillByDefault(Return(false));
    }

    void Tick(uint32_t ticks) {
        for (uint32_t i = 0; i < ticks; ++i) {
            buffer_.producerClock();
            engine_.Tick();
        }
    }

    RingLayout layout_{};
};

TEST_F(TransferEngineMockBusTest, RefusedRequestsAreRetriedWithSameBurst) {
    const uint64_t expectedAddress = layout_.BufferAddress(0);
    EXPECT_CALL(bus_, RequestBurst(::testing::AllOf(
                          ::testing::Field(&Bus::BurstRequest::address, expectedAddress),
                          ::testing::Field(&Bus::BurstRequest::beatCount, 16u),
                          ::testing::Field(&Bus::BurstRequest::beatBytes, 32u))))
        .WillOnce(Return(false))
        .WillOnce(Return(false))
        .WillOnce(Return(true));
    EXPECT_CALL(bus_, ReadBeat(_)).WillRepeatedly(Return(Bus::BeatStatus{true, false}));

    engine_.SetEnabled(true);
    Tick(4);
    EXPECT_EQ(engine_.State(), EngineState::MoveData);
    EXPECT_EQ(engine_.GetCounters().stallTicks.load(), 2u);
}

TEST_F(TransferEngineMockBusTest, LastBeatEndsBurstEarly) {
    EXPECT_CALL(bus_, RequestBurst(_)).WillOnce(Return(true));
    EXPECT_CALL(bus_, ReadBeat(_))
        .WillOnce(Return(Bus::BeatStatus{true, false}))
        .WillOnce(Return(Bus::BeatStatus{true, true}));

    engine_.SetEnabled(true);
    Tick(4);
    EXPECT_EQ(engine_.State(), EngineState::UpdateDescriptor);
    EXPECT_EQ(engine_.BurstCounter(), 2u);

    // Two of sixteen frames moved: the descriptor stays open.
    Tick(1);
    EXPECT_EQ(engine_.State(), EngineState::Idle);
    EXPECT_FALSE(engine_.Ring().At(0)->complete);
    EXPECT_EQ(engine_.Ring().BytesProcessed(), 64u);
}

TEST_F(TransferEngineMockBusTest, CompletionPostsFlagsWithOwnedBitCleared) {
    EXPECT_CALL(bus_, RequestBurst(_)).WillOnce(Return(true));
    EXPECT_CALL(bus_, ReadBeat(_)).WillRepeatedly(Return(Bus::BeatStatus{true, false}));
    EXPECT_CALL(bus_, PostWrite32(Bus::BurstDirection::kRead,
                                  layout_.ringBase + HW::kDescriptorFlagsOffset, kLastInChain));

    engine_.SetEnabled(true);
    Tick(2 + 16 + 1);
    EXPECT_EQ(engine_.State(), EngineState::Complete);
}

TEST_F(TransferEngineMockBusTest, RefusedRequestWithErrorPendingLatchesDmaError) {
    EXPECT_CALL(bus_, RequestBurst(_)).WillOnce(Return(false));
    EXPECT_CALL(bus_, ErrorPending(Bus::BurstDirection::kRead))
        .WillOnce(Return(false))
        .WillRepeatedly(Return(true));

    engine_.SetEnabled(true);
    Tick(2);
    EXPECT_TRUE(engine_.DmaError());
    EXPECT_EQ(engine_.State(), EngineState::Idle);
}

} // namespace PCIA::Testing
