#include "TransferEngine.hpp"

#include <algorithm>
#include <span>

#include "../Hardware/DescriptorLayout.hpp"
#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace PCIA::Dma {

TransferEngine::TransferEngine(Direction direction,
                               Bus::IHostBus& bus,
                               Cdc::ElasticBuffer& buffer,
                               const Config::DeviceConfig& config)
    : direction_(direction),
      bus_(bus),
      buffer_(buffer),
      ring_(config.descriptorCapacity),
      channels_(config.channelCount),
      frameBytes_(Config::FrameBytes(config)),
      burstBytes_(config.burstBytes),
      burstFrames_(Config::BurstFrames(config)) {}

// ============================================================================
// Stream lifecycle
// ============================================================================

Result<void> TransferEngine::OpenStream(const Shared::IHostMemory& memory,
                                        uint64_t baseAddress,
                                        uint32_t descriptorCount,
                                        uint32_t bufferSize) noexcept {
    if (enabled_) {
        return PCIA_ERROR_BUSY("Direction must be disabled before opening a stream");
    }
    if (burstBytes_ == 0 || frameBytes_ == 0 || burstBytes_ % frameBytes_ != 0) {
        return PCIA_ERROR_CONFIG("Burst size must be a whole number of frames");
    }
    if (bufferSize == 0 || bufferSize % burstBytes_ != 0) {
        return PCIA_ERROR_CONFIG("Burst size must evenly divide the buffer size");
    }

    PCIA_TRY(ring_.Load(memory, baseAddress, descriptorCount));

    for (size_t i = 0; i < ring_.Size(); ++i) {
        const Shared::Descriptor* d = ring_.At(i);
        const bool valid = d->length != 0 &&
                           (d->length >= burstBytes_ ? d->length % burstBytes_ == 0
                                                     : d->length % frameBytes_ == 0);
        if (!valid) {
            PCIA_LOG_V0(Dma, "%s: descriptor %zu length %u incompatible with burst %u / frame %u",
                        ToString(direction_), i, d->length, burstBytes_, frameBytes_);
            ring_.Clear();
            return PCIA_ERROR_CONFIG("Descriptor length incompatible with burst size");
        }
    }

    state_ = EngineState::Idle;
    dmaError_ = false;
    pendingEdge_ = false;
    burstBeats_ = 0;
    burstCounter_ = 0;
    bus_.ClearError(BusDirection());

    PCIA_LOG_V1(Dma, "%s: stream opened, %u descriptors at 0x%llx, buffer %u bytes, burst %u frames",
                ToString(direction_), descriptorCount, (unsigned long long)baseAddress,
                bufferSize, burstFrames_);
    return {};
}

void TransferEngine::CloseStream() noexcept {
    enabled_ = false;
    ring_.Clear();
    state_ = EngineState::Idle;
    pendingEdge_ = false;
    burstBeats_ = 0;
    burstCounter_ = 0;
    PCIA_LOG_V1(Dma, "%s: stream closed", ToString(direction_));
}

void TransferEngine::SetEnabled(bool enabled) noexcept {
    if (enabled_ == enabled) {
        return;
    }
    enabled_ = enabled;
    PCIA_LOG_V2(Dma, "%s: %s in %s", ToString(direction_), enabled ? "enabled" : "disabled",
                ToString(state_));
}

Result<void> TransferEngine::ResetRing() noexcept {
    if (enabled_) {
        return PCIA_ERROR_BUSY("Direction must be disabled before resetting its ring");
    }
    ForceReset();
    return {};
}

void TransferEngine::ForceReset() noexcept {
    ring_.Reset();
    state_ = EngineState::Idle;
    dmaError_ = false;
    pendingEdge_ = false;
    burstBeats_ = 0;
    burstCounter_ = 0;
    bus_.ClearError(BusDirection());
}

bool TransferEngine::TakeCompletionEdge() noexcept {
    const bool edge = pendingEdge_;
    pendingEdge_ = false;
    return edge;
}

// ============================================================================
// State machine
// ============================================================================

void TransferEngine::Tick() noexcept {
    switch (state_) {
        case EngineState::Idle:             TickIdle(); break;
        case EngineState::FetchDescriptor:  TickFetchDescriptor(); break;
        case EngineState::MoveData:         TickMoveData(); break;
        case EngineState::UpdateDescriptor: TickUpdateDescriptor(); break;
        case EngineState::Complete:         TickComplete(); break;
    }
}

void TransferEngine::TickIdle() noexcept {
    if (!enabled_ || dmaError_ || !ring_.IsLoaded()) {
        return;
    }

    const bool room = direction_ == Direction::kPlayback
                          ? buffer_.availableSpace() >= burstFrames_
                          : buffer_.fillLevel() >= burstFrames_;
    if (room) {
        TransitionTo(EngineState::FetchDescriptor);
    }
}

void TransferEngine::TickFetchDescriptor() noexcept {
    if (bus_.ErrorPending(BusDirection())) {
        LatchDmaError("fetch");
        return;
    }

    Shared::Descriptor* current = ring_.Current();
    if (!current) {
        TransitionTo(EngineState::Idle);
        return;
    }
    if (current->complete) {
        TransitionTo(EngineState::Complete);
        return;
    }

    const uint32_t bytes = std::min(burstBytes_, current->Remaining());
    Bus::BurstRequest request{};
    request.direction = BusDirection();
    request.address = current->bufferAddress + current->offset;
    request.beatCount = bytes / frameBytes_;
    request.beatBytes = frameBytes_;

    if (!bus_.RequestBurst(request)) {
        if (bus_.ErrorPending(BusDirection())) {
            LatchDmaError("request");
            return;
        }
        counters_.stallTicks.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    ring_.Activate();
    burstBeats_ = request.beatCount;
    burstCounter_ = 0;
    PCIA_LOG_V4(Dma, "%s: burst desc=%zu addr=0x%llx beats=%u", ToString(direction_),
                ring_.CurrentIndex(), (unsigned long long)request.address, request.beatCount);
    TransitionTo(EngineState::MoveData);
}

void TransferEngine::TickMoveData() noexcept {
    if (direction_ == Direction::kPlayback) {
        MovePlaybackBeat();
    } else {
        MoveCaptureBeat();
    }
}

void TransferEngine::MovePlaybackBeat() noexcept {
    if (buffer_.availableSpace() == 0) {
        counters_.stallTicks.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    const Bus::BeatStatus status = bus_.ReadBeat(std::span<uint8_t>(beat_.data(), frameBytes_));
    if (!status.valid) {
        if (bus_.ErrorPending(BusDirection())) {
            LatchDmaError("read beat");
            return;
        }
        counters_.stallTicks.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    Audio::AudioFrame frame{};
    for (uint32_t ch = 0; ch < channels_; ++ch) {
        frame.words[ch] = HW::LoadLE32(beat_.data() + ch * Config::kContainerBytes);
    }
    if (!buffer_.push(frame)) {
        PCIA_LOG_RL(Dma, "pb/push", 1000, Error, "PB: elastic buffer refused a beat");
    }
    FinishBeat(status.last);
}

void TransferEngine::MoveCaptureBeat() noexcept {
    const Audio::AudioFrame* head = buffer_.peek();
    if (!head) {
        counters_.stallTicks.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    for (uint32_t ch = 0; ch < channels_; ++ch) {
        HW::StoreLE32(beat_.data() + ch * Config::kContainerBytes, head->words[ch]);
    }

    const Bus::BeatStatus status = bus_.WriteBeat(std::span<const uint8_t>(beat_.data(), frameBytes_));
    if (!status.valid) {
        if (bus_.ErrorPending(BusDirection())) {
            LatchDmaError("write beat");
            return;
        }
        counters_.stallTicks.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    buffer_.discard();
    FinishBeat(status.last);
}

void TransferEngine::FinishBeat(bool last) noexcept {
    ++burstCounter_;
    if (last || burstCounter_ >= burstBeats_) {
        TransitionTo(EngineState::UpdateDescriptor);
    }
}

void TransferEngine::TickUpdateDescriptor() noexcept {
    Shared::Descriptor* current = ring_.Current();
    if (!current) {
        TransitionTo(EngineState::Idle);
        return;
    }

    const uint32_t bytes = burstCounter_ * frameBytes_;
    counters_.burstsCompleted.fetch_add(1, std::memory_order_relaxed);

    if (bytes < current->Remaining()) {
        ring_.RecordBurst(bytes);
        TransitionTo(EngineState::Idle);
        return;
    }

    if (!ring_.MarkComplete(bytes)) {
        PCIA_LOG_RL(Dma, "desc/double-complete", 1000, Error,
                    "%s: descriptor %zu already complete", ToString(direction_), ring_.CurrentIndex());
    }
    counters_.descriptorsCompleted.fetch_add(1, std::memory_order_relaxed);

    if (current->hardwareOwned) {
        current->hardwareOwned = false;
        bus_.PostWrite32(BusDirection(), ring_.CurrentAddress() + HW::kDescriptorFlagsOffset,
                         current->ToRecord().flags);
    }

    if (current->interrupt) {
        pendingEdge_ = true;
        counters_.completionEdges.fetch_add(1, std::memory_order_relaxed);
    }

    const bool lastInChain = current->lastInChain;
    PCIA_LOG_DESCRIPTOR("%s: desc %zu complete, bytes=%u total=%u irq=%d last=%d",
                        ToString(direction_), ring_.CurrentIndex(), current->length,
                        ring_.BytesProcessed(), current->interrupt, lastInChain);
    ring_.Advance();
    TransitionTo(lastInChain ? EngineState::Complete : EngineState::Idle);
}

void TransferEngine::TickComplete() noexcept {
    if (!enabled_) {
        TransitionTo(EngineState::Idle);
    }
}

void TransferEngine::LatchDmaError(const char* where) noexcept {
    dmaError_ = true;
    burstBeats_ = 0;
    burstCounter_ = 0;
    counters_.dmaErrors.fetch_add(1, std::memory_order_relaxed);
    PCIA_LOG_RL(Dma, "dma/error", 1000, Fault, "%s: DMA error during %s at descriptor %zu, engine halted",
                ToString(direction_), where, ring_.CurrentIndex());
    TransitionTo(EngineState::Idle);
}

void TransferEngine::TransitionTo(EngineState next) noexcept {
    if (next == state_) {
        return;
    }
    PCIA_LOG_V3(Dma, "%s: %s -> %s", ToString(direction_), ToString(state_), ToString(next));
    state_ = next;
}

} // namespace PCIA::Dma
