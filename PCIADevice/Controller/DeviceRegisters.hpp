// DeviceRegisters.hpp
// PCIA - host-visible configuration and status surface
//
// Value-per-item view of the register file. Address decoding lives outside
// the core; the controller only sees whole values.

#pragma once

#include <cstdint>

#include "../Audio/AudioFormat.hpp"
#include "../Config/EngineConstants.hpp"
#include "../Dma/TransferEngine.hpp"

namespace PCIA::Controller {

struct FormatControl {
    Audio::AudioFormat format{Audio::AudioFormat::kI2SStandard};
    Audio::SampleRateFamily family{Audio::SampleRateFamily::k48k};
    uint8_t multiplier{0};      // x1, x2, x4, x8
    Audio::DsdMode dsdMode{Audio::DsdMode::kMsbFirst};
    Audio::ClockSource clockSource{Audio::ClockSource::kAuto};
    bool masterMode{false};
    uint8_t tdmSlots{Config::kDefaultTdmSlots};
    uint8_t slotWidthBits{Config::kDefaultSlotWidthBits};
};

struct RingRegisters {
    uint64_t baseAddress{0};
    uint32_t descriptorCount{0};
    uint32_t bufferSize{0};         // bytes covered by the ring
    bool interruptEnable{false};
    uint32_t thresholdFrames{0};    // 0 = off
};

struct DirectionStatus {
    Dma::EngineState state{Dma::EngineState::Idle};
    bool enabled{false};
    bool complete{false};
    bool dmaError{false};
    uint32_t currentIndex{0};
    uint32_t activeCount{0};
    uint32_t bytesProcessed{0};
    uint32_t bufferLevel{0};
    bool thresholdReached{false};   // playback: level <= threshold, capture: level >= threshold
};

struct DeviceStatus {
    bool locked{false};
    uint32_t measuredRate{0};
    bool underrun{false};
    bool overrun{false};
    uint64_t underrunCount{0};
    uint64_t overrunCount{0};
    bool recoveryMode{false};
    DirectionStatus playback{};
    DirectionStatus capture{};
};

} // namespace PCIA::Controller
