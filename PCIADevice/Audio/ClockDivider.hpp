// ClockDivider.hpp
// PCIA - bit/frame timing for each serial format
//
// The audio domain ticks once per MCLK cycle. A bit period lasts
// bitClockDivider ticks; a frame is bitsPerFrame bit periods on every data
// line in parallel.
//
//   I2S  MCLK = 256 fs, 2 slots per line, channels/2 lines (rounded up)
//   TDM  MCLK = 512 fs, tdmSlots slots on one line
//   DSD  fixed dividers 1/2/4 (DSD64/128/256), 8 bits per channel, one line per channel

#pragma once

#include <cstdint>

#include "../Common/Error.hpp"
#include "../Config/EngineConstants.hpp"
#include "AudioFormat.hpp"

namespace PCIA::Audio {

struct FormatParams {
    AudioFormat format{AudioFormat::kI2SStandard};
    uint8_t multiplier{0};
    uint32_t channels{Config::kDefaultChannels};
    uint32_t sampleWidthBits{Config::kDefaultSampleWidthBits};
    uint32_t slotWidthBits{Config::kDefaultSlotWidthBits};
    uint32_t tdmSlots{Config::kDefaultTdmSlots};
};

struct FrameTiming {
    AudioFormat format{AudioFormat::kI2SStandard};
    uint32_t mclkRatio{0};          ///< MCLK cycles per frame at multiplier 0
    uint32_t bitClockDivider{1};    ///< MCLK cycles per bit period
    uint32_t bitsPerFrame{0};       ///< per data line
    uint32_t dataLines{0};
    uint32_t slotsPerLine{0};
    uint32_t slotWidthBits{0};
    uint32_t sampleWidthBits{0};    ///< bits serialized per slot
    uint32_t dataDelayBits{0};      ///< first data bit offset inside a slot
    uint32_t channels{0};

    [[nodiscard]] constexpr uint32_t TicksPerFrame() const noexcept {
        return bitClockDivider * bitsPerFrame;
    }

    /// Channel carried by (line, slot), or -1 when the slot is unused.
    [[nodiscard]] constexpr int32_t ChannelAt(uint32_t line, uint32_t slot) const noexcept {
        uint32_t channel = 0;
        if (IsI2S(format)) {
            channel = line * 2 + slot;
        } else if (format == AudioFormat::kTdm) {
            channel = slot;
        } else {
            channel = line;
        }
        return channel < channels ? static_cast<int32_t>(channel) : -1;
    }

    [[nodiscard]] bool operator==(const FrameTiming&) const noexcept = default;
};

[[nodiscard]] constexpr uint32_t MclkRatio(AudioFormat format) noexcept {
    return format == AudioFormat::kTdm ? Config::kTdmMclkRatio : Config::kI2SMclkRatio;
}

[[nodiscard]] constexpr uint32_t DsdDivider(AudioFormat format) noexcept {
    switch (format) {
        case AudioFormat::kDsd64:  return Config::kDsd64Divider;
        case AudioFormat::kDsd128: return Config::kDsd128Divider;
        case AudioFormat::kDsd256: return Config::kDsd256Divider;
        default:                   return 1;
    }
}

/// MCLK ratio / bits per frame, halved per multiplier step. 0 when the frame
/// does not fit in one MCLK cycle per bit at that rate.
[[nodiscard]] constexpr uint32_t PcmBitClockDivider(uint32_t mclkRatio,
                                                    uint32_t bitsPerFrame,
                                                    uint32_t multiplier) noexcept {
    if (bitsPerFrame == 0) {
        return 0;
    }
    return (mclkRatio / bitsPerFrame) >> multiplier;
}

/// MCLK frequency for a format: TDM runs twice the 256 fs family clock.
[[nodiscard]] constexpr uint32_t MclkFrequencyHz(uint32_t familyMclk256Hz, AudioFormat format) noexcept {
    return format == AudioFormat::kTdm ? familyMclk256Hz * (Config::kTdmMclkRatio / Config::kI2SMclkRatio)
                                       : familyMclk256Hz;
}

[[nodiscard]] Result<FrameTiming> ComputeFrameTiming(const FormatParams& params) noexcept;

static_assert(PcmBitClockDivider(256, 64, 0) == 4, "I2S 2x32 at 256 fs");
static_assert(PcmBitClockDivider(512, 256, 0) == 2, "TDM 8x32 at 512 fs");
static_assert(PcmBitClockDivider(256, 64, 3) == 0, "I2S 2x32 cannot run at x8");

} // namespace PCIA::Audio
