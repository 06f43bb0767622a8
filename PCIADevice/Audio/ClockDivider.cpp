#include "ClockDivider.hpp"

namespace PCIA::Audio {

Result<FrameTiming> ComputeFrameTiming(const FormatParams& params) noexcept {
    if (params.channels == 0 || params.channels > Config::kMaxChannels) {
        return PCIA_ERROR_CONFIG("Channel count must be 1..16");
    }
    if (params.multiplier > Config::kMaxRateMultiplier) {
        return PCIA_ERROR_CONFIG("Sample-rate multiplier must be 0..3");
    }

    FrameTiming timing{};
    timing.format = params.format;
    timing.channels = params.channels;
    timing.mclkRatio = MclkRatio(params.format);

    if (IsDsd(params.format)) {
        timing.slotWidthBits = Config::kDsdBitsPerFrame;
        timing.sampleWidthBits = Config::kDsdBitsPerFrame;
        timing.slotsPerLine = 1;
        timing.bitsPerFrame = Config::kDsdBitsPerFrame;
        timing.dataLines = params.channels;
        timing.dataDelayBits = 0;
        timing.bitClockDivider = DsdDivider(params.format);
        return timing;
    }

    if (params.sampleWidthBits == 0 || params.sampleWidthBits > Config::kMaxSampleWidthBits) {
        return PCIA_ERROR_CONFIG("Sample width must be 1..32 bits");
    }
    if (params.slotWidthBits == 0 || params.slotWidthBits > Config::kMaxSlotWidthBits) {
        return PCIA_ERROR_CONFIG("Slot width must be 1..32 bits");
    }

    timing.slotWidthBits = params.slotWidthBits;
    timing.sampleWidthBits = params.sampleWidthBits;

    if (params.format == AudioFormat::kTdm) {
        if (params.tdmSlots == 0 || params.tdmSlots > Config::kMaxTdmSlots) {
            return PCIA_ERROR_CONFIG("TDM slot count must be 1..16");
        }
        if (params.tdmSlots < params.channels) {
            return PCIA_ERROR_CONFIG("TDM frame has fewer slots than channels");
        }
        if (params.slotWidthBits < params.sampleWidthBits) {
            return PCIA_ERROR_CONFIG("Slot width smaller than sample width");
        }
        timing.slotsPerLine = params.tdmSlots;
        timing.dataLines = 1;
        timing.dataDelayBits = 0;
    } else {
        uint32_t delay = 0;
        switch (params.format) {
            case AudioFormat::kI2SStandard:
                delay = 1;
                break;
            case AudioFormat::kI2SRightJustified:
                delay = params.slotWidthBits >= params.sampleWidthBits
                            ? params.slotWidthBits - params.sampleWidthBits
                            : 0;
                break;
            default:
                delay = 0;
                break;
        }
        if (params.slotWidthBits < params.sampleWidthBits + delay) {
            return PCIA_ERROR_CONFIG("I2S slot too narrow for sample width and data delay");
        }
        timing.slotsPerLine = 2;
        timing.dataLines = (params.channels + 1) / 2;
        timing.dataDelayBits = delay;
    }

    timing.bitsPerFrame = timing.slotsPerLine * timing.slotWidthBits;
    timing.bitClockDivider = PcmBitClockDivider(timing.mclkRatio, timing.bitsPerFrame, params.multiplier);
    if (timing.bitClockDivider == 0) {
        return PCIA_ERROR_CONFIG("Frame does not fit the MCLK at this rate multiplier");
    }
    return timing;
}

} // namespace PCIA::Audio
