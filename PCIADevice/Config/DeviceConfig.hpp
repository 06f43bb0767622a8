#pragma once

#include <cstdint>

#include "../Common/Error.hpp"
#include "BufferProfiles.hpp"
#include "EngineConstants.hpp"
#include "PropertyMap.hpp"

namespace PCIA::Config {

/// Device-lifetime configuration. Fixed once the controller is constructed;
/// per-stream settings (format, rate, ring base) go through the register surface.
struct DeviceConfig {
    uint32_t channelCount{kDefaultChannels};
    uint32_t sampleWidthBits{kDefaultSampleWidthBits};
    uint32_t slotWidthBits{kDefaultSlotWidthBits};
    uint32_t tdmSlots{kDefaultTdmSlots};

    uint32_t burstBytes{kBufferProfile.burstBytes};
    uint32_t elasticCapacityFrames{kBufferProfile.elasticCapacityFrames};
    uint32_t descriptorCapacity{kBufferProfile.descriptorCapacity};

    uint32_t mclk44k1Hz{kDefaultMclk44k1Hz};
    uint32_t mclk48kHz{kDefaultMclk48kHz};
};

void InitializeDeviceConfigDefaults(DeviceConfig& outConfig);

/// Overlay recognised PCIA* properties. Unknown keys are ignored; malformed
/// values are logged and leave the field unchanged.
void ParseDeviceConfigFromProperties(const PropertyMap& properties,
                                     DeviceConfig& inOutConfig);

[[nodiscard]] Result<void> ValidateDeviceConfig(const DeviceConfig& config);

/// Bytes of one transport beat (one Audio Sample Frame).
[[nodiscard]] constexpr uint32_t FrameBytes(const DeviceConfig& config) noexcept {
    return config.channelCount * kContainerBytes;
}

[[nodiscard]] constexpr uint32_t BurstFrames(const DeviceConfig& config) noexcept {
    const uint32_t frameBytes = FrameBytes(config);
    return frameBytes == 0 ? 0 : config.burstBytes / frameBytes;
}

} // namespace PCIA::Config
