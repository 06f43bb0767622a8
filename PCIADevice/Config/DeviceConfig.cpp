#include "DeviceConfig.hpp"

#include <limits>

#include "../Logging/LogConfig.hpp"

namespace PCIA::Config {
namespace {

void ReadUInt32(const PropertyMap& properties, const char* key, uint32_t& inOutValue) {
    const std::string* raw = FindProperty(properties, key);
    if (!raw) {
        return;
    }

    const auto parsed = ParseUnsigned(*raw);
    if (!parsed || *parsed > std::numeric_limits<uint32_t>::max()) {
        PCIA_LOG_ERROR(Controller, "DeviceConfig: property '%s' has malformed value '%s', keeping %u",
                       key, raw->c_str(), inOutValue);
        return;
    }

    inOutValue = static_cast<uint32_t>(*parsed);
    PCIA_LOG_V2(Controller, "DeviceConfig: %s = %u", key, inOutValue);
}

} // namespace

void InitializeDeviceConfigDefaults(DeviceConfig& outConfig) {
    outConfig = DeviceConfig{};
}

void ParseDeviceConfigFromProperties(const PropertyMap& properties,
                                     DeviceConfig& inOutConfig) {
    ReadUInt32(properties, "PCIAChannelCount", inOutConfig.channelCount);
    ReadUInt32(properties, "PCIASampleWidth", inOutConfig.sampleWidthBits);
    ReadUInt32(properties, "PCIASlotWidth", inOutConfig.slotWidthBits);
    ReadUInt32(properties, "PCIATdmSlots", inOutConfig.tdmSlots);
    ReadUInt32(properties, "PCIABurstBytes", inOutConfig.burstBytes);
    ReadUInt32(properties, "PCIAElasticCapacityFrames", inOutConfig.elasticCapacityFrames);
    ReadUInt32(properties, "PCIADescriptorCapacity", inOutConfig.descriptorCapacity);
    ReadUInt32(properties, "PCIAMclk44k1Hz", inOutConfig.mclk44k1Hz);
    ReadUInt32(properties, "PCIAMclk48kHz", inOutConfig.mclk48kHz);
}

Result<void> ValidateDeviceConfig(const DeviceConfig& config) {
    if (config.channelCount == 0 || config.channelCount > kMaxChannels) {
        return PCIA_ERROR_CONFIG("Channel count must be 1..16");
    }
    if (config.sampleWidthBits == 0 || config.sampleWidthBits > kMaxSampleWidthBits) {
        return PCIA_ERROR_CONFIG("Sample width must be 1..32 bits");
    }
    if (config.slotWidthBits < config.sampleWidthBits || config.slotWidthBits > kMaxSlotWidthBits) {
        return PCIA_ERROR_CONFIG("Slot width must hold the sample and be at most 32 bits");
    }
    if (config.tdmSlots == 0 || config.tdmSlots > kMaxTdmSlots) {
        return PCIA_ERROR_CONFIG("TDM slot count must be 1..16");
    }
    if (config.burstBytes == 0 || config.burstBytes % FrameBytes(config) != 0) {
        return PCIA_ERROR_CONFIG("Burst size must be a whole number of frames");
    }
    if (!IsPowerOfTwo(config.elasticCapacityFrames)) {
        return PCIA_ERROR_CONFIG("Elastic buffer capacity must be a power of two");
    }
    if (config.elasticCapacityFrames < BurstFrames(config)) {
        return PCIA_ERROR_CONFIG("Elastic buffer must hold at least one burst");
    }
    if (config.descriptorCapacity == 0) {
        return PCIA_ERROR_CONFIG("Descriptor ring capacity must be non-zero");
    }
    if (config.mclk44k1Hz == 0 || config.mclk48kHz == 0 ||
        config.mclk44k1Hz % kRateWindowsPerSecond != 0 ||
        config.mclk48kHz % kRateWindowsPerSecond != 0) {
        return PCIA_ERROR_CONFIG("MCLK frequencies must be non-zero multiples of the rate window");
    }
    return {};
}

} // namespace PCIA::Config
