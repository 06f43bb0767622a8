//
// LogConfig.cpp
// PCIADevice
//
// Runtime logging configuration implementation
//

#include "LogConfig.hpp"
#include "Logging.hpp"

namespace PCIA {

namespace {
constexpr uint8_t kDefaultVerbosity = 1; // Compact
constexpr uint8_t kMaxVerbosity = 4;
} // namespace

// ============================================================================
// Singleton Access
// ============================================================================

LogConfig& LogConfig::Shared() {
    static LogConfig instance;
    return instance;
}

LogConfig::LogConfig()
{
    controllerVerbosity_.store(kDefaultVerbosity);
    dmaVerbosity_.store(kDefaultVerbosity);
    cdcVerbosity_.store(kDefaultVerbosity);
    audioVerbosity_.store(kDefaultVerbosity);
    simVerbosity_.store(kDefaultVerbosity);
    logStatistics_.store(true);
    initialized_.store(false);
}

// ============================================================================
// Initialization
// ============================================================================

void LogConfig::Initialize(const Config::PropertyMap& properties) {
    if (initialized_.load()) {
        PCIA_LOG(Controller, "LogConfig already initialized, skipping");
        return;
    }

    controllerVerbosity_.store(ReadUInt8Property(properties, "PCIAControllerVerbosity", kDefaultVerbosity));
    dmaVerbosity_.store(ReadUInt8Property(properties, "PCIADmaVerbosity", kDefaultVerbosity));
    cdcVerbosity_.store(ReadUInt8Property(properties, "PCIACdcVerbosity", kDefaultVerbosity));
    audioVerbosity_.store(ReadUInt8Property(properties, "PCIAAudioVerbosity", kDefaultVerbosity));
    simVerbosity_.store(ReadUInt8Property(properties, "PCIASimVerbosity", kDefaultVerbosity));
    logStatistics_.store(ReadBoolProperty(properties, "PCIALogStatistics", true));

    initialized_.store(true);

    PCIA_LOG_INFO(Controller,
                  "LogConfig initialized: Controller=%u Dma=%u Cdc=%u Audio=%u Sim=%u Stats=%d",
                  controllerVerbosity_.load(), dmaVerbosity_.load(), cdcVerbosity_.load(),
                  audioVerbosity_.load(), simVerbosity_.load(), logStatistics_.load());
}

void LogConfig::ResetToDefaults() {
    controllerVerbosity_.store(kDefaultVerbosity);
    dmaVerbosity_.store(kDefaultVerbosity);
    cdcVerbosity_.store(kDefaultVerbosity);
    audioVerbosity_.store(kDefaultVerbosity);
    simVerbosity_.store(kDefaultVerbosity);
    logStatistics_.store(true);
    initialized_.store(false);
}

// ============================================================================
// Getters (Thread-Safe)
// ============================================================================

uint8_t LogConfig::GetControllerVerbosity() const {
    return controllerVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetDmaVerbosity() const {
    return dmaVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetCdcVerbosity() const {
    return cdcVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetAudioVerbosity() const {
    return audioVerbosity_.load(std::memory_order_relaxed);
}

uint8_t LogConfig::GetSimVerbosity() const {
    return simVerbosity_.load(std::memory_order_relaxed);
}

bool LogConfig::IsStatisticsEnabled() const {
    return logStatistics_.load(std::memory_order_relaxed);
}

bool LogConfig::IsInitialized() const {
    return initialized_.load(std::memory_order_relaxed);
}

// ============================================================================
// Runtime Setters (Thread-Safe)
// ============================================================================

void LogConfig::SetControllerVerbosity(uint8_t level) {
    level = ClampLevel(level);
    controllerVerbosity_.store(level, std::memory_order_relaxed);
    PCIA_LOG_INFO(Controller, "Controller verbosity changed to %u", level);
}

void LogConfig::SetDmaVerbosity(uint8_t level) {
    level = ClampLevel(level);
    dmaVerbosity_.store(level, std::memory_order_relaxed);
    PCIA_LOG_INFO(Controller, "Dma verbosity changed to %u", level);
}

void LogConfig::SetCdcVerbosity(uint8_t level) {
    level = ClampLevel(level);
    cdcVerbosity_.store(level, std::memory_order_relaxed);
    PCIA_LOG_INFO(Controller, "Cdc verbosity changed to %u", level);
}

void LogConfig::SetAudioVerbosity(uint8_t level) {
    level = ClampLevel(level);
    audioVerbosity_.store(level, std::memory_order_relaxed);
    PCIA_LOG_INFO(Controller, "Audio verbosity changed to %u", level);
}

void LogConfig::SetSimVerbosity(uint8_t level) {
    level = ClampLevel(level);
    simVerbosity_.store(level, std::memory_order_relaxed);
    PCIA_LOG_INFO(Controller, "Sim verbosity changed to %u", level);
}

void LogConfig::SetStatistics(bool enable) {
    logStatistics_.store(enable, std::memory_order_relaxed);
    PCIA_LOG_INFO(Controller, "Statistics logging %s", enable ? "enabled" : "disabled");
}

// ============================================================================
// Private Helpers
// ============================================================================

uint8_t LogConfig::ReadUInt8Property(const Config::PropertyMap& properties,
                                     const char* key,
                                     uint8_t defaultValue) {
    const std::string* raw = Config::FindProperty(properties, key);
    if (!raw) {
        PCIA_LOG_INFO(Controller, "Property '%s' = %u (default, not set)", key, defaultValue);
        return defaultValue;
    }

    const auto parsed = Config::ParseUnsigned(*raw);
    if (!parsed) {
        PCIA_LOG_ERROR(Controller, "Property '%s' has malformed value '%s', using default %u",
                       key, raw->c_str(), defaultValue);
        return defaultValue;
    }

    const uint8_t value = ClampLevel(*parsed);
    PCIA_LOG_INFO(Controller, "Property '%s' = %u (from properties)", key, value);
    return value;
}

bool LogConfig::ReadBoolProperty(const Config::PropertyMap& properties,
                                 const char* key,
                                 bool defaultValue) {
    const std::string* raw = Config::FindProperty(properties, key);
    if (!raw) {
        PCIA_LOG_INFO(Controller, "Property '%s' = %s (default, not set)",
                      key, defaultValue ? "true" : "false");
        return defaultValue;
    }

    const auto parsed = Config::ParseBool(*raw);
    if (!parsed) {
        PCIA_LOG_ERROR(Controller, "Property '%s' has malformed value '%s', using default %s",
                       key, raw->c_str(), defaultValue ? "true" : "false");
        return defaultValue;
    }

    PCIA_LOG_INFO(Controller, "Property '%s' = %s (from properties)", key, *parsed ? "true" : "false");
    return *parsed;
}

uint8_t LogConfig::ClampLevel(uint64_t level) {
    if (level > kMaxVerbosity) {
        return kMaxVerbosity;
    }
    return static_cast<uint8_t>(level);
}

} // namespace PCIA
