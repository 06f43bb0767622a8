//
// LogConfig.hpp
// PCIADevice
//
// Runtime logging configuration singleton
// Reads verbosity levels from the host property map and supports runtime updates
//

#ifndef PCIA_LOGGING_LOGCONFIG_HPP
#define PCIA_LOGGING_LOGCONFIG_HPP

#include <stdint.h>
#include <atomic>

#include "../Config/PropertyMap.hpp"

namespace PCIA {

/**
 * @brief Centralized logging configuration manager
 *
 * Reads verbosity settings from host properties:
 * - PCIAControllerVerbosity (integer 0-4): register surface, stream open/close, resets
 * - PCIADmaVerbosity (integer 0-4): transfer engines and descriptor rings
 * - PCIACdcVerbosity (integer 0-4): clock-domain bridge and elastic buffers
 * - PCIAAudioVerbosity (integer 0-4): frame processor, dividers, lock monitor
 * - PCIASimVerbosity (integer 0-4): dual-clock simulation harness
 * - PCIALogStatistics (boolean): Enable aggregate statistics logging
 *
 * Thread-safe singleton with runtime update support.
 */
class LogConfig {
public:
    static LogConfig& Shared();

    /**
     * @brief Initialize from host properties
     *
     * Must be called once during device bring-up. Later calls are ignored
     * until ResetToDefaults().
     */
    void Initialize(const Config::PropertyMap& properties);

    /**
     * @brief Restore built-in defaults and allow Initialize() again
     */
    void ResetToDefaults();

    // ========================================================================
    // Getters (thread-safe, const)
    // ========================================================================

    uint8_t GetControllerVerbosity() const;
    uint8_t GetDmaVerbosity() const;
    uint8_t GetCdcVerbosity() const;
    uint8_t GetAudioVerbosity() const;
    uint8_t GetSimVerbosity() const;

    /**
     * @brief Check if aggregate statistics logging is enabled
     */
    bool IsStatisticsEnabled() const;

    bool IsInitialized() const;

    // ========================================================================
    // Runtime Setters (thread-safe)
    // ========================================================================

    /**
     * @brief Set Controller verbosity at runtime
     * @param level New verbosity level (0-4, clamped if out of range)
     */
    void SetControllerVerbosity(uint8_t level);
    void SetDmaVerbosity(uint8_t level);
    void SetCdcVerbosity(uint8_t level);
    void SetAudioVerbosity(uint8_t level);
    void SetSimVerbosity(uint8_t level);
    void SetStatistics(bool enable);

private:
    LogConfig();
    ~LogConfig() = default;

    LogConfig(const LogConfig&) = delete;
    LogConfig& operator=(const LogConfig&) = delete;

    uint8_t ReadUInt8Property(const Config::PropertyMap& properties, const char* key, uint8_t defaultValue);
    bool ReadBoolProperty(const Config::PropertyMap& properties, const char* key, bool defaultValue);

    /**
     * @brief Clamp verbosity level to valid range [0, 4]
     */
    static uint8_t ClampLevel(uint64_t level);

    std::atomic<uint8_t> controllerVerbosity_;
    std::atomic<uint8_t> dmaVerbosity_;
    std::atomic<uint8_t> cdcVerbosity_;
    std::atomic<uint8_t> audioVerbosity_;
    std::atomic<uint8_t> simVerbosity_;
    std::atomic<bool> logStatistics_;
    std::atomic<bool> initialized_;
};

} // namespace PCIA

#endif // PCIA_LOGGING_LOGCONFIG_HPP
