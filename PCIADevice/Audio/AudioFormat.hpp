// AudioFormat.hpp
// PCIA - serial audio format vocabulary shared by the register surface,
// the clock-domain bridge and the frame processor.

#pragma once

#include <array>
#include <cstdint>

#include "../Config/EngineConstants.hpp"

namespace PCIA::Audio {

enum class AudioFormat : uint8_t {
    kI2SStandard = 0,       // data MSB one bit-clock after the word-select edge
    kI2SLeftJustified = 1,  // data MSB on the word-select edge
    kI2SRightJustified = 2, // data LSB on the last bit of the slot
    kTdm = 3,
    kDsd64 = 4,
    kDsd128 = 5,
    kDsd256 = 6,
};

enum class SampleRateFamily : uint8_t {
    k44k1 = 0,
    k48k = 1,
};

enum class ClockSource : uint8_t {
    kAuto = 0,
    k44k1Oscillator = 1,
    k48kOscillator = 2,
};

/// DSD bit order on the wire.
enum class DsdMode : uint8_t {
    kMsbFirst = 0, // DFF order
    kLsbFirst = 1, // DSF order
};

[[nodiscard]] constexpr bool IsI2S(AudioFormat format) noexcept {
    return format == AudioFormat::kI2SStandard ||
           format == AudioFormat::kI2SLeftJustified ||
           format == AudioFormat::kI2SRightJustified;
}

[[nodiscard]] constexpr bool IsDsd(AudioFormat format) noexcept {
    return format == AudioFormat::kDsd64 ||
           format == AudioFormat::kDsd128 ||
           format == AudioFormat::kDsd256;
}

[[nodiscard]] constexpr bool IsValidFormatCode(uint32_t code) noexcept {
    return code <= static_cast<uint32_t>(AudioFormat::kDsd256);
}

[[nodiscard]] constexpr const char* ToString(AudioFormat format) noexcept {
    switch (format) {
        case AudioFormat::kI2SStandard:       return "I2S";
        case AudioFormat::kI2SLeftJustified:  return "I2S-LJ";
        case AudioFormat::kI2SRightJustified: return "I2S-RJ";
        case AudioFormat::kTdm:               return "TDM";
        case AudioFormat::kDsd64:             return "DSD64";
        case AudioFormat::kDsd128:            return "DSD128";
        case AudioFormat::kDsd256:            return "DSD256";
    }
    return "unknown";
}

[[nodiscard]] constexpr const char* ToString(SampleRateFamily family) noexcept {
    return family == SampleRateFamily::k44k1 ? "44.1k" : "48k";
}

/// One Audio Sample Frame: per-channel 32-bit containers, channel 0 first.
/// Only the first `channels` words of a frame are meaningful.
struct AudioFrame {
    std::array<uint32_t, Config::kMaxChannels> words{};

    [[nodiscard]] bool operator==(const AudioFrame&) const noexcept = default;
};

static_assert(sizeof(AudioFrame) == Config::kMaxChannels * sizeof(uint32_t),
              "AudioFrame must stay a flat word array");

[[nodiscard]] constexpr uint32_t SampleMask(uint32_t widthBits) noexcept {
    return widthBits >= 32 ? 0xFFFF'FFFFu : ((1u << widthBits) - 1u);
}

} // namespace PCIA::Audio
