#pragma once

#include <cstddef>
#include <cstdint>

namespace PCIA::Config {

/// Maximum channels per Audio Sample Frame (and per transport beat).
inline constexpr uint32_t kMaxChannels = 16;

/// Maximum serial data lines (I2S pairs or DSD channels).
inline constexpr uint32_t kMaxDataLines = kMaxChannels;

/// Every channel travels in a 32-bit container, low sampleWidth bits significant.
inline constexpr uint32_t kContainerBytes = 4;
inline constexpr uint32_t kMaxSampleWidthBits = 32;
inline constexpr uint32_t kMaxSlotWidthBits = 32;
inline constexpr uint32_t kMaxTdmSlots = 16;

/// Largest beat the transport ever carries.
inline constexpr uint32_t kMaxBeatBytes = kMaxChannels * kContainerBytes;

// Defaults (8-channel, 24-in-32, TDM 8 x 32).
inline constexpr uint32_t kDefaultChannels = 8;
inline constexpr uint32_t kDefaultSampleWidthBits = 24;
inline constexpr uint32_t kDefaultSlotWidthBits = 32;
inline constexpr uint32_t kDefaultTdmSlots = 8;

/// Synchronizer depth for every scalar and index crossing.
inline constexpr uint32_t kSyncStages = 2;

/// MCLK of each sample-rate family at 256 x fs. TDM runs MCLK at 512 x fs.
inline constexpr uint32_t kDefaultMclk44k1Hz = 11'289'600;
inline constexpr uint32_t kDefaultMclk48kHz = 12'288'000;
inline constexpr uint32_t kI2SMclkRatio = 256;
inline constexpr uint32_t kTdmMclkRatio = 512;

/// DSD bit-clock dividers (DSD64, DSD128, DSD256).
inline constexpr uint32_t kDsd64Divider = 1;
inline constexpr uint32_t kDsd128Divider = 2;
inline constexpr uint32_t kDsd256Divider = 4;
inline constexpr uint32_t kDsdBitsPerFrame = 8;

/// Bit-clock edges with a stable configuration before the clock reports lock.
inline constexpr uint32_t kLockEdgeCount = 4096;

/// Rate measurement windows per second (10 ms windows).
inline constexpr uint32_t kRateWindowsPerSecond = 100;

/// Largest sample-rate multiplier step (x1, x2, x4, x8).
inline constexpr uint32_t kMaxRateMultiplier = 3;

static_assert(kMaxBeatBytes == 64, "Beat buffer sizing assumes 16 x 32-bit channels");
static_assert(kSyncStages >= 2, "Crossings need at least two synchronizer stages");
static_assert(kDefaultTdmSlots * kDefaultSlotWidthBits <= kTdmMclkRatio,
              "Default TDM frame must fit the TDM MCLK ratio");
static_assert(kDefaultMclk48kHz % kRateWindowsPerSecond == 0 &&
              kDefaultMclk44k1Hz % kRateWindowsPerSecond == 0,
              "Rate window must be a whole number of MCLK cycles");

} // namespace PCIA::Config
