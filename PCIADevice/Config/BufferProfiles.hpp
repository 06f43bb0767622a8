#pragma once

#include <cstdint>

#include "EngineConstants.hpp"

namespace PCIA::Config {

#define PCIA_BUFFER_PROFILE_A 1 // Default: 1024-frame elastic buffers, 512-byte bursts
#define PCIA_BUFFER_PROFILE_B 2 // Low latency: short elastic buffers and bursts
#define PCIA_BUFFER_PROFILE_C 3 // Deep: long elastic buffers for hosts with irregular service

#ifndef PCIA_BUFFER_PROFILE
#define PCIA_BUFFER_PROFILE PCIA_BUFFER_PROFILE_A
#endif

struct BufferProfile {
    const char* name;
    uint32_t elasticCapacityFrames;   // per direction, power of two
    uint32_t burstBytes;
    uint32_t descriptorCapacity;
};

inline constexpr BufferProfile kBufferProfileA{
    "A",
    1024,  // elasticCapacityFrames
    512,   // burstBytes
    32     // descriptorCapacity
};

inline constexpr BufferProfile kBufferProfileB{
    "B",
    256,   // elasticCapacityFrames
    256,   // burstBytes
    16     // descriptorCapacity
};

inline constexpr BufferProfile kBufferProfileC{
    "C",
    4096,  // elasticCapacityFrames
    512,   // burstBytes
    64     // descriptorCapacity
};

constexpr bool IsPowerOfTwo(uint32_t value) noexcept {
    return value != 0 && (value & (value - 1)) == 0;
}

constexpr bool IsValidProfile(const BufferProfile& profile) noexcept {
    return IsPowerOfTwo(profile.elasticCapacityFrames) &&
           profile.burstBytes > 0 &&
           profile.burstBytes % kContainerBytes == 0 &&
           profile.descriptorCapacity > 0;
}

static_assert(IsValidProfile(kBufferProfileA), "Profile A is invalid");
static_assert(IsValidProfile(kBufferProfileB), "Profile B is invalid");
static_assert(IsValidProfile(kBufferProfileC), "Profile C is invalid");

// The default channel layout must fit one burst into every profile's buffers.
static_assert(kBufferProfileA.burstBytes % (kDefaultChannels * kContainerBytes) == 0,
              "Profile A burst must be whole default frames");
static_assert(kBufferProfileB.burstBytes % (kDefaultChannels * kContainerBytes) == 0,
              "Profile B burst must be whole default frames");
static_assert(kBufferProfileC.burstBytes % (kDefaultChannels * kContainerBytes) == 0,
              "Profile C burst must be whole default frames");

#if PCIA_BUFFER_PROFILE == PCIA_BUFFER_PROFILE_A
inline constexpr BufferProfile kBufferProfile = kBufferProfileA;
#elif PCIA_BUFFER_PROFILE == PCIA_BUFFER_PROFILE_B
inline constexpr BufferProfile kBufferProfile = kBufferProfileB;
#elif PCIA_BUFFER_PROFILE == PCIA_BUFFER_PROFILE_C
inline constexpr BufferProfile kBufferProfile = kBufferProfileC;
#else
#error "Invalid PCIA_BUFFER_PROFILE value. Use PCIA_BUFFER_PROFILE_A/B/C."
#endif

static_assert(IsValidProfile(kBufferProfile), "Selected buffer profile is invalid");

} // namespace PCIA::Config
