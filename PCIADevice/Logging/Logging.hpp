#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

#ifndef PCIA_DEBUG_DESCRIPTORS
#define PCIA_DEBUG_DESCRIPTORS 0
#endif

#ifndef PCIA_DEBUG_FRAME_BOUNDARY
#define PCIA_DEBUG_FRAME_BOUNDARY 0
#endif

//
// Category loggers. Every category writes through the same backend; the
// "[Category]" prefix added by PCIA_LOG keeps messages filterable.
//

namespace PCIA::Driver::Logging {

enum class LogType : uint8_t {
    Default,
    Info,
    Debug,
    Error,
    Fault,
};

struct LogCategory {
    const char* name;
};

const LogCategory& Controller();
const LogCategory& Dma();
const LogCategory& Cdc();
const LogCategory& Audio();
const LogCategory& Sim();

/// Line sink. nullptr restores the stderr backend.
using LogSink = void (*)(LogType type, const char* line);
void SetSink(LogSink sink) noexcept;

void Write(const LogCategory& category, LogType type, const char* fmt, ...) noexcept
    __attribute__((format(printf, 3, 4)));

[[nodiscard]] const char* ToString(LogType type) noexcept;

} // namespace PCIA::Driver::Logging

// ----- time helpers (header-only) -----
namespace PCIA::LogDetail {
inline uint64_t NowNs() {
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(now).count());
}
struct RlState {
    std::atomic<uint64_t> last_ns{0};
    std::atomic<uint64_t> suppressed{0};
};
} // namespace PCIA::LogDetail

// ----- Plain logging -----
#define PCIA_LOG(cat, fmt, ...)                                                                  \
    ::PCIA::Driver::Logging::Write(::PCIA::Driver::Logging::cat(),                              \
                                   ::PCIA::Driver::Logging::LogType::Default,                   \
                                   "[%s] " fmt, #cat, ##__VA_ARGS__)

#define PCIA_LOG_TYPE(cat, type, fmt, ...)                                                       \
    ::PCIA::Driver::Logging::Write(::PCIA::Driver::Logging::cat(),                              \
                                   ::PCIA::Driver::Logging::LogType::type,                      \
                                   "[%s] " fmt, #cat, ##__VA_ARGS__)

// ----- Rate-limited logging -----
// key: per-callsite stable string (e.g. "pb/underrun"); interval_ms: throttle window
#define PCIA_LOG_RL(cat, key, interval_ms, type, fmt, ...)                                      \
    do {                                                                                        \
        static ::PCIA::LogDetail::RlState _s;                                                   \
        const uint64_t _now = ::PCIA::LogDetail::NowNs();                                       \
        const uint64_t _intv = (uint64_t)(interval_ms) * 1000000ull;                            \
        uint64_t _last = _s.last_ns.load(std::memory_order_relaxed);                            \
        if (_now - _last >= _intv || _last == 0) {                                              \
            if (_s.last_ns.exchange(_now, std::memory_order_relaxed) != 0) {                    \
                uint64_t _lost = _s.suppressed.exchange(0, std::memory_order_relaxed);          \
                if (_lost) {                                                                    \
                    PCIA_LOG_TYPE(cat, type, "[%s] (suppressed=%llu prior)", key,               \
                                  (unsigned long long)_lost);                                   \
                }                                                                               \
            }                                                                                   \
            PCIA_LOG_TYPE(cat, type, "[%s] " fmt, key, ##__VA_ARGS__);                          \
        } else {                                                                                \
            _s.suppressed.fetch_add(1, std::memory_order_relaxed);                              \
        }                                                                                       \
    } while (0)

// Convenience shorthands
#define PCIA_LOG_INFO(cat, fmt, ...)    PCIA_LOG_TYPE(cat, Info,  fmt, ##__VA_ARGS__)
#define PCIA_LOG_ERROR(cat, fmt, ...)   PCIA_LOG_TYPE(cat, Error, fmt, ##__VA_ARGS__)
#define PCIA_LOG_DEBUG(cat, fmt, ...)   PCIA_LOG_TYPE(cat, Debug, fmt, ##__VA_ARGS__)

#if PCIA_DEBUG_DESCRIPTORS
#define PCIA_LOG_DESCRIPTOR(fmt, ...) PCIA_LOG_DEBUG(Dma, fmt, ##__VA_ARGS__)
#else
#define PCIA_LOG_DESCRIPTOR(fmt, ...)
#endif

#if PCIA_DEBUG_FRAME_BOUNDARY
#define PCIA_LOG_FRAME(fmt, ...) PCIA_LOG_DEBUG(Audio, fmt, ##__VA_ARGS__)
#else
#define PCIA_LOG_FRAME(fmt, ...)
#endif

// ============================================================================
// Runtime Verbosity-Aware Logging Macros
// ============================================================================
//
//   PCIA_LOG_V0(Dma, "Critical error");     // Level 0+ (always logs errors)
//   PCIA_LOG_V1(Dma, "PB ring loaded");     // Level 1+ (compact summaries)
//   PCIA_LOG_V2(Dma, "State transition");   // Level 2+ (key transitions)
//   PCIA_LOG_V3(Dma, "Detailed flow");      // Level 3+ (verbose)
//   PCIA_LOG_V4(Dma, "Debug dump");         // Level 4+ (full diagnostics)
//
// Levels come from the PCIA<Category>Verbosity properties (see LogConfig).
//

namespace PCIA {
class LogConfig;
}

#define PCIA_GET_VERBOSITY(category) \
    (::PCIA::LogConfig::Shared().Get##category##Verbosity())

#define PCIA_LOG_V0(category, fmt, ...) \
    do { \
        if (PCIA_GET_VERBOSITY(category) >= 0) { \
            PCIA_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define PCIA_LOG_V1(category, fmt, ...) \
    do { \
        if (PCIA_GET_VERBOSITY(category) >= 1) { \
            PCIA_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define PCIA_LOG_V2(category, fmt, ...) \
    do { \
        if (PCIA_GET_VERBOSITY(category) >= 2) { \
            PCIA_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define PCIA_LOG_V3(category, fmt, ...) \
    do { \
        if (PCIA_GET_VERBOSITY(category) >= 3) { \
            PCIA_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)

#define PCIA_LOG_V4(category, fmt, ...) \
    do { \
        if (PCIA_GET_VERBOSITY(category) >= 4) { \
            PCIA_LOG(category, fmt, ##__VA_ARGS__); \
        } \
    } while (0)
