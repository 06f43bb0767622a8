// Error.hpp - C++23 error handling with std::expected
//
// Configuration-time failures (device configure, stream open, register writes
// that are rejected) are reported as Result<T> = std::expected<T, Error>.
// Streaming conditions (underrun, overrun, stalls, DMA faults) are never
// reported this way; they are counted and latched by the components.
//
// Usage:
//   Result<void> OpenStream(Direction dir) {
//       if (IsEnabled(dir)) {
//           return PCIA_ERROR_BUSY("Stream must be disabled before open");
//       }
//       PCIA_TRY(LoadRing(dir));
//       return {};
//   }
//
//   auto result = controller.OpenStream(Direction::Playback);
//   if (!result) {
//       result.error().Log();  // Logs with file:line:function context
//   }

#pragma once

#include <cstdint>
#include <expected>
#include <string_view>
#include <utility>

#include "../Logging/Logging.hpp"

namespace PCIA {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : uint32_t {
    kSuccess = 0,
    kBadArgument,
    kInvalidConfiguration,
    kNotReady,
    kBusy,
    kDmaError,
};

[[nodiscard]] constexpr const char* ToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kSuccess:              return "success";
        case ErrorCode::kBadArgument:          return "bad-argument";
        case ErrorCode::kInvalidConfiguration: return "invalid-configuration";
        case ErrorCode::kNotReady:             return "not-ready";
        case ErrorCode::kBusy:                 return "busy";
        case ErrorCode::kDmaError:             return "dma-error";
    }
    return "unknown";
}

// ============================================================================
// Source Location
// ============================================================================

/// Compile-time source location tracking via compiler builtins
struct SourceLocation {
    const char* file;
    const char* function;
    int line;

    constexpr SourceLocation(
        const char* f = __builtin_FILE(),
        const char* fn = __builtin_FUNCTION(),
        int l = __builtin_LINE()) noexcept
        : file(f), function(fn), line(l) {}

    /// Extract filename from full path (strips directory)
    [[nodiscard]] constexpr std::string_view FileName() const noexcept {
        std::string_view path(file);
        auto pos = path.find_last_of('/');
        return (pos != std::string_view::npos) ? path.substr(pos + 1) : path;
    }
};

// ============================================================================
// Error Severity
// ============================================================================

enum class ErrorSeverity : uint8_t {
    /// Can retry once the condition clears (e.g. disable the direction first)
    Recoverable,

    /// Request is invalid as given and will never succeed
    Fatal
};

[[nodiscard]] constexpr const char* ToString(ErrorSeverity severity) noexcept {
    switch (severity) {
        case ErrorSeverity::Recoverable: return "RECOVERABLE";
        case ErrorSeverity::Fatal:       return "FATAL";
    }
    return "UNKNOWN";
}

// ============================================================================
// Error Type
// ============================================================================

struct Error {
    ErrorCode code;
    SourceLocation location;
    ErrorSeverity severity;
    const char* message;

    /// Use the PCIA_ERROR_* macros instead of calling this directly
    [[nodiscard]] static constexpr Error Make(
        ErrorCode code,
        ErrorSeverity sev,
        const char* msg,
        SourceLocation loc = SourceLocation()) noexcept
    {
        return Error{code, loc, sev, msg};
    }

    [[nodiscard]] constexpr bool IsRecoverable() const noexcept {
        return severity == ErrorSeverity::Recoverable;
    }

    [[nodiscard]] constexpr bool IsFatal() const noexcept {
        return severity == ErrorSeverity::Fatal;
    }

    void Log() const noexcept {
        const std::string_view file = location.FileName();
        PCIA_LOG_ERROR(Controller,
                       "[%s] %.*s:%d in %s() - code=%s (%s)",
                       ToString(severity),
                       static_cast<int>(file.size()), file.data(),
                       location.line,
                       location.function,
                       ToString(code),
                       message);
    }

    /// Default-level log for errors the caller absorbs.
    void LogAsWarning() const noexcept {
        const std::string_view file = location.FileName();
        PCIA_LOG(Controller,
                 "[%s] %.*s:%d in %s() - code=%s (%s)",
                 ToString(severity),
                 static_cast<int>(file.size()), file.data(),
                 location.line,
                 location.function,
                 ToString(code),
                 message);
    }
};

static_assert(sizeof(Error) <= 64, "Error must be cache-line friendly (<=64 bytes)");

// ============================================================================
// Result Type
// ============================================================================

template<typename T>
using Result = std::expected<T, Error>;

// ============================================================================
// Error Creation Macros (with automatic source location)
// ============================================================================

#define PCIA_ERROR_RECOVERABLE(code, msg) \
    std::unexpected(::PCIA::Error::Make((code), ::PCIA::ErrorSeverity::Recoverable, (msg)))

#define PCIA_ERROR_FATAL(code, msg) \
    std::unexpected(::PCIA::Error::Make((code), ::PCIA::ErrorSeverity::Fatal, (msg)))

#define PCIA_ERROR_INVALID(msg) \
    PCIA_ERROR_FATAL(::PCIA::ErrorCode::kBadArgument, (msg))

#define PCIA_ERROR_CONFIG(msg) \
    PCIA_ERROR_FATAL(::PCIA::ErrorCode::kInvalidConfiguration, (msg))

#define PCIA_ERROR_NOT_READY(msg) \
    PCIA_ERROR_RECOVERABLE(::PCIA::ErrorCode::kNotReady, (msg))

#define PCIA_ERROR_BUSY(msg) \
    PCIA_ERROR_RECOVERABLE(::PCIA::ErrorCode::kBusy, (msg))

#define PCIA_ERROR_DMA(msg) \
    PCIA_ERROR_RECOVERABLE(::PCIA::ErrorCode::kDmaError, (msg))

// ============================================================================
// Error Propagation Helpers
// ============================================================================

/// Propagate error or extract value
#define PCIA_TRY(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

/// Log, then propagate
#define PCIA_TRY_LOG(expr) \
    ({ \
        auto&& _result = (expr); \
        if (!_result) { \
            _result.error().Log(); \
            return std::unexpected(_result.error()); \
        } \
        std::move(_result).value(); \
    })

} // namespace PCIA
