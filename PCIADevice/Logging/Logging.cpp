// Host logging backend. Categories share one sink; the PCIA_LOG macros add
// the "[Category]" prefix used for filtering.
#include "Logging.hpp"

#include <cstdarg>
#include <cstdio>

namespace {

constexpr size_t kMaxLineBytes = 512;

std::atomic<PCIA::Driver::Logging::LogSink> gSink{nullptr};

void WriteToStderr(PCIA::Driver::Logging::LogType type, const char* line) {
    std::fprintf(stderr, "pcia %-7s %s\n", PCIA::Driver::Logging::ToString(type), line);
}

} // namespace

namespace PCIA::Driver::Logging {

const LogCategory& Controller() { static const LogCategory log{"controller"}; return log; }
const LogCategory& Dma()        { static const LogCategory log{"dma"};        return log; }
const LogCategory& Cdc()        { static const LogCategory log{"cdc"};        return log; }
const LogCategory& Audio()      { static const LogCategory log{"audio"};      return log; }
const LogCategory& Sim()        { static const LogCategory log{"sim"};        return log; }

void SetSink(LogSink sink) noexcept {
    gSink.store(sink, std::memory_order_release);
}

void Write(const LogCategory& category, LogType type, const char* fmt, ...) noexcept {
    (void)category; // name is already part of the formatted prefix

    char line[kMaxLineBytes];
    va_list args;
    va_start(args, fmt);
    const int written = std::vsnprintf(line, sizeof(line), fmt, args);
    va_end(args);
    if (written < 0) {
        return;
    }

    LogSink sink = gSink.load(std::memory_order_acquire);
    if (sink) {
        sink(type, line);
    } else {
        WriteToStderr(type, line);
    }
}

const char* ToString(LogType type) noexcept {
    switch (type) {
        case LogType::Default: return "default";
        case LogType::Info:    return "info";
        case LogType::Debug:   return "debug";
        case LogType::Error:   return "error";
        case LogType::Fault:   return "fault";
    }
    return "unknown";
}

} // namespace PCIA::Driver::Logging
