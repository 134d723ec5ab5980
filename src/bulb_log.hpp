///// Otter: Host-only logging, clear contract, ASCII-only.
///// Schneefuchs: No CUDA/GL in this header; core, GPU and app TUs share one logger.
///// Maus: Variadic macro captures call site; one mutex-guarded line per call.
///// Datei: src/bulb_log.hpp

#pragma once

#include <cstdarg>

namespace BulbLog {
    // Thread-safe host logger with uniform formatting:
    // [YYYY-MM-DD HH:MM:SS.mmm][file][line]: message
    void logMessage(const char* file, int line, const char* fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
        __attribute__((format(printf, 3, 4)))
#endif
        ;
    void flushLogs();

    // Raise verbosity at runtime (-d). Compile-time Settings::debugLogging still gates
    // the heavy diagnostic paths; this only unlocks the [DEBUG] lines routed through isVerbose().
    void setVerbose(bool enable) noexcept;
    [[nodiscard]] bool isVerbose() noexcept;
}

// Variadic convenience macro: captures call site file/line.
#define BULB_LOG_HOST(...) ::BulbLog::logMessage(__FILE__, __LINE__, __VA_ARGS__)
