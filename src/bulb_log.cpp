///// Otter: Host logging - precise timestamps, ASCII-only.
///// Schneefuchs: Thread-safe; filename stripped to basename; no strncat.
///// Maus: stdout only; flush per line so crashes keep the last message.
///// Datei: src/bulb_log.cpp

#include "bulb_log.hpp"
#include "common.hpp" // getLocalTime(...)

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace BulbLog {
    namespace {
        std::mutex        g_logMutex;
        std::atomic<bool> g_verbose{false};
    } // anon

    void setVerbose(bool enable) noexcept { g_verbose.store(enable, std::memory_order_relaxed); }
    bool isVerbose() noexcept { return g_verbose.load(std::memory_order_relaxed); }

    void logMessage(const char* file, int line, const char* fmt, ...) {
        std::lock_guard<std::mutex> guard(g_logMutex);

        // Filename only (strip path)
        const char* base = std::strrchr(file, '\\');
        if (!base) base = std::strrchr(file, '/');
        base = base ? base + 1 : file;

        const auto now = std::chrono::system_clock::now();
        const auto t   = std::chrono::system_clock::to_time_t(now);
        const auto ms  = std::chrono::duration_cast<std::chrono::milliseconds>(
                             now.time_since_epoch()) % 1000;

        std::tm tm{};
        getLocalTime(tm, t);

        char ts[32];
        std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

        std::fprintf(stdout, "[%s.%03lld][%s][%d]: ",
                     ts, static_cast<long long>(ms.count()), base, line);

        va_list args;
        va_start(args, fmt);
        std::vfprintf(stdout, fmt, args);
        va_end(args);

        std::fputc('\n', stdout);
        std::fflush(stdout);
    }

    void flushLogs() { std::fflush(stdout); }

} // namespace BulbLog
