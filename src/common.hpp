///// Otter: Small shared host helpers; platform time conversion lives here.
///// Schneefuchs: Deterministic, ASCII-only; no GL/CUDA includes so core TUs stay toolkit-free.
///// Maus: Only BULB_LOG_HOST for logging; Settings control behavior.
///// Datei: src/common.hpp

#pragma once

#ifdef _WIN32
  #ifndef WIN32_LEAN_AND_MEAN
    #define WIN32_LEAN_AND_MEAN
  #endif
  #ifndef NOMINMAX
    #define NOMINMAX
  #endif
#endif

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <thread>
#include <utility>

#include "settings.hpp"

// Thread-safe local time conversion (localtime_s vs. localtime_r).
inline void getLocalTime(std::tm& out, std::time_t t) noexcept {
#if defined(_WIN32)
    localtime_s(&out, &t);
#else
    localtime_r(&t, &out);
#endif
}

// Worker count for the scanline pool: Settings value or hardware concurrency (min 1).
[[nodiscard]] inline int resolveWorkerCount(int requested) noexcept {
    if (requested > 0) return requested;
    const unsigned hw = std::thread::hardware_concurrency();
    return std::max(1, static_cast<int>(hw));
}

// Runs fn once when the scope ends, on normal exit and during unwinding alike.
// fn must not throw.
template <class Fn>
class ScopeExit {
public:
    explicit ScopeExit(Fn fn) noexcept : fn_(std::move(fn)) {}
    ~ScopeExit() { fn_(); }

    ScopeExit(const ScopeExit&) = delete;
    ScopeExit& operator=(const ScopeExit&) = delete;

private:
    Fn fn_;
};
