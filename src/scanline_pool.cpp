///// Otter: ScanlinePool implementation - generation counter wakes workers, pending counter ends the job.
///// Schneefuchs: First worker exception wins and drains the remaining rows; rethrown after the join.
///// Maus: ASCII logs only via BULB_LOG_HOST; start/stop lines gated by debugLogging.
///// Datei: src/scanline_pool.cpp

#include "scanline_pool.hpp"
#include "bulb_log.hpp"
#include "common.hpp"
#include "settings.hpp"

#include <stdexcept>

namespace bulb {

namespace {
    // Clears the busy flag on every exit path of run().
    struct BusyGuard {
        std::atomic<bool>& flag;
        ~BusyGuard() { flag.store(false, std::memory_order_release); }
    };
} // namespace

ScanlinePool::ScanlinePool(int threadCount) {
    const int n = resolveWorkerCount(threadCount);
    workers_.reserve(static_cast<std::size_t>(n));
    for (int i = 0; i < n; ++i) {
        workers_.emplace_back(&ScanlinePool::workerLoop, this);
    }
    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[ScanlinePool] started; threads=%d", n);
    }
}

ScanlinePool::~ScanlinePool() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        stopping_ = true;
    }
    cvWork_.notify_all();
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    if constexpr (Settings::debugLogging) {
        BULB_LOG_HOST("[ScanlinePool] stopped");
    }
}

void ScanlinePool::run(int rows, const RowFn& fn) {
    bool expected = false;
    if (!busy_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        throw std::logic_error("ScanlinePool: job already in flight");
    }
    BusyGuard guard{busy_};

    if (rows <= 0) return;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        job_     = &fn;
        rows_    = rows;
        nextRow_.store(0, std::memory_order_relaxed);
        error_   = nullptr;
        pending_ = workers_.size();
        ++generation_;
    }
    cvWork_.notify_all();

    std::exception_ptr err;
    {
        std::unique_lock<std::mutex> lock(mtx_);
        cvDone_.wait(lock, [&] { return pending_ == 0; });
        job_ = nullptr;
        err  = error_;
        error_ = nullptr;
    }

    if (err) std::rethrow_exception(err);
}

void ScanlinePool::workerLoop() {
    std::uint64_t seen = 0;
    for (;;) {
        const RowFn* fn = nullptr;
        int rows = 0;
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cvWork_.wait(lock, [&] { return stopping_ || generation_ != seen; });
            if (stopping_) return;
            seen = generation_;
            fn   = job_;
            rows = rows_;
        }

        for (;;) {
            const int row = nextRow_.fetch_add(1, std::memory_order_relaxed);
            if (row >= rows) break;
            try {
                (*fn)(row);
            } catch (...) {
                std::lock_guard<std::mutex> lock(mtx_);
                if (!error_) error_ = std::current_exception();
                nextRow_.store(rows, std::memory_order_relaxed);
                break;
            }
        }

        {
            std::lock_guard<std::mutex> lock(mtx_);
            if (--pending_ == 0) cvDone_.notify_all();
        }
    }
}

} // namespace bulb
