///// Otter: ScanlinePool - persistent workers claim rows from an atomic counter; run() is the final join.
///// Schneefuchs: One job at a time (a second run() while busy throws std::logic_error); worker exceptions rethrown on the caller.
///// Maus: Threads are created once in the ctor and joined in the dtor; no per-frame thread churn.
///// Datei: src/scanline_pool.hpp

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace bulb {

class ScanlinePool {
public:
    using RowFn = std::function<void(int row)>;

    // threadCount <= 0 => std::thread::hardware_concurrency() (min 1).
    explicit ScanlinePool(int threadCount = 0);
    ~ScanlinePool();

    ScanlinePool(const ScanlinePool&) = delete;
    ScanlinePool& operator=(const ScanlinePool&) = delete;

    // Runs fn(row) for every row in [0, rows) across the workers and blocks until all are done.
    void run(int rows, const RowFn& fn);

    [[nodiscard]] int threadCount() const noexcept { return static_cast<int>(workers_.size()); }

private:
    void workerLoop();

    std::vector<std::thread> workers_;

    std::mutex              mtx_;
    std::condition_variable cvWork_;
    std::condition_variable cvDone_;

    const RowFn*       job_ = nullptr;
    int                rows_ = 0;
    std::atomic<int>   nextRow_{0};
    std::size_t        pending_ = 0;     // workers still inside the current generation
    std::uint64_t      generation_ = 0;
    bool               stopping_ = false;
    std::exception_ptr error_;

    std::atomic<bool>  busy_{false};
};

} // namespace bulb
