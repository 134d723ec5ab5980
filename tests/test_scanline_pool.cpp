///// Otter: ScanlinePool tests - coverage of every row, error propagation, one job at a time.
///// Schneefuchs: Row hits counted with atomics; the pool is reused across jobs.
///// Maus: Thread counts fixed so results do not depend on the host core count.
///// Datei: tests/test_scanline_pool.cpp

#include <gtest/gtest.h>

#include "scanline_pool.hpp"

#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>

TEST(ScanlinePool, RunsEveryRowExactlyOnce) {
    bulb::ScanlinePool pool(4);
    EXPECT_EQ(pool.threadCount(), 4);

    constexpr int rows = 257;
    std::vector<std::atomic<int>> hits(rows);
    for (auto& h : hits) h.store(0);

    pool.run(rows, [&](int r) { hits[static_cast<std::size_t>(r)].fetch_add(1); });
    for (int r = 0; r < rows; ++r) {
        EXPECT_EQ(hits[static_cast<std::size_t>(r)].load(), 1) << "row " << r;
    }
}

TEST(ScanlinePool, ReusableAcrossJobs) {
    bulb::ScanlinePool pool(3);
    std::atomic<int> total{0};
    for (int job = 0; job < 20; ++job) {
        pool.run(10, [&](int) { total.fetch_add(1); });
    }
    EXPECT_EQ(total.load(), 200);
}

TEST(ScanlinePool, EmptyJobIsNoOp) {
    bulb::ScanlinePool pool(2);
    std::atomic<int> calls{0};
    pool.run(0, [&](int) { calls.fetch_add(1); });
    pool.run(-5, [&](int) { calls.fetch_add(1); });
    EXPECT_EQ(calls.load(), 0);
}

TEST(ScanlinePool, WorkerExceptionIsRethrownOnCaller) {
    bulb::ScanlinePool pool(4);
    EXPECT_THROW(pool.run(64, [](int r) {
                     if (r == 13) throw std::runtime_error("row 13");
                 }),
                 std::runtime_error);

    // Pool stays usable after a failed job.
    std::atomic<int> calls{0};
    pool.run(8, [&](int) { calls.fetch_add(1); });
    EXPECT_EQ(calls.load(), 8);
}

TEST(ScanlinePool, NestedRunIsRejected) {
    bulb::ScanlinePool pool(2);
    EXPECT_THROW(pool.run(4, [&](int) { pool.run(1, [](int) {}); }), std::logic_error);
}

TEST(ScanlinePool, DefaultThreadCountIsPositive) {
    bulb::ScanlinePool pool;
    EXPECT_GE(pool.threadCount(), 1);
}
