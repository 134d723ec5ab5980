///// Otter: Shared helper tests - ScopeExit cleanup on normal exit and while unwinding.
///// Schneefuchs: The session teardown in main() relies on this running exactly once.
///// Maus: Worker count resolution checked for explicit and automatic requests.
///// Datei: tests/test_common.cpp

#include <gtest/gtest.h>

#include "common.hpp"

#include <stdexcept>
#include <vector>

TEST(ScopeExit, RunsOnceAtScopeEnd) {
    int calls = 0;
    {
        const ScopeExit guard([&calls]() noexcept { ++calls; });
        EXPECT_EQ(calls, 0);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeExit, RunsWhileUnwinding) {
    int calls = 0;
    bool caught = false;
    try {
        const ScopeExit guard([&calls]() noexcept { ++calls; });
        throw std::runtime_error("frame loop failed");
    } catch (const std::runtime_error&) {
        caught = true;
        EXPECT_EQ(calls, 1);
    }
    EXPECT_TRUE(caught);
    EXPECT_EQ(calls, 1);
}

TEST(ScopeExit, NestedGuardsReleaseInReverseOrder) {
    std::vector<int> order;
    {
        const ScopeExit outer([&order]() noexcept { order.push_back(1); });
        const ScopeExit inner([&order]() noexcept { order.push_back(2); });
    }
    ASSERT_EQ(order.size(), 2u);
    EXPECT_EQ(order[0], 2);
    EXPECT_EQ(order[1], 1);
}

TEST(ResolveWorkerCount, ExplicitAndAutomatic) {
    EXPECT_EQ(resolveWorkerCount(3), 3);
    EXPECT_GE(resolveWorkerCount(0), 1);
    EXPECT_GE(resolveWorkerCount(-2), 1);
}
