/**
 * @file test_task_group.cpp
 * @brief Unit tests for TaskGroup fan-out, join and cancellation.
 */

#include "core/clock.hpp"
#include "executor/task_group.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>

using namespace tracie;
using namespace std::chrono_literals;

TEST(TaskGroupTest, SpawnReturnsValue) {
    TaskGroup group;
    auto future = group.spawn([](std::stop_token) { return 42; });
    group.wait_all();
    EXPECT_EQ(future.get(), 42);
    EXPECT_EQ(group.size(), 1u);
}

TEST(TaskGroupTest, ManyUnitsAllRun) {
    TaskGroup group;
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 64; ++i) {
        futures.push_back(group.spawn([&counter](std::stop_token) {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }
    group.wait_all();

    EXPECT_EQ(counter.load(), 64);
    for (auto& f : futures) EXPECT_NO_THROW(f.get());
}

TEST(TaskGroupTest, UnitsRunConcurrently) {
    TaskGroup group;
    auto start = std::chrono::steady_clock::now();
    for (int i = 0; i < 8; ++i) {
        group.spawn([](std::stop_token stop) { return sleep_for(0.1, stop); });
    }
    group.wait_all();
    // Eight 100 ms sleeps in parallel, not in sequence.
    EXPECT_LT(std::chrono::steady_clock::now() - start, 600ms);
}

TEST(TaskGroupTest, ExceptionDeliveredThroughFuture) {
    TaskGroup group;
    auto failing = group.spawn([](std::stop_token) -> int {
        throw std::runtime_error("unit failed");
    });
    auto healthy = group.spawn([](std::stop_token) { return 7; });
    group.wait_all();

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(healthy.get(), 7);
    EXPECT_FALSE(group.stop_requested());
}

TEST(TaskGroupTest, RequestStopWakesUnits) {
    TaskGroup group;
    std::vector<std::future<bool>> finished;
    for (int i = 0; i < 4; ++i) {
        finished.push_back(group.spawn([](std::stop_token stop) { return sleep_for(30.0, stop); }));
    }

    auto start = std::chrono::steady_clock::now();
    group.request_stop();
    group.wait_all();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    for (auto& f : finished) EXPECT_FALSE(f.get());
}

TEST(TaskGroupTest, ExternalStopForwardedByCallback) {
    std::stop_source outer;
    TaskGroup group;
    std::stop_callback forward(outer.get_token(), [&group] { group.request_stop(); });

    auto unit = group.spawn([](std::stop_token stop) { return sleep_for(30.0, stop); });
    outer.request_stop();
    group.wait_all();

    EXPECT_FALSE(unit.get());
    EXPECT_TRUE(group.stop_requested());
}

TEST(TaskGroupTest, SpawnAfterStopSeesStop) {
    TaskGroup group;
    group.request_stop();
    auto unit = group.spawn([](std::stop_token stop) { return stop.stop_requested(); });
    group.wait_all();
    EXPECT_TRUE(unit.get());
}

TEST(TaskGroupTest, AbandonDetachesUnits) {
    auto released = std::make_shared<std::atomic<bool>>(false);
    std::future<bool> unit;
    {
        TaskGroup group;
        unit = group.spawn([released](std::stop_token stop) {
            bool completed = sleep_for(30.0, stop);
            released->store(true);
            return completed;
        });
        group.abandon();
        EXPECT_TRUE(group.stop_requested());
    }
    // The detached unit observed the stop and still delivers its result.
    ASSERT_EQ(unit.wait_for(5s), std::future_status::ready);
    EXPECT_FALSE(unit.get());
    EXPECT_TRUE(released->load());
}

TEST(TaskGroupTest, DestructorStopsAndJoins) {
    std::future<bool> unit;
    auto start = std::chrono::steady_clock::now();
    {
        TaskGroup group;
        unit = group.spawn([](std::stop_token stop) { return sleep_for(30.0, stop); });
    }
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_FALSE(unit.get());
}
