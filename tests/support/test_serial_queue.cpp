// File: tests/support/test_serial_queue.cpp
// Purpose: Verify SerialQueue runs jobs one at a time in submission order and
//          drains queued work on destruction.
// Key invariants: No two jobs overlap; futures carry each job's result.
// Ownership/Lifetime: Each test owns its queue.
// Links: DESIGN.md

#include <gtest/gtest.h>

#include "support/serial_queue.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using hotswap::support::SerialQueue;

TEST(SerialQueue, RunsJobsInSubmissionOrder)
{
    SerialQueue queue;
    std::mutex m;
    std::vector<int> order;
    std::vector<std::future<int>> results;
    for (int i = 0; i < 16; ++i)
    {
        results.push_back(queue.submit(
            [&, i]()
            {
                std::lock_guard<std::mutex> lock(m);
                order.push_back(i);
                return i * 2;
            }));
    }
    for (int i = 0; i < 16; ++i)
        EXPECT_EQ(results[i].get(), i * 2);
    ASSERT_EQ(order.size(), 16u);
    for (int i = 0; i < 16; ++i)
        EXPECT_EQ(order[i], i);
}

TEST(SerialQueue, JobsNeverOverlap)
{
    SerialQueue queue;
    std::atomic<int> running{0};
    std::atomic<int> peak{0};
    std::vector<std::future<void>> done;
    for (int i = 0; i < 8; ++i)
    {
        done.push_back(queue.submit(
            [&]()
            {
                const int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now))
                {
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(2));
                --running;
            }));
    }
    for (auto &f : done)
        f.get();
    EXPECT_EQ(peak.load(), 1);
}

TEST(SerialQueue, DestructorDrainsPendingJobs)
{
    std::atomic<int> ran{0};
    {
        SerialQueue queue;
        for (int i = 0; i < 10; ++i)
        {
            queue.submit(
                [&]()
                {
                    std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    ++ran;
                });
        }
    }
    EXPECT_EQ(ran.load(), 10);
}

TEST(SerialQueue, ExceptionsReachTheFuture)
{
    SerialQueue queue;
    auto f = queue.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(f.get(), std::runtime_error);
    auto g = queue.submit([]() { return 7; });
    EXPECT_EQ(g.get(), 7);
}
