//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/support/serial_queue.hpp
// Purpose: Single worker thread draining a FIFO of jobs.
// Key invariants: Jobs run one at a time in submission order; the destructor
//                 drains every job submitted before it was called.
// Ownership/Lifetime: Owns its worker thread and queued jobs.
// Links: DESIGN.md
//
//===----------------------------------------------------------------------===//

#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>

namespace hotswap::support
{

/// @brief FIFO executor with one dedicated worker thread.
class SerialQueue
{
  public:
    SerialQueue();
    ~SerialQueue();

    SerialQueue(const SerialQueue &) = delete;
    SerialQueue &operator=(const SerialQueue &) = delete;

    /// @brief Queue @p fn and return a future for its result.
    template <class Fn> auto submit(Fn fn) -> std::future<decltype(fn())>
    {
        using R = decltype(fn());
        auto task = std::make_shared<std::packaged_task<R()>>(std::move(fn));
        std::future<R> result = task->get_future();
        push([task]() { (*task)(); });
        return result;
    }

    /// @brief Number of jobs waiting to start.
    size_t pending() const;

  private:
    void push(std::function<void()> job);
    void run();

    std::queue<std::function<void()>> jobs_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool stop_ = false;
    std::thread worker_;
};

} // namespace hotswap::support
