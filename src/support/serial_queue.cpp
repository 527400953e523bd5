//===----------------------------------------------------------------------===//
//
// Part of the Hotswap project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements SerialQueue.  Exceptions thrown by a job are captured by its
// packaged_task and surface through the returned future.
//
//===----------------------------------------------------------------------===//

#include "support/serial_queue.hpp"

namespace hotswap::support
{

SerialQueue::SerialQueue() : worker_([this]() { run(); }) {}

SerialQueue::~SerialQueue()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    if (worker_.joinable())
        worker_.join();
}

size_t SerialQueue::pending() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void SerialQueue::push(std::function<void()> job)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.push(std::move(job));
    }
    cv_.notify_one();
}

void SerialQueue::run()
{
    for (;;)
    {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !jobs_.empty(); });
            if (jobs_.empty())
                return;
            job = std::move(jobs_.front());
            jobs_.pop();
        }
        job();
    }
}

} // namespace hotswap::support
