#pragma once

#include "medialib/core/result.hpp"
#include "medialib/jobs/thread_safe_queue.hpp"
#include "medialib/jobs/types.hpp"

#include <atomic>
#include <optional>
#include <vector>

namespace medialib::jobs {

/**
 * @brief Fire-and-forget enqueue contract (at-least-once delivery)
 *
 * The pipeline depends only on this interface; the broker behind it is an
 * external collaborator.
 */
class JobQueue {
public:
    virtual ~JobQueue() = default;

    virtual Result<void> enqueue(JobName name, json payload) = 0;
};

/**
 * @brief Process-local queue used by JobDispatcher, tests and the CLI
 *
 * close() makes further enqueues fail with TransientIO and wakes a consumer
 * blocked in next().
 */
class InMemoryJobQueue : public JobQueue {
public:
    Result<void> enqueue(JobName name, json payload) override;

    /// Re-deliver an item, keeping its attempt count.
    Result<void> requeue(JobItem item);

    std::optional<JobItem> try_next() { return queue_.try_pop(); }

    /// Blocks until an item arrives or the queue is closed.
    std::optional<JobItem> next() { return queue_.pop(); }

    std::vector<JobItem> pending() const { return queue_.snapshot(); }

    size_t size() const { return queue_.size(); }

    bool empty() const { return queue_.empty(); }

    void close();

    bool closed() const noexcept { return closed_.load(std::memory_order_acquire); }

private:
    ThreadSafeQueue<JobItem> queue_;
    std::atomic<bool> closed_{false};
};

} // namespace medialib::jobs
