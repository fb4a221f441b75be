#pragma once

#include "medialib/core/result.hpp"
#include "medialib/events/event_bus.hpp"
#include "medialib/jobs/job_queue.hpp"
#include "medialib/jobs/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace medialib::jobs {

struct DispatcherOptions {
    size_t worker_threads = 4;
    std::uint32_t max_attempts = 3;   // Deliveries per job before a transient failure becomes final
};

struct JobFailure {
    JobItem job;
    Error error;
};

struct DispatchStats {
    std::uint64_t succeeded = 0;
    std::uint64_t failed = 0;
    std::uint64_t retried = 0;
    std::uint64_t unhandled = 0;   // No handler registered (downstream job names)
};

/**
 * @brief Consumes an InMemoryJobQueue on a Boost.Asio thread pool
 *
 * Each job runs independently on a pool thread; there is no ordering between
 * jobs. Handler results drive bookkeeping:
 * - Ok                       -> succeeded
 * - Err, TransientIO         -> re-enqueued until max_attempts, then failed
 * - Err, any other kind      -> failed immediately, never retried
 *
 * Failures are kept for inspection (failures()) and published as
 * JobFailedEvent when an EventBus is attached.
 *
 * USAGE:
 * JobDispatcher dispatcher(queue, {4, 3}, &bus);
 * dispatcher.register_handler(JobName::RefreshLibraryFile, [&](const json& p) { ... });
 * dispatcher.run_until_idle();   // or start() / stop() for a long-lived consumer
 */
class JobDispatcher {
public:
    using Handler = std::function<Result<bool>(const json& payload)>;

    JobDispatcher(InMemoryJobQueue& queue, DispatcherOptions options, events::EventBus* bus = nullptr);
    ~JobDispatcher();

    JobDispatcher(const JobDispatcher&) = delete;
    JobDispatcher& operator=(const JobDispatcher&) = delete;

    /**
     * @brief Register the consumer for one job name (replaces any previous one)
     *
     * Must be called before jobs of that name are dispatched.
     */
    void register_handler(JobName name, Handler handler);

    /**
     * @brief Dispatch until the queue is empty and nothing is in flight
     *
     * Jobs enqueued by handlers while draining (follow-on jobs, retries) are
     * dispatched too. Must not be combined with start().
     *
     * RETURNS: number of deliveries dispatched
     */
    size_t run_until_idle();

    /**
     * @brief Start a background consumer blocking on the queue
     */
    void start();

    /**
     * @brief Close the queue, stop the consumer and wait for in-flight jobs
     */
    void stop();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    std::vector<JobFailure> failures() const;

    DispatchStats stats() const;

private:
    // Releases one in-flight slot however the delivery ends
    struct InFlightGuard {
        explicit InFlightGuard(JobDispatcher& dispatcher) : dispatcher_(dispatcher) {}
        ~InFlightGuard() { dispatcher_.finish_one(); }

        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;

        JobDispatcher& dispatcher_;
    };

    void submit(JobItem item);
    void process(JobItem item);
    void record_failure(JobItem item, Error error);
    void finish_one();

    InMemoryJobQueue& queue_;
    DispatcherOptions options_;
    events::EventBus* bus_;

    boost::asio::thread_pool pool_;

    mutable std::mutex handlers_mutex_;
    std::unordered_map<JobName, Handler> handlers_;

    mutable std::mutex state_mutex_;
    std::condition_variable idle_cv_;
    size_t in_flight_ = 0;
    std::vector<JobFailure> failures_;

    std::atomic<std::uint64_t> succeeded_{0};
    std::atomic<std::uint64_t> failed_{0};
    std::atomic<std::uint64_t> retried_{0};
    std::atomic<std::uint64_t> unhandled_{0};

    std::atomic<bool> running_{false};
    std::thread consumer_;
};

} // namespace medialib::jobs
