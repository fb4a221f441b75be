#include "medialib/jobs/job_queue.hpp"

#include <spdlog/spdlog.h>

namespace medialib::jobs {

Result<void> InMemoryJobQueue::enqueue(JobName name, json payload) {
    JobItem item;
    item.name = name;
    item.payload = std::move(payload);
    return requeue(std::move(item));
}

Result<void> InMemoryJobQueue::requeue(JobItem item) {
    if (closed()) {
        return Err<void>(Error(ErrorKind::TransientIO,
            "Job queue is closed, dropping " + JobNameUtils::to_string(item.name)));
    }

    if (spdlog::default_logger_raw()->should_log(spdlog::level::trace)) {
        spdlog::trace("[Queue] {} {}", JobNameUtils::to_string(item.name), describe_payload(item.payload));
    }
    queue_.push(std::move(item));
    return Ok();
}

void InMemoryJobQueue::close() {
    closed_.store(true, std::memory_order_release);
    queue_.shutdown();
}

} // namespace medialib::jobs
