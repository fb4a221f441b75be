#include "medialib/jobs/dispatcher.hpp"

#include "medialib/events/events.hpp"

#include <boost/asio/post.hpp>
#include <spdlog/spdlog.h>

#include <exception>

namespace medialib::jobs {

JobDispatcher::JobDispatcher(InMemoryJobQueue& queue, DispatcherOptions options, events::EventBus* bus)
    : queue_(queue),
      options_(options),
      bus_(bus),
      pool_(options.worker_threads == 0 ? 1 : options.worker_threads) {
    if (options_.max_attempts == 0) {
        options_.max_attempts = 1;
    }
}

JobDispatcher::~JobDispatcher() {
    if (is_running()) {
        stop();
    }
    pool_.join();
}

void JobDispatcher::register_handler(JobName name, Handler handler) {
    std::lock_guard lock(handlers_mutex_);
    handlers_[name] = std::move(handler);
}

size_t JobDispatcher::run_until_idle() {
    size_t dispatched = 0;

    while (true) {
        while (auto item = queue_.try_next()) {
            submit(std::move(*item));
            ++dispatched;
        }

        std::unique_lock lock(state_mutex_);
        idle_cv_.wait(lock, [this]() {
            return in_flight_ == 0 || !queue_.empty();
        });

        if (in_flight_ == 0 && queue_.empty()) {
            break;
        }
    }

    spdlog::debug("[Dispatch] idle after {} deliveries", dispatched);
    return dispatched;
}

void JobDispatcher::start() {
    if (running_.exchange(true)) {
        return;
    }

    consumer_ = std::thread([this]() {
        while (auto item = queue_.next()) {
            submit(std::move(*item));
        }
        spdlog::debug("[Dispatch] consumer stopped");
    });
}

void JobDispatcher::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    queue_.close();
    if (consumer_.joinable()) {
        consumer_.join();
    }

    std::unique_lock lock(state_mutex_);
    idle_cv_.wait(lock, [this]() { return in_flight_ == 0; });
}

std::vector<JobFailure> JobDispatcher::failures() const {
    std::lock_guard lock(state_mutex_);
    return failures_;
}

DispatchStats JobDispatcher::stats() const {
    DispatchStats stats;
    stats.succeeded = succeeded_.load();
    stats.failed = failed_.load();
    stats.retried = retried_.load();
    stats.unhandled = unhandled_.load();
    return stats;
}

void JobDispatcher::submit(JobItem item) {
    {
        std::lock_guard lock(state_mutex_);
        ++in_flight_;
    }

    boost::asio::post(pool_, [this, item = std::move(item)]() mutable {
        InFlightGuard guard(*this);
        process(std::move(item));
    });
}

void JobDispatcher::process(JobItem item) {
    const auto name = JobNameUtils::to_string(item.name);
    item.attempts++;

    Handler handler;
    {
        std::lock_guard lock(handlers_mutex_);
        auto it = handlers_.find(item.name);
        if (it != handlers_.end()) {
            handler = it->second;
        }
    }

    if (!handler) {
        unhandled_++;
        spdlog::debug("[Dispatch] no consumer for {} {}", name, describe_payload(item.payload));
        return;
    }

    Result<bool> result = [&]() {
        try {
            return handler(item.payload);
        } catch (const std::exception& e) {
            return fail<bool>(ErrorKind::Internal, std::string("Handler threw: ") + e.what());
        } catch (...) {
            return fail<bool>(ErrorKind::Internal, "Handler threw a non-standard exception");
        }
    }();

    if (result.is_ok()) {
        if (!result.value()) {
            spdlog::warn("[Dispatch] {} reported unhandled payload {}", name, describe_payload(item.payload));
        }
        succeeded_++;
        return;
    }

    const Error error = result.error();
    if (!is_permanent(error.kind) && item.attempts < options_.max_attempts) {
        spdlog::warn("[Dispatch] {} attempt {}/{} failed, retrying: {}",
            name, item.attempts, options_.max_attempts, error.message);
        auto requeued = queue_.requeue(item);
        if (requeued.is_ok()) {
            retried_++;
            return;
        }
        record_failure(std::move(item), requeued.error());
        return;
    }

    record_failure(std::move(item), error);
}

void JobDispatcher::record_failure(JobItem item, Error error) {
    failed_++;

    if (bus_ != nullptr) {
        bus_->emit(events::JobFailedEvent{
            JobNameUtils::to_string(item.name),
            error_kind_name(error.kind),
            error.message,
            item.attempts});
    } else {
        spdlog::warn("[Dispatch] {} failed after {} attempt(s): {}",
            JobNameUtils::to_string(item.name), item.attempts, to_string(error));
    }

    std::lock_guard lock(state_mutex_);
    failures_.push_back(JobFailure{std::move(item), std::move(error)});
}

void JobDispatcher::finish_one() {
    {
        std::lock_guard lock(state_mutex_);
        --in_flight_;
    }
    idle_cv_.notify_all();
}

} // namespace medialib::jobs
