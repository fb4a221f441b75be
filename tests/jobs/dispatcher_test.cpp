#include "medialib/events/event_bus.hpp"
#include "medialib/events/events.hpp"
#include "medialib/jobs/dispatcher.hpp"
#include "medialib/jobs/job_queue.hpp"
#include "medialib/jobs/types.hpp"

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>

using medialib::ErrorKind;
using medialib::Result;
using medialib::events::EventBus;
using medialib::events::JobFailedEvent;
using medialib::jobs::AssetJob;
using medialib::jobs::DispatcherOptions;
using medialib::jobs::InMemoryJobQueue;
using medialib::jobs::JobDispatcher;
using medialib::jobs::JobName;
using medialib::jobs::JobNameUtils;
using medialib::jobs::LibraryJob;
using medialib::jobs::json;

// ════════════════════════════════════════════════════════
// Payloads
// ════════════════════════════════════════════════════════

TEST(JobTypes, JobNamesRoundTripThroughStrings) {
    for (auto name : {JobName::RefreshLibraryFile, JobName::OfflineLibraryFile,
                      JobName::MetadataExtraction, JobName::VideoConversion}) {
        auto parsed = JobNameUtils::from_string(JobNameUtils::to_string(name));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, name);
    }
    EXPECT_EQ(JobNameUtils::to_string(JobName::RefreshLibraryFile), "REFRESH_LIBRARY_FILE");
    EXPECT_FALSE(JobNameUtils::from_string("SOMETHING_ELSE").has_value());
}

TEST(JobTypes, LibraryJobWireFormat) {
    LibraryJob job{"/media/a.jpg", "user-1", "7", true, false};
    auto payload = medialib::jobs::library_job_to_json(job);

    EXPECT_EQ(payload["asset_path"].get<std::string>(), "/media/a.jpg");
    EXPECT_EQ(payload["owner_id"].get<std::string>(), "user-1");
    EXPECT_EQ(payload["library_id"].get<std::string>(), "7");
    EXPECT_TRUE(payload["force_refresh"].get<bool>());
    EXPECT_FALSE(payload["empty_trash"].get<bool>());
}

TEST(JobTypes, LibraryJobDecodingValidates) {
    auto decoded = medialib::jobs::library_job_from_json(
        json{{"asset_path", "/media/a.jpg"}, {"library_id", "7"}, {"empty_trash", "yes"}});
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_TRUE(decoded.value().owner_id.empty());
    EXPECT_FALSE(decoded.value().force_refresh);
    EXPECT_FALSE(decoded.value().empty_trash);

    auto missing_path = medialib::jobs::library_job_from_json(json{{"library_id", "7"}});
    ASSERT_TRUE(missing_path.is_error());
    EXPECT_EQ(missing_path.error().kind, ErrorKind::InvalidRequest);

    auto wrong_type = medialib::jobs::library_job_from_json(json{{"asset_path", 3}, {"library_id", "7"}});
    ASSERT_TRUE(wrong_type.is_error());
}

TEST(JobTypes, AssetJobSourceIsOptional) {
    auto with_source = medialib::jobs::asset_job_to_json(AssetJob{"12", std::string("upload")});
    EXPECT_EQ(with_source["source"].get<std::string>(), "upload");

    auto without = medialib::jobs::asset_job_to_json(AssetJob{"12", std::nullopt});
    EXPECT_FALSE(without.contains("source"));

    auto decoded = medialib::jobs::asset_job_from_json(without);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().id, "12");
    EXPECT_FALSE(decoded.value().source.has_value());
}

TEST(JobTypes, DescribePayloadToleratesRawPathBytes) {
    json payload{{"asset_path", std::string("/media/caf\xe9.jpg")}};

    std::string text;
    EXPECT_NO_THROW(text = medialib::jobs::describe_payload(payload));
    EXPECT_NE(text.find("/media/caf"), std::string::npos);
}

TEST(InMemoryJobQueue, TraceLoggingDoesNotThrowOnRawPathBytes) {
    const auto previous = spdlog::get_level();
    spdlog::set_level(spdlog::level::trace);

    InMemoryJobQueue queue;
    LibraryJob job{"/media/caf\xe9.jpg", "user-1", "7"};
    Result<void> queued = medialib::Ok();
    EXPECT_NO_THROW(queued = queue.enqueue(JobName::RefreshLibraryFile, medialib::jobs::library_job_to_json(job)));
    spdlog::set_level(previous);

    ASSERT_TRUE(queued.is_ok());
    auto item = queue.try_next();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->payload["asset_path"].get<std::string>(), "/media/caf\xe9.jpg");
}

TEST(InMemoryJobQueue, ClosedQueueRejectsEnqueue) {
    InMemoryJobQueue queue;
    ASSERT_TRUE(queue.enqueue(JobName::MetadataExtraction, json{{"id", "1"}}).is_ok());

    queue.close();
    EXPECT_TRUE(queue.closed());

    auto rejected = queue.enqueue(JobName::MetadataExtraction, json{{"id", "2"}});
    ASSERT_TRUE(rejected.is_error());
    EXPECT_EQ(rejected.error().kind, ErrorKind::TransientIO);
    EXPECT_EQ(queue.size(), 1u);

    // Items queued before close are still delivered
    auto item = queue.next();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item->payload["id"].get<std::string>(), "1");
    EXPECT_FALSE(queue.next().has_value());
}

// ════════════════════════════════════════════════════════
// Dispatcher
// ════════════════════════════════════════════════════════

class JobDispatcherTest : public ::testing::Test {
protected:
    void enqueue(JobName name, int n) {
        ASSERT_TRUE(queue_.enqueue(name, json{{"n", n}}).is_ok());
    }

    InMemoryJobQueue queue_;
    EventBus bus_;
};

TEST_F(JobDispatcherTest, RunsEveryJobOnce) {
    JobDispatcher dispatcher(queue_, DispatcherOptions{4, 3}, &bus_);
    std::atomic<int> sum{0};
    dispatcher.register_handler(JobName::RefreshLibraryFile, [&](const json& payload) {
        sum += payload["n"].get<int>();
        return medialib::Ok(true);
    });

    for (int i = 1; i <= 50; ++i) {
        enqueue(JobName::RefreshLibraryFile, i);
    }

    EXPECT_EQ(dispatcher.run_until_idle(), 50u);
    EXPECT_EQ(sum.load(), 1275);
    EXPECT_EQ(dispatcher.stats().succeeded, 50u);
    EXPECT_TRUE(queue_.empty());
}

TEST_F(JobDispatcherTest, FollowOnJobsAreDrainedToo) {
    JobDispatcher dispatcher(queue_, DispatcherOptions{2, 3});
    std::atomic<int> follow_ons{0};
    dispatcher.register_handler(JobName::RefreshLibraryFile, [&](const json& payload) -> Result<bool> {
        auto queued = queue_.enqueue(JobName::OfflineLibraryFile, payload);
        if (queued.is_error()) {
            return medialib::Err<bool>(queued.error());
        }
        return medialib::Ok(true);
    });
    dispatcher.register_handler(JobName::OfflineLibraryFile, [&](const json&) {
        follow_ons++;
        return medialib::Ok(true);
    });

    for (int i = 0; i < 10; ++i) {
        enqueue(JobName::RefreshLibraryFile, i);
    }

    EXPECT_EQ(dispatcher.run_until_idle(), 20u);
    EXPECT_EQ(follow_ons.load(), 10);
}

TEST_F(JobDispatcherTest, TransientFailureIsRetriedUntilSuccess) {
    JobDispatcher dispatcher(queue_, DispatcherOptions{1, 3});
    std::atomic<int> calls{0};
    dispatcher.register_handler(JobName::RefreshLibraryFile, [&](const json&) {
        if (++calls < 3) {
            return medialib::fail<bool>(ErrorKind::TransientIO, "disk busy");
        }
        return medialib::Ok(true);
    });

    enqueue(JobName::RefreshLibraryFile, 1);
    dispatcher.run_until_idle();

    EXPECT_EQ(calls.load(), 3);
    EXPECT_EQ(dispatcher.stats().retried, 2u);
    EXPECT_EQ(dispatcher.stats().succeeded, 1u);
    EXPECT_TRUE(dispatcher.failures().empty());
}

TEST_F(JobDispatcherTest, TransientFailureGivesUpAfterMaxAttempts) {
    JobDispatcher dispatcher(queue_, DispatcherOptions{1, 2}, &bus_);
    std::atomic<int> failed_events{0};
    bus_.subscribe<JobFailedEvent>([&](const JobFailedEvent& e) {
        EXPECT_EQ(e.job_name, "REFRESH_LIBRARY_FILE");
        EXPECT_EQ(e.error_kind, "TransientIO");
        EXPECT_EQ(e.attempts, 2u);
        failed_events++;
    });
    dispatcher.register_handler(JobName::RefreshLibraryFile, [](const json&) {
        return medialib::fail<bool>(ErrorKind::TransientIO, "disk gone");
    });

    enqueue(JobName::RefreshLibraryFile, 1);
    dispatcher.run_until_idle();

    auto failures = dispatcher.failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].job.attempts, 2u);
    EXPECT_EQ(failures[0].error.kind, ErrorKind::TransientIO);
    EXPECT_EQ(failed_events.load(), 1);
}

TEST_F(JobDispatcherTest, PermanentFailureIsNeverRetried) {
    JobDispatcher dispatcher(queue_, DispatcherOptions{1, 5});
    std::atomic<int> calls{0};
    dispatcher.register_handler(JobName::RefreshLibraryFile, [&](const json&) {
        calls++;
        return medialib::fail<bool>(ErrorKind::UnprocessableAsset, "unknown mime type");
    });

    enqueue(JobName::RefreshLibraryFile, 1);
    dispatcher.run_until_idle();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(dispatcher.stats().failed, 1u);
    EXPECT_EQ(dispatcher.stats().retried, 0u);
}

TEST_F(JobDispatcherTest, ThrowingHandlerBecomesInternalFailure) {
    JobDispatcher dispatcher(queue_, DispatcherOptions{1, 3});
    dispatcher.register_handler(JobName::RefreshLibraryFile, [](const json&) -> Result<bool> {
        throw std::runtime_error("boom");
    });

    enqueue(JobName::RefreshLibraryFile, 1);
    dispatcher.run_until_idle();

    auto failures = dispatcher.failures();
    ASSERT_EQ(failures.size(), 1u);
    EXPECT_EQ(failures[0].error.kind, ErrorKind::Internal);
    EXPECT_NE(failures[0].error.message.find("boom"), std::string::npos);
}

TEST_F(JobDispatcherTest, NonStandardThrowStillReleasesTheJob) {
    JobDispatcher dispatcher(queue_, DispatcherOptions{2, 3});
    dispatcher.register_handler(JobName::RefreshLibraryFile, [](const json&) -> Result<bool> {
        throw 42;
    });

    enqueue(JobName::RefreshLibraryFile, 1);
    enqueue(JobName::RefreshLibraryFile, 2);
    EXPECT_EQ(dispatcher.run_until_idle(), 2u);

    auto failures = dispatcher.failures();
    ASSERT_EQ(failures.size(), 2u);
    EXPECT_EQ(failures[0].error.kind, ErrorKind::Internal);
    EXPECT_EQ(failures[0].job.attempts, 1u);
}

TEST_F(JobDispatcherTest, JobsWithoutHandlerAreCountedAsUnhandled) {
    JobDispatcher dispatcher(queue_, DispatcherOptions{2, 3});

    enqueue(JobName::MetadataExtraction, 1);
    enqueue(JobName::VideoConversion, 2);
    dispatcher.run_until_idle();

    EXPECT_EQ(dispatcher.stats().unhandled, 2u);
    EXPECT_TRUE(dispatcher.failures().empty());
}

TEST_F(JobDispatcherTest, BackgroundConsumerProcessesUntilStopped) {
    JobDispatcher dispatcher(queue_, DispatcherOptions{2, 3});
    std::atomic<int> handled{0};
    dispatcher.register_handler(JobName::RefreshLibraryFile, [&](const json&) {
        handled++;
        return medialib::Ok(true);
    });

    dispatcher.start();
    EXPECT_TRUE(dispatcher.is_running());

    for (int i = 0; i < 20; ++i) {
        enqueue(JobName::RefreshLibraryFile, i);
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (handled.load() < 20 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }

    dispatcher.stop();
    EXPECT_FALSE(dispatcher.is_running());
    EXPECT_EQ(handled.load(), 20);
    EXPECT_TRUE(queue_.closed());
}
