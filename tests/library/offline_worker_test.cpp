#include "medialib/catalog/memory_catalog.hpp"
#include "medialib/events/event_bus.hpp"
#include "medialib/events/events.hpp"
#include "medialib/library/offline_worker.hpp"
#include "medialib/library/path_lock.hpp"

#include <gtest/gtest.h>

#include <string>

using medialib::ErrorKind;
using medialib::catalog::Asset;
using medialib::catalog::InMemoryCatalog;
using medialib::catalog::Library;
using medialib::catalog::LibraryType;
using medialib::events::AssetOfflineEvent;
using medialib::events::AssetRemovedEvent;
using medialib::events::EventBus;
using medialib::jobs::LibraryJob;
using medialib::library::OfflineWorker;
using medialib::library::PathLockTable;

class OfflineWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Library library;
        library.owner_id = "user-1";
        library.name = "Media";
        library.type = LibraryType::Import;
        library.import_paths = {"/media"};
        auto created = catalog_.create_library(library);
        ASSERT_TRUE(created.is_ok());
        library_id_ = created.value().id;

        Asset asset;
        asset.owner_id = "user-1";
        asset.library_id = library_id_;
        asset.original_path = "/media/c.jpg";
        auto stored = catalog_.create_asset(asset);
        ASSERT_TRUE(stored.is_ok());
        asset_id_ = stored.value().id;

        bus_.subscribe<AssetOfflineEvent>([this](const AssetOfflineEvent& e) {
            offline_events_++;
            last_path_ = e.path;
        });
        bus_.subscribe<AssetRemovedEvent>([this](const AssetRemovedEvent& e) {
            removed_events_++;
            last_path_ = e.path;
        });
    }

    LibraryJob job_for(const std::string& path, bool empty_trash = false) const {
        LibraryJob job;
        job.asset_path = path;
        job.owner_id = "user-1";
        job.library_id = library_id_;
        job.empty_trash = empty_trash;
        return job;
    }

    bool is_offline() const {
        auto found = catalog_.get_asset_by_library_and_path(library_id_, "/media/c.jpg");
        return found.is_ok() && found.value() && found.value()->is_offline;
    }

    InMemoryCatalog catalog_;
    PathLockTable locks_;
    EventBus bus_;
    OfflineWorker worker_{catalog_, locks_, &bus_};
    std::string library_id_;
    std::string asset_id_;

    int offline_events_ = 0;
    int removed_events_ = 0;
    std::string last_path_;
};

TEST_F(OfflineWorkerTest, MarksAssetOffline) {
    auto result = worker_.mark_offline(job_for("/media/c.jpg"));
    ASSERT_TRUE(result.is_ok());
    EXPECT_TRUE(result.value());

    EXPECT_TRUE(is_offline());
    EXPECT_EQ(catalog_.asset_count(), 1u);
    EXPECT_EQ(offline_events_, 1);
    EXPECT_EQ(last_path_, "/media/c.jpg");
}

TEST_F(OfflineWorkerTest, AlreadyOfflineIsANoOp) {
    ASSERT_TRUE(worker_.mark_offline(job_for("/media/c.jpg")).is_ok());
    ASSERT_TRUE(worker_.mark_offline(job_for("/media/c.jpg")).is_ok());

    EXPECT_TRUE(is_offline());
    EXPECT_EQ(offline_events_, 1);
}

TEST_F(OfflineWorkerTest, EmptyTrashDeletesAsset) {
    auto result = worker_.mark_offline(job_for("/media/c.jpg", true));
    ASSERT_TRUE(result.is_ok());

    EXPECT_EQ(catalog_.asset_count(), 0u);
    EXPECT_EQ(removed_events_, 1);
    EXPECT_EQ(offline_events_, 0);
}

TEST_F(OfflineWorkerTest, EmptyTrashDeletesAlreadyOfflineAsset) {
    ASSERT_TRUE(worker_.mark_offline(job_for("/media/c.jpg")).is_ok());
    ASSERT_TRUE(worker_.mark_offline(job_for("/media/c.jpg", true)).is_ok());

    EXPECT_EQ(catalog_.asset_count(), 0u);
}

TEST_F(OfflineWorkerTest, UnknownPathIsNotFound) {
    auto result = worker_.mark_offline(job_for("/media/never.jpg"));
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
    EXPECT_TRUE(medialib::is_permanent(result.error().kind));
    EXPECT_FALSE(is_offline());
}

TEST_F(OfflineWorkerTest, RedeliveredRemovalIsNotFound) {
    ASSERT_TRUE(worker_.mark_offline(job_for("/media/c.jpg", true)).is_ok());

    auto again = worker_.mark_offline(job_for("/media/c.jpg", true));
    ASSERT_TRUE(again.is_error());
    EXPECT_EQ(again.error().kind, ErrorKind::NotFound);
    EXPECT_EQ(removed_events_, 1);
}

TEST_F(OfflineWorkerTest, PathIsNormalizedBeforeLookup) {
    ASSERT_TRUE(worker_.mark_offline(job_for("/media/./x/../c.jpg")).is_ok());
    EXPECT_TRUE(is_offline());
}

TEST_F(OfflineWorkerTest, AssetInAnotherLibraryIsUntouched) {
    LibraryJob job = job_for("/media/c.jpg");
    job.library_id = "999";

    auto result = worker_.mark_offline(job);
    ASSERT_TRUE(result.is_error());
    EXPECT_EQ(result.error().kind, ErrorKind::NotFound);
    EXPECT_FALSE(is_offline());
}

TEST_F(OfflineWorkerTest, HandleDecodesPayload) {
    auto payload = medialib::jobs::library_job_to_json(job_for("/media/c.jpg"));
    ASSERT_TRUE(worker_.handle(payload).is_ok());
    EXPECT_TRUE(is_offline());

    auto bad = worker_.handle(medialib::jobs::json::array());
    ASSERT_TRUE(bad.is_error());
    EXPECT_EQ(bad.error().kind, ErrorKind::InvalidRequest);
}
