/**
 * @file components.hpp
 * @brief Observers attached to the pipeline's EventBus
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * // Workers emit, components react
 */

#pragma once

#include "medialib/events/event_bus.hpp"
#include "medialib/events/events.hpp"
#include "medialib/library/checksum.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <cstdint>

namespace medialib::events {

/**
 * @brief Logs every pipeline event with spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<AssetImportedEvent>([this](const AssetImportedEvent& e) {
            on_asset_imported(e);
        });

        bus_.subscribe<AssetOnlineEvent>([this](const AssetOnlineEvent& e) {
            on_asset_online(e);
        });

        bus_.subscribe<AssetOfflineEvent>([this](const AssetOfflineEvent& e) {
            on_asset_offline(e);
        });

        bus_.subscribe<AssetRemovedEvent>([this](const AssetRemovedEvent& e) {
            on_asset_removed(e);
        });

        bus_.subscribe<LibraryRefreshedEvent>([this](const LibraryRefreshedEvent& e) {
            on_library_refreshed(e);
        });

        bus_.subscribe<JobFailedEvent>([this](const JobFailedEvent& e) {
            on_job_failed(e);
        });
    }

private:
    void on_asset_imported(const AssetImportedEvent& e) {
        spdlog::info("[AssetImported] id={} path={} type={} size={} checksum={} reimport={}",
            e.asset.id,
            e.asset.original_path,
            catalog::CatalogEnumUtils::to_string(e.asset.type),
            e.file_size,
            library::to_hex(e.asset.checksum),
            e.reimport);
    }

    void on_asset_online(const AssetOnlineEvent& e) {
        spdlog::info("[AssetOnline] id={} library={} path={}", e.asset_id, e.library_id, e.path);
    }

    void on_asset_offline(const AssetOfflineEvent& e) {
        spdlog::info("[AssetOffline] id={} library={} path={}", e.asset_id, e.library_id, e.path);
    }

    void on_asset_removed(const AssetRemovedEvent& e) {
        spdlog::info("[AssetRemoved] id={} library={} path={}", e.asset_id, e.library_id, e.path);
    }

    void on_library_refreshed(const LibraryRefreshedEvent& e) {
        spdlog::info("[LibraryRefreshed] library={} crawled={} refresh_jobs={} offline_jobs={} duration={}ms",
            e.library_id, e.crawled_paths, e.refresh_jobs, e.offline_jobs, e.duration.count());
    }

    void on_job_failed(const JobFailedEvent& e) {
        spdlog::warn("[JobFailed] job={} kind={} attempts={} error={}",
            e.job_name, e.error_kind, e.attempts, e.error_message);
    }

    EventBus& bus_;
};

/**
 * @brief Counts pipeline outcomes for the end-of-run summary
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> assets_imported{0};
        std::atomic<uint64_t> assets_reimported{0};
        std::atomic<uint64_t> bytes_imported{0};
        std::atomic<uint64_t> assets_online{0};
        std::atomic<uint64_t> assets_offline{0};
        std::atomic<uint64_t> assets_removed{0};
        std::atomic<uint64_t> refreshes{0};
        std::atomic<uint64_t> refresh_jobs{0};
        std::atomic<uint64_t> offline_jobs{0};
        std::atomic<uint64_t> jobs_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<AssetImportedEvent>([this](const AssetImportedEvent& e) {
            on_asset_imported(e);
        });

        bus_.subscribe<AssetOnlineEvent>([this](const AssetOnlineEvent&) {
            stats_.assets_online++;
        });

        bus_.subscribe<AssetOfflineEvent>([this](const AssetOfflineEvent&) {
            stats_.assets_offline++;
        });

        bus_.subscribe<AssetRemovedEvent>([this](const AssetRemovedEvent&) {
            stats_.assets_removed++;
        });

        bus_.subscribe<LibraryRefreshedEvent>([this](const LibraryRefreshedEvent& e) {
            on_library_refreshed(e);
        });

        bus_.subscribe<JobFailedEvent>([this](const JobFailedEvent&) {
            stats_.jobs_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Refresh Statistics:");
        spdlog::info("  Refresh passes:    {}", stats_.refreshes.load());
        spdlog::info("  Refresh jobs:      {}", stats_.refresh_jobs.load());
        spdlog::info("  Offline jobs:      {}", stats_.offline_jobs.load());
        spdlog::info("  Assets imported:   {}", stats_.assets_imported.load());
        spdlog::info("  Assets reimported: {}", stats_.assets_reimported.load());
        spdlog::info("  Bytes imported:    {}", stats_.bytes_imported.load());
        spdlog::info("  Back online:       {}", stats_.assets_online.load());
        spdlog::info("  Marked offline:    {}", stats_.assets_offline.load());
        spdlog::info("  Removed:           {}", stats_.assets_removed.load());
        spdlog::info("  Failed jobs:       {}", stats_.jobs_failed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_asset_imported(const AssetImportedEvent& e) {
        if (e.reimport) {
            stats_.assets_reimported++;
        } else {
            stats_.assets_imported++;
        }
        stats_.bytes_imported += e.file_size;
    }

    void on_library_refreshed(const LibraryRefreshedEvent& e) {
        stats_.refreshes++;
        stats_.refresh_jobs += e.refresh_jobs;
        stats_.offline_jobs += e.offline_jobs;
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace medialib::events
