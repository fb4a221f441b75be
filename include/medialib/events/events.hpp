/**
 * @file events.hpp
 * @brief Event types published by the reconciliation pipeline
 *
 * NAMING CONVENTION:
 * Events are past-tense facts about the catalog or the queue:
 * AssetImportedEvent, AssetOfflineEvent, JobFailedEvent.
 */

#pragma once

#include "medialib/catalog/types.hpp"
#include <chrono>
#include <cstdint>
#include <string>

namespace medialib::events {

// ════════════════════════════════════════════════════════
// Asset Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted after an asset row was created or refreshed from disk
 *
 * WHO EMITS: IngestWorker (first sighting, changed mtime, force refresh)
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct AssetImportedEvent {
    catalog::Asset asset;
    std::uint64_t file_size;
    bool reimport;   // true when an existing row was updated
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when a previously offline asset is found on disk again
 */
struct AssetOnlineEvent {
    std::string asset_id;
    std::string library_id;
    std::string path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when an asset's file is gone and the row was soft-marked
 *
 * WHO EMITS:
 * - IngestWorker (crawled path became unreadable before the job ran)
 * - OfflineWorker (path missing from the crawl)
 */
struct AssetOfflineEvent {
    std::string asset_id;
    std::string library_id;
    std::string path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted when an offline job ran with empty-trash and deleted the row
 */
struct AssetRemovedEvent {
    std::string asset_id;
    std::string library_id;
    std::string path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Pipeline Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted once per successful reconciliation pass
 */
struct LibraryRefreshedEvent {
    std::string library_id;
    size_t crawled_paths;
    size_t refresh_jobs;
    size_t offline_jobs;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted by JobDispatcher when a job will not be delivered again
 */
struct JobFailedEvent {
    std::string job_name;
    std::string error_kind;
    std::string error_message;
    std::uint32_t attempts;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace medialib::events
