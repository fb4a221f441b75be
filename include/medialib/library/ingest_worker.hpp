#pragma once

#include "medialib/catalog/repository.hpp"
#include "medialib/core/result.hpp"
#include "medialib/events/event_bus.hpp"
#include "medialib/jobs/job_queue.hpp"
#include "medialib/jobs/types.hpp"
#include "medialib/library/mime.hpp"
#include "medialib/library/path_lock.hpp"

#include <optional>
#include <string>

namespace medialib::library {

/**
 * @brief Handles REFRESH_LIBRARY_FILE: decides whether one path needs (re)import
 *
 * DECISION TABLE (evaluated in this order):
 * | stat fails, no asset          | fail permanently (InvalidRequest)       |
 * | stat fails, asset exists      | mark offline, handled                   |
 * | asset exists and is offline   | clear the offline flag first            |
 * | force_refresh                 | import                                  |
 * | no asset                      | import                                  |
 * | stored mtime != file mtime    | import                                  |
 * | otherwise                     | handled, nothing to do                  |
 *
 * IMPORT:
 * MIME lookup -> allow-list -> SHA-1 -> device asset id -> asset type ->
 * sidecar -> create or update -> METADATA_EXTRACTION (+ VIDEO_CONVERSION).
 *
 * Everything from the catalog lookup to the upsert runs inside the path's
 * PathLockTable scope.
 */
class IngestWorker {
public:
    IngestWorker(catalog::CatalogRepository& catalog,
                 jobs::JobQueue& queue,
                 const MimeClassifier& classifier,
                 PathLockTable& locks,
                 events::EventBus* bus = nullptr);

    /**
     * @brief Run the decision table for one path
     *
     * RETURNS: Ok(true) when the path needs no further action; an error when
     * the job failed (see ErrorKind for which failures are retryable)
     */
    Result<bool> ingest(const jobs::LibraryJob& job);

    /**
     * @brief Dispatcher entry point: decode the payload, then ingest()
     */
    Result<bool> handle(const jobs::json& payload);

private:
    Result<bool> import_asset(const jobs::LibraryJob& job,
                              const std::string& path,
                              const std::optional<catalog::Asset>& existing,
                              std::uint64_t file_size,
                              catalog::Timestamp created_at,
                              catalog::Timestamp modified_at);

    Result<void> enqueue_follow_ups(const catalog::Asset& asset);

    catalog::CatalogRepository& catalog_;
    jobs::JobQueue& queue_;
    const MimeClassifier& classifier_;
    PathLockTable& locks_;
    events::EventBus* bus_;
};

/**
 * @brief "<basename>-<size>" with all whitespace removed
 *
 * Stable across refreshes of an unchanged file; used by downstream systems
 * as an idempotency key.
 */
std::string make_device_asset_id(const std::string& path, std::uint64_t size);

} // namespace medialib::library
