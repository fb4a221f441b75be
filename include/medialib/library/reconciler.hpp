#pragma once

#include "medialib/catalog/repository.hpp"
#include "medialib/core/result.hpp"
#include "medialib/events/event_bus.hpp"
#include "medialib/jobs/job_queue.hpp"
#include "medialib/library/crawler.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace medialib::library {

struct RefreshOptions {
    bool force_refresh = false;   // Re-import even when the mtime is unchanged
    bool empty_trash = false;     // Delete missing assets instead of marking them offline
};

/**
 * @brief Outcome of one reconciliation pass
 */
struct ReconcileSummary {
    std::string library_id;
    std::size_t crawled_paths = 0;
    std::size_t refresh_jobs = 0;
    std::size_t offline_jobs = 0;
    std::size_t skipped_paths = 0;   // Paths whose job could not be encoded
    std::chrono::milliseconds duration{0};
};

/**
 * @brief Diffs a library's import paths against its catalog rows
 *
 * ALGORITHM:
 * 1. Reject non-IMPORT libraries
 * 2. Probe every import root; an unavailable root aborts the pass, since
 *    every asset under it would otherwise be reported missing
 * 3. Crawl and normalize into a set
 * 4. Fetch the library's assets and normalize their paths
 * 5. One REFRESH_LIBRARY_FILE job per crawled path
 * 6. One OFFLINE_LIBRARY_FILE job per catalog path not crawled
 *
 * Steps 1-4 complete before anything is enqueued, so a failure there emits
 * nothing. A path seen on disk never gets an offline job in the same pass.
 * The decision to import or skip is left to the ingest worker.
 */
class Reconciler {
public:
    Reconciler(catalog::CatalogRepository& catalog,
               jobs::JobQueue& queue,
               const Crawler& crawler,
               events::EventBus* bus = nullptr);

    Result<ReconcileSummary> reconcile(const std::string& owner_id,
                                       const catalog::Library& library,
                                       const RefreshOptions& options);

private:
    Result<void> check_import_roots(const catalog::Library& library) const;

    catalog::CatalogRepository& catalog_;
    jobs::JobQueue& queue_;
    const Crawler& crawler_;
    events::EventBus* bus_;
};

} // namespace medialib::library
