#pragma once

#include "medialib/catalog/repository.hpp"
#include "medialib/core/result.hpp"
#include "medialib/events/event_bus.hpp"
#include "medialib/jobs/dispatcher.hpp"
#include "medialib/jobs/job_queue.hpp"
#include "medialib/library/crawler.hpp"
#include "medialib/library/ingest_worker.hpp"
#include "medialib/library/mime.hpp"
#include "medialib/library/offline_worker.hpp"
#include "medialib/library/path_lock.hpp"
#include "medialib/library/reconciler.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace medialib::library {

struct CreateLibraryRequest {
    std::string name;
    catalog::LibraryType type = catalog::LibraryType::Import;
    std::optional<bool> is_visible;   // Defaults to visible
};

/**
 * @brief Library management and the refresh trigger
 *
 * Owns the pipeline pieces (crawler, reconciler, both workers and the path
 * lock table they share) and wires the workers into a JobDispatcher.
 *
 * REFRESH EXCLUSION:
 * A library is refreshed by at most one caller at a time, and its import
 * paths cannot change while its reconciliation pass runs. Jobs already
 * emitted are not covered; they are serialized per path by the workers.
 */
class LibraryService {
public:
    LibraryService(catalog::CatalogRepository& catalog,
                   jobs::JobQueue& queue,
                   const MimeClassifier& classifier,
                   events::EventBus* bus = nullptr);

    LibraryService(const LibraryService&) = delete;
    LibraryService& operator=(const LibraryService&) = delete;

    Result<catalog::Library> create_library(const std::string& owner_id, const CreateLibraryRequest& request);

    Result<catalog::Library> get_library(const std::string& library_id) const;

    Result<std::vector<catalog::Library>> get_all_libraries(const std::string& owner_id) const;

    Result<std::size_t> get_library_count(const std::string& owner_id) const;

    Result<std::vector<std::string>> get_import_paths(const std::string& library_id) const;

    /**
     * @brief Replace a library's import paths
     *
     * Paths are normalized and de-duplicated, keeping the first occurrence.
     * Fails with InvalidRequest for non-IMPORT libraries, empty entries, or
     * while the library is being refreshed.
     */
    Result<catalog::Library> set_import_paths(const std::string& library_id,
                                              const std::vector<std::string>& import_paths);

    /**
     * @brief Reconcile one library and enqueue its jobs
     */
    Result<ReconcileSummary> refresh(const std::string& owner_id,
                                     const std::string& library_id,
                                     const RefreshOptions& options = {});

    /**
     * @brief Route REFRESH_LIBRARY_FILE and OFFLINE_LIBRARY_FILE to the workers
     */
    void register_handlers(jobs::JobDispatcher& dispatcher);

    IngestWorker& ingest_worker() noexcept { return ingest_worker_; }
    OfflineWorker& offline_worker() noexcept { return offline_worker_; }

private:
    catalog::CatalogRepository& catalog_;

    Crawler crawler_;
    PathLockTable locks_;
    Reconciler reconciler_;
    IngestWorker ingest_worker_;
    OfflineWorker offline_worker_;

    mutable std::mutex refresh_mutex_;
    std::unordered_set<std::string> refreshing_;
};

} // namespace medialib::library
