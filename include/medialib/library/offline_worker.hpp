#pragma once

#include "medialib/catalog/repository.hpp"
#include "medialib/core/result.hpp"
#include "medialib/events/event_bus.hpp"
#include "medialib/jobs/types.hpp"
#include "medialib/library/path_lock.hpp"

namespace medialib::library {

/**
 * @brief Handles OFFLINE_LIBRARY_FILE for a catalog path missing from disk
 *
 * - No asset for the path: NotFound (permanent)
 * - empty_trash: the row is deleted for good
 * - otherwise:   is_offline = true; IngestWorker clears it when the file
 *                comes back
 *
 * Shares the PathLockTable with IngestWorker so the two never interleave on
 * one path.
 */
class OfflineWorker {
public:
    OfflineWorker(catalog::CatalogRepository& catalog,
                  PathLockTable& locks,
                  events::EventBus* bus = nullptr);

    Result<bool> mark_offline(const jobs::LibraryJob& job);

    Result<bool> handle(const jobs::json& payload);

private:
    catalog::CatalogRepository& catalog_;
    PathLockTable& locks_;
    events::EventBus* bus_;
};

} // namespace medialib::library
