#include "medialib/library/offline_worker.hpp"

#include "medialib/events/events.hpp"
#include "medialib/library/paths.hpp"

#include <spdlog/spdlog.h>

namespace medialib::library {

OfflineWorker::OfflineWorker(catalog::CatalogRepository& catalog,
                             PathLockTable& locks,
                             events::EventBus* bus)
    : catalog_(catalog), locks_(locks), bus_(bus) {}

Result<bool> OfflineWorker::handle(const jobs::json& payload) {
    auto job = jobs::library_job_from_json(payload);
    if (job.is_error()) {
        return Err<bool>(job.error());
    }
    return mark_offline(job.value());
}

Result<bool> OfflineWorker::mark_offline(const jobs::LibraryJob& job) {
    const auto path = normalize_path(job.asset_path);
    auto scope = locks_.acquire(job.library_id, path);

    auto lookup = catalog_.get_asset_by_library_and_path(job.library_id, path);
    if (lookup.is_error()) {
        return Err<bool>(lookup.error());
    }
    if (!lookup.value()) {
        return fail<bool>(ErrorKind::NotFound, "Asset does not exist in catalog: " + path);
    }
    const catalog::Asset& asset = *lookup.value();

    if (job.empty_trash) {
        auto removed = catalog_.delete_asset(asset.id);
        if (removed.is_error()) {
            return Err<bool>(removed.error());
        }
        spdlog::debug("[Offline] removed asset {} ({})", asset.id, path);
        if (bus_ != nullptr) {
            bus_->emit(events::AssetRemovedEvent{asset.id, job.library_id, path});
        }
        return Ok(true);
    }

    if (asset.is_offline) {
        return Ok(true);
    }

    catalog::AssetPatch patch;
    patch.is_offline = true;
    auto updated = catalog_.update_asset(asset.id, patch);
    if (updated.is_error()) {
        return Err<bool>(updated.error());
    }

    spdlog::debug("[Offline] asset {} ({}) marked offline", asset.id, path);
    if (bus_ != nullptr) {
        bus_->emit(events::AssetOfflineEvent{asset.id, job.library_id, path});
    }
    return Ok(true);
}

} // namespace medialib::library
