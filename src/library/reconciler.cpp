#include "medialib/library/reconciler.hpp"

#include "medialib/events/events.hpp"
#include "medialib/library/paths.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <system_error>
#include <unordered_set>
#include <vector>

namespace fs = std::filesystem;

namespace medialib::library {
namespace {

// A path that cannot be encoded is that path's failure alone
Result<jobs::json> encode_job(const jobs::LibraryJob& job) {
    try {
        return Ok(jobs::library_job_to_json(job));
    } catch (const jobs::json::exception& e) {
        return fail<jobs::json>(ErrorKind::UnprocessableAsset,
            "Cannot encode job for " + job.asset_path + ": " + e.what());
    }
}

} // namespace

Reconciler::Reconciler(catalog::CatalogRepository& catalog,
                       jobs::JobQueue& queue,
                       const Crawler& crawler,
                       events::EventBus* bus)
    : catalog_(catalog), queue_(queue), crawler_(crawler), bus_(bus) {}

Result<void> Reconciler::check_import_roots(const catalog::Library& library) const {
    for (const auto& import_path : library.import_paths) {
        std::error_code ec;
        if (!fs::is_directory(import_path, ec) || ec) {
            return Err<void>(Error(ErrorKind::TransientIO,
                "Import path is not an accessible directory: " + import_path));
        }

        fs::directory_iterator probe(import_path, ec);
        if (ec) {
            return Err<void>(Error(ErrorKind::TransientIO,
                "Cannot list import path " + import_path + ": " + ec.message()));
        }
    }
    return Ok();
}

Result<ReconcileSummary> Reconciler::reconcile(const std::string& owner_id,
                                               const catalog::Library& library,
                                               const RefreshOptions& options) {
    const auto started = std::chrono::steady_clock::now();

    if (library.type != catalog::LibraryType::Import) {
        spdlog::error("[Refresh] library {} is not an import library", library.id);
        return fail<ReconcileSummary>(ErrorKind::InvalidRequest, "Only imported libraries can be refreshed");
    }

    auto roots = check_import_roots(library);
    if (roots.is_error()) {
        spdlog::error("[Refresh] library {} aborted: {}", library.id, roots.error().message);
        return Err<ReconcileSummary>(roots.error());
    }

    // Crawl first; order of discovery is kept only to make job order stable for a given walk
    std::vector<std::string> crawled;
    std::unordered_set<std::string> on_disk;
    for (const auto& path : crawler_.crawl(library.import_paths)) {
        auto normalized = normalize_path(path);
        if (on_disk.insert(normalized).second) {
            crawled.push_back(std::move(normalized));
        }
    }

    auto assets = catalog_.get_assets_by_library({library.id});
    if (assets.is_error()) {
        spdlog::error("[Refresh] library {} aborted, catalog fetch failed: {}",
            library.id, assets.error().message);
        return Err<ReconcileSummary>(assets.error());
    }

    std::vector<std::string> missing;
    std::unordered_set<std::string> seen_missing;
    for (const auto& asset : assets.value()) {
        auto normalized = normalize_path(asset.original_path);
        if (on_disk.count(normalized) == 0 && seen_missing.insert(normalized).second) {
            missing.push_back(std::move(normalized));
        }
    }

    ReconcileSummary summary;
    summary.library_id = library.id;
    summary.crawled_paths = crawled.size();

    for (const auto& path : crawled) {
        jobs::LibraryJob job;
        job.asset_path = path;
        job.owner_id = owner_id;
        job.library_id = library.id;
        job.force_refresh = options.force_refresh;
        job.empty_trash = options.empty_trash;

        auto payload = encode_job(job);
        if (payload.is_error()) {
            spdlog::warn("[Refresh] library {} skipping path: {}", library.id, payload.error().message);
            summary.skipped_paths++;
            continue;
        }

        auto queued = queue_.enqueue(jobs::JobName::RefreshLibraryFile, std::move(payload.value()));
        if (queued.is_error()) {
            spdlog::error("[Refresh] library {} stopped after {} refresh jobs: {}",
                library.id, summary.refresh_jobs, queued.error().message);
            return Err<ReconcileSummary>(queued.error());
        }
        summary.refresh_jobs++;
    }

    for (const auto& path : missing) {
        jobs::LibraryJob job;
        job.asset_path = path;
        job.owner_id = owner_id;
        job.library_id = library.id;
        job.force_refresh = false;
        job.empty_trash = options.empty_trash;

        auto payload = encode_job(job);
        if (payload.is_error()) {
            spdlog::warn("[Refresh] library {} skipping path: {}", library.id, payload.error().message);
            summary.skipped_paths++;
            continue;
        }

        auto queued = queue_.enqueue(jobs::JobName::OfflineLibraryFile, std::move(payload.value()));
        if (queued.is_error()) {
            spdlog::error("[Refresh] library {} stopped after {} offline jobs: {}",
                library.id, summary.offline_jobs, queued.error().message);
            return Err<ReconcileSummary>(queued.error());
        }
        summary.offline_jobs++;
    }

    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    spdlog::debug("[Refresh] library {} crawled={} refresh_jobs={} offline_jobs={} skipped={}",
        library.id, summary.crawled_paths, summary.refresh_jobs, summary.offline_jobs, summary.skipped_paths);

    if (bus_ != nullptr) {
        bus_->emit(events::LibraryRefreshedEvent{
            summary.library_id,
            summary.crawled_paths,
            summary.refresh_jobs,
            summary.offline_jobs,
            summary.duration});
    }

    return Ok(std::move(summary));
}

} // namespace medialib::library
