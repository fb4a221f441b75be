#include "medialib/library/ingest_worker.hpp"

#include "medialib/core/platform.hpp"
#include "medialib/events/events.hpp"
#include "medialib/library/checksum.hpp"
#include "medialib/library/paths.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace fs = std::filesystem;

namespace medialib::library {
namespace {

constexpr const char* kLibraryImportDeviceId = "Library Import";
constexpr const char* kSidecarExtension = ".xmp";

} // namespace

std::string make_device_asset_id(const std::string& path, std::uint64_t size) {
    std::string id = fs::path(path).filename().string() + "-" + std::to_string(size);
    id.erase(std::remove_if(id.begin(), id.end(),
                 [](unsigned char c) { return std::isspace(c) != 0; }),
             id.end());
    return id;
}

IngestWorker::IngestWorker(catalog::CatalogRepository& catalog,
                           jobs::JobQueue& queue,
                           const MimeClassifier& classifier,
                           PathLockTable& locks,
                           events::EventBus* bus)
    : catalog_(catalog), queue_(queue), classifier_(classifier), locks_(locks), bus_(bus) {}

Result<bool> IngestWorker::handle(const jobs::json& payload) {
    auto job = jobs::library_job_from_json(payload);
    if (job.is_error()) {
        return Err<bool>(job.error());
    }
    return ingest(job.value());
}

Result<bool> IngestWorker::ingest(const jobs::LibraryJob& job) {
    const auto path = normalize_path(job.asset_path);
    auto scope = locks_.acquire(job.library_id, path);

    auto lookup = catalog_.get_asset_by_library_and_path(job.library_id, path);
    if (lookup.is_error()) {
        return Err<bool>(lookup.error());
    }
    std::optional<catalog::Asset> existing = std::move(lookup.value());

    FileStat stat;
    if (!stat_file(path, stat) || !stat.is_regular) {
        if (!existing) {
            return fail<bool>(ErrorKind::InvalidRequest, "Can't access file: " + path);
        }

        // Probably offline
        if (!existing->is_offline) {
            catalog::AssetPatch patch;
            patch.is_offline = true;
            auto updated = catalog_.update_asset(existing->id, patch);
            if (updated.is_error()) {
                return Err<bool>(updated.error());
            }
            if (bus_ != nullptr) {
                bus_->emit(events::AssetOfflineEvent{existing->id, job.library_id, path});
            }
        }
        spdlog::debug("[Ingest] {} is not accessible, asset {} offline", path, existing->id);
        return Ok(true);
    }

    if (existing && existing->is_offline) {
        catalog::AssetPatch patch;
        patch.is_offline = false;
        auto updated = catalog_.update_asset(existing->id, patch);
        if (updated.is_error()) {
            return Err<bool>(updated.error());
        }
        existing->is_offline = false;
        if (bus_ != nullptr) {
            bus_->emit(events::AssetOnlineEvent{existing->id, job.library_id, path});
        }
    }

    const bool needs_import = job.force_refresh ||
                              !existing ||
                              existing->file_modified_at != stat.modified_at;
    if (!needs_import) {
        spdlog::trace("[Ingest] {} unchanged, skipping", path);
        return Ok(true);
    }

    return import_asset(job, path, existing, stat.size, stat.changed_at, stat.modified_at);
}

Result<bool> IngestWorker::import_asset(const jobs::LibraryJob& job,
                                        const std::string& path,
                                        const std::optional<catalog::Asset>& existing,
                                        std::uint64_t file_size,
                                        catalog::Timestamp created_at,
                                        catalog::Timestamp modified_at) {
    // Extension based; content sniffing is left to metadata extraction
    const auto mime_type = classifier_.lookup(path);
    if (!mime_type) {
        return fail<bool>(ErrorKind::UnprocessableAsset, "Cannot determine mime type of asset: " + path);
    }
    if (!classifier_.is_allowed(*mime_type)) {
        return fail<bool>(ErrorKind::UnprocessableAsset, "Unsupported file type " + *mime_type + ": " + path);
    }

    auto checksum = hash_file(path);
    if (checksum.is_error()) {
        return Err<bool>(checksum.error());
    }

    const auto device_asset_id = make_device_asset_id(path, file_size);
    const auto asset_type = MimeClassifier::asset_type_for(*mime_type);
    const auto file_name = fs::path(path).stem().string();

    std::optional<std::string> sidecar_path;
    const std::string sidecar_candidate = path + kSidecarExtension;
    if (is_readable(sidecar_candidate)) {
        sidecar_path = sidecar_candidate;
    }

    catalog::Asset stored;
    if (existing) {
        catalog::AssetPatch patch;
        patch.checksum = checksum.value();
        patch.device_asset_id = device_asset_id;
        patch.original_file_name = file_name;
        patch.type = asset_type;
        patch.file_created_at = created_at;
        patch.file_modified_at = modified_at;
        patch.sidecar_path.emplace(sidecar_path);
        patch.is_offline = false;
        patch.is_read_only = true;

        auto updated = catalog_.update_asset(existing->id, patch);
        if (updated.is_error()) {
            return Err<bool>(updated.error());
        }
        stored = std::move(updated.value());
    } else {
        catalog::Asset asset;
        asset.owner_id = job.owner_id;
        asset.library_id = job.library_id;
        asset.original_path = path;
        asset.original_file_name = file_name;
        asset.checksum = checksum.value();
        asset.device_asset_id = device_asset_id;
        asset.device_id = kLibraryImportDeviceId;
        asset.type = asset_type;
        asset.file_created_at = created_at;
        asset.file_modified_at = modified_at;
        asset.sidecar_path = sidecar_path;
        asset.is_offline = false;
        asset.is_read_only = true;
        asset.is_visible = true;

        auto created = catalog_.create_asset(std::move(asset));
        if (created.is_error()) {
            return Err<bool>(created.error());
        }
        stored = std::move(created.value());
    }

    if (bus_ != nullptr) {
        bus_->emit(events::AssetImportedEvent{stored, file_size, existing.has_value()});
    }

    auto follow_ups = enqueue_follow_ups(stored);
    if (follow_ups.is_error()) {
        return Err<bool>(follow_ups.error());
    }

    return Ok(true);
}

Result<void> IngestWorker::enqueue_follow_ups(const catalog::Asset& asset) {
    auto metadata = queue_.enqueue(jobs::JobName::MetadataExtraction,
        jobs::asset_job_to_json(jobs::AssetJob{asset.id, std::string("upload")}));
    if (metadata.is_error()) {
        spdlog::error("[Ingest] could not queue metadata extraction for {}: {}", asset.id, metadata.error().message);
        return metadata;
    }

    if (asset.type == catalog::AssetType::Video) {
        auto conversion = queue_.enqueue(jobs::JobName::VideoConversion,
            jobs::asset_job_to_json(jobs::AssetJob{asset.id, std::nullopt}));
        if (conversion.is_error()) {
            spdlog::error("[Ingest] could not queue video conversion for {}: {}", asset.id, conversion.error().message);
            return conversion;
        }
    }

    return Ok();
}

} // namespace medialib::library
