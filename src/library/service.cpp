#include "medialib/library/service.hpp"

#include "medialib/library/paths.hpp"

#include <spdlog/spdlog.h>

namespace medialib::library {
namespace {

/**
 * @brief Marks a library as being refreshed for the lifetime of the guard
 */
class RefreshGuard {
public:
    RefreshGuard(std::mutex& mutex, std::unordered_set<std::string>& refreshing, std::string library_id)
        : mutex_(mutex), refreshing_(refreshing), library_id_(std::move(library_id)) {}

    ~RefreshGuard() {
        std::lock_guard lock(mutex_);
        refreshing_.erase(library_id_);
    }

    RefreshGuard(const RefreshGuard&) = delete;
    RefreshGuard& operator=(const RefreshGuard&) = delete;

private:
    std::mutex& mutex_;
    std::unordered_set<std::string>& refreshing_;
    std::string library_id_;
};

} // namespace

LibraryService::LibraryService(catalog::CatalogRepository& catalog,
                               jobs::JobQueue& queue,
                               const MimeClassifier& classifier,
                               events::EventBus* bus)
    : catalog_(catalog),
      crawler_(classifier),
      reconciler_(catalog, queue, crawler_, bus),
      ingest_worker_(catalog, queue, classifier, locks_, bus),
      offline_worker_(catalog, locks_, bus) {}

Result<catalog::Library> LibraryService::create_library(const std::string& owner_id,
                                                        const CreateLibraryRequest& request) {
    if (owner_id.empty()) {
        return fail<catalog::Library>(ErrorKind::InvalidRequest, "Library owner is required");
    }

    catalog::Library library;
    library.owner_id = owner_id;
    library.name = request.name;
    library.type = request.type;
    library.is_visible = request.is_visible.value_or(true);

    auto created = catalog_.create_library(std::move(library));
    if (created.is_ok()) {
        spdlog::info("[Library] created {} '{}' ({}) for {}",
            created.value().id, created.value().name,
            catalog::CatalogEnumUtils::to_string(created.value().type), owner_id);
    }
    return created;
}

Result<catalog::Library> LibraryService::get_library(const std::string& library_id) const {
    return catalog_.get_library(library_id);
}

Result<std::vector<catalog::Library>> LibraryService::get_all_libraries(const std::string& owner_id) const {
    return catalog_.get_libraries_by_owner(owner_id);
}

Result<std::size_t> LibraryService::get_library_count(const std::string& owner_id) const {
    auto libraries = catalog_.get_libraries_by_owner(owner_id);
    if (libraries.is_error()) {
        return Err<std::size_t>(libraries.error());
    }
    return Ok(libraries.value().size());
}

Result<std::vector<std::string>> LibraryService::get_import_paths(const std::string& library_id) const {
    auto library = catalog_.get_library(library_id);
    if (library.is_error()) {
        return Err<std::vector<std::string>>(library.error());
    }
    return Ok(library.value().import_paths);
}

Result<catalog::Library> LibraryService::set_import_paths(const std::string& library_id,
                                                          const std::vector<std::string>& import_paths) {
    auto library = catalog_.get_library(library_id);
    if (library.is_error()) {
        return library;
    }
    if (library.value().type != catalog::LibraryType::Import) {
        return fail<catalog::Library>(ErrorKind::InvalidRequest,
            "Can only set import paths on an Import type library");
    }

    std::vector<std::string> normalized;
    std::unordered_set<std::string> seen;
    for (const auto& import_path : import_paths) {
        if (import_path.empty()) {
            return fail<catalog::Library>(ErrorKind::InvalidRequest, "Import paths must not be empty");
        }
        auto path = normalize_path(import_path);
        if (seen.insert(path).second) {
            normalized.push_back(std::move(path));
        }
    }

    std::lock_guard lock(refresh_mutex_);
    if (refreshing_.count(library_id) > 0) {
        return fail<catalog::Library>(ErrorKind::InvalidRequest,
            "Library " + library_id + " is being refreshed, try again later");
    }
    return catalog_.set_library_import_paths(library_id, std::move(normalized));
}

Result<ReconcileSummary> LibraryService::refresh(const std::string& owner_id,
                                                 const std::string& library_id,
                                                 const RefreshOptions& options) {
    {
        std::lock_guard lock(refresh_mutex_);
        if (!refreshing_.insert(library_id).second) {
            return fail<ReconcileSummary>(ErrorKind::InvalidRequest,
                "Library " + library_id + " is already being refreshed");
        }
    }
    RefreshGuard guard(refresh_mutex_, refreshing_, library_id);

    auto library = catalog_.get_library(library_id);
    if (library.is_error()) {
        return Err<ReconcileSummary>(library.error());
    }

    spdlog::info("[Refresh] library {} force_refresh={} empty_trash={}",
        library_id, options.force_refresh, options.empty_trash);
    return reconciler_.reconcile(owner_id, library.value(), options);
}

void LibraryService::register_handlers(jobs::JobDispatcher& dispatcher) {
    dispatcher.register_handler(jobs::JobName::RefreshLibraryFile, [this](const jobs::json& payload) {
        return ingest_worker_.handle(payload);
    });
    dispatcher.register_handler(jobs::JobName::OfflineLibraryFile, [this](const jobs::json& payload) {
        return offline_worker_.handle(payload);
    });
}

} // namespace medialib::library
