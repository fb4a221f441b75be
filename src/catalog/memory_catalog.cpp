#include "medialib/catalog/memory_catalog.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <unordered_set>

namespace medialib::catalog {

std::string InMemoryCatalog::path_key(const std::string& library_id, const std::string& original_path) {
    std::string key;
    key.reserve(library_id.size() + original_path.size() + 1);
    key.append(library_id);
    key.push_back('\0');
    key.append(original_path);
    return key;
}

Result<Library> InMemoryCatalog::get_library(const std::string& library_id) const {
    std::shared_lock lock(mutex_);

    auto it = libraries_.find(library_id);
    if (it == libraries_.end()) {
        return fail<Library>(ErrorKind::NotFound, "Library not found: " + library_id);
    }
    return Ok(it->second);
}

Result<std::vector<Library>> InMemoryCatalog::get_libraries_by_owner(const std::string& owner_id) const {
    std::shared_lock lock(mutex_);

    std::vector<Library> result;
    for (const auto& [id, library] : libraries_) {
        if (library.owner_id == owner_id) {
            result.push_back(library);
        }
    }

    // Creation order; ids are assigned from a counter
    std::sort(result.begin(), result.end(), [](const Library& lhs, const Library& rhs) {
        return std::stoull(lhs.id) < std::stoull(rhs.id);
    });
    return Ok(std::move(result));
}

Result<Library> InMemoryCatalog::create_library(Library library) {
    std::unique_lock lock(mutex_);

    library.id = std::to_string(++library_counter_);
    const auto now = std::chrono::system_clock::now();
    library.created_at = now;
    library.updated_at = now;

    libraries_[library.id] = library;
    return Ok(std::move(library));
}

Result<Library> InMemoryCatalog::set_library_import_paths(const std::string& library_id,
                                                          std::vector<std::string> import_paths) {
    std::unique_lock lock(mutex_);

    auto it = libraries_.find(library_id);
    if (it == libraries_.end()) {
        return fail<Library>(ErrorKind::NotFound, "Library not found: " + library_id);
    }

    it->second.import_paths = std::move(import_paths);
    it->second.updated_at = std::chrono::system_clock::now();
    return Ok(it->second);
}

Result<std::vector<Asset>> InMemoryCatalog::get_assets_by_library(const std::vector<std::string>& library_ids) const {
    std::shared_lock lock(mutex_);

    const std::unordered_set<std::string> wanted(library_ids.begin(), library_ids.end());

    std::vector<Asset> result;
    for (const auto& [id, asset] : assets_) {
        if (wanted.count(asset.library_id) > 0) {
            result.push_back(asset);
        }
    }
    return Ok(std::move(result));
}

Result<std::optional<Asset>> InMemoryCatalog::get_asset_by_library_and_path(const std::string& library_id,
                                                                           const std::string& original_path) const {
    std::shared_lock lock(mutex_);

    auto index_it = by_path_.find(path_key(library_id, original_path));
    if (index_it == by_path_.end()) {
        return Ok(std::optional<Asset>{});
    }

    auto asset_it = assets_.find(index_it->second);
    if (asset_it == assets_.end()) {
        return fail<std::optional<Asset>>(ErrorKind::Internal,
            "Path index points at missing asset " + index_it->second);
    }
    return Ok(std::optional<Asset>(asset_it->second));
}

Result<Asset> InMemoryCatalog::create_asset(Asset asset) {
    std::unique_lock lock(mutex_);

    if (libraries_.find(asset.library_id) == libraries_.end()) {
        return fail<Asset>(ErrorKind::NotFound, "Library not found: " + asset.library_id);
    }

    const auto key = path_key(asset.library_id, asset.original_path);
    if (by_path_.find(key) != by_path_.end()) {
        return fail<Asset>(ErrorKind::AlreadyExists,
            "Asset already exists in library " + asset.library_id + ": " + asset.original_path);
    }

    asset.id = std::to_string(++asset_counter_);
    by_path_[key] = asset.id;
    assets_[asset.id] = asset;
    return Ok(std::move(asset));
}

Result<Asset> InMemoryCatalog::update_asset(const std::string& asset_id, const AssetPatch& patch) {
    std::unique_lock lock(mutex_);

    auto it = assets_.find(asset_id);
    if (it == assets_.end()) {
        return fail<Asset>(ErrorKind::NotFound, "Asset not found: " + asset_id);
    }

    patch.apply_to(it->second);
    return Ok(it->second);
}

Result<void> InMemoryCatalog::delete_asset(const std::string& asset_id) {
    std::unique_lock lock(mutex_);

    auto it = assets_.find(asset_id);
    if (it == assets_.end()) {
        return Err<void>(Error(ErrorKind::NotFound, "Asset not found: " + asset_id));
    }

    by_path_.erase(path_key(it->second.library_id, it->second.original_path));
    assets_.erase(it);
    return Ok();
}

size_t InMemoryCatalog::asset_count() const {
    std::shared_lock lock(mutex_);
    return assets_.size();
}

void InMemoryCatalog::clear() {
    std::unique_lock lock(mutex_);
    libraries_.clear();
    assets_.clear();
    by_path_.clear();
}

} // namespace medialib::catalog
