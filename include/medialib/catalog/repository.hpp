#pragma once

#include "medialib/catalog/types.hpp"
#include "medialib/core/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace medialib::catalog {

/**
 * @brief Storage contract the pipeline consumes
 *
 * Every call is atomic for the row it touches. Nothing is coordinated across
 * rows; callers that need read-modify-write on one path take a PathLockTable
 * scope around it.
 */
class CatalogRepository {
public:
    virtual ~CatalogRepository() = default;

    virtual Result<Library> get_library(const std::string& library_id) const = 0;

    virtual Result<std::vector<Library>> get_libraries_by_owner(const std::string& owner_id) const = 0;

    /// Assigns id and timestamps; the input's id is ignored.
    virtual Result<Library> create_library(Library library) = 0;

    virtual Result<Library> set_library_import_paths(const std::string& library_id,
                                                     std::vector<std::string> import_paths) = 0;

    virtual Result<std::vector<Asset>> get_assets_by_library(const std::vector<std::string>& library_ids) const = 0;

    /// Ok(nullopt) means "no asset"; an error means the lookup itself failed.
    virtual Result<std::optional<Asset>> get_asset_by_library_and_path(const std::string& library_id,
                                                                      const std::string& original_path) const = 0;

    /// Assigns the id. Fails with AlreadyExists if the library already has an asset at that path.
    virtual Result<Asset> create_asset(Asset asset) = 0;

    virtual Result<Asset> update_asset(const std::string& asset_id, const AssetPatch& patch) = 0;

    virtual Result<void> delete_asset(const std::string& asset_id) = 0;
};

} // namespace medialib::catalog
