#pragma once

/**
 * @file memory_catalog.hpp
 * @brief Thread-safe in-memory implementation of CatalogRepository
 *
 * WHY THIS FILE EXISTS:
 * The real catalog lives in an external database. The pipeline only needs
 * the CatalogRepository contract, so tests and the example program run
 * against this adapter instead.
 *
 * THREAD SAFETY PATTERN:
 * - Reads (get_*) take a std::shared_lock, so workers can look up paths
 *   concurrently
 * - Writes (create/update/delete/set) take a std::unique_lock
 * - Each call is atomic on its own; nothing spans two calls
 *
 * INDEXES:
 * - libraries_: library id -> Library
 * - assets_:    asset id -> Asset
 * - by_path_:   (library id, original path) -> asset id, which is also what
 *               enforces the one-asset-per-path invariant
 */

#include "medialib/catalog/repository.hpp"

#include <atomic>
#include <cstdint>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace medialib::catalog {

class InMemoryCatalog : public CatalogRepository {
public:
    InMemoryCatalog() = default;

    InMemoryCatalog(const InMemoryCatalog&) = delete;
    InMemoryCatalog& operator=(const InMemoryCatalog&) = delete;

    Result<Library> get_library(const std::string& library_id) const override;

    Result<std::vector<Library>> get_libraries_by_owner(const std::string& owner_id) const override;

    Result<Library> create_library(Library library) override;

    Result<Library> set_library_import_paths(const std::string& library_id,
                                             std::vector<std::string> import_paths) override;

    Result<std::vector<Asset>> get_assets_by_library(const std::vector<std::string>& library_ids) const override;

    Result<std::optional<Asset>> get_asset_by_library_and_path(const std::string& library_id,
                                                              const std::string& original_path) const override;

    Result<Asset> create_asset(Asset asset) override;

    Result<Asset> update_asset(const std::string& asset_id, const AssetPatch& patch) override;

    Result<void> delete_asset(const std::string& asset_id) override;

    /**
     * @brief Number of asset rows across all libraries
     */
    size_t asset_count() const;

    /**
     * @brief Remove everything (tests)
     */
    void clear();

private:
    static std::string path_key(const std::string& library_id, const std::string& original_path);

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Library> libraries_;
    std::unordered_map<std::string, Asset> assets_;
    std::unordered_map<std::string, std::string> by_path_;

    std::atomic<uint64_t> library_counter_{0};
    std::atomic<uint64_t> asset_counter_{0};
};

} // namespace medialib::catalog
