#pragma once

/**
 * @file types.hpp
 * @brief Catalog records for libraries and the assets they own
 *
 * WHY THIS FILE EXISTS:
 * The reconciliation pipeline compares two views of truth: what is on disk
 * and what the catalog remembers. These structs are the catalog's side of
 * that comparison.
 *
 * HOW IT INTEGRATES:
 * - CatalogRepository (catalog/repository.hpp) stores and returns them
 * - Reconciler reads Library::import_paths and every Asset::original_path
 * - IngestWorker creates Assets and patches them on re-import
 * - OfflineWorker flips Asset::is_offline or deletes the record
 *
 * DESIGN DECISIONS:
 * - Plain structs: the catalog owns the behaviour, records are data
 * - Checksum kept as raw digest bytes; rendering to hex is a logging concern
 * - Timestamps as system_clock::time_point at OS resolution, so that an
 *   untouched file's mtime compares equal to the stored one
 */

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace medialib::catalog {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief How assets enter a library
 *
 * IMPORT libraries mirror folders on disk and are the only ones that can be
 * refreshed. UPLOAD libraries are filled through uploads and never crawled.
 */
enum class LibraryType {
    Import,
    Upload
};

enum class AssetType {
    Image,
    Video,
    Audio,
    Other
};

struct Library {
    std::string id;
    std::string owner_id;
    std::string name;
    LibraryType type = LibraryType::Upload;
    std::vector<std::string> import_paths;   // Ordered as the user declared them
    bool is_visible = true;
    Timestamp created_at{};
    Timestamp updated_at{};
};

/**
 * @brief One media file known to the catalog
 *
 * INVARIANT:
 * At most one Asset per (library_id, original_path). The in-memory catalog
 * enforces it on create; the workers serialize per path so they never try
 * to break it.
 */
struct Asset {
    std::string id;
    std::string owner_id;
    std::string library_id;

    std::string original_path;               // Normalized absolute path
    std::string original_file_name;          // Path stem, e.g. "IMG_0001"
    std::vector<std::uint8_t> checksum;      // SHA-1 digest of the file contents

    std::string device_asset_id;             // "<basename>-<size>", whitespace stripped
    std::string device_id;                   // "Library Import" for crawled assets

    AssetType type = AssetType::Other;
    Timestamp file_created_at{};
    Timestamp file_modified_at{};

    std::optional<std::string> sidecar_path; // "<original_path>.xmp" when readable
    bool is_offline = false;
    bool is_read_only = false;               // True for library imports, false for uploads
    bool is_visible = true;
};

/**
 * @brief Partial update for an Asset; unset fields are left untouched
 *
 * sidecar_path is doubly optional: the outer optional says "change it", the
 * inner one carries the new value (which may be "no sidecar").
 */
struct AssetPatch {
    std::optional<std::vector<std::uint8_t>> checksum;
    std::optional<std::string> device_asset_id;
    std::optional<std::string> original_file_name;
    std::optional<AssetType> type;
    std::optional<Timestamp> file_created_at;
    std::optional<Timestamp> file_modified_at;
    std::optional<std::optional<std::string>> sidecar_path;
    std::optional<bool> is_offline;
    std::optional<bool> is_read_only;

    void apply_to(Asset& asset) const {
        if (checksum) asset.checksum = *checksum;
        if (device_asset_id) asset.device_asset_id = *device_asset_id;
        if (original_file_name) asset.original_file_name = *original_file_name;
        if (type) asset.type = *type;
        if (file_created_at) asset.file_created_at = *file_created_at;
        if (file_modified_at) asset.file_modified_at = *file_modified_at;
        if (sidecar_path) asset.sidecar_path = *sidecar_path;
        if (is_offline) asset.is_offline = *is_offline;
        if (is_read_only) asset.is_read_only = *is_read_only;
    }
};

/**
 * @brief String conversions for enums (config files, job payloads, logs)
 */
class CatalogEnumUtils {
public:
    static std::optional<LibraryType> library_type_from_string(const std::string& value) {
        if (value == "IMPORT") return LibraryType::Import;
        if (value == "UPLOAD") return LibraryType::Upload;
        return std::nullopt;
    }

    static std::string to_string(LibraryType type) {
        switch (type) {
            case LibraryType::Import: return "IMPORT";
            case LibraryType::Upload: return "UPLOAD";
            default: return "UNKNOWN";
        }
    }

    static std::string to_string(AssetType type) {
        switch (type) {
            case AssetType::Image: return "IMAGE";
            case AssetType::Video: return "VIDEO";
            case AssetType::Audio: return "AUDIO";
            case AssetType::Other: return "OTHER";
            default: return "UNKNOWN";
        }
    }
};

} // namespace medialib::catalog
