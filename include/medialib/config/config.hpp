#pragma once

#include "medialib/catalog/types.hpp"
#include "medialib/core/result.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace medialib::config {

struct LibraryConfig {
    std::string name;
    std::string owner_id;
    catalog::LibraryType type = catalog::LibraryType::Import;
    std::vector<std::string> import_paths;
    bool is_visible = true;
};

/**
 * @brief Runtime settings for the refresh pipeline
 *
 * EXAMPLE:
 * {
 *   "log_level": "info",
 *   "worker_threads": 4,
 *   "max_attempts": 3,
 *   "libraries": [
 *     {"name": "Photos", "owner_id": "user-1", "type": "IMPORT",
 *      "import_paths": ["/media/photos"]}
 *   ]
 * }
 *
 * Every key is optional except libraries[].name and libraries[].owner_id.
 */
struct AppConfig {
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::size_t worker_threads = 4;
    std::uint32_t max_attempts = 3;
    std::vector<LibraryConfig> libraries;
};

Result<AppConfig> parse_config(const nlohmann::json& document);

Result<AppConfig> load_config(const std::filesystem::path& path);

} // namespace medialib::config
