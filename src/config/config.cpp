#include "medialib/config/config.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>

namespace medialib::config {

using json = nlohmann::json;

namespace {

Result<LibraryConfig> parse_library(const json& entry, std::size_t index) {
    const auto where = "libraries[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        return fail<LibraryConfig>(ErrorKind::InvalidRequest, where + " must be an object");
    }

    LibraryConfig library;
    for (const char* key : {"name", "owner_id"}) {
        auto it = entry.find(key);
        if (it == entry.end() || !it->is_string() || it->get<std::string>().empty()) {
            return fail<LibraryConfig>(ErrorKind::InvalidRequest, where + "." + key + " is required");
        }
    }
    library.name = entry["name"].get<std::string>();
    library.owner_id = entry["owner_id"].get<std::string>();

    if (auto it = entry.find("type"); it != entry.end()) {
        auto type = it->is_string()
            ? catalog::CatalogEnumUtils::library_type_from_string(it->get<std::string>())
            : std::nullopt;
        if (!type) {
            return fail<LibraryConfig>(ErrorKind::InvalidRequest, where + ".type must be IMPORT or UPLOAD");
        }
        library.type = *type;
    }

    if (auto it = entry.find("import_paths"); it != entry.end()) {
        if (!it->is_array()) {
            return fail<LibraryConfig>(ErrorKind::InvalidRequest, where + ".import_paths must be an array");
        }
        for (const auto& path : *it) {
            if (!path.is_string()) {
                return fail<LibraryConfig>(ErrorKind::InvalidRequest, where + ".import_paths must hold strings");
            }
            library.import_paths.push_back(path.get<std::string>());
        }
    }

    if (auto it = entry.find("is_visible"); it != entry.end()) {
        if (!it->is_boolean()) {
            return fail<LibraryConfig>(ErrorKind::InvalidRequest, where + ".is_visible must be a boolean");
        }
        library.is_visible = it->get<bool>();
    }

    return Ok(std::move(library));
}

} // namespace

Result<AppConfig> parse_config(const json& document) {
    if (!document.is_object()) {
        return fail<AppConfig>(ErrorKind::InvalidRequest, "Config root must be an object");
    }

    AppConfig config;

    if (auto it = document.find("log_level"); it != document.end()) {
        if (!it->is_string()) {
            return fail<AppConfig>(ErrorKind::InvalidRequest, "log_level must be a string");
        }
        const auto name = it->get<std::string>();
        const auto level = spdlog::level::from_str(name);
        // from_str falls back to "off" for names it does not know
        if (level == spdlog::level::off && name != "off") {
            return fail<AppConfig>(ErrorKind::InvalidRequest, "Unknown log_level: " + name);
        }
        config.log_level = level;
    }

    if (auto it = document.find("worker_threads"); it != document.end()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
            return fail<AppConfig>(ErrorKind::InvalidRequest, "worker_threads must be a positive integer");
        }
        config.worker_threads = it->get<std::size_t>();
    }

    if (auto it = document.find("max_attempts"); it != document.end()) {
        if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
            return fail<AppConfig>(ErrorKind::InvalidRequest, "max_attempts must be a positive integer");
        }
        config.max_attempts = it->get<std::uint32_t>();
    }

    if (auto it = document.find("libraries"); it != document.end()) {
        if (!it->is_array()) {
            return fail<AppConfig>(ErrorKind::InvalidRequest, "libraries must be an array");
        }
        for (std::size_t i = 0; i < it->size(); ++i) {
            auto library = parse_library((*it)[i], i);
            if (library.is_error()) {
                return Err<AppConfig>(library.error());
            }
            config.libraries.push_back(std::move(library.value()));
        }
    }

    return Ok(std::move(config));
}

Result<AppConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return fail<AppConfig>(ErrorKind::NotFound, "Cannot open config file: " + path.string());
    }

    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return fail<AppConfig>(ErrorKind::InvalidRequest, "Config file is not valid JSON: " + path.string());
    }

    return parse_config(document);
}

} // namespace medialib::config
