#include "medialib/library/paths.hpp"

#include <system_error>

namespace medialib::library {

std::string normalize_path(const std::filesystem::path& path) {
    namespace fs = std::filesystem;

    if (path.empty()) {
        return {};
    }

    fs::path absolute = path;
    if (!absolute.is_absolute()) {
        std::error_code ec;
        auto resolved = fs::absolute(path, ec);
        if (!ec) {
            absolute = resolved;
        }
    }

    auto normalized = absolute.lexically_normal().generic_string();
    while (normalized.size() > 1 && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

} // namespace medialib::library
