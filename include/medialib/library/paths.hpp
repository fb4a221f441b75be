#pragma once

#include <filesystem>
#include <string>

namespace medialib::library {

/**
 * @brief Canonical string form used for every path comparison
 *
 * Absolute, lexically normal ("a/./b/../c" -> "a/c"), generic separators and
 * no trailing separator. Purely lexical: symlinks are not resolved and the
 * path does not need to exist, so catalog paths of vanished files normalize
 * the same way as freshly crawled ones.
 */
std::string normalize_path(const std::filesystem::path& path);

} // namespace medialib::library
