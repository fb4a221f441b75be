#pragma once

#include "medialib/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace medialib::library {

/**
 * @brief SHA-1 digest of a file's full contents
 *
 * Streams the file in fixed-size blocks, so memory use does not depend on
 * file size. Read failures are TransientIO: the file was stat'ed a moment
 * earlier and may simply be mid-copy.
 */
Result<std::vector<std::uint8_t>> hash_file(const std::filesystem::path& path);

/**
 * @brief Lower-case hex rendering of a digest (logging only)
 */
std::string to_hex(const std::vector<std::uint8_t>& digest);

} // namespace medialib::library
