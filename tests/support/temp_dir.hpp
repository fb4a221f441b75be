#pragma once

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace medialib::test_support {

namespace fs = std::filesystem;

inline fs::path create_temp_dir() {
    static std::atomic<uint64_t> counter{0};
    const auto base = fs::temp_directory_path();
    const auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    const auto id = timestamp ^ (counter.fetch_add(1) << 8);
    auto unique = base / fs::path("medialib_test_" + std::to_string(id));
    fs::create_directories(unique);
    return unique;
}

inline void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    output << content;
}

/**
 * @brief Move a file's mtime by a whole number of seconds
 *
 * Rewriting a file within the same clock tick can leave its mtime unchanged,
 * so tests that need a "modified" file shift the timestamp explicitly.
 */
inline void shift_mtime(const fs::path& path, std::chrono::seconds delta) {
    std::error_code ec;
    const auto current = fs::last_write_time(path, ec);
    if (!ec) {
        fs::last_write_time(path, current + delta, ec);
    }
}

/**
 * @brief Temporary directory removed when the fixture ends
 */
class TempDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        root_ = create_temp_dir();
    }

    void TearDown() override {
        if (!root_.empty()) {
            std::error_code ec;
            fs::permissions(root_, fs::perms::owner_all, fs::perm_options::add, ec);
            fs::remove_all(root_, ec);
        }
    }

    fs::path root_;
};

} // namespace medialib::test_support
