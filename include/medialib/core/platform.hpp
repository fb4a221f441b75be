#pragma once

#ifdef _WIN32
    #define MEDIALIB_PLATFORM_WINDOWS
    #include <io.h>
    #include <sys/stat.h>
    #include <sys/types.h>
#else
    #define MEDIALIB_PLATFORM_LINUX
    #include <sys/stat.h>
    #include <sys/types.h>
    #include <unistd.h>
#endif

#include <chrono>
#include <cstdint>
#include <string>

namespace medialib {

/**
 * @brief Subset of stat(2) the pipeline relies on
 *
 * Timestamps keep the full resolution reported by the OS so that two stats
 * of an untouched file compare equal.
 */
struct FileStat {
    std::uint64_t size = 0;
    bool is_regular = false;
    std::chrono::system_clock::time_point modified_at{};
    std::chrono::system_clock::time_point changed_at{};
};

/**
 * @brief stat() a path, following symlinks
 *
 * RETURNS: false when the path is missing or inaccessible
 */
inline bool stat_file(const std::string& path, FileStat& out) {
#ifdef MEDIALIB_PLATFORM_WINDOWS
    struct _stat64 st {};
    if (::_stat64(path.c_str(), &st) != 0) {
        return false;
    }
    out.size = static_cast<std::uint64_t>(st.st_size);
    out.is_regular = (st.st_mode & _S_IFREG) != 0;
    out.modified_at = std::chrono::system_clock::from_time_t(st.st_mtime);
    out.changed_at = std::chrono::system_clock::from_time_t(st.st_ctime);
    return true;
#else
    struct stat st {};
    if (::stat(path.c_str(), &st) != 0) {
        return false;
    }
    using std::chrono::duration_cast;
    using std::chrono::nanoseconds;
    using std::chrono::seconds;
    using std::chrono::system_clock;

    auto to_time_point = [](const timespec& ts) {
        const auto since_epoch = seconds(ts.tv_sec) + nanoseconds(ts.tv_nsec);
        return system_clock::time_point(duration_cast<system_clock::duration>(since_epoch));
    };

    out.size = static_cast<std::uint64_t>(st.st_size);
    out.is_regular = S_ISREG(st.st_mode);
    out.modified_at = to_time_point(st.st_mtim);
    out.changed_at = to_time_point(st.st_ctim);
    return true;
#endif
}

/**
 * @brief True when the current process may read the path
 */
inline bool is_readable(const std::string& path) {
#ifdef MEDIALIB_PLATFORM_WINDOWS
    return ::_access(path.c_str(), 4) == 0;
#else
    return ::access(path.c_str(), R_OK) == 0;
#endif
}

} // namespace medialib
