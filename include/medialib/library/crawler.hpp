#pragma once

#include "medialib/library/mime.hpp"

#include <cstddef>
#include <filesystem>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

namespace medialib::library {

class CrawlWalker;

/**
 * @brief Lazy, restartable walk over a set of root directories
 *
 * Nothing touches the filesystem until begin() is called, and every call to
 * begin() starts an independent walk from the first root. Only paths the
 * classifier accepts as media are yielded; everything else is skipped
 * silently.
 *
 * SKIPPED WITHOUT ABORTING:
 * - Directories that cannot be opened or stop iterating midway
 * - Entries whose status cannot be read
 * - Symlinked directories (never descended into, which also rules out cycles)
 *
 * Symlinks to regular files are yielded under the link's own path.
 * Order is unspecified.
 */
class CrawlSequence {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = std::filesystem::path;
        using difference_type = std::ptrdiff_t;
        using pointer = const std::filesystem::path*;
        using reference = const std::filesystem::path&;

        iterator() = default;

        reference operator*() const { return current_; }
        pointer operator->() const { return &current_; }

        iterator& operator++();

        bool operator==(const iterator& other) const { return walker_ == other.walker_; }
        bool operator!=(const iterator& other) const { return !(*this == other); }

    private:
        friend class CrawlSequence;
        explicit iterator(std::shared_ptr<CrawlWalker> walker);

        std::shared_ptr<CrawlWalker> walker_;
        std::filesystem::path current_;
    };

    CrawlSequence(std::vector<std::filesystem::path> roots, const MimeClassifier& classifier);

    iterator begin() const;
    iterator end() const { return iterator(); }

    const std::vector<std::filesystem::path>& roots() const noexcept { return roots_; }

private:
    std::vector<std::filesystem::path> roots_;
    const MimeClassifier& classifier_;
};

/**
 * @brief Discovers media files under a library's import paths
 */
class Crawler {
public:
    explicit Crawler(const MimeClassifier& classifier) : classifier_(classifier) {}

    CrawlSequence crawl(const std::vector<std::string>& import_paths) const;

private:
    const MimeClassifier& classifier_;
};

} // namespace medialib::library
