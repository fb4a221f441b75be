#include "medialib/library/crawler.hpp"

#include <spdlog/spdlog.h>

#include <optional>
#include <system_error>

namespace fs = std::filesystem;

namespace medialib::library {

/**
 * @brief Depth-first walk state for one pass over the roots
 *
 * One directory_iterator per open directory, so a failure inside a subtree
 * only discards that subtree's frame. Holds its own copy of the roots so an
 * iterator may outlive the sequence that produced it.
 */
class CrawlWalker {
public:
    CrawlWalker(const std::vector<fs::path>& roots, const MimeClassifier& classifier)
        : roots_(roots), classifier_(classifier) {}

    std::optional<fs::path> next() {
        while (true) {
            if (stack_.empty()) {
                if (next_root_ >= roots_.size()) {
                    return std::nullopt;
                }
                open_directory(roots_[next_root_++]);
                continue;
            }

            auto& frame = stack_.back();
            if (frame == fs::directory_iterator()) {
                stack_.pop_back();
                continue;
            }

            const fs::directory_entry entry = *frame;

            std::error_code ec;
            frame.increment(ec);
            if (ec) {
                spdlog::debug("[Crawler] stopped listing {}: {}", entry.path().parent_path().string(), ec.message());
                stack_.pop_back();
            }

            if (auto path = visit(entry)) {
                return path;
            }
        }
    }

private:
    std::optional<fs::path> visit(const fs::directory_entry& entry) {
        std::error_code ec;
        const auto link_status = entry.symlink_status(ec);
        if (ec) {
            spdlog::debug("[Crawler] cannot stat {}: {}", entry.path().string(), ec.message());
            return std::nullopt;
        }

        if (fs::is_symlink(link_status)) {
            const auto target = entry.status(ec);
            if (ec || !fs::is_regular_file(target)) {
                return std::nullopt;
            }
            return accept(entry.path());
        }

        if (fs::is_directory(link_status)) {
            open_directory(entry.path());
            return std::nullopt;
        }

        if (fs::is_regular_file(link_status)) {
            return accept(entry.path());
        }

        return std::nullopt;
    }

    std::optional<fs::path> accept(const fs::path& path) const {
        if (!classifier_.is_supported_media(path)) {
            return std::nullopt;
        }
        return path;
    }

    void open_directory(const fs::path& directory) {
        std::error_code ec;
        fs::directory_iterator it(directory, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            spdlog::debug("[Crawler] skipping {}: {}", directory.string(), ec.message());
            return;
        }
        stack_.push_back(std::move(it));
    }

    const std::vector<fs::path> roots_;
    const MimeClassifier& classifier_;
    std::size_t next_root_ = 0;
    std::vector<fs::directory_iterator> stack_;
};

CrawlSequence::iterator::iterator(std::shared_ptr<CrawlWalker> walker)
    : walker_(std::move(walker)) {
    ++(*this);
}

CrawlSequence::iterator& CrawlSequence::iterator::operator++() {
    if (!walker_) {
        return *this;
    }

    if (auto path = walker_->next()) {
        current_ = std::move(*path);
    } else {
        walker_.reset();
        current_.clear();
    }
    return *this;
}

CrawlSequence::CrawlSequence(std::vector<fs::path> roots, const MimeClassifier& classifier)
    : roots_(std::move(roots)), classifier_(classifier) {}

CrawlSequence::iterator CrawlSequence::begin() const {
    return iterator(std::make_shared<CrawlWalker>(roots_, classifier_));
}

CrawlSequence Crawler::crawl(const std::vector<std::string>& import_paths) const {
    std::vector<fs::path> roots;
    roots.reserve(import_paths.size());
    for (const auto& import_path : import_paths) {
        roots.emplace_back(import_path);
    }
    return CrawlSequence(std::move(roots), classifier_);
}

} // namespace medialib::library
