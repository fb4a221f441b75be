#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace medialib::library {

/**
 * @brief Per-(library, path) mutual exclusion for the workers
 *
 * Ingest and offline jobs are check-then-act against the catalog. Two jobs
 * for the same path (overlapping refreshes, a redelivered job next to its
 * original) must not interleave between the lookup and the upsert, while
 * jobs for different paths should still run in parallel.
 *
 * Entries are reference counted and erased when the last holder releases,
 * so the table only ever holds paths that are being worked on.
 *
 * USAGE:
 * auto scope = locks.acquire(job.library_id, job.asset_path);
 * // lookup, decide, upsert
 * // released when scope goes out of scope
 */
class PathLockTable {
private:
    struct Entry {
        std::mutex mutex;
        std::size_t holders = 0;
    };

public:
    class Scope {
    public:
        Scope(PathLockTable& table, std::string key, Entry& entry)
            : table_(&table), key_(std::move(key)), entry_(&entry) {}

        ~Scope() { release(); }

        Scope(const Scope&) = delete;
        Scope& operator=(const Scope&) = delete;

        Scope(Scope&& other) noexcept
            : table_(other.table_), key_(std::move(other.key_)), entry_(other.entry_) {
            other.table_ = nullptr;
            other.entry_ = nullptr;
        }

        Scope& operator=(Scope&&) = delete;

    private:
        void release() {
            if (table_ == nullptr) {
                return;
            }
            entry_->mutex.unlock();
            table_->release(key_);
            table_ = nullptr;
            entry_ = nullptr;
        }

        PathLockTable* table_;
        std::string key_;
        Entry* entry_;
    };

    PathLockTable() = default;

    PathLockTable(const PathLockTable&) = delete;
    PathLockTable& operator=(const PathLockTable&) = delete;

    /**
     * @brief Block until the caller holds the (library, path) scope
     */
    Scope acquire(const std::string& library_id, const std::string& path) {
        std::string key = library_id;
        key.push_back('\0');
        key.append(path);

        Entry* entry = nullptr;
        {
            std::lock_guard lock(mutex_);
            auto& slot = entries_[key];
            if (!slot) {
                slot = std::make_unique<Entry>();
            }
            slot->holders++;
            entry = slot.get();
        }

        entry->mutex.lock();
        return Scope(*this, std::move(key), *entry);
    }

    /**
     * @brief Number of paths currently held or waited on
     */
    std::size_t active() const {
        std::lock_guard lock(mutex_);
        return entries_.size();
    }

private:
    void release(const std::string& key) {
        std::lock_guard lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end() && --it->second->holders == 0) {
            entries_.erase(it);
        }
    }

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace medialib::library
