#pragma once

#include "scan/Metadata.hpp"
#include "scan/errors.hpp"

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

namespace ds::test {

// In-memory tree. Lets tests fail individual listings or stats regardless of process privileges.
class FakeMetadata final : public scan::Metadata {
public:
    void addDir(const std::filesystem::path& dir) {
        dirs_.insert(dir);
        if (dir.has_parent_path() && dir.parent_path() != dir) {
            if (!dirs_.contains(dir.parent_path())) addDir(dir.parent_path());
            link(dir, scan::EntryKind::Directory);
        }
    }

    void addFile(const std::filesystem::path& file, const uintmax_t size) {
        addDir(file.parent_path());
        sizes_[file] = size;
        link(file, scan::EntryKind::File);
    }

    void addOther(const std::filesystem::path& entry) {
        addDir(entry.parent_path());
        link(entry, scan::EntryKind::Other);
    }

    void failListing(const std::filesystem::path& dir) { failedListings_.insert(dir); }
    void failStat(const std::filesystem::path& file) { failedStats_.insert(file); }
    void denyRead(const std::filesystem::path& dir) { unreadable_.insert(dir); }

    // fileSize(file) throws something other than an access error.
    void corruptStat(const std::filesystem::path& file) { corruptStats_.insert(file); }

    // exists(path) answers true for the first `checks` queries, false afterwards.
    void vanishAfter(const std::filesystem::path& path, const unsigned int checks) {
        std::scoped_lock lock(mutex_);
        vanishing_[path] = checks;
    }

    // list(dir) blocks until release() is called.
    void blockListing(const std::filesystem::path& dir) { blocked_ = dir; }

    void waitUntilBlocked() {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [&] { return entered_; });
    }

    void release() {
        {
            std::scoped_lock lock(mutex_);
            released_ = true;
        }
        cv_.notify_all();
    }

    bool exists(const std::filesystem::path& path) const override {
        {
            std::scoped_lock lock(mutex_);
            if (const auto it = vanishing_.find(path); it != vanishing_.end()) {
                if (it->second == 0) return false;
                --it->second;
            }
        }
        return dirs_.contains(path) || sizes_.contains(path);
    }

    bool isDirectory(const std::filesystem::path& path) const override { return dirs_.contains(path); }

    bool isReadable(const std::filesystem::path& path) const override { return !unreadable_.contains(path); }

    std::vector<scan::DirEntry> list(const std::filesystem::path& dir) const override {
        if (!blocked_.empty() && dir == blocked_) {
            std::unique_lock lock(mutex_);
            entered_ = true;
            cv_.notify_all();
            cv_.wait(lock, [&] { return released_; });
        }

        if (failedListings_.contains(dir) || !dirs_.contains(dir))
            throw scan::EntryAccessError(dir, std::make_error_code(std::errc::permission_denied));

        std::vector<scan::DirEntry> out;
        if (const auto it = children_.find(dir); it != children_.end())
            for (const auto& [path, kind] : it->second) out.push_back({path, kind});
        return out;
    }

    uintmax_t fileSize(const std::filesystem::path& file) const override {
        if (corruptStats_.contains(file)) throw std::runtime_error("corrupt metadata for " + file.string());
        if (failedStats_.contains(file) || !sizes_.contains(file))
            throw scan::EntryAccessError(file, std::make_error_code(std::errc::no_such_file_or_directory));
        return sizes_.at(file);
    }

private:
    void link(const std::filesystem::path& entry, const scan::EntryKind kind) {
        children_[entry.parent_path()][entry] = kind;
    }

    std::set<std::filesystem::path> dirs_;
    std::map<std::filesystem::path, uintmax_t> sizes_;
    std::map<std::filesystem::path, std::map<std::filesystem::path, scan::EntryKind>> children_;

    std::set<std::filesystem::path> failedListings_, failedStats_, unreadable_, corruptStats_;
    mutable std::map<std::filesystem::path, unsigned int> vanishing_;

    std::filesystem::path blocked_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    mutable bool entered_ = false;
    bool released_ = false;
};

}
