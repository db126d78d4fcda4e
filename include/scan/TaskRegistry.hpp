#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ds::scan {

class Channel;
class Task;

class TaskRegistry {
public:
    // Unique for the life of the process.
    std::string generateId();

    std::shared_ptr<Task> create(const std::filesystem::path& root, unsigned int maxDepth,
                                 const std::shared_ptr<Channel>& channel);

    std::shared_ptr<Task> get(const std::string& id) const;

    // Cancels and removes the task if it is still running. False for unknown or already finished ids.
    bool requestAbort(const std::string& id);

    void remove(const std::string& id);

    [[nodiscard]] bool exists(const std::string& id) const;

    // Cancels every running task bound to the channel. Returns how many were aborted.
    size_t abortOwnedBy(const std::string& channelId);

    size_t abortAll();

    [[nodiscard]] size_t size() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Task>> tasks_;
    std::atomic<uint64_t> sequence_{0};
};

}
