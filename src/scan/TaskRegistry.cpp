#include "scan/TaskRegistry.hpp"
#include "scan/Task.hpp"
#include "log/Registry.hpp"

#include <chrono>
#include <vector>
#include <fmt/format.h>

using namespace ds::scan;

std::string TaskRegistry::generateId() {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return fmt::format("scan_{}_{}", ms, ++sequence_);
}

std::shared_ptr<Task> TaskRegistry::create(const std::filesystem::path& root, const unsigned int maxDepth,
                                           const std::shared_ptr<Channel>& channel) {
    auto task = std::make_shared<Task>(generateId(), root, maxDepth, channel);

    std::scoped_lock lock(mutex_);
    tasks_.emplace(task->id(), task);
    log::Registry::scan()->debug("[TaskRegistry] Registered {} for {} ({} active)", task->id(), root.string(), tasks_.size());
    return task;
}

std::shared_ptr<Task> TaskRegistry::get(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    if (const auto it = tasks_.find(id); it != tasks_.end()) return it->second;
    return nullptr;
}

bool TaskRegistry::requestAbort(const std::string& id) {
    std::scoped_lock lock(mutex_);
    const auto it = tasks_.find(id);
    if (it == tasks_.end()) return false;

    // a task that already reached an outcome removes itself
    if (!it->second->abort()) return false;

    tasks_.erase(it);
    return true;
}

void TaskRegistry::remove(const std::string& id) {
    std::scoped_lock lock(mutex_);
    tasks_.erase(id);
}

bool TaskRegistry::exists(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    return tasks_.contains(id);
}

size_t TaskRegistry::abortOwnedBy(const std::string& channelId) {
    std::scoped_lock lock(mutex_);
    size_t aborted = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second->channelId() == channelId && it->second->abort()) {
            it = tasks_.erase(it);
            ++aborted;
        } else ++it;
    }
    return aborted;
}

size_t TaskRegistry::abortAll() {
    std::scoped_lock lock(mutex_);
    size_t aborted = 0;
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if (it->second->abort()) {
            it = tasks_.erase(it);
            ++aborted;
        } else ++it;
    }
    return aborted;
}

size_t TaskRegistry::size() const {
    std::scoped_lock lock(mutex_);
    return tasks_.size();
}
