#pragma once

#include "scan/ProgressPublisher.hpp"
#include "scan/model/Stats.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ds::scan {

class Channel;

// One scan from registration to its terminal message.
//
// The state transition out of Running and the emission tied to it happen under
// one lock, and progress is only emitted while Running under the same lock, so
// nothing can follow a task's terminal message.
class Task {
public:
    enum class State { Running, Completed, Aborted, Failed };

    Task(std::string id, std::filesystem::path root, unsigned int maxDepth, const std::shared_ptr<Channel>& channel);

    const std::string& id() const { return id_; }
    const std::filesystem::path& root() const { return root_; }
    unsigned int maxDepth() const { return maxDepth_; }
    const std::string& channelId() const { return channelId_; }
    std::chrono::steady_clock::time_point startedAt() const { return startedAt_; }

    // Whole seconds since registration, rounded.
    [[nodiscard]] long elapsedSeconds() const;

    model::Stats& stats() { return stats_; }
    const model::Stats& stats() const { return stats_; }

    [[nodiscard]] bool isCancelled() const noexcept { return cancelRequested_.load(std::memory_order_acquire); }

    State state() const;

    // Emits only while the task is still Running.
    bool emitIfRunning(const std::string& type, const nlohmann::json& payload);

    void reportProgress(const std::filesystem::path& currentPath);

    // Running -> terminal, then emits type/payload unless type is empty.
    // Returns false when another outcome already won.
    bool finish(State terminal, const std::string& type, const nlohmann::json& payload);

    // Raises the cancellation flag and emits scan_stopped. False if already terminal.
    bool abort();

private:
    const std::string id_;
    const std::filesystem::path root_;
    const unsigned int maxDepth_;
    const std::string channelId_;
    const std::chrono::steady_clock::time_point startedAt_;

    mutable std::mutex mutex_;
    State state_ = State::Running;
    std::atomic<bool> cancelRequested_{false};

    ProgressPublisher publisher_;
    model::Stats stats_;
};

std::string to_string(Task::State state);

}
