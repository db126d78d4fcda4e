#include "scan/Task.hpp"
#include "scan/Channel.hpp"
#include "scan/model/Progress.hpp"
#include "log/Registry.hpp"

#include <cmath>
#include <nlohmann/json.hpp>

using namespace ds::scan;

namespace {
std::string channelIdOf(const std::shared_ptr<Channel>& channel) {
    return channel ? channel->channelId() : std::string{};
}
}

Task::Task(std::string id, std::filesystem::path root, const unsigned int maxDepth, const std::shared_ptr<Channel>& channel)
    : id_(std::move(id)),
      root_(std::move(root)),
      maxDepth_(maxDepth),
      channelId_(channelIdOf(channel)),
      startedAt_(std::chrono::steady_clock::now()),
      publisher_(channel) {}

long Task::elapsedSeconds() const {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - startedAt_);
    return std::lround(static_cast<double>(ms.count()) / 1000.0);
}

Task::State Task::state() const {
    std::scoped_lock lock(mutex_);
    return state_;
}

bool Task::emitIfRunning(const std::string& type, const nlohmann::json& payload) {
    std::scoped_lock lock(mutex_);
    if (state_ != State::Running) return false;
    return publisher_.publish(type, payload);
}

void Task::reportProgress(const std::filesystem::path& currentPath) {
    const model::Progress snapshot(id_, stats_, currentPath.string());
    const auto message = ProgressPublisher::serialize("scan_progress", snapshot);

    std::scoped_lock lock(mutex_);
    if (state_ != State::Running) return;
    publisher_.deliver("scan_progress", message);
}

bool Task::finish(const State terminal, const std::string& type, const nlohmann::json& payload) {
    // serialized before the transition so a throw leaves the task Running
    const auto message = type.empty() ? std::string{} : ProgressPublisher::serialize(type, payload);

    std::scoped_lock lock(mutex_);
    if (state_ != State::Running) return false;

    state_ = terminal;
    if (!type.empty()) publisher_.deliver(type, message);

    log::Registry::scan()->debug("[Task] {} -> {}", id_, to_string(terminal));
    return true;
}

bool Task::abort() {
    std::scoped_lock lock(mutex_);
    if (state_ != State::Running) return false;

    cancelRequested_.store(true, std::memory_order_release);
    state_ = State::Aborted;
    publisher_.publish("scan_stopped", {{"taskId", id_}});

    log::Registry::scan()->debug("[Task] {} -> aborted", id_);
    return true;
}

std::string ds::scan::to_string(const Task::State state) {
    switch (state) {
        case Task::State::Running: return "running";
        case Task::State::Completed: return "completed";
        case Task::State::Aborted: return "aborted";
        case Task::State::Failed: return "failed";
    }
    return "unknown";
}
