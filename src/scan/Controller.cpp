#include "scan/Controller.hpp"
#include "scan/Engine.hpp"
#include "scan/ProgressPublisher.hpp"
#include "scan/ResultFormatter.hpp"
#include "scan/Task.hpp"
#include "scan/TaskRegistry.hpp"
#include "scan/errors.hpp"
#include "scan/task/Walk.hpp"
#include "concurrency/ThreadPool.hpp"
#include "log/Registry.hpp"

#include <fmt/format.h>
#include <nlohmann/json.hpp>

using namespace ds::scan;

Controller::Controller(std::shared_ptr<TaskRegistry> registry,
                       std::shared_ptr<Engine> engine,
                       std::shared_ptr<concurrency::ThreadPool> pool,
                       config::ScanConfig cfg)
    : registry_(std::move(registry)), engine_(std::move(engine)), pool_(std::move(pool)), cfg_(cfg) {}

void Controller::reject(const std::shared_ptr<Channel>& channel, const std::string& taskId, const std::string& error) {
    log::Registry::scan()->warn("[Controller] Rejected scan {}: {}", taskId, error);
    ProgressPublisher(channel).publish("scan_error", {{"taskId", taskId}, {"error", error}});
}

void Controller::startScan(const std::shared_ptr<Channel>& channel, const std::string& drivePath,
                           const std::optional<int64_t> scanDepth) {
    const auto depth = scanDepth.value_or(cfg_.default_depth);
    if (depth < 1 || depth > static_cast<int64_t>(cfg_.max_depth))
        return reject(channel, registry_->generateId(),
                      fmt::format("Invalid scan depth: {} (expected 1 to {})", depth, cfg_.max_depth));

    const auto root = Engine::normalizeRoot(drivePath);
    try {
        engine_->validateRoot(root);
    } catch (const InvalidRootError& e) {
        return reject(channel, registry_->generateId(), e.what());
    }

    const auto task = registry_->create(root, static_cast<unsigned int>(depth), channel);
    log::Registry::scan()->info("[Controller] Starting scan {} of {} (depth {})", task->id(), root.string(), depth);

    task->emitIfRunning("scan_started", {{"taskId", task->id()}});

    try {
        pool_->submit(std::make_shared<scan::task::Walk>(shared_from_this(), task));
    } catch (const std::exception& e) {
        fail(task, std::string("Unable to schedule scan: ") + e.what());
    }
}

void Controller::stopScan(const std::string& taskId) const {
    if (registry_->requestAbort(taskId)) log::Registry::scan()->info("[Controller] Stopped scan {}", taskId);
    else log::Registry::scan()->debug("[Controller] Stop ignored for unknown or finished scan {}", taskId);
}

void Controller::onDisconnect(const std::string& channelId) const {
    if (const auto n = registry_->abortOwnedBy(channelId); n > 0)
        log::Registry::scan()->info("[Controller] Aborted {} scan(s) for disconnected channel {}", n, channelId);
}

void Controller::fail(const std::shared_ptr<Task>& task, const std::string& error) const {
    if (task->finish(Task::State::Failed, "scan_error", {{"taskId", task->id()}, {"error", error}}))
        registry_->remove(task->id());
}

void Controller::run(const std::shared_ptr<Task>& task) const {
    const auto outcome = engine_->walk(*task);

    switch (outcome.kind) {
        case Outcome::Kind::Completed: {
            try {
                const auto result = ResultFormatter(cfg_.top_n).format(task->stats());
                const auto duration = task->elapsedSeconds();
                const nlohmann::json payload = {
                    {"taskId", task->id()},
                    {"stats", result},
                    {"duration", duration}
                };

                if (task->finish(Task::State::Completed, "scan_complete", payload)) {
                    registry_->remove(task->id());
                    log::Registry::scan()->info("[Controller] Scan {} complete: {} files, {} bytes, {} errors in {}s",
                                                task->id(), result.totalFiles, result.totalSize, result.errorCount, duration);
                }
            } catch (const std::exception& e) {
                log::Registry::scan()->error("[Controller] Failed to publish result for {}: {}", task->id(), e.what());
                fail(task, e.what());
            }
            break;
        }
        case Outcome::Kind::Failed:
            fail(task, outcome.reason);
            break;
        case Outcome::Kind::Aborted:
            log::Registry::scan()->debug("[Controller] Walk for {} exited after stop", task->id());
            break;
    }
}
