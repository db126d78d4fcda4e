#pragma once

#include "config/Config.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace ds::concurrency { class ThreadPool; }

namespace ds::scan {

class Channel;
class Engine;
class Task;
class TaskRegistry;

// Owns the start/stop/disconnect flow for scans requested over a channel.
class Controller : public std::enable_shared_from_this<Controller> {
public:
    Controller(std::shared_ptr<TaskRegistry> registry,
               std::shared_ptr<Engine> engine,
               std::shared_ptr<concurrency::ThreadPool> pool,
               config::ScanConfig cfg);

    void startScan(const std::shared_ptr<Channel>& channel, const std::string& drivePath,
                   std::optional<int64_t> scanDepth);

    void stopScan(const std::string& taskId) const;

    void onDisconnect(const std::string& channelId) const;

    // Worker side: walks the task and publishes its outcome.
    void run(const std::shared_ptr<Task>& task) const;

private:
    static void reject(const std::shared_ptr<Channel>& channel, const std::string& taskId, const std::string& error);

    void fail(const std::shared_ptr<Task>& task, const std::string& error) const;

    std::shared_ptr<TaskRegistry> registry_;
    std::shared_ptr<Engine> engine_;
    std::shared_ptr<concurrency::ThreadPool> pool_;
    config::ScanConfig cfg_;
};

}
