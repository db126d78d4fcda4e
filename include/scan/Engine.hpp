#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace ds::scan {

class Metadata;
class Task;

namespace model { struct Stats; }

struct Outcome {
    enum class Kind { Completed, Aborted, Failed };

    Kind kind = Kind::Completed;
    std::string reason;

    static Outcome completed() { return {Kind::Completed, {}}; }
    static Outcome aborted() { return {Kind::Aborted, {}}; }
    static Outcome failed(std::string reason) { return {Kind::Failed, std::move(reason)}; }
};

struct EngineOptions {
    unsigned int progressInterval = 50;
};

// Depth-bounded recursive walk feeding a task's Stats.
class Engine {
public:
    using Options = EngineOptions;

    explicit Engine(std::shared_ptr<const Metadata> metadata, Options opts = {});

    // Throws InvalidRootError naming the problem.
    void validateRoot(const std::filesystem::path& root) const;

    // Never throws. Per-entry failures are counted in the task's errorCount.
    Outcome walk(Task& task) const;

    // Absolute, lexically normal, no trailing separator unless it is the filesystem root.
    static std::filesystem::path normalizeRoot(const std::filesystem::path& root);

private:
    void walkDirectory(Task& task, const std::filesystem::path& dir, unsigned int depth) const;
    void processFile(Task& task, const std::filesystem::path& file) const;

    static void rollup(model::Stats& stats, const std::filesystem::path& folder,
                       const std::string& root, uintmax_t size);

    static void checkpoint(const Task& task);

    std::shared_ptr<const Metadata> metadata_;
    Options opts_;
};

}
