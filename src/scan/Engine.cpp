#include "scan/Engine.hpp"
#include "scan/Classifier.hpp"
#include "scan/Metadata.hpp"
#include "scan/Task.hpp"
#include "scan/errors.hpp"
#include "log/Registry.hpp"

using namespace ds::scan;
namespace fs = std::filesystem;

Engine::Engine(std::shared_ptr<const Metadata> metadata, const Options opts)
    : metadata_(std::move(metadata)), opts_(opts) {
    if (!metadata_) throw std::invalid_argument("Engine requires a metadata provider");
    if (opts_.progressInterval == 0) opts_.progressInterval = 1;
}

fs::path Engine::normalizeRoot(const fs::path& root) {
    if (root.empty()) return root;

    std::error_code ec;
    auto abs = fs::absolute(root, ec);
    if (ec) abs = root;

    auto normal = abs.lexically_normal();
    if (!normal.has_filename() && normal != normal.root_path()) normal = normal.parent_path();
    return normal;
}

void Engine::validateRoot(const fs::path& root) const {
    if (root.empty()) throw InvalidRootError("Invalid scan path: path is empty");

    try {
        if (!metadata_->exists(root))
            throw InvalidRootError("Invalid scan path: " + root.string() + " does not exist");
        if (!metadata_->isDirectory(root))
            throw InvalidRootError("Invalid scan path: " + root.string() + " is not a directory");
        if (!metadata_->isReadable(root))
            throw InvalidRootError("Invalid scan path: " + root.string() + " is not readable");
    } catch (const EntryAccessError& e) {
        throw InvalidRootError(std::string("Invalid scan path: ") + e.what());
    }
}

Outcome Engine::walk(Task& task) const {
    try {
        validateRoot(task.root());
        walkDirectory(task, task.root(), 1);
        return Outcome::completed();
    } catch (const Interrupted&) {
        log::Registry::scan()->debug("[Engine] {} stopped at checkpoint", task.id());
        return Outcome::aborted();
    } catch (const std::exception& e) {
        log::Registry::scan()->error("[Engine] {} failed: {}", task.id(), e.what());
        return Outcome::failed(e.what());
    }
}

void Engine::checkpoint(const Task& task) {
    if (task.isCancelled()) throw Interrupted(task.id());
}

void Engine::walkDirectory(Task& task, const fs::path& dir, const unsigned int depth) const {
    checkpoint(task);

    std::vector<DirEntry> entries;
    try {
        if (!metadata_->isReadable(dir)) throw EntryAccessError(dir, std::make_error_code(std::errc::permission_denied));
        entries = metadata_->list(dir);
    } catch (const EntryAccessError& e) {
        task.stats().recordError();
        log::Registry::scan()->debug("[Engine] Skipping directory: {}", e.what());
        return;
    }

    for (const auto& entry : entries) {
        checkpoint(task);

        try {
            switch (entry.kind) {
                case EntryKind::Directory:
                    task.stats().folder(entry.path);
                    if (depth < task.maxDepth()) walkDirectory(task, entry.path, depth + 1);
                    break;
                case EntryKind::File:
                    processFile(task, entry.path);
                    break;
                case EntryKind::Unknown:
                    throw EntryAccessError(entry.path, "unable to determine entry type");
                case EntryKind::Other:
                    break;
            }
        } catch (const EntryAccessError& e) {
            task.stats().recordError();
            log::Registry::scan()->debug("[Engine] Skipping entry: {}", e.what());
        }
    }
}

void Engine::processFile(Task& task, const fs::path& file) const {
    const auto size = metadata_->fileSize(file);
    const auto ext = Classifier::extensionOf(file);
    const auto parent = file.parent_path();

    auto& stats = task.stats();
    stats.recordFile(ext, size);
    stats.addToFolder(parent, size);

    if (Classifier::isApplication(file, ext))
        stats.recordApplication(Classifier::applicationName(file, ext), file, size);

    rollup(stats, parent, task.root().string(), size);

    ++stats.scannedCount;
    if (stats.scannedCount % opts_.progressInterval == 0) task.reportProgress(file);
}

void Engine::rollup(model::Stats& stats, const fs::path& folder, const std::string& root, const uintmax_t size) {
    auto current = folder.string();
    auto parent = folder.parent_path();

    while (true) {
        auto candidate = parent.string();

        // parent_path stops shrinking at the filesystem root
        if (candidate.size() >= current.size()) break;
        if (candidate.size() < root.size() || !candidate.starts_with(root)) break;

        stats.addToFolder(parent, size);
        current = std::move(candidate);
        parent = parent.parent_path();
    }
}
