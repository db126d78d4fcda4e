#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace ds::scan {

// Root missing, unreadable or not a directory. Fails the task before it is registered.
struct InvalidRootError : std::runtime_error {
    explicit InvalidRootError(const std::string& msg) : std::runtime_error(msg) {}
};

// A single entry or listing could not be read. Counted and skipped, never fatal.
struct EntryAccessError : std::runtime_error {
    std::filesystem::path path;
    std::error_code code;

    EntryAccessError(std::filesystem::path p, const std::error_code& ec)
        : std::runtime_error(p.string() + ": " + ec.message()), path(std::move(p)), code(ec) {}

    EntryAccessError(std::filesystem::path p, const std::string& msg)
        : std::runtime_error(p.string() + ": " + msg), path(std::move(p)) {}
};

// Raised at cancellation checkpoints and caught at the walk boundary.
struct Interrupted : std::runtime_error {
    explicit Interrupted(const std::string& taskId) : std::runtime_error("Scan task " + taskId + " interrupted") {}
};

}
