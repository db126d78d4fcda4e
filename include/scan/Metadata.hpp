#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace ds::scan {

enum class EntryKind { File, Directory, Other, Unknown };

struct DirEntry {
    std::filesystem::path path;
    EntryKind kind = EntryKind::Unknown;
};

// Filesystem queries the engine depends on. Failures surface as EntryAccessError,
// distinct from a clean "does not exist" answer.
class Metadata {
public:
    virtual ~Metadata() = default;

    virtual bool exists(const std::filesystem::path& path) const = 0;
    virtual bool isDirectory(const std::filesystem::path& path) const = 0;
    virtual bool isReadable(const std::filesystem::path& path) const = 0;

    // Symbolic links are reported as Other and never followed.
    virtual std::vector<DirEntry> list(const std::filesystem::path& dir) const = 0;

    virtual uintmax_t fileSize(const std::filesystem::path& file) const = 0;
};

class LocalMetadata final : public Metadata {
public:
    bool exists(const std::filesystem::path& path) const override;
    bool isDirectory(const std::filesystem::path& path) const override;
    bool isReadable(const std::filesystem::path& path) const override;
    std::vector<DirEntry> list(const std::filesystem::path& dir) const override;
    uintmax_t fileSize(const std::filesystem::path& file) const override;
};

}
