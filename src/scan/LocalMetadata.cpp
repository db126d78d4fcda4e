#include "scan/Metadata.hpp"
#include "scan/errors.hpp"

#include <cerrno>
#include <unistd.h>

using namespace ds::scan;
namespace fs = std::filesystem;

bool LocalMetadata::exists(const fs::path& path) const {
    std::error_code ec;
    const auto st = fs::symlink_status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
        throw EntryAccessError(path, ec);
    return fs::exists(st);
}

bool LocalMetadata::isDirectory(const fs::path& path) const {
    std::error_code ec;
    const auto st = fs::status(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) throw EntryAccessError(path, ec);
    return fs::is_directory(st);
}

bool LocalMetadata::isReadable(const fs::path& path) const {
    if (::access(path.c_str(), R_OK) == 0) return true;
    if (errno == EACCES || errno == EROFS) return false;
    throw EntryAccessError(path, std::error_code(errno, std::generic_category()));
}

std::vector<DirEntry> LocalMetadata::list(const fs::path& dir) const {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) throw EntryAccessError(dir, ec);

    std::vector<DirEntry> entries;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) throw EntryAccessError(dir, ec);

        DirEntry entry{it->path(), EntryKind::Unknown};

        std::error_code stEc;
        const auto st = it->symlink_status(stEc);
        if (!stEc) {
            if (fs::is_directory(st)) entry.kind = EntryKind::Directory;
            else if (fs::is_regular_file(st)) entry.kind = EntryKind::File;
            else entry.kind = EntryKind::Other;
        }

        entries.push_back(std::move(entry));
    }
    if (ec) throw EntryAccessError(dir, ec);

    return entries;
}

uintmax_t LocalMetadata::fileSize(const fs::path& file) const {
    std::error_code ec;
    const auto size = fs::file_size(file, ec);
    if (ec) throw EntryAccessError(file, ec);
    return size;
}
