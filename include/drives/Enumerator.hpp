#pragma once

#include "drives/model/Drive.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace ds::drives {

class Enumerator {
public:
    static constexpr const char* MOUNTS_PATH = "/proc/self/mounts";

    // Mounted filesystems worth scanning. Never empty.
    static std::vector<model::Drive> list(const std::filesystem::path& mounts = MOUNTS_PATH);

    // Parses fstab-formatted mount lines. Pseudo filesystems and repeated mount points are skipped.
    static std::vector<model::Drive> parse(std::istream& in);

    static std::vector<model::Drive> fallback();

    static bool isPseudoFilesystem(const std::string& fsType);
    static bool isNetworkFilesystem(const std::string& fsType);

    // Undoes the octal escaping the kernel applies to spaces, tabs and newlines.
    static std::string unescape(const std::string& field);
};

}
