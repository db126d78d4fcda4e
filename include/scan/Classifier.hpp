#pragma once

#include <filesystem>
#include <string>

namespace ds::scan {

inline constexpr const char* NO_EXTENSION = "no-extension";

struct Classifier {
    // Lowercase extension without the dot, or NO_EXTENSION.
    static std::string extensionOf(const std::filesystem::path& path);

    static std::string describe(const std::string& extension);

    static bool isExecutableExtension(const std::string& extension);
    static bool isInApplicationDirectory(const std::filesystem::path& path);
    static bool isApplication(const std::filesystem::path& path, const std::string& extension);

    // File name without its extension.
    static std::string applicationName(const std::filesystem::path& path, const std::string& extension);

    static std::string folderDisplayName(const std::filesystem::path& path);
};

}
