#pragma once

#include "scan/model/Application.hpp"
#include "scan/model/FileType.hpp"
#include "scan/model/Folder.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace ds::scan::model {

// Accumulator for a single scan. One writer only: the walk that owns it.
struct Stats {
    uintmax_t totalFiles = 0;
    uintmax_t totalSize = 0;
    uintmax_t scannedCount = 0;
    uintmax_t errorCount = 0;

    std::unordered_map<std::string, FileType> fileTypes;
    std::unordered_map<std::string, Folder> folders;
    std::unordered_map<std::string, Application> applications;

    // Returns the entry for path, creating it on first sight.
    Folder& folder(const std::filesystem::path& path);

    void recordFile(const std::string& extension, uintmax_t size);
    void recordApplication(const std::string& name, const std::filesystem::path& path, uintmax_t size);
    void addToFolder(const std::filesystem::path& path, uintmax_t size);
    void recordError() { ++errorCount; }
};

}
