#include "scan/model/Stats.hpp"
#include "scan/Classifier.hpp"

using namespace ds::scan;
using namespace ds::scan::model;

Folder& Stats::folder(const std::filesystem::path& path) {
    const auto key = path.string();
    auto it = folders.find(key);
    if (it == folders.end())
        it = folders.emplace(key, Folder{Classifier::folderDisplayName(path), key, 0}).first;
    return it->second;
}

void Stats::recordFile(const std::string& extension, const uintmax_t size) {
    ++totalFiles;
    totalSize += size;

    auto it = fileTypes.find(extension);
    if (it == fileTypes.end())
        it = fileTypes.emplace(extension, FileType{extension, Classifier::describe(extension), 0, 0}).first;

    ++it->second.count;
    it->second.size += size;
}

void Stats::recordApplication(const std::string& name, const std::filesystem::path& path, const uintmax_t size) {
    auto it = applications.find(name);
    if (it == applications.end())
        it = applications.emplace(name, Application{name, path.string(), 0}).first;
    it->second.size += size;
}

void Stats::addToFolder(const std::filesystem::path& path, const uintmax_t size) {
    folder(path).size += size;
}
