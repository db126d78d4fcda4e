#pragma once

#include "scan/model/Application.hpp"
#include "scan/model/FileType.hpp"
#include "scan/model/Folder.hpp"

#include <cstdint>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ds::scan::model {

struct Result {
    uintmax_t totalFiles = 0;
    uintmax_t totalSize = 0;
    std::vector<FileType> fileTypes;
    std::vector<Folder> folders;
    std::vector<Application> applications;
    uintmax_t errorCount = 0;
};

void to_json(nlohmann::json& j, const Result& r);

}
