#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ds::scan::model {

struct Stats;

struct Progress {
    std::string taskId;
    uintmax_t scannedCount = 0;
    uintmax_t totalSize = 0;
    uintmax_t errorCount = 0;
    std::string currentPath;
    unsigned int percentage = 0;

    Progress(std::string taskId, const Stats& stats, std::string currentPath);

    // Coarse estimate, the amount of work is unknown up front. Never reaches 100.
    static unsigned int estimatePercentage(uintmax_t scannedCount);
};

void to_json(nlohmann::json& j, const Progress& p);

}
