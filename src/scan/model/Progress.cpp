#include "scan/model/Progress.hpp"
#include "scan/model/Stats.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

using namespace ds::scan::model;

Progress::Progress(std::string taskId, const Stats& stats, std::string currentPath)
    : taskId(std::move(taskId)),
      scannedCount(stats.scannedCount),
      totalSize(stats.totalSize),
      errorCount(stats.errorCount),
      currentPath(std::move(currentPath)),
      percentage(estimatePercentage(stats.scannedCount)) {}

unsigned int Progress::estimatePercentage(const uintmax_t scannedCount) {
    return static_cast<unsigned int>(std::min<uintmax_t>(99, scannedCount / 100));
}

void ds::scan::model::to_json(nlohmann::json& j, const Progress& p) {
    j = {
        {"taskId", p.taskId},
        {"scannedCount", p.scannedCount},
        {"totalSize", p.totalSize},
        {"errorCount", p.errorCount},
        {"currentPath", p.currentPath},
        {"percentage", p.percentage}
    };
}
