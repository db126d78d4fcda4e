#include "scan/model/Result.hpp"

#include <nlohmann/json.hpp>

void ds::scan::model::to_json(nlohmann::json& j, const Result& r) {
    j = {
        {"totalFiles", r.totalFiles},
        {"totalSize", r.totalSize},
        {"fileTypes", r.fileTypes},
        {"folders", r.folders},
        {"applications", r.applications},
        {"errorCount", r.errorCount}
    };
}
