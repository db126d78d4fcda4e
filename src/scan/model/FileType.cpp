#include "scan/model/FileType.hpp"

#include <nlohmann/json.hpp>

void ds::scan::model::to_json(nlohmann::json& j, const FileType& t) {
    j = {
        {"name", t.extension},
        {"type", t.extension},
        {"description", t.description},
        {"count", t.count},
        {"size", t.size}
    };
}
