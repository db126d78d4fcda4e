#include "scan/model/Folder.hpp"

#include <nlohmann/json.hpp>

void ds::scan::model::to_json(nlohmann::json& j, const Folder& f) {
    j = {
        {"name", f.name},
        {"path", f.path},
        {"size", f.size}
    };
}
