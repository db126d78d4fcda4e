#include "scan/model/Application.hpp"

#include <nlohmann/json.hpp>

void ds::scan::model::to_json(nlohmann::json& j, const Application& a) {
    j = {
        {"name", a.name},
        {"size", a.size}
    };
    if (!a.path.empty()) j["path"] = a.path;
}
