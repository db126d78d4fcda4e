#include "drives/model/Drive.hpp"

#include <nlohmann/json.hpp>

void ds::drives::model::to_json(nlohmann::json& j, const Drive& d) {
    j = {
        {"name", d.name},
        {"path", d.path},
        {"kind", d.kind}
    };
}
