#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ds::drives::model {

struct Drive {
    std::string name;
    std::string path;
    std::string kind;   // "local" or "network"
};

void to_json(nlohmann::json& j, const Drive& d);

}
