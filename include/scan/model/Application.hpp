#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ds::scan::model {

struct Application {
    std::string name;
    std::string path;   // first file that matched; empty for the placeholder
    uintmax_t size = 0;
};

void to_json(nlohmann::json& j, const Application& a);

}
