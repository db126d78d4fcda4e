#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ds::scan::model {

struct Folder {
    std::string name;   // display name
    std::string path;   // absolute
    uintmax_t size = 0; // cumulative over the visited subtree
};

void to_json(nlohmann::json& j, const Folder& f);

}
