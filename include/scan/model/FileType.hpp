#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace ds::scan::model {

struct FileType {
    std::string extension;     // lowercase, no leading dot, or NO_EXTENSION
    std::string description;
    uintmax_t count = 0;
    uintmax_t size = 0;
};

void to_json(nlohmann::json& j, const FileType& t);

}
