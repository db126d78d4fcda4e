#pragma once

#include "scan/model/Result.hpp"

#include <cstddef>

namespace ds::scan {

namespace model { struct Stats; }

class ResultFormatter {
public:
    static constexpr const char* UNRECOGNIZED_APPLICATION = "unrecognized";
    static constexpr size_t DEFAULT_TOP_N = 20;

    explicit ResultFormatter(size_t topN = DEFAULT_TOP_N);

    // Top N of each category by size, descending. Zero-sized entries are dropped.
    model::Result format(const model::Stats& stats) const;

private:
    size_t topN_;
};

}
