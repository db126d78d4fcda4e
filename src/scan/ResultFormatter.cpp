#include "scan/ResultFormatter.hpp"
#include "scan/model/Stats.hpp"

#include <algorithm>

using namespace ds::scan;
using namespace ds::scan::model;

namespace {

template <typename T>
std::vector<T> topBySize(const std::unordered_map<std::string, T>& map, const size_t n) {
    std::vector<T> out;
    out.reserve(map.size());
    for (const auto& [_, value] : map)
        if (value.size > 0) out.push_back(value);

    const auto bySize = [](const T& a, const T& b) { return a.size > b.size; };
    if (out.size() > n) {
        std::partial_sort(out.begin(), out.begin() + static_cast<std::ptrdiff_t>(n), out.end(), bySize);
        out.resize(n);
    } else {
        std::ranges::sort(out, bySize);
    }
    return out;
}

}

ResultFormatter::ResultFormatter(const size_t topN) : topN_(topN == 0 ? DEFAULT_TOP_N : topN) {}

Result ResultFormatter::format(const Stats& stats) const {
    Result result{
        .totalFiles = stats.totalFiles,
        .totalSize = stats.totalSize,
        .fileTypes = topBySize(stats.fileTypes, topN_),
        .folders = topBySize(stats.folders, topN_),
        .applications = topBySize(stats.applications, topN_),
        .errorCount = stats.errorCount
    };

    // never empty
    if (result.applications.empty())
        result.applications.push_back(Application{UNRECOGNIZED_APPLICATION, {}, 1});

    return result;
}
