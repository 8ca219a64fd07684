#include "gridnav/pathfinding/Path.hpp"
#include "gridnav/grid/Grid.hpp"

#include <algorithm>

namespace gridnav::pf {

const char* ToString(SearchStatus status) noexcept {
    switch (status) {
        case SearchStatus::Found:     return "found";
        case SearchStatus::Partial:   return "partial";
        case SearchStatus::NotFound:  return "not found";
        case SearchStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

float Path::Length() const noexcept {
    float total = 0.0f;
    for (std::size_t i = 1; i < nodes.size(); ++i)
        total += nodes[i - 1].cell->Position().Distance(nodes[i].cell->Position());
    return total;
}

std::size_t Path::Simplify(int segmentSize, int iterations) {
    if (!settings.grid || segmentSize < 2 || nodes.size() <= 2) return 0;
    const std::size_t before = nodes.size();

    for (int pass = 0; pass < iterations; ++pass) {
        bool changed = false;
        std::size_t s = 0;
        std::size_t e = std::min<std::size_t>(static_cast<std::size_t>(segmentSize), nodes.size() - 1);

        while (nodes.size() > 2 && e >= s + 2) {
            if (settings.grid->LineOfSight(*nodes[s].cell, *nodes[e].cell, settings.pathCreator)) {
                nodes.erase(nodes.begin() + static_cast<std::ptrdiff_t>(s + 1),
                            nodes.begin() + static_cast<std::ptrdiff_t>(e));
                nodes[s + 1].movementTag.clear(); // walked now
                changed = true;
            }
            if (s + 2 >= nodes.size()) break;
            ++s;
            e = std::min(s + static_cast<std::size_t>(segmentSize), nodes.size() - 1);
        }
        if (!changed) break;
    }
    return before - nodes.size();
}

} // namespace gridnav::pf
