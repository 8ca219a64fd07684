#pragma once
#include "gridnav/grid/Cell.hpp"
#include "gridnav/grid/Occupancy.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace gridnav {
class Grid;
}

namespace gridnav::pf {

// One stop along a path: the cell, and how the mover gets onto it
// (empty = walk, otherwise the connection tag such as "drop").
struct Waypoint {
    const Cell* cell = nullptr;
    std::string movementTag;

    bool operator==(const Waypoint& o) const { return cell == o.cell && movementTag == o.movementTag; }
};

enum class SearchStatus : std::uint8_t {
    Found,      // reached the target
    Partial,    // target unreachable, path ends at the closest explored cell
    NotFound,   // target unreachable (or partial produced nothing)
    Cancelled   // token fired mid-search
};

const char* ToString(SearchStatus status) noexcept;

// What a path was produced with.
struct PathSettings {
    const Grid* grid        = nullptr;
    OccupantId  pathCreator = kNoOccupant;
    bool        partial     = false;
    float       maxDistance = 0.0f;   // 0 = unbounded
    bool        connections = true;   // follow drop/jump links
    bool        reversed    = false;
    bool        simplify    = true;
    int         segmentSize = 2;
    int         iterations  = 8;
};

struct Path {
    std::vector<Waypoint> nodes;
    PathSettings          settings;
    SearchStatus          status = SearchStatus::NotFound;

    static Path Empty(const PathSettings& s = {}, SearchStatus st = SearchStatus::NotFound) {
        Path p;
        p.settings = s;
        p.status = st;
        return p;
    }

    [[nodiscard]] bool IsEmpty() const noexcept { return nodes.empty(); }
    [[nodiscard]] std::size_t Count() const noexcept { return nodes.size(); }
    [[nodiscard]] const Waypoint& Front() const { return nodes.front(); }
    [[nodiscard]] const Waypoint& Back() const { return nodes.back(); }
    [[nodiscard]] const PathSettings& Settings() const noexcept { return settings; }

    // Sum of the 3-D segment lengths between consecutive waypoints.
    [[nodiscard]] float Length() const noexcept;

    // Chord-cutting pass: slides a window of `segmentSize` over the waypoints and
    // drops the interior whenever the window ends see each other. Keeps the first
    // and last waypoint. Needs settings.grid; without one it does nothing.
    // Returns the number of waypoints removed.
    std::size_t Simplify(int segmentSize = 2, int iterations = 8);
};

} // namespace gridnav::pf
