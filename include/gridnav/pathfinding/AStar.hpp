#pragma once
#include "gridnav/grid/Cell.hpp"
#include "gridnav/grid/Occupancy.hpp"
#include "gridnav/pathfinding/IndexedPriorityQueue.hpp"
#include "gridnav/pathfinding/Path.hpp"

#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gridnav {
class Grid;
}

namespace gridnav::pf {

class CancelToken;

struct AStarConfig {
    OccupantId pathCreator = kNoOccupant; // cells it occupies don't block
    bool  partial          = false;       // return a path to the closest explored cell on failure
    float maxDistance      = 0.0f;        // don't expand cells farther than this from the start (0 = off)
    bool  connections      = true;        // follow explicit drop/jump links
    bool  reversed         = false;       // hand the waypoints back target -> start

    // Sees every cell as it is expanded, on the searching thread.
    std::function<void(const Cell&)> onExpand;
};

struct SearchResult {
    std::vector<Waypoint> waypoints;      // includes start and the last cell reached
    SearchStatus          status = SearchStatus::NotFound;
    std::size_t           expanded = 0;
};

// A* over the cell graph. Step cost and heuristic are both the 3-D distance between
// cell centres. One instance per search; the grid is only read.
class AStar {
public:
    explicit AStar(const Grid& grid, AStarConfig cfg = {}) : _grid(grid), _cfg(cfg) {}

    // Throws std::invalid_argument on a null start or target.
    SearchResult FindPath(const Cell* start, const Cell* target, const CancelToken* token = nullptr);

private:
    struct Node {
        const Cell* cell = nullptr;
        float g = 0.0f;
        float h = 0.0f;
        int   parent = -1;
        std::string tag;     // movement tag of the edge parent -> this
        bool  closed = false;
    };

    int NodeFor(const Cell* cell);
    std::vector<Waypoint> Reconstruct(int goal) const;

    const Grid& _grid;
    AStarConfig _cfg;
    std::vector<Node> _nodes;
    std::unordered_map<const Cell*, int> _ids;
    IndexedPriorityQueue _open;
};

} // namespace gridnav::pf
