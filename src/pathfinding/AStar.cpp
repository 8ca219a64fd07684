#include "gridnav/pathfinding/AStar.hpp"
#include "gridnav/grid/Grid.hpp"
#include "gridnav/pathfinding/PathJobs.hpp"

#include <algorithm>
#include <stdexcept>

namespace gridnav::pf {

int AStar::NodeFor(const Cell* cell) {
    const auto [it, inserted] = _ids.try_emplace(cell, static_cast<int>(_nodes.size()));
    if (inserted) {
        Node n;
        n.cell = cell;
        _nodes.push_back(std::move(n));
    }
    return it->second;
}

std::vector<Waypoint> AStar::Reconstruct(int goal) const {
    std::vector<Waypoint> out;
    for (int cur = goal; cur != -1; cur = _nodes[cur].parent)
        out.push_back(Waypoint{ _nodes[cur].cell, _nodes[cur].tag });
    if (!_cfg.reversed) std::reverse(out.begin(), out.end());
    return out;
}

SearchResult AStar::FindPath(const Cell* start, const Cell* target, const CancelToken* token) {
    if (!start || !target) throw std::invalid_argument("AStar::FindPath: null start or target cell");

    _nodes.clear();
    _ids.clear();
    _open.Reset(64);

    SearchResult result;
    const Vec3& startPos = start->Position();
    const Vec3& targetPos = target->Position();

    const int sid = NodeFor(start);
    _nodes[sid].h = startPos.Distance(targetPos);
    _open.PushOrDecrease(sid, _nodes[sid].h);

    // Closest explored node to the target: lowest h, then lowest f.
    int best = sid;

    while (!_open.Empty()) {
        if (token && token->IsCancelled()) {
            result.status = SearchStatus::Cancelled;
            return result;
        }

        const int cur = _open.PopMin();
        _nodes[cur].closed = true;
        ++result.expanded;
        if (_cfg.onExpand) _cfg.onExpand(*_nodes[cur].cell);

        if (_nodes[cur].cell == target) {
            result.waypoints = Reconstruct(cur);
            result.status = SearchStatus::Found;
            return result;
        }

        const Node& b = _nodes[best];
        const Node& c = _nodes[cur];
        if (c.h < b.h || (c.h == b.h && c.g + c.h < b.g + b.h)) best = cur;

        const Cell& from = *_nodes[cur].cell;
        auto edges = _cfg.connections ? _grid.GetNeighbourAndConnections(from)
                                      : std::vector<Connection>{};
        if (!_cfg.connections)
            for (Cell* n : _grid.GetNeighbours(from)) edges.push_back(Connection{ n, {} });

        for (Connection& edge : edges) {
            const Cell* next = edge.target;
            if (!next || next->IsBlockedFor(_cfg.pathCreator)) continue;
            if (_cfg.maxDistance > 0.0f && next->Position().Distance(startPos) > _cfg.maxDistance) continue;

            const auto known = _ids.find(next);
            if (known != _ids.end() && _nodes[known->second].closed) continue;

            const float g = _nodes[cur].g + from.Position().Distance(next->Position());
            const bool seen = known != _ids.end();
            const int nid = seen ? known->second : NodeFor(next);

            Node& n = _nodes[nid];
            if (!seen || g < n.g) {
                n.g = g;
                n.h = next->Position().Distance(targetPos);
                n.parent = cur;
                n.tag = std::move(edge.tag);
                _open.PushOrDecrease(nid, n.g + n.h);
            }
        }
    }

    if (_cfg.partial && best != sid) {
        result.waypoints = Reconstruct(best);
        result.status = SearchStatus::Partial;
    }
    return result;
}

} // namespace gridnav::pf
