#include "gridnav/grid/Connectivity.hpp"
#include "gridnav/grid/Grid.hpp"
#include "gridnav/math/NavMath.hpp"
#include "gridnav/probe/TerrainProbe.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace gridnav {

std::size_t ConnectivityBuilder::AssignEdgeCells(int maxNeighbourCount) {
    std::size_t tagged = 0;
    for (Cell* cell : _grid.AllCells()) {
        if (static_cast<int>(_grid.GetNeighbours(*cell).size()) < maxNeighbourCount) {
            cell->Tags().Add(tags::kEdge);
            ++tagged;
        }
    }
    return tagged;
}

std::size_t ConnectivityBuilder::AssignDroppableCells() {
    std::size_t linked = 0;
    for (Cell* cell : _grid.CellsWithTag(tags::kEdge)) {
        if (Cell* target = GetFirstValidDroppable(*cell)) {
            cell->AddConnection(target, std::string(tags::kDrop));
            ++linked;
        }
    }
    spdlog::debug("Connectivity: {} drop links on '{}'", linked, _grid.Identifier());
    return linked;
}

Cell* ConnectivityBuilder::GetFirstValidDroppable(const Cell& cell, int minCellDistance, int maxCellDistance) const {
    return GetFirstValidDroppable(cell, minCellDistance, maxCellDistance, _grid.Settings().maxDropHeight);
}

Cell* ConnectivityBuilder::GetFirstValidDroppable(const Cell& cell, int minCellDistance, int maxCellDistance,
                                                  float maxHeightDistance) const {
    const GridSettings& s = _grid.Settings();
    const float step = s.RealStepSize();
    const float w = s.widthClearance * 0.5f;
    const BBox clearance{ Vec3{ -w, -w, 0.0f }, Vec3{ w, w, s.heightClearance - step } };
    const ProbeFilter filter = ProbeFilter::Generation(s.worldOnly);
    const IVec2 at = cell.GridPosition();
    const Vec3& pos = cell.Position();

    for (int y = 0; y <= maxCellDistance * 2; ++y) {
        const int sy = SpiralPattern(y);
        for (int x = 0; x <= maxCellDistance * 2; ++x) {
            const int sx = SpiralPattern(x);
            if (sx == 0 && sy == 0) continue;
            if (std::abs(sx) <= minCellDistance && std::abs(sy) <= minCellDistance) continue;

            Cell* found = _grid.GetCell(IVec2{ at.x + sx, at.y + sy }, pos.z);
            if (!found || found == &cell) continue;
            if (cell.IsNeighbour(*found)) continue;

            const float vertical = pos.z - found->Position().z;
            if (vertical > maxHeightDistance) continue;

            // Shallow relative to the horizontal offset: that's a slope or stairs, not a ledge.
            const float horizontal = std::sqrt(static_cast<float>(sx * sx + sy * sy)) - 1.0f;
            if (vertical < step * horizontal) continue;

            if (_grid.LineOfSight(cell, *found)) continue;

            const Vec3 overLedge = found->Position().WithZ(pos.z + step);
            if (_probe.BoxProbe(clearance, pos + Vec3::Up() * step, overLedge, filter).hit) continue;
            if (_probe.BoxProbe(clearance, overLedge, found->Position() + Vec3::Up() * step, filter).hit) continue;

            return found;
        }
    }
    return nullptr;
}

Cell* ConnectivityBuilder::LandingCell(const Cell& from, const Vec3& direction, float horizontalSpeed,
                                       float verticalSpeed, float gravity, float maxHeightDistance) const {
    const Vec3 end = _grid.TraceParabola(_probe, from.Position(), direction.WithZ(0.0f).Normal() * horizontalSpeed,
                                         verticalSpeed, gravity, maxHeightDistance);
    return _grid.GetCellInArea(end, _grid.Settings().widthClearance);
}

std::vector<Cell*> ConnectivityBuilder::GetValidJumpables(const Cell& cell, float horizontalSpeed, float verticalSpeed,
                                                          float gravity, int sidesToCheck, float maxHeightDistance) const {
    std::vector<Cell*> accepted;
    const float stepYaw = 360.0f / static_cast<float>(std::max(1, sidesToCheck));

    for (int side = 0; side < sidesToCheck; ++side) {
        const Vec3 direction = Rotation::FromYaw(stepYaw * static_cast<float>(side)).Forward();
        Cell* landing = LandingCell(cell, direction, horizontalSpeed, verticalSpeed, gravity, maxHeightDistance);
        if (!landing) continue;

        // Walkable already, or the same patch of ground as a link we have.
        if (_grid.LineOfSight(*landing, cell)) continue;
        const bool duplicate =
            std::any_of(accepted.begin(), accepted.end(),
                        [&](const Cell* other) { return _grid.LineOfSight(*landing, *other); }) ||
            std::any_of(cell.Connections().begin(), cell.Connections().end(),
                        [&](const Connection& c) { return _grid.LineOfSight(*landing, *c.target); });
        if (duplicate) continue;

        accepted.push_back(landing);
    }
    return accepted;
}

Cell* ConnectivityBuilder::GetValidJumpable(const Cell& cell, float horizontalSpeed, float verticalSpeed,
                                            float gravity, const Vec3& direction, float maxHeightDistance) const {
    Cell* landing = LandingCell(cell, direction, horizontalSpeed, verticalSpeed, gravity, maxHeightDistance);
    if (!landing || _grid.LineOfSight(*landing, cell)) return nullptr;
    return landing;
}

std::size_t ConnectivityBuilder::AssignJumpableCells(const JumpSettings& jump) {
    if (!(jump.gravity > 0.0f)) throw std::invalid_argument("AssignJumpableCells: gravity must be positive");
    if (!(jump.horizontalSpeed > 0.0f)) throw std::invalid_argument("AssignJumpableCells: horizontal speed must be positive");

    const float maxDrop = _grid.Settings().maxDropHeight;
    std::size_t linked = 0;
    float budget = 0.0f;

    for (Cell* cell : _grid.CellsWithTag(tags::kEdge)) {
        // Deterministic sampling: every 1/fraction-th edge cell gets tested.
        budget += jump.generateFraction;
        if (budget < 1.0f) continue;
        budget -= 1.0f;

        const auto landings = GetValidJumpables(*cell, jump.horizontalSpeed, jump.verticalSpeed, jump.gravity,
                                                jump.sidesToCheck, maxDrop);
        for (Cell* landing : landings) {
            cell->AddConnection(landing, jump.tag);
            ++linked;
        }

        // Try to jump back the way we came.
        for (Cell* landing : landings) {
            const Vec3 back = (cell->Position() - landing->Position()).WithZ(0.0f).Normal();
            if (Cell* target = GetValidJumpable(*landing, jump.horizontalSpeed, jump.verticalSpeed, jump.gravity,
                                                back, maxDrop)) {
                landing->AddConnection(target, jump.tag);
                ++linked;
            }
        }
    }

    spdlog::debug("Connectivity: {} '{}' links on '{}'", linked, jump.tag, _grid.Identifier());
    return linked;
}

std::size_t ConnectivityBuilder::AssignJumpableCells(const std::string& tag, float horizontalSpeed, float verticalSpeed,
                                                     float gravity, float generateFraction) {
    JumpSettings jump;
    jump.tag = tag;
    jump.horizontalSpeed = horizontalSpeed;
    jump.verticalSpeed = verticalSpeed;
    jump.gravity = gravity;
    jump.generateFraction = generateFraction;
    return AssignJumpableCells(jump);
}

} // namespace gridnav
