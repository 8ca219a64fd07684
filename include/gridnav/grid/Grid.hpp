#pragma once
#include "gridnav/grid/Cell.hpp"
#include "gridnav/grid/GridSettings.hpp"
#include "gridnav/grid/Occupancy.hpp"
#include "gridnav/math/Vector.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace gridnav {

class TerrainProbe;

// Spatial index of walkable cells keyed by 2-D coordinate. Several cells can share a
// coordinate (bridge over ground); they keep the order they were added in.
//
// Threading: build the grid (AddCell, connections, tags) before searching it. After
// that, any number of searches may read it concurrently while the owning thread
// keeps refreshing occupancy.
class Grid {
public:
    using CellStack = std::vector<std::unique_ptr<Cell>>;

    // Throws std::invalid_argument on a non-positive cell size.
    explicit Grid(GridSettings settings);

    Grid(const Grid&) = delete;
    Grid& operator=(const Grid&) = delete;

    [[nodiscard]] const GridSettings& Settings() const noexcept { return _settings; }
    [[nodiscard]] const std::string& Identifier() const noexcept { return _settings.identifier; }
    [[nodiscard]] float CellSize() const noexcept { return _settings.cellSize; }
    [[nodiscard]] const BBox& WorldBounds() const noexcept { return _worldBounds; }

    // ---- coordinates ----
    [[nodiscard]] IVec2 PositionToCoordinates(const Vec3& position) const noexcept;
    // Centre of the column at `coordinates`, at height `z`.
    [[nodiscard]] Vec3 CoordinatesToPosition(IVec2 coordinates, float z = 0.0f) const noexcept;
    // Number of columns per axis covered by the bounds.
    [[nodiscard]] IVec2 Dimensions() const noexcept;

    [[nodiscard]] bool IsInsideBounds(const Vec3& point) const noexcept;
    [[nodiscard]] bool IsInsideCylinder(const Vec3& point) const noexcept;

    // ---- structure ----
    // Appends to the stack at the cell's coordinate. Throws std::invalid_argument on null.
    Cell* AddCell(std::unique_ptr<Cell> cell);
    void Clear();

    [[nodiscard]] const std::vector<Cell*>& AllCells() const noexcept { return _allCells; }
    [[nodiscard]] std::size_t CellCount() const noexcept { return _allCells.size(); }
    [[nodiscard]] const CellStack* Stack(IVec2 coordinates) const;
    [[nodiscard]] int StackIndexOf(const Cell& cell) const;

    // ---- lookups ----
    // First cell of the stack whose lowest corner minus the step size is under `height`.
    [[nodiscard]] Cell* GetCell(IVec2 coordinates, float height) const;
    // onlyBelow = false looks from the top of the bounds instead of from `position`.
    [[nodiscard]] Cell* GetCell(const Vec3& position, bool onlyBelow = true) const;
    // Full scan, use sparingly.
    [[nodiscard]] Cell* GetNearestCell(const Vec3& position, bool onlyBelow = true, bool unoccupiedOnly = false) const;
    // Spiral search around `position` covering `width`.
    [[nodiscard]] Cell* GetCellInArea(const Vec3& position, float width, bool onlyBelow = true,
                                      bool withinStepRange = true) const;

    [[nodiscard]] Cell* GetCellInDirection(const Cell& from, const Vec3& direction, int cells = 1) const;
    [[nodiscard]] Cell* GetNeighbourInDirection(const Cell& cell, const Vec3& direction) const;

    [[nodiscard]] static bool IsNeighbour(const Cell& a, const Cell& b) noexcept { return a.IsNeighbour(b); }
    [[nodiscard]] std::vector<Cell*> GetNeighbours(const Cell& cell) const;
    // Plain neighbours (untagged) followed by the cell's explicit connections.
    [[nodiscard]] std::vector<Connection> GetNeighbourAndConnections(const Cell& cell) const;

    // Unobstructed, unoccupied walk from cell to cell. Cells occupied by
    // `pathCreator` don't block.
    [[nodiscard]] bool LineOfSight(const Cell& start, const Cell& end, OccupantId pathCreator = kNoOccupant) const;

    // ---- tag queries ----
    [[nodiscard]] std::vector<Cell*> CellsWithTag(std::string_view tag) const;
    [[nodiscard]] std::vector<Cell*> CellsWithTags(const std::vector<std::string>& all) const;
    [[nodiscard]] std::vector<Cell*> CellsWithAnyTag(const std::vector<std::string>& any) const;

    // ---- runtime ----
    // Recomputes every cell's occupied flag. Returns how many are occupied.
    std::size_t CheckOccupancy(const TerrainProbe& probe, const OccupantSource* occupants, const std::string& tag);

    // Steps a clearance box along a jump arc until something blocks it or the arc
    // falls maxDropHeight below its apex. Returns where it stopped.
    [[nodiscard]] Vec3 TraceParabola(const TerrainProbe& probe, const Vec3& start, const Vec3& horizontalVelocity,
                                     float verticalSpeed, float gravity, float maxDropHeight, int subSteps = 2) const;

private:
    [[nodiscard]] Vec3 ToLocal(const Vec3& world) const noexcept;

    GridSettings _settings;
    BBox _worldBounds;
    std::unordered_map<IVec2, CellStack, IVec2Hash> _stacks;
    std::vector<Cell*> _allCells;
};

} // namespace gridnav
