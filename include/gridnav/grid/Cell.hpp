#pragma once
#include "gridnav/grid/CellTags.hpp"
#include "gridnav/grid/GridSettings.hpp"
#include "gridnav/grid/Occupancy.hpp"
#include "gridnav/math/BBox.hpp"
#include "gridnav/math/Vector.hpp"

#include <array>
#include <atomic>
#include <string>
#include <vector>

namespace gridnav {

class Cell;
class TerrainProbe;

// A traversable link that is not (necessarily) a plain geometric neighbour.
// An empty tag means walk; otherwise the movement style ("drop", "jump", ...).
struct Connection {
    Cell*       target = nullptr;
    std::string tag;
};

// Corner order used everywhere: 0 = bottom-left (-x,-y), 1 = bottom-right (-x,+y),
// 2 = top-left (+x,-y), 3 = top-right (+x,+y), in the grid's local frame.
enum Corner : int { kBottomLeft = 0, kBottomRight = 1, kTopLeft = 2, kTopRight = 3 };

// One walkable quad patch. Owned by its Grid; address is identity and stays stable.
// Geometry never changes after construction. Tags and occupancy are runtime state.
class Cell {
public:
    Cell(IVec2 gridPosition, Vec3 position, std::array<float, 4> vertices);

    Cell(const Cell&) = delete;
    Cell& operator=(const Cell&) = delete;

    // ---- geometry ----
    [[nodiscard]] IVec2 GridPosition() const noexcept { return _gridPosition; }
    [[nodiscard]] const Vec3& Position() const noexcept { return _position; }
    [[nodiscard]] const std::array<float, 4>& Vertices() const noexcept { return _vertices; }

    [[nodiscard]] float MinVertex() const noexcept;
    [[nodiscard]] float MaxVertex() const noexcept;
    [[nodiscard]] float Height() const noexcept { return MaxVertex() - MinVertex(); }
    [[nodiscard]] Vec3 Bottom() const noexcept { return _position.WithZ(MinVertex()); }

    [[nodiscard]] Vec3 CornerPosition(Corner corner, const GridSettings& settings) const noexcept;
    [[nodiscard]] Vec3 BottomLeft(const GridSettings& s) const noexcept  { return CornerPosition(kBottomLeft, s); }
    [[nodiscard]] Vec3 BottomRight(const GridSettings& s) const noexcept { return CornerPosition(kBottomRight, s); }
    [[nodiscard]] Vec3 TopLeft(const GridSettings& s) const noexcept     { return CornerPosition(kTopLeft, s); }
    [[nodiscard]] Vec3 TopRight(const GridSettings& s) const noexcept    { return CornerPosition(kTopRight, s); }

    // Clearance volume a mover needs on this cell, local to Position().
    [[nodiscard]] static BBox Bounds(const GridSettings& settings) noexcept;
    [[nodiscard]] BBox WorldBounds(const GridSettings& settings) const noexcept {
        return Bounds(settings).Translate(_position);
    }

    // Coordinates differ by at most one per axis and the shared corners line up.
    [[nodiscard]] bool IsNeighbour(const Cell& other) const noexcept;

    // ---- tags ----
    [[nodiscard]] CellTags& Tags() noexcept { return _tags; }
    [[nodiscard]] const CellTags& Tags() const noexcept { return _tags; }

    // ---- occupancy ----
    void SetOccupant(OccupantId id, const Pose& pose);
    void ClearOccupant();
    [[nodiscard]] bool IsOccupied() const noexcept { return _tags.Has(CellTags::Occupied); }
    [[nodiscard]] OccupantId Occupant() const noexcept { return _occupant.load(std::memory_order_relaxed); }
    [[nodiscard]] bool IsOccupiedBy(OccupantId id) const noexcept { return IsOccupied() && Occupant() == id; }

    // Occupied by anything other than `pathCreator` (kNoOccupant exempts nobody).
    [[nodiscard]] bool IsBlockedFor(OccupantId pathCreator) const noexcept {
        if (!IsOccupied()) return false;
        return pathCreator == kNoOccupant || Occupant() != pathCreator;
    }

    // Recomputes the occupied flag. A recorded occupant that has not moved since it
    // was seen keeps the cell without probing again. Main thread only.
    bool TestForOccupancy(const TerrainProbe& probe, const GridSettings& settings,
                          const OccupantSource* occupants, const std::string& tag);

    // ---- explicit connections ----
    void AddConnection(Cell* target, std::string tag);
    void ClearConnections() { _connections.clear(); }
    [[nodiscard]] const std::vector<Connection>& Connections() const noexcept { return _connections; }
    [[nodiscard]] bool HasConnectionTo(const Cell* target) const noexcept;

private:
    IVec2                 _gridPosition;
    Vec3                  _position;
    std::array<float, 4>  _vertices;

    CellTags                 _tags;
    std::atomic<OccupantId>  _occupant{kNoOccupant};
    Pose                     _occupantPose{};
    std::vector<Connection>  _connections;
};

} // namespace gridnav
