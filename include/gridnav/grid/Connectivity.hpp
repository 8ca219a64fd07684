#pragma once
#include "gridnav/grid/Cell.hpp"
#include "gridnav/grid/GridSettings.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace gridnav {

class Grid;
class TerrainProbe;

// Launch parameters for jump links.
struct JumpSettings {
    std::string tag             = "jump";
    float horizontalSpeed       = 300.0f;
    float verticalSpeed         = 300.0f;
    float gravity               = 800.0f;
    float generateFraction      = 0.2f;  // 0.1 = try roughly one edge cell in ten
    int   sidesToCheck          = 8;
};

// Synthesizes edges the plain corner-matching adjacency misses: "edge" tags on
// ledge/boundary cells, then drop and jump links off them. Run during the
// generation phase only; it mutates cell tags and connections.
class ConnectivityBuilder {
public:
    ConnectivityBuilder(Grid& grid, const TerrainProbe& probe) : _grid(grid), _probe(probe) {}

    // Tags every cell with fewer than `maxNeighbourCount` plain neighbours as "edge".
    std::size_t AssignEdgeCells(int maxNeighbourCount = 8);

    // Links each edge cell to the first lower cell it can safely drop onto.
    std::size_t AssignDroppableCells();

    // Links edge cells to cells reachable by a jump arc. Throws std::invalid_argument
    // on non-positive gravity or horizontal speed.
    std::size_t AssignJumpableCells(const JumpSettings& jump);
    std::size_t AssignJumpableCells(const std::string& tag, float horizontalSpeed, float verticalSpeed,
                                    float gravity, float generateFraction = 0.2f);

    // First cell between the min and max rings that is lower, not walkable to, and
    // reachable by walking off the ledge and falling straight down.
    [[nodiscard]] Cell* GetFirstValidDroppable(const Cell& cell, int minCellDistance = 1, int maxCellDistance = 3) const;
    [[nodiscard]] Cell* GetFirstValidDroppable(const Cell& cell, int minCellDistance, int maxCellDistance,
                                               float maxHeightDistance) const;

    [[nodiscard]] std::vector<Cell*> GetValidJumpables(const Cell& cell, float horizontalSpeed, float verticalSpeed,
                                                       float gravity, int sidesToCheck, float maxHeightDistance) const;
    // Single arc in `direction`; nullptr when it lands nowhere new.
    [[nodiscard]] Cell* GetValidJumpable(const Cell& cell, float horizontalSpeed, float verticalSpeed,
                                         float gravity, const Vec3& direction, float maxHeightDistance) const;

private:
    [[nodiscard]] Cell* LandingCell(const Cell& from, const Vec3& direction, float horizontalSpeed,
                                    float verticalSpeed, float gravity, float maxHeightDistance) const;

    Grid& _grid;
    const TerrainProbe& _probe;
};

} // namespace gridnav
