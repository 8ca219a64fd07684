#pragma once
#include "gridnav/grid/Cell.hpp"
#include "gridnav/math/Vector.hpp"

#include <memory>

namespace gridnav {

class Grid;
class TerrainProbe;

// Samples terrain under one column and decides whether a walkable cell sits there.
class CellFactory {
public:
    // Walkability verdict of the corner samples.
    struct Classification {
        bool walkable = false;
        bool step     = false;
    };

    // `position` is the ground point at the centre of the column.
    // Returns nullptr when the location is rejected (embedded corner, missing
    // ground, too steep, wall, not enough clearance).
    [[nodiscard]] static std::unique_ptr<Cell> TryCreate(const Grid& grid, const TerrainProbe& probe,
                                                         const Vec3& position);

    // Height band the corner rays search in, above and below the centre.
    [[nodiscard]] static float MaxCornerHeight(const GridSettings& settings) noexcept;

    // Staircase detection between the lowest corners and the highest one.
    [[nodiscard]] static Classification ClassifySteps(const GridSettings& settings, const TerrainProbe& probe,
                                                      const Vec3& position, const std::array<Vec3, 4>& corners);

    [[nodiscard]] static bool TestForClearance(const GridSettings& settings, const TerrainProbe& probe,
                                               const Vec3& position);

private:
    static Classification TestForStep(const GridSettings& settings, const TerrainProbe& probe,
                                      const Vec3& start, const Vec3& end,
                                      const Vec3& highest, const Vec3& lowest);
};

} // namespace gridnav
