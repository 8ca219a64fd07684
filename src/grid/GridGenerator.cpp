#include "gridnav/grid/GridGenerator.hpp"
#include "gridnav/grid/CellFactory.hpp"
#include "gridnav/pathfinding/PathJobs.hpp"
#include "gridnav/probe/TerrainProbe.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace gridnav {

namespace {
constexpr int kMaxLayersPerColumn = 64;
}

GridGenerator::Column GridGenerator::SampleColumn(const Grid& grid, const TerrainProbe& probe, IVec2 coordinates) {
    const GridSettings& s = grid.Settings();
    const ProbeFilter filter = ProbeFilter::Generation(s.worldOnly);
    const float top = grid.WorldBounds().maxs.z;
    const float bottom = grid.WorldBounds().mins.z;
    const float nudge = std::max(s.RealStepSize(), 1.0f);

    Column column;
    Vec3 from = grid.CoordinatesToPosition(coordinates, top);

    for (int layer = 0; layer < kMaxLayersPerColumn && from.z > bottom; ++layer) {
        const RayHit hit = probe.RayProbe(from, from.WithZ(bottom), filter);
        if (hit.startedSolid) {
            // Inside a floor slab; sink until we are out the other side.
            from.z -= nudge;
            continue;
        }
        if (!hit.hit) break;

        if (!s.cylinderShaped || grid.IsInsideCylinder(hit.position)) {
            if (auto cell = CellFactory::TryCreate(grid, probe, hit.position))
                column.cells.push_back(std::move(cell));
            else
                ++column.rejected;
        }
        from = hit.position.WithZ(hit.position.z - 1.0f);
    }
    return column;
}

void GridGenerator::Populate(Grid& grid) {
    const IVec2 dims = grid.Dimensions();
    const int count = dims.x * dims.y;
    std::vector<Column> columns(static_cast<std::size_t>(std::max(count, 0)));

    auto sample = [&](int i) {
        const IVec2 c{ i % dims.x, i / dims.x };
        columns[static_cast<std::size_t>(i)] = SampleColumn(grid, _probe, c);
    };

    if (_executor && count > 1) _executor->ParallelForIndex(0, count, 1, sample);
    else for (int i = 0; i < count; ++i) sample(i);

    // Merge in row order so stacks are identical no matter how columns were scheduled.
    for (Column& column : columns) {
        _stats.rejected += column.rejected;
        for (auto& cell : column.cells) grid.AddCell(std::move(cell));
    }
    _stats.cells = grid.CellCount();
}

std::unique_ptr<Grid> GridGenerator::Generate(const GridSettings& settings, const GenerationOptions& options) {
    const auto t0 = std::chrono::steady_clock::now();
    _stats = {};

    auto grid = std::make_unique<Grid>(settings);
    Populate(*grid);

    ConnectivityBuilder links(*grid, _probe);
    if (options.assignEdges) _stats.edges = links.AssignEdgeCells();
    if (options.assignEdges && options.assignDrops) _stats.drops = links.AssignDroppableCells();
    if (options.assignEdges && options.jumps) _stats.jumps = links.AssignJumpableCells(*options.jumps);

    _stats.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    spdlog::info("GridGenerator: '{}' built {} cells ({} edge, {} drop, {} jump, {} rejected) in {:.3f}s",
                 grid->Identifier(), _stats.cells, _stats.edges, _stats.drops, _stats.jumps,
                 _stats.rejected, _stats.seconds);
    return grid;
}

} // namespace gridnav
