#pragma once
#include "gridnav/grid/Cell.hpp"
#include "gridnav/grid/Connectivity.hpp"
#include "gridnav/grid/Grid.hpp"
#include "gridnav/grid/GridSettings.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <vector>

namespace gridnav {

class TerrainProbe;
namespace pf { class SearchExecutor; }

struct GenerationOptions {
    bool assignEdges = true;
    bool assignDrops = true;
    std::optional<JumpSettings> jumps;   // unset: no jump links
};

struct GenerationStats {
    std::size_t cells = 0;
    std::size_t edges = 0;
    std::size_t drops = 0;
    std::size_t jumps = 0;
    std::size_t rejected = 0;   // ground hits CellFactory turned down
    double      seconds = 0.0;
};

// Builds a grid from scratch: one downward ray scan per column (stacked floors
// become stacked cells, top first), then the connectivity passes.
class GridGenerator {
public:
    // Without an executor, columns are sampled on the calling thread.
    explicit GridGenerator(const TerrainProbe& probe, pf::SearchExecutor* executor = nullptr)
        : _probe(probe), _executor(executor) {}

    [[nodiscard]] std::unique_ptr<Grid> Generate(const GridSettings& settings, const GenerationOptions& options = {});

    // Column scan only; appends to `grid`.
    void Populate(Grid& grid);

    [[nodiscard]] const GenerationStats& LastStats() const noexcept { return _stats; }

    struct Column {
        std::vector<std::unique_ptr<Cell>> cells;
        std::size_t rejected = 0;
    };
    [[nodiscard]] static Column SampleColumn(const Grid& grid, const TerrainProbe& probe, IVec2 coordinates);

private:
    const TerrainProbe& _probe;
    pf::SearchExecutor* _executor;
    GenerationStats _stats;
};

} // namespace gridnav
