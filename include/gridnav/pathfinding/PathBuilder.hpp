#pragma once
#include "gridnav/grid/Occupancy.hpp"
#include "gridnav/pathfinding/Path.hpp"
#include "gridnav/pathfinding/PathJobs.hpp"

#include <functional>
#include <future>
#include <utility>

namespace gridnav {
class Cell;
class Grid;
}

namespace gridnav::pf {

// Search configuration + orchestration: A*, then simplification.
//
//   auto path = PathBuilder::From(grid).WithPathCreator(me).WithPartialEnabled().Run(a, b);
//
// The grid must outlive every search started from the builder.
class PathBuilder {
public:
    explicit PathBuilder(const Grid& grid) { _settings.grid = &grid; }
    static PathBuilder From(const Grid& grid) { return PathBuilder(grid); }

    PathBuilder& WithPathCreator(OccupantId creator) { _settings.pathCreator = creator; return *this; }
    PathBuilder& WithPartialEnabled(bool enabled = true) { _settings.partial = enabled; return *this; }
    PathBuilder& WithMaxDistance(float distance) { _settings.maxDistance = distance; return *this; }
    PathBuilder& WithConnections(bool enabled = true) { _settings.connections = enabled; return *this; }
    PathBuilder& WithReversed(bool enabled = true) { _settings.reversed = enabled; return *this; }
    PathBuilder& WithSimplify(int segmentSize = 2, int iterations = 8) {
        _settings.simplify = true;
        _settings.segmentSize = segmentSize;
        _settings.iterations = iterations;
        return *this;
    }
    PathBuilder& WithoutSimplify() { _settings.simplify = false; return *this; }

    // Called for each expanded cell. Raced searches call it from both workers at once.
    PathBuilder& WithExpansionObserver(std::function<void(const Cell&)> observer) {
        _onExpand = std::move(observer);
        return *this;
    }

    [[nodiscard]] const PathSettings& Settings() const noexcept { return _settings; }
    [[nodiscard]] const Grid& GetGrid() const noexcept { return *_settings.grid; }

    // Blocking search on the calling thread. Throws std::invalid_argument on null cells.
    [[nodiscard]] Path Run(const Cell* start, const Cell* target, const CancelToken* token = nullptr) const;

    // Search on the executor. Null cells throw here, before anything is queued.
    [[nodiscard]] std::future<Path> RunAsync(SearchExecutor& executor, const Cell* start, const Cell* target,
                                             CancelTokenPtr token = nullptr) const;

    // Races start -> target against target -> start (plain neighbours only, handed
    // back start-first) and resolves with the first path found. The slower search
    // is cancelled as soon as a winner is known. If neither finds one, resolves with
    // the forward search's result.
    [[nodiscard]] std::future<Path> RunParallelAsync(SearchExecutor& executor, const Cell* start, const Cell* target,
                                                     CancelTokenPtr token = nullptr) const;

private:
    PathSettings _settings;
    std::function<void(const Cell&)> _onExpand;
};

} // namespace gridnav::pf
