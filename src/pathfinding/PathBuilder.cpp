#include "gridnav/pathfinding/PathBuilder.hpp"
#include "gridnav/grid/Grid.hpp"
#include "gridnav/pathfinding/AStar.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace gridnav::pf {

namespace {

void RequireCells(const Cell* start, const Cell* target) {
    if (!start || !target) throw std::invalid_argument("PathBuilder: null start or target cell");
}

// Shared by both sides of a race; whoever settles it first wins.
struct RaceState {
    std::promise<Path>  promise;
    std::mutex          mx;
    bool                settled = false;
    int                 pending = 2;
    std::optional<Path> forward;

    void Finish(Path path, bool isForward, CancelToken& race) {
        std::lock_guard<std::mutex> lk(mx);
        --pending;
        if (settled) return;
        if (path.status == SearchStatus::Found) {
            settled = true;
            race.Cancel();
            promise.set_value(std::move(path));
            return;
        }
        if (isForward) forward = std::move(path);
        if (pending == 0) {
            settled = true;
            promise.set_value(forward ? std::move(*forward) : Path::Empty());
        }
    }

    void Fail(std::exception_ptr error, CancelToken& race) {
        std::lock_guard<std::mutex> lk(mx);
        --pending;
        if (settled) return;
        settled = true;
        race.Cancel();
        promise.set_exception(std::move(error));
    }
};

} // namespace

Path PathBuilder::Run(const Cell* start, const Cell* target, const CancelToken* token) const {
    RequireCells(start, target);

    AStarConfig cfg;
    cfg.pathCreator = _settings.pathCreator;
    cfg.partial = _settings.partial;
    cfg.maxDistance = _settings.maxDistance;
    cfg.connections = _settings.connections;
    cfg.reversed = _settings.reversed;
    cfg.onExpand = _onExpand;

    AStar search(*_settings.grid, cfg);
    SearchResult found = search.FindPath(start, target, token);

    Path path;
    path.settings = _settings;
    path.status = found.status;
    path.nodes = std::move(found.waypoints);
    if (path.nodes.empty() && path.status == SearchStatus::Partial) path.status = SearchStatus::NotFound;

    if (_settings.simplify && !path.IsEmpty())
        path.Simplify(_settings.segmentSize, _settings.iterations);

    spdlog::debug("PathBuilder: {} after {} expansions, {} waypoints",
                  ToString(path.status), found.expanded, path.Count());
    return path;
}

std::future<Path> PathBuilder::RunAsync(SearchExecutor& executor, const Cell* start, const Cell* target,
                                        CancelTokenPtr token) const {
    RequireCells(start, target);
    return executor.Submit([builder = *this, start, target, token = std::move(token)]() {
        return builder.Run(start, target, token.get());
    });
}

std::future<Path> PathBuilder::RunParallelAsync(SearchExecutor& executor, const Cell* start, const Cell* target,
                                                CancelTokenPtr token) const {
    RequireCells(start, target);

    auto state = std::make_shared<RaceState>();
    auto race = MakeCancelToken(std::move(token));
    auto result = state->promise.get_future();

    PathBuilder backward = *this;
    backward._settings.connections = false;   // links are one-way
    backward._settings.partial = false;
    backward._settings.reversed = !_settings.reversed;

    auto launch = [&](PathBuilder builder, const Cell* from, const Cell* to, bool isForward) {
        executor.Submit([builder, from, to, isForward, state, race, requested = _settings]() {
            try {
                Path path = builder.Run(from, to, race.get());
                path.settings = requested;
                state->Finish(std::move(path), isForward, *race);
            } catch (...) {
                state->Fail(std::current_exception(), *race);
            }
        });
    };

    launch(*this, start, target, true);
    launch(backward, target, start, false);
    return result;
}

} // namespace gridnav::pf
