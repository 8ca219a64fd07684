#include "gridnav/nav/PathFollower.hpp"
#include "gridnav/grid/Grid.hpp"

#include <algorithm>
#include <utility>

namespace gridnav::nav {

namespace {
constexpr float kStrayFactor = 1.42f;  // a bit more than one diagonal cell
}

bool PathFollower::NavigateTo(const Cell* target, const Cell* nearest, const pf::PathBuilder& builder,
                              pf::SearchExecutor& executor) {
    if (!target || !nearest || target == nearest) return false;

    pf::Path path = builder.RunAsync(executor, nearest, target).get();
    if (path.IsEmpty()) return false;

    if (!builder.Settings().simplify) path.Simplify();
    return Adopt(std::move(path));
}

bool PathFollower::Adopt(pf::Path path) {
    if (path.IsEmpty() || !path.settings.grid) return false;
    _path = std::move(path);
    _index = 0;
    _arrived = false;
    _target = LastCell();
    return true;
}

const pf::Waypoint* PathFollower::NextWaypoint() const noexcept {
    if (!IsFollowingPath()) return nullptr;
    const std::size_t i = std::min(static_cast<std::size_t>(_index) + 1, _path.Count() - 1);
    return &_path.nodes[i];
}

const Cell* PathFollower::CurrentCell() const noexcept {
    if (!IsFollowingPath() || static_cast<std::size_t>(_index) >= _path.Count()) return nullptr;
    return _path.nodes[static_cast<std::size_t>(_index)].cell;
}

const Cell* PathFollower::NextCell() const noexcept {
    const pf::Waypoint* next = NextWaypoint();
    return next ? next->cell : nullptr;
}

std::string PathFollower::NextMovementTag() const {
    const pf::Waypoint* next = NextWaypoint();
    return next ? next->movementTag : std::string{};
}

void PathFollower::Tick(const Vec3& moverPosition) {
    if (!IsFollowingPath()) return;

    const GridSettings& s = _path.settings.grid->Settings();
    const float reach = s.cellSize * 0.5f + s.stepSize;
    if (moverPosition.DistanceSquared(NextCell()->Position()) <= reach * reach) ++_index;

    if (static_cast<std::size_t>(_index) >= _path.Count() || CurrentCell() == _target) {
        _arrived = true;
        _index = -1;
    }
}

bool PathFollower::NeedsRetrace(double now, const Vec3& moverPosition) {
    if (now < _nextRetrace) return false;
    _nextRetrace = now + _retraceInterval;
    if (!IsFollowingPath()) return false;

    if (_target != LastCell()) return true;

    const float stray = _path.settings.grid->CellSize() * kStrayFactor;
    return moverPosition.DistanceSquared(CurrentCell()->Position()) > stray * stray;
}

} // namespace gridnav::nav
