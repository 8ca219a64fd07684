#pragma once
#include "gridnav/math/Vector.hpp"
#include "gridnav/pathfinding/Path.hpp"
#include "gridnav/pathfinding/PathBuilder.hpp"
#include "gridnav/pathfinding/PathJobs.hpp"

#include <string>

namespace gridnav {
class Cell;
}

namespace gridnav::nav {

// Waypoint bookkeeping for one mover. No steering: the owner reads NextCell() and
// NextMovementTag() every tick and moves however it likes.
class PathFollower {
public:
    explicit PathFollower(double retraceInterval = 0.1) : _retraceInterval(retraceInterval) {}

    // Searches from `nearest` to `target` on the executor and waits for the result.
    // False for a null target, when already there, or when no path came back.
    bool NavigateTo(const Cell* target, const Cell* nearest, const pf::PathBuilder& builder,
                    pf::SearchExecutor& executor);

    // Takes over an already computed path. False (and nothing changes) if it is empty
    // or was not produced on a grid.
    bool Adopt(pf::Path path);

    // Advances to the next waypoint once the mover is close enough to it.
    void Tick(const Vec3& moverPosition);

    // True at most once per retrace interval, when the target moved away from the
    // end of the path or the mover strayed too far from its current waypoint.
    bool NeedsRetrace(double now, const Vec3& moverPosition);

    void SetTarget(const Cell* target) noexcept { _target = target; }
    void Stop() noexcept { _index = -1; }

    [[nodiscard]] bool IsFollowingPath() const noexcept { return _index >= 0 && !_path.IsEmpty(); }
    [[nodiscard]] bool HasArrived() const noexcept { return _arrived; }
    [[nodiscard]] const Cell* CurrentCell() const noexcept;
    [[nodiscard]] const Cell* NextCell() const noexcept;
    [[nodiscard]] const Cell* LastCell() const noexcept { return _path.IsEmpty() ? nullptr : _path.Back().cell; }
    [[nodiscard]] const Cell* Target() const noexcept { return _target; }
    [[nodiscard]] std::string NextMovementTag() const;
    [[nodiscard]] const pf::Path& CurrentPath() const noexcept { return _path; }
    [[nodiscard]] int Index() const noexcept { return _index; }

private:
    [[nodiscard]] const pf::Waypoint* NextWaypoint() const noexcept;

    pf::Path    _path;
    int         _index = -1;     // -1 = not following
    const Cell* _target = nullptr;
    bool        _arrived = false;
    double      _retraceInterval;
    double      _nextRetrace = 0.0;
};

} // namespace gridnav::nav
