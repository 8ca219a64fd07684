#include "gridnav/grid/Grid.hpp"

#include <cmath>

namespace gridnav {

// Greedy walk towards `end`, one plain neighbour at a time. Every step must land on
// a cell that really touches the previous one, so the walk can't slip through
// a gap between two floors.
bool Grid::LineOfSight(const Cell& start, const Cell& end, OccupantId pathCreator) const {
    if (start.IsBlockedFor(pathCreator) || end.IsBlockedFor(pathCreator)) return false;
    if (&start == &end) return true;

    const Vec3& target = end.Position();
    // One extra step absorbs rounding in the distance.
    const int maxSteps = static_cast<int>(std::ceil(start.Position().Distance(target) / _settings.cellSize)) + 1;

    const Cell* last = &start;
    for (int i = 0; i < maxSteps; ++i) {
        const Cell* next = GetNeighbourInDirection(*last, target - last->Position());
        if (!next || next == last) return false;
        if (next == &end) return true;
        if (next->IsBlockedFor(pathCreator)) return false;
        if (!next->IsNeighbour(*last)) return false;
        last = next;
    }
    return false;
}

} // namespace gridnav
