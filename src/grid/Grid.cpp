#include "gridnav/grid/Grid.hpp"
#include "gridnav/math/NavMath.hpp"
#include "gridnav/probe/TerrainProbe.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <utility>

namespace gridnav {

Grid::Grid(GridSettings settings)
    : _settings(std::move(settings)) {
    if (!(_settings.cellSize > 0.0f))
        throw std::invalid_argument("Grid: cell size must be positive");
    _worldBounds = _settings.WorldBounds();
}

// Axis-aligned grids index the world AABB of their bounds; rotated ones index their own frame.
Vec3 Grid::ToLocal(const Vec3& world) const noexcept {
    if (_settings.axisAligned) return world - _worldBounds.mins;
    return _settings.rotation.Inverse().Rotate(world - _settings.position) - _settings.bounds.mins;
}

IVec2 Grid::PositionToCoordinates(const Vec3& position) const noexcept {
    return ToIntVector2(ToLocal(position) - _settings.cellSize * 0.5f, _settings.cellSize);
}

Vec3 Grid::CoordinatesToPosition(IVec2 coordinates, float z) const noexcept {
    const float cs = _settings.cellSize;
    const Vec3 local{ coordinates.x * cs + cs * 0.5f, coordinates.y * cs + cs * 0.5f, 0.0f };
    if (_settings.axisAligned) return (_worldBounds.mins + local).WithZ(z);
    return (_settings.position + _settings.rotation.Rotate(local + _settings.bounds.mins)).WithZ(z);
}

IVec2 Grid::Dimensions() const noexcept {
    const Vec3 size = _settings.axisAligned ? _worldBounds.Size() : _settings.bounds.Size();
    const float cs = _settings.cellSize;
    return { std::max(0, static_cast<int>(std::ceil(size.x / cs - 1e-4f))),
             std::max(0, static_cast<int>(std::ceil(size.y / cs - 1e-4f))) };
}

bool Grid::IsInsideBounds(const Vec3& point) const noexcept {
    return _settings.bounds.IsRotatedPointWithinBounds(_settings.position, point, _settings.rotation);
}

bool Grid::IsInsideCylinder(const Vec3& point) const noexcept {
    return _settings.bounds.IsInsideSquishedRotatedCylinder(_settings.position, point, _settings.rotation);
}

Cell* Grid::AddCell(std::unique_ptr<Cell> cell) {
    if (!cell) throw std::invalid_argument("Grid::AddCell: null cell");
    Cell* raw = cell.get();
    _stacks[raw->GridPosition()].push_back(std::move(cell));
    _allCells.push_back(raw);
    return raw;
}

void Grid::Clear() {
    _allCells.clear();
    _stacks.clear();
}

const Grid::CellStack* Grid::Stack(IVec2 coordinates) const {
    const auto it = _stacks.find(coordinates);
    return it == _stacks.end() ? nullptr : &it->second;
}

int Grid::StackIndexOf(const Cell& cell) const {
    if (const CellStack* stack = Stack(cell.GridPosition())) {
        for (std::size_t i = 0; i < stack->size(); ++i)
            if ((*stack)[i].get() == &cell) return static_cast<int>(i);
    }
    return -1;
}

Cell* Grid::GetCell(IVec2 coordinates, float height) const {
    const CellStack* stack = Stack(coordinates);
    if (!stack) return nullptr;
    for (const auto& cell : *stack)
        if (cell->MinVertex() - _settings.stepSize < height) return cell.get();
    return nullptr;
}

Cell* Grid::GetCell(const Vec3& position, bool onlyBelow) const {
    return GetCell(PositionToCoordinates(position), onlyBelow ? position.z : _worldBounds.maxs.z);
}

Cell* Grid::GetNearestCell(const Vec3& position, bool onlyBelow, bool unoccupiedOnly) const {
    Cell* best = nullptr;
    float bestDist = std::numeric_limits<float>::max();
    for (Cell* cell : _allCells) {
        if (unoccupiedOnly && cell->IsOccupied()) continue;
        if (onlyBelow && cell->MinVertex() - _settings.stepSize > position.z) continue;
        const float d = cell->Position().DistanceSquared(position);
        if (d < bestDist) { bestDist = d; best = cell; }
    }
    return best;
}

Cell* Grid::GetCellInArea(const Vec3& position, float width, bool onlyBelow, bool withinStepRange) const {
    const int cellsToCheck = static_cast<int>(std::ceil(width / _settings.cellSize)) * 2;
    const Rotation rot = _settings.AxisRotation();
    const float step = _settings.RealStepSize();

    for (int y = 0; y <= cellsToCheck; ++y) {
        const float sy = static_cast<float>(SpiralPattern(y));
        for (int x = 0; x <= cellsToCheck; ++x) {
            const float sx = static_cast<float>(SpiralPattern(x));
            const Vec3 probe = position + rot.Forward() * (sx * _settings.cellSize)
                             + rot.Right() * (sy * _settings.cellSize) + Vec3::Up() * step;
            Cell* found = GetCell(probe, onlyBelow);
            if (!found) continue;
            if (withinStepRange && position.z - found->Position().z > step) continue;
            return found;
        }
    }
    return nullptr;
}

Cell* Grid::GetCellInDirection(const Cell& from, const Vec3& direction, int cells) const {
    return GetCell(from.Position() + direction * (_settings.cellSize * static_cast<float>(cells)));
}

Cell* Grid::GetNeighbourInDirection(const Cell& cell, const Vec3& direction) const {
    Vec3 horizontal = direction.WithZ(0.0f);
    if (!_settings.axisAligned) horizontal = _settings.rotation.Inverse().Rotate(horizontal);
    const IVec2 offset = ToIntVector2(horizontal.WithZ(0.0f).Normal());

    const CellStack* stack = Stack(cell.GridPosition() + offset);
    if (!stack) return nullptr;
    for (const auto& candidate : *stack)
        if (cell.IsNeighbour(*candidate)) return candidate.get();
    return nullptr;
}

std::vector<Cell*> Grid::GetNeighbours(const Cell& cell) const {
    std::vector<Cell*> out;
    out.reserve(8);
    const IVec2 at = cell.GridPosition();
    for (int y = -1; y <= 1; ++y) {
        for (int x = -1; x <= 1; ++x) {
            if (x == 0 && y == 0) continue;
            Cell* found = GetCell(IVec2{ at.x + x, at.y + y }, cell.Position().z);
            if (found && cell.IsNeighbour(*found)) out.push_back(found);
        }
    }
    return out;
}

std::vector<Connection> Grid::GetNeighbourAndConnections(const Cell& cell) const {
    std::vector<Connection> out;
    const auto neighbours = GetNeighbours(cell);
    out.reserve(neighbours.size() + cell.Connections().size());
    for (Cell* n : neighbours) out.push_back(Connection{ n, {} });
    out.insert(out.end(), cell.Connections().begin(), cell.Connections().end());
    return out;
}

std::vector<Cell*> Grid::CellsWithTag(std::string_view tag) const {
    std::vector<Cell*> out;
    std::copy_if(_allCells.begin(), _allCells.end(), std::back_inserter(out),
                 [&](const Cell* c) { return c->Tags().Has(tag); });
    return out;
}

std::vector<Cell*> Grid::CellsWithTags(const std::vector<std::string>& all) const {
    std::vector<Cell*> out;
    std::copy_if(_allCells.begin(), _allCells.end(), std::back_inserter(out),
                 [&](const Cell* c) { return c->Tags().HasAll(all); });
    return out;
}

std::vector<Cell*> Grid::CellsWithAnyTag(const std::vector<std::string>& any) const {
    std::vector<Cell*> out;
    std::copy_if(_allCells.begin(), _allCells.end(), std::back_inserter(out),
                 [&](const Cell* c) { return c->Tags().HasAny(any); });
    return out;
}

std::size_t Grid::CheckOccupancy(const TerrainProbe& probe, const OccupantSource* occupants, const std::string& tag) {
    std::size_t occupied = 0;
    for (Cell* cell : _allCells)
        if (cell->TestForOccupancy(probe, _settings, occupants, tag)) ++occupied;
    return occupied;
}

Vec3 Grid::TraceParabola(const TerrainProbe& probe, const Vec3& start, const Vec3& horizontalVelocity,
                         float verticalSpeed, float gravity, float maxDropHeight, int subSteps) const {
    const Vec3 flat = horizontalVelocity.WithZ(0.0f);
    const float horizontalSpeed = flat.Length();
    if (!(gravity > 0.0f)) throw std::invalid_argument("TraceParabola: gravity must be positive");
    if (!(horizontalSpeed > 0.0f)) throw std::invalid_argument("TraceParabola: horizontal speed must be positive");
    if (subSteps < 1) subSteps = 1;

    const Vec3 direction = flat.Normal();
    const float apex = start.z + ParabolaMaxHeight(verticalSpeed, gravity);
    const float floor = apex - maxDropHeight;

    const float w = _settings.widthClearance * 0.5f;
    const BBox box{ Vec3{ -w, -w, _settings.RealStepSize() }, Vec3{ w, w, _settings.heightClearance } };
    const ProbeFilter filter = ProbeFilter::Generation(_settings.worldOnly);

    Vec3 last = start;
    for (int k = 1; last.z >= floor; ++k) {
        const float offset = _settings.cellSize * static_cast<float>(k) / static_cast<float>(subSteps);
        const Vec3 next = start + direction * offset
                        + Vec3::Up() * ParabolaHeight(offset, horizontalSpeed, verticalSpeed, gravity);

        const BoxHit hit = probe.BoxProbe(box, last, next, filter);
        if (hit.hit) return hit.endPosition;
        last = next;
    }
    return last;
}

} // namespace gridnav
