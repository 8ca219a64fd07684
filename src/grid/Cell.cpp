#include "gridnav/grid/Cell.hpp"
#include "gridnav/probe/TerrainProbe.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace gridnav {

namespace {

struct CornerPair { int self; int other; };

// Corners that must line up between a cell and its neighbour at (dx, dy).
// Indexed by (dx + 1) * 3 + (dy + 1); the centre entry is never used.
struct NeighbourRule { CornerPair pairs[2]; int count; };

constexpr NeighbourRule kNeighbourRules[9] = {
    { { { kBottomLeft,  kTopRight    }, { 0, 0 } }, 1 },                              // (-1,-1)
    { { { kBottomRight, kTopRight    }, { kBottomLeft, kTopLeft } }, 2 },             // (-1, 0)
    { { { kBottomRight, kTopLeft     }, { 0, 0 } }, 1 },                              // (-1, 1)
    { { { kBottomLeft,  kBottomRight }, { kTopLeft, kTopRight } }, 2 },               // ( 0,-1)
    { { { 0, 0 }, { 0, 0 } }, 0 },                                                    // ( 0, 0)
    { { { kBottomRight, kBottomLeft  }, { kTopRight, kTopLeft } }, 2 },               // ( 0, 1)
    { { { kTopLeft,     kBottomRight }, { 0, 0 } }, 1 },                              // ( 1,-1)
    { { { kTopRight,    kBottomRight }, { kTopLeft, kBottomLeft } }, 2 },             // ( 1, 0)
    { { { kTopRight,    kBottomLeft  }, { 0, 0 } }, 1 },                              // ( 1, 1)
};

constexpr float kCornerMatchTolerance = 0.1f;

} // namespace

Cell::Cell(IVec2 gridPosition, Vec3 position, std::array<float, 4> vertices)
    : _gridPosition(gridPosition), _position(position), _vertices(vertices) {}

float Cell::MinVertex() const noexcept {
    return *std::min_element(_vertices.begin(), _vertices.end());
}

float Cell::MaxVertex() const noexcept {
    return *std::max_element(_vertices.begin(), _vertices.end());
}

Vec3 Cell::CornerPosition(Corner corner, const GridSettings& settings) const noexcept {
    const float h = settings.cellSize * 0.5f;
    const float sx = (corner == kTopLeft || corner == kTopRight) ? h : -h;
    const float sy = (corner == kBottomRight || corner == kTopRight) ? h : -h;
    const Vec3 offset = settings.AxisRotation().Rotate(Vec3{ sx, sy, 0.0f });
    return (_position + offset).WithZ(_vertices[corner]);
}

BBox Cell::Bounds(const GridSettings& settings) noexcept {
    const float w = settings.widthClearance * 0.5f;
    return { Vec3{ -w, -w, 0.0f }, Vec3{ w, w, settings.heightClearance } };
}

bool Cell::IsNeighbour(const Cell& other) const noexcept {
    if (&other == this) return true;

    const int dx = other._gridPosition.x - _gridPosition.x;
    const int dy = other._gridPosition.y - _gridPosition.y;
    if (std::abs(dx) > 1 || std::abs(dy) > 1) return false;
    if (dx == 0 && dy == 0) return false; // another floor in the same stack

    const NeighbourRule& rule = kNeighbourRules[(dx + 1) * 3 + (dy + 1)];
    for (int i = 0; i < rule.count; ++i) {
        const CornerPair& p = rule.pairs[i];
        if (std::fabs(_vertices[p.self] - other._vertices[p.other]) >= kCornerMatchTolerance)
            return false;
    }
    return true;
}

void Cell::SetOccupant(OccupantId id, const Pose& pose) {
    _occupant.store(id, std::memory_order_relaxed);
    _occupantPose = pose;
    _tags.Set(CellTags::Occupied, true);
}

void Cell::ClearOccupant() {
    _tags.Set(CellTags::Occupied, false);
    _occupant.store(kNoOccupant, std::memory_order_relaxed);
    _occupantPose = {};
}

bool Cell::TestForOccupancy(const TerrainProbe& probe, const GridSettings& settings,
                            const OccupantSource* occupants, const std::string& tag) {
    const OccupantId current = Occupant();
    if (current != kNoOccupant && occupants) {
        const auto pose = occupants->PoseOf(current);
        if (pose && *pose == _occupantPose) return true;
    }

    // Lift the box off the floor so slopes and steps don't count as occupants.
    const Vec3 from = _position + Vec3::Up() * settings.RealStepSize();
    const BBox box = Bounds(settings);
    const BoxHit hit = probe.BoxProbe(BBox{ box.mins, box.maxs - Vec3::Up() * settings.RealStepSize() },
                                      from, from, ProbeFilter::Entities(tag));
    if (!hit.hit) {
        ClearOccupant();
        return false;
    }

    Pose pose{};
    if (occupants && hit.occupant != kNoOccupant) {
        if (const auto seen = occupants->PoseOf(hit.occupant)) pose = *seen;
    }
    SetOccupant(hit.occupant, pose);
    return true;
}

void Cell::AddConnection(Cell* target, std::string tag) {
    if (!target || target == this) return;
    for (Connection& c : _connections) {
        if (c.target == target) { c.tag = std::move(tag); return; }
    }
    _connections.push_back(Connection{ target, std::move(tag) });
}

bool Cell::HasConnectionTo(const Cell* target) const noexcept {
    return std::any_of(_connections.begin(), _connections.end(),
                       [&](const Connection& c) { return c.target == target; });
}

} // namespace gridnav
