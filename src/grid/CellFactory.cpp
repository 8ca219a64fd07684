#include "gridnav/grid/CellFactory.hpp"
#include "gridnav/grid/Grid.hpp"
#include "gridnav/probe/TerrainProbe.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <vector>

namespace gridnav {

namespace {
constexpr float kStepTolerance  = 0.01f;
constexpr float kVerticalAngle  = 89.9f; // straight walls are risers, not slopes
constexpr float kDegToRad       = 0.017453292519943295f;
}

float CellFactory::MaxCornerHeight(const GridSettings& settings) noexcept {
    return std::max(settings.cellSize * std::tan(settings.standableAngle * kDegToRad), settings.RealStepSize());
}

std::unique_ptr<Cell> CellFactory::TryCreate(const Grid& grid, const TerrainProbe& probe, const Vec3& position) {
    const GridSettings& settings = grid.Settings();
    const ProbeFilter filter = ProbeFilter::Generation(settings.worldOnly);
    const float half = settings.cellSize * 0.5f;
    const float maxHeight = MaxCornerHeight(settings);
    const Rotation rot = settings.AxisRotation();

    const std::array<Vec3, 4> offsets = {
        rot.Rotate(Vec3{ -half, -half, 0.0f }),
        rot.Rotate(Vec3{ -half,  half, 0.0f }),
        rot.Rotate(Vec3{  half, -half, 0.0f }),
        rot.Rotate(Vec3{  half,  half, 0.0f }),
    };

    std::array<float, 4> vertices{};
    std::array<Vec3, 4> corners{};
    for (int i = 0; i < 4; ++i) {
        // Pull towards the centre a hair so grid-perfect terrain isn't sampled on its seams.
        const Vec3 inward = offsets[i].Normal() * settings.Tolerance();
        const Vec3 from = position + offsets[i].WithZ(maxHeight * 2.0f) - inward;
        const Vec3 to = position + offsets[i].WithZ(-maxHeight * 2.0f) - inward;

        const RayHit hit = probe.RayProbe(from, to, filter);
        if (hit.startedSolid || !hit.hit) return nullptr;

        vertices[i] = hit.position.z;
        corners[i] = hit.position;
    }

    const Classification kind = ClassifySteps(settings, probe, position, corners);
    if (!kind.walkable) return nullptr;

    // Anything that isn't a staircase must fit the standable slope.
    if (!kind.step) {
        const auto [lo, hi] = std::minmax_element(vertices.begin(), vertices.end());
        if (*hi - *lo > maxHeight) return nullptr;
    }

    if (!TestForClearance(settings, probe, position)) return nullptr;

    auto cell = std::make_unique<Cell>(grid.PositionToCoordinates(position), position, vertices);
    if (kind.step) cell->Tags().Add(tags::kStep);
    return cell;
}

CellFactory::Classification CellFactory::ClassifySteps(const GridSettings& settings, const TerrainProbe& probe,
                                                       const Vec3& position, const std::array<Vec3, 4>& corners) {
    if (settings.RealStepSize() <= 0.1f) return { true, true };

    std::array<Vec3, 4> sorted = corners;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Vec3& a, const Vec3& b) { return a.z < b.z; });

    const Classification fromLowest = TestForStep(settings, probe, sorted[0], sorted[3], position, sorted[0]);
    if (!fromLowest.walkable) return { false, fromLowest.step };

    const Classification fromMid = TestForStep(settings, probe, sorted[1], sorted[3], position, sorted[1]);
    if (!fromMid.walkable) return { false, fromMid.step };

    return { true, fromLowest.step || fromMid.step };
}

// Sweeps a small box from `start` towards `end` at rising heights. A riser that
// the box clears within a few samples is a stair; the same landing distance
// twice in a row means the obstacle keeps going up and is a wall.
CellFactory::Classification CellFactory::TestForStep(const GridSettings& settings, const TerrainProbe& probe,
                                                     const Vec3& start, const Vec3& end,
                                                     const Vec3& highest, const Vec3& lowest) {
    const float stepSize = settings.RealStepSize();
    const float rise = std::fabs(highest.z - lowest.z);
    if (highest.z - lowest.z <= settings.stepSize * 0.5f) return { true, false };

    const int maxSteps = std::max(static_cast<int>(rise / (stepSize * 0.5f) + 1.0f), 3);
    std::vector<float> distances(static_cast<std::size_t>(maxSteps), 0.0f);
    const BBox box = BBox::FromExtents(Vec3{ stepSize * 0.25f, stepSize * 0.25f, stepSize * 0.25f });
    const ProbeFilter filter = ProbeFilter::Generation(settings.worldOnly);

    for (int tried = 0; tried < maxSteps; ++tried) {
        const Vec3 from = start + Vec3::Up() * (stepSize * 0.25f + stepSize * 0.5f * static_cast<float>(tried) + kStepTolerance);
        const Vec3 target = end.WithZ(from.z);
        const Vec3 dir = (target - from).Normal();
        const float length = from.Distance(target);

        const BoxHit hit = probe.BoxProbe(box, from, from + dir * (length + kStepTolerance * 2.0f), filter);
        const float angle = AngleBetween(Vec3::Up(), hit.normal);

        if (tried == 0 && hit.endPosition.Distance(end) <= kStepTolerance * 3.0f)
            return { true, false };

        if (hit.hit && angle > settings.standableAngle && angle < kVerticalAngle)
            return { false, false };

        if (hit.hit && angle < settings.standableAngle)
            return { true, false }; // slope, not stairs

        const float fromStart = start.Distance(hit.endPosition.WithZ(start.z));
        if (tried >= 2 && std::fabs(fromStart - distances[static_cast<std::size_t>(tried - 2)]) < kStepTolerance)
            return { false, true };

        distances[static_cast<std::size_t>(tried)] = fromStart;
    }

    return { true, true };
}

bool CellFactory::TestForClearance(const GridSettings& settings, const TerrainProbe& probe, const Vec3& position) {
    const float w = settings.widthClearance * 0.5f;
    const BBox box{ Vec3{ -w, -w, 0.0f }, Vec3{ w, w, 1.0f } };
    const Vec3 from = position + Vec3::Up() * settings.heightClearance;
    const Vec3 to = position + Vec3::Up() * settings.stepSize;

    const BoxHit hit = probe.BoxProbe(box, from, to, ProbeFilter::Generation(settings.worldOnly));
    if (hit.startedSolid) return false;
    return hit.endPosition.z - position.z <= settings.RealStepSize() + kStepTolerance;
}

} // namespace gridnav
