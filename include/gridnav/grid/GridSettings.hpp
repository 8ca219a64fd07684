#pragma once
#include "gridnav/math/BBox.hpp"
#include "gridnav/math/Rotation.hpp"
#include "gridnav/math/Vector.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace gridnav {

// Set stepSize or widthClearance to 0 to disable them (faster grid generation).
struct GridDefaults {
    static constexpr float kStandableAngle  = 40.0f;  // steepest walkable slope, degrees
    static constexpr float kStepSize        = 12.0f;  // tallest step a mover climbs without jumping
    static constexpr float kCellSize        = 16.0f;
    static constexpr float kHeightClearance = 72.0f;  // vertical space a mover needs
    static constexpr float kWidthClearance  = 24.0f;  // horizontal space a mover needs
    static constexpr float kDropHeight      = 400.0f; // highest ledge a mover drops from
    static constexpr bool  kGridPerfect     = false;  // true: skip step detection, expect ramps
    static constexpr bool  kWorldOnly       = true;   // ignore static entities while sampling
};

struct GridSettings {
    std::string identifier      = "main";
    Vec3        position{};
    BBox        bounds{ Vec3{ -512.0f, -512.0f, -512.0f }, Vec3{ 512.0f, 512.0f, 512.0f } };
    Rotation    rotation{};
    bool        axisAligned     = true;
    float       standableAngle  = GridDefaults::kStandableAngle;
    float       stepSize        = GridDefaults::kStepSize;
    float       cellSize        = GridDefaults::kCellSize;
    float       heightClearance = GridDefaults::kHeightClearance;
    float       widthClearance  = GridDefaults::kWidthClearance;
    float       maxDropHeight   = GridDefaults::kDropHeight;
    bool        gridPerfect     = GridDefaults::kGridPerfect;
    bool        worldOnly       = GridDefaults::kWorldOnly;
    bool        cylinderShaped  = false;

    // ---- fluent construction ----
    static GridSettings From(const BBox& localBounds, const Vec3& origin = {}) {
        GridSettings s;
        s.bounds = localBounds;
        s.position = origin;
        return s;
    }

    GridSettings& WithIdentifier(std::string id)  { identifier = std::move(id); return *this; }
    GridSettings& WithRotation(const Rotation& r) { rotation = r; axisAligned = r.IsIdentity(); return *this; }
    GridSettings& WithAxisAligned(bool v)         { axisAligned = v; return *this; }
    GridSettings& WithStandableAngle(float deg)   { standableAngle = deg; return *this; }
    GridSettings& WithStepSize(float v)           { stepSize = v; return *this; }
    GridSettings& WithCellSize(float v)           { cellSize = v; return *this; }
    GridSettings& WithHeightClearance(float v)    { heightClearance = v; return *this; }
    GridSettings& WithWidthClearance(float v)     { widthClearance = v; return *this; }
    GridSettings& WithMaxDropHeight(float v)      { maxDropHeight = v; return *this; }
    GridSettings& WithGridPerfect(bool v)         { gridPerfect = v; return *this; }
    GridSettings& WithWorldOnly(bool v)           { worldOnly = v; return *this; }
    GridSettings& WithCylinderShaped(bool v)      { cylinderShaped = v; return *this; }

    // ---- derived ----
    [[nodiscard]] float RealStepSize() const noexcept { return gridPerfect ? 0.1f : std::max(0.1f, stepSize); }
    [[nodiscard]] float Tolerance() const noexcept { return gridPerfect ? 0.001f : 0.0f; }
    [[nodiscard]] Rotation AxisRotation() const noexcept { return axisAligned ? Rotation{} : rotation; }
    [[nodiscard]] BBox RotatedBounds() const noexcept { return bounds.GetRotatedBounds(AxisRotation()); }
    [[nodiscard]] BBox WorldBounds() const noexcept { return RotatedBounds().Translate(position); }

    bool operator==(const GridSettings&) const = default;
};

} // namespace gridnav
