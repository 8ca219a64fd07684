#pragma once
#include "Rotation.hpp"
#include "Vector.hpp"
#include <algorithm>
#include <array>

namespace gridnav {

// Axis-aligned box. Probes take it in local space (relative to the swept origin).
struct BBox {
    Vec3 mins{};
    Vec3 maxs{};

    constexpr bool operator==(const BBox&) const = default;

    static constexpr BBox FromExtents(const Vec3& half) { return { -half, half }; }

    [[nodiscard]] constexpr Vec3 Size() const noexcept { return maxs - mins; }
    [[nodiscard]] constexpr Vec3 Center() const noexcept { return (mins + maxs) * 0.5f; }
    [[nodiscard]] constexpr BBox Translate(const Vec3& by) const noexcept { return { mins + by, maxs + by }; }

    [[nodiscard]] constexpr bool Contains(const Vec3& p) const noexcept {
        return p.x >= mins.x && p.y >= mins.y && p.z >= mins.z
            && p.x <= maxs.x && p.y <= maxs.y && p.z <= maxs.z;
    }

    [[nodiscard]] std::array<Vec3, 8> Corners() const noexcept {
        return { Vec3{ mins.x, mins.y, mins.z }, Vec3{ maxs.x, mins.y, mins.z },
                 Vec3{ mins.x, maxs.y, mins.z }, Vec3{ maxs.x, maxs.y, mins.z },
                 Vec3{ mins.x, mins.y, maxs.z }, Vec3{ maxs.x, mins.y, maxs.z },
                 Vec3{ mins.x, maxs.y, maxs.z }, Vec3{ maxs.x, maxs.y, maxs.z } };
    }

    // AABB enclosing this box after rotation around the origin.
    [[nodiscard]] BBox GetRotatedBounds(const Rotation& rot) const noexcept {
        if (rot.IsIdentity()) return *this;
        BBox out{ Vec3{ 1e30f, 1e30f, 1e30f }, Vec3{ -1e30f, -1e30f, -1e30f } };
        for (const Vec3& c : Corners()) {
            const Vec3 r = rot.Rotate(c);
            out.mins = { std::min(out.mins.x, r.x), std::min(out.mins.y, r.y), std::min(out.mins.z, r.z) };
            out.maxs = { std::max(out.maxs.x, r.x), std::max(out.maxs.y, r.y), std::max(out.maxs.z, r.z) };
        }
        return out;
    }

    // Point test in the box's own frame (box placed at `origin`, rotated by `rot`).
    [[nodiscard]] bool IsRotatedPointWithinBounds(const Vec3& origin, const Vec3& point, const Rotation& rot) const noexcept {
        return Contains(rot.Inverse().Rotate(point - origin));
    }

    // Vertical cylinder inscribed in the box, squished to its x/y aspect.
    [[nodiscard]] bool IsInsideSquishedRotatedCylinder(const Vec3& origin, const Vec3& point, const Rotation& rot) const noexcept {
        const Vec3 local = rot.Inverse().Rotate(point - origin);
        if (local.z < mins.z || local.z > maxs.z) return false;
        const Vec3 c = Center();
        const Vec3 half = Size() * 0.5f;
        if (half.x <= 0.0f || half.y <= 0.0f) return false;
        const float nx = (local.x - c.x) / half.x;
        const float ny = (local.y - c.y) / half.y;
        return nx * nx + ny * ny <= 1.0f;
    }
};

} // namespace gridnav
