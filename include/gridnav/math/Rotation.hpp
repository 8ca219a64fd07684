#pragma once
#include "Vector.hpp"
#include <cmath>

namespace gridnav {

// Unit quaternion. Grids only ever use yaw, but rotations compose fully.
struct Rotation {
    float x{0.0f}, y{0.0f}, z{0.0f}, w{1.0f};

    constexpr bool operator==(const Rotation&) const = default;

    static constexpr Rotation Identity() { return {}; }

    static Rotation FromYaw(float degrees) noexcept {
        const float half = degrees * 0.5f * 0.017453292519943295f;
        return { 0.0f, 0.0f, std::sin(half), std::cos(half) };
    }

    [[nodiscard]] float Yaw() const noexcept {
        const float siny = 2.0f * (w * z + x * y);
        const float cosy = 1.0f - 2.0f * (y * y + z * z);
        return std::atan2(siny, cosy) * 57.29577951308232f;
    }

    [[nodiscard]] constexpr Rotation Inverse() const noexcept { return { -x, -y, -z, w }; }

    [[nodiscard]] constexpr bool IsIdentity() const noexcept {
        return x == 0.0f && y == 0.0f && z == 0.0f && w == 1.0f;
    }

    // v' = q * v * q^-1
    [[nodiscard]] Vec3 Rotate(const Vec3& v) const noexcept {
        const Vec3 q{ x, y, z };
        const Vec3 t = Cross(q, v) * 2.0f;
        return v + t * w + Cross(q, t);
    }

    [[nodiscard]] Vec3 Forward() const noexcept { return Rotate(Vec3::Forward()); }
    [[nodiscard]] Vec3 Right() const noexcept   { return Rotate(Vec3::Right()); }
    [[nodiscard]] Vec3 Up() const noexcept      { return Rotate(Vec3::Up()); }

    Rotation operator*(const Rotation& o) const noexcept {
        return {
            w * o.x + x * o.w + y * o.z - z * o.y,
            w * o.y - x * o.z + y * o.w + z * o.x,
            w * o.z + x * o.y - y * o.x + z * o.w,
            w * o.w - x * o.x - y * o.y - z * o.z
        };
    }

private:
    static constexpr Vec3 Cross(const Vec3& a, const Vec3& b) noexcept {
        return { a.y * b.z - a.z * b.y, a.z * b.x - a.x * b.z, a.x * b.y - a.y * b.x };
    }
};

inline Vec3 operator*(const Vec3& v, const Rotation& r) noexcept { return r.Rotate(v); }

} // namespace gridnav
