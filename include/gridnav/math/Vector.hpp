#pragma once
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace gridnav {

struct IVec2 {
    int x{}, y{};
    constexpr bool operator==(const IVec2&) const = default;
};

constexpr IVec2 operator+(IVec2 a, IVec2 b) noexcept { return { a.x + b.x, a.y + b.y }; }
constexpr IVec2 operator-(IVec2 a, IVec2 b) noexcept { return { a.x - b.x, a.y - b.y }; }

struct IVec2Hash {
    std::size_t operator()(const IVec2& c) const noexcept {
        // 2D -> 64-bit mix, same trick as the nav CoordHash
        const std::uint64_t k = (static_cast<std::uint64_t>(static_cast<std::uint32_t>(c.x)) << 32)
                              ^ static_cast<std::uint32_t>(c.y);
        return std::hash<std::uint64_t>{}(k);
    }
};

struct Vec3 {
    float x{}, y{}, z{};

    constexpr Vec3() = default;
    constexpr Vec3(float X, float Y, float Z = 0.0f) : x(X), y(Y), z(Z) {}

    static constexpr Vec3 Zero()    { return { 0.0f, 0.0f, 0.0f }; }
    static constexpr Vec3 Up()      { return { 0.0f, 0.0f, 1.0f }; }
    static constexpr Vec3 Forward() { return { 1.0f, 0.0f, 0.0f }; }
    static constexpr Vec3 Right()   { return { 0.0f, 1.0f, 0.0f }; }

    constexpr bool operator==(const Vec3&) const = default;

    constexpr Vec3 operator-() const noexcept { return { -x, -y, -z }; }
    constexpr Vec3& operator+=(const Vec3& o) noexcept { x += o.x; y += o.y; z += o.z; return *this; }
    constexpr Vec3& operator-=(const Vec3& o) noexcept { x -= o.x; y -= o.y; z -= o.z; return *this; }
    constexpr Vec3& operator*=(float s) noexcept { x *= s; y *= s; z *= s; return *this; }

    [[nodiscard]] constexpr Vec3 WithZ(float nz) const noexcept { return { x, y, nz }; }
    [[nodiscard]] constexpr float LengthSquared() const noexcept { return x * x + y * y + z * z; }
    [[nodiscard]] float Length() const noexcept { return std::sqrt(LengthSquared()); }

    // Unit vector; zero stays zero.
    [[nodiscard]] Vec3 Normal() const noexcept {
        const float len = Length();
        if (len <= 1e-6f) return {};
        return { x / len, y / len, z / len };
    }

    [[nodiscard]] float Distance(const Vec3& o) const noexcept;
    [[nodiscard]] constexpr float DistanceSquared(const Vec3& o) const noexcept;
};

constexpr Vec3 operator+(Vec3 a, const Vec3& b) noexcept { return a += b; }
constexpr Vec3 operator-(Vec3 a, const Vec3& b) noexcept { return a -= b; }
constexpr Vec3 operator*(Vec3 a, float s) noexcept { return a *= s; }
constexpr Vec3 operator*(float s, Vec3 a) noexcept { return a *= s; }
constexpr Vec3 operator/(Vec3 a, float s) noexcept { return { a.x / s, a.y / s, a.z / s }; }
constexpr Vec3 operator-(Vec3 a, float s) noexcept { return { a.x - s, a.y - s, a.z - s }; }

constexpr float Dot(const Vec3& a, const Vec3& b) noexcept { return a.x * b.x + a.y * b.y + a.z * b.z; }

inline float Vec3::Distance(const Vec3& o) const noexcept { return (*this - o).Length(); }
constexpr float Vec3::DistanceSquared(const Vec3& o) const noexcept { return (*this - o).LengthSquared(); }

// Angle in degrees between two directions.
inline float AngleBetween(const Vec3& a, const Vec3& b) noexcept {
    const float la = a.Length(), lb = b.Length();
    if (la <= 1e-6f || lb <= 1e-6f) return 0.0f;
    float c = Dot(a, b) / (la * lb);
    c = c < -1.0f ? -1.0f : (c > 1.0f ? 1.0f : c);
    return std::acos(c) * 57.29577951308232f;
}

// Horizontal components snapped to a grid of `size` (round to nearest).
inline IVec2 ToIntVector2(const Vec3& v, float size = 1.0f) noexcept {
    return { static_cast<int>(std::lround(v.x / size)), static_cast<int>(std::lround(v.y / size)) };
}

} // namespace gridnav
