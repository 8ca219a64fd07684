#pragma once
#include <cmath>

namespace gridnav {

// Inward-to-outward sweep for loop indices: 0 1 2 3 4 5 -> 0 1 -1 2 -2 3
constexpr int SpiralPattern(int input) noexcept {
    const int half = (input + 1) / 2;
    return (input % 2 == 0) ? -half : half;
}

// Apex of a jump launched with vertical speed vz under gravity g.
inline float ParabolaMaxHeight(float verticalSpeed, float gravity) noexcept {
    return verticalSpeed * verticalSpeed / (2.0f * gravity);
}

// Height of the jump arc after travelling `horizontalOffset` horizontally.
inline float ParabolaHeight(float horizontalOffset, float horizontalSpeed, float verticalSpeed, float gravity) noexcept {
    const float t = horizontalOffset / horizontalSpeed;
    return verticalSpeed * t - 0.5f * gravity * t * t;
}

} // namespace gridnav
