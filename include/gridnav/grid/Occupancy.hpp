#pragma once
#include "gridnav/math/Vector.hpp"

#include <cstdint>
#include <optional>

namespace gridnav {

// Opaque mover handle. Keep it POD so callers can map it to whatever entity system they run.
using OccupantId = std::uint32_t;
inline constexpr OccupantId kNoOccupant = 0;

// Snapshot of a mover's transform at the time it was seen on a cell.
struct Pose {
    Vec3  position{};
    float yaw = 0.0f;
    constexpr bool operator==(const Pose&) const = default;
};

// Bridge to the mover system: where is this occupant now?
class OccupantSource {
public:
    virtual ~OccupantSource() = default;
    [[nodiscard]] virtual std::optional<Pose> PoseOf(OccupantId id) const = 0;
};

} // namespace gridnav
