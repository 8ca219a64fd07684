#pragma once
#include "gridnav/math/BBox.hpp"
#include "gridnav/math/Vector.hpp"
#include "gridnav/grid/Occupancy.hpp"

#include <string>
#include <utility>

namespace gridnav {

// What a probe may collide with.
struct ProbeFilter {
    bool worldOnly    = true;   // static world geometry only (no entities)
    bool entitiesOnly = false;  // movers / dynamic entities only
    std::string tag;            // entities must carry this tag (empty = any)

    static ProbeFilter World() { return {}; }
    static ProbeFilter Entities(std::string withTag) { return { false, true, std::move(withTag) }; }
    // Generation traces: static world, plus static entities unless `worldOnly`.
    static ProbeFilter Generation(bool worldOnly) { return worldOnly ? World() : ProbeFilter{ false, false, {} }; }
};

struct RayHit {
    bool  hit          = false;
    bool  startedSolid = false;
    Vec3  position{};           // impact point, or the segment end if nothing was hit
    Vec3  normal{};
    float fraction     = 1.0f;  // [0,1] along the segment
};

struct BoxHit {
    bool       hit          = false;
    bool       startedSolid = false;
    Vec3       endPosition{};   // where the box origin stopped
    Vec3       normal{};
    OccupantId occupant     = kNoOccupant;
    float      fraction     = 1.0f;
};

// Ray/box intersection queries against world geometry.
// Implementations must be safe to call concurrently from several threads:
// grid generation samples columns in parallel.
class TerrainProbe {
public:
    virtual ~TerrainProbe() = default;

    [[nodiscard]] virtual RayHit RayProbe(const Vec3& from, const Vec3& to,
                                          const ProbeFilter& filter = {}) const = 0;

    // Sweeps `box` (local to the origin) from `from` to `to`.
    [[nodiscard]] virtual BoxHit BoxProbe(const BBox& box, const Vec3& from, const Vec3& to,
                                          const ProbeFilter& filter = {}) const = 0;
};

} // namespace gridnav
