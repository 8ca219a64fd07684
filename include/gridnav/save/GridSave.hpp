#pragma once
// include/gridnav/save/GridSave.hpp
//
// Versioned grid snapshots. Uses nlohmann::json for (de)serialization.
// Occupancy is runtime state and is never written.

#include "gridnav/grid/Grid.hpp"
#include "gridnav/grid/GridSettings.hpp"
#include "gridnav/math/BBox.hpp"
#include "gridnav/math/Rotation.hpp"
#include "gridnav/math/Vector.hpp"

#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <string>

namespace gridnav::save {

using json = nlohmann::json;

// Bump this when the layout changes.
inline constexpr int kGridFormatVersion = 1;

struct PersistError {
    enum class Code {
        None,
        IoOpenFail,
        IoWriteFail,
        JsonParseError,
        JsonTypeError,
        VersionMismatch
    } code{ Code::None };
    std::string message;
};

} // namespace gridnav::save

// nlohmann finds these through ADL on the gridnav types.
namespace gridnav {

void to_json(nlohmann::json& j, const Vec3& v);
void from_json(const nlohmann::json& j, Vec3& v);

void to_json(nlohmann::json& j, const BBox& v);
void from_json(const nlohmann::json& j, BBox& v);

void to_json(nlohmann::json& j, const Rotation& v);
void from_json(const nlohmann::json& j, Rotation& v);

void to_json(nlohmann::json& j, const GridSettings& v);
void from_json(const nlohmann::json& j, GridSettings& v);

} // namespace gridnav

namespace gridnav::save {

// Whole grid: settings, cells in insertion order, generation tags and links.
// Links are stored as (coordinate, stack index, tag).
[[nodiscard]] json GridToJson(const Grid& grid);
// Throws nlohmann::json exceptions on malformed documents.
[[nodiscard]] std::unique_ptr<Grid> GridFromJson(const json& doc);

// ---------- I/O API ----------
bool SaveGrid(const Grid& grid, const std::filesystem::path& file, PersistError& err);
[[nodiscard]] std::unique_ptr<Grid> LoadGrid(const std::filesystem::path& file, PersistError& err);

} // namespace gridnav::save
