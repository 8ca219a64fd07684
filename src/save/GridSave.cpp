// src/save/GridSave.cpp
#include "gridnav/save/GridSave.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

namespace gridnav {
using json = nlohmann::json;

// ---------- Vec3 ----------
void to_json(json& j, const Vec3& v) {
    j = json::array({ v.x, v.y, v.z });
}

void from_json(const json& j, Vec3& v) {
    if (j.is_array() && j.size() == 3) {
        v.x = j.at(0).get<float>();
        v.y = j.at(1).get<float>();
        v.z = j.at(2).get<float>();
    } else if (j.is_object()) {
        v.x = j.value("x", 0.0f);
        v.y = j.value("y", 0.0f);
        v.z = j.value("z", 0.0f);
    } else {
        throw json::type_error::create(302, "Vec3 expects array[3] or object", &j);
    }
}

// ---------- BBox ----------
void to_json(json& j, const BBox& v) {
    j = json::object({ {"mins", v.mins}, {"maxs", v.maxs} });
}

void from_json(const json& j, BBox& v) {
    v.mins = j.at("mins").get<Vec3>();
    v.maxs = j.at("maxs").get<Vec3>();
}

// ---------- Rotation ----------
// Stored as the raw quaternion so a reload is bit-exact.
void to_json(json& j, const Rotation& v) {
    j = json::array({ v.x, v.y, v.z, v.w });
}

void from_json(const json& j, Rotation& v) {
    if (!j.is_array() || j.size() != 4)
        throw json::type_error::create(302, "Rotation expects array[4]", &j);
    v.x = j.at(0).get<float>();
    v.y = j.at(1).get<float>();
    v.z = j.at(2).get<float>();
    v.w = j.at(3).get<float>();
}

// ---------- GridSettings ----------
void to_json(json& j, const GridSettings& v) {
    j = json::object({
        {"identifier",      v.identifier},
        {"position",        v.position},
        {"bounds",          v.bounds},
        {"rotation",        v.rotation},
        {"axisAligned",     v.axisAligned},
        {"standableAngle",  v.standableAngle},
        {"stepSize",        v.stepSize},
        {"cellSize",        v.cellSize},
        {"heightClearance", v.heightClearance},
        {"widthClearance",  v.widthClearance},
        {"maxDropHeight",   v.maxDropHeight},
        {"gridPerfect",     v.gridPerfect},
        {"worldOnly",       v.worldOnly},
        {"cylinderShaped",  v.cylinderShaped}
    });
}

void from_json(const json& j, GridSettings& v) {
    const GridSettings d;
    v.identifier      = j.value("identifier", d.identifier);
    v.position        = j.value("position", d.position);
    v.bounds          = j.value("bounds", d.bounds);
    v.rotation        = j.value("rotation", d.rotation);
    v.axisAligned     = j.value("axisAligned", d.axisAligned);
    v.standableAngle  = j.value("standableAngle", d.standableAngle);
    v.stepSize        = j.value("stepSize", d.stepSize);
    v.cellSize        = j.value("cellSize", d.cellSize);
    v.heightClearance = j.value("heightClearance", d.heightClearance);
    v.widthClearance  = j.value("widthClearance", d.widthClearance);
    v.maxDropHeight   = j.value("maxDropHeight", d.maxDropHeight);
    v.gridPerfect     = j.value("gridPerfect", d.gridPerfect);
    v.worldOnly       = j.value("worldOnly", d.worldOnly);
    v.cylinderShaped  = j.value("cylinderShaped", d.cylinderShaped);
}

} // namespace gridnav

namespace gridnav::save {

static json CoordToJson(IVec2 c) {
    return json::array({ c.x, c.y });
}

static IVec2 CoordFromJson(const json& j) {
    if (!j.is_array() || j.size() != 2)
        throw json::type_error::create(302, "coordinate expects array[2]", &j);
    return IVec2{ j.at(0).get<int>(), j.at(1).get<int>() };
}

json GridToJson(const Grid& grid)
{
    json cells = json::array();
    for (const Cell* cell : grid.AllCells()) {
        std::vector<std::string> tagList = cell->Tags().All();
        tagList.erase(std::remove(tagList.begin(), tagList.end(), std::string(tags::kOccupied)), tagList.end());

        json links = json::array();
        for (const Connection& c : cell->Connections()) {
            links.push_back(json::object({
                {"coord", CoordToJson(c.target->GridPosition())},
                {"index", grid.StackIndexOf(*c.target)},
                {"tag",   c.tag}
            }));
        }

        const auto& v = cell->Vertices();
        cells.push_back(json::object({
            {"coord",       CoordToJson(cell->GridPosition())},
            {"position",    cell->Position()},
            {"vertices",    json::array({ v[0], v[1], v[2], v[3] })},
            {"tags",        tagList},
            {"connections", std::move(links)}
        }));
    }

    return json::object({
        {"version",  kGridFormatVersion},
        {"settings", grid.Settings()},
        {"cells",    std::move(cells)}
    });
}

std::unique_ptr<Grid> GridFromJson(const json& doc)
{
    auto grid = std::make_unique<Grid>(doc.at("settings").get<GridSettings>());
    const json& cells = doc.at("cells");
    if (!cells.is_array())
        throw json::type_error::create(302, "cells expects an array", &cells);

    // Pass 1: cells, in saved order so every stack comes back in the same order.
    std::vector<Cell*> created;
    created.reserve(cells.size());
    for (const json& c : cells) {
        const json& vj = c.at("vertices");
        if (!vj.is_array() || vj.size() != 4)
            throw json::type_error::create(302, "vertices expects array[4]", &vj);
        const std::array<float, 4> vertices{ vj[0].get<float>(), vj[1].get<float>(),
                                             vj[2].get<float>(), vj[3].get<float>() };

        auto cell = std::make_unique<Cell>(CoordFromJson(c.at("coord")), c.at("position").get<Vec3>(), vertices);
        for (const auto& tag : c.value("tags", std::vector<std::string>{}))
            cell->Tags().Add(tag);
        created.push_back(grid->AddCell(std::move(cell)));
    }

    // Pass 2: links, now that every target exists.
    for (std::size_t i = 0; i < created.size(); ++i) {
        const json& links = cells[i].value("connections", json::array());
        for (const json& link : links) {
            const IVec2 at = CoordFromJson(link.at("coord"));
            const int index = link.at("index").get<int>();
            const Grid::CellStack* stack = grid->Stack(at);
            if (!stack || index < 0 || static_cast<std::size_t>(index) >= stack->size())
                throw json::type_error::create(302, "connection points at a missing cell", &link);
            created[i]->AddConnection((*stack)[static_cast<std::size_t>(index)].get(),
                                      link.value("tag", std::string{}));
        }
    }
    return grid;
}

// ---------- I/O ----------

bool SaveGrid(const Grid& grid, const std::filesystem::path& file, PersistError& err)
{
    err = {};
    try {
        const std::string serialized = GridToJson(grid).dump();

        if (file.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(file.parent_path(), ec);
        }

        // Write next to the target, then swap it in.
        std::filesystem::path tmp = file;
        tmp += ".tmp";
        {
            std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
            if (!ofs) {
                err = { PersistError::Code::IoOpenFail, "Cannot open for write: " + tmp.string() };
                spdlog::warn("SaveGrid: {}", err.message);
                return false;
            }
            ofs.write(serialized.data(), static_cast<std::streamsize>(serialized.size()));
            ofs.flush();
            if (!ofs) {
                err = { PersistError::Code::IoWriteFail, "Write failed for: " + tmp.string() };
                spdlog::warn("SaveGrid: {}", err.message);
                return false;
            }
        }

        std::error_code ec;
        std::filesystem::rename(tmp, file, ec);
        if (ec) {
            std::filesystem::remove(tmp, ec);
            err = { PersistError::Code::IoWriteFail, "Cannot replace " + file.string() };
            spdlog::warn("SaveGrid: {}", err.message);
            return false;
        }

        spdlog::info("SaveGrid: '{}' ({} cells) -> {}", grid.Identifier(), grid.CellCount(), file.string());
        return true;
    }
    catch (const std::exception& e) {
        err = { PersistError::Code::IoWriteFail, e.what() };
        spdlog::warn("SaveGrid: {}", err.message);
        return false;
    }
}

std::unique_ptr<Grid> LoadGrid(const std::filesystem::path& file, PersistError& err)
{
    err = {};
    auto fail = [&](PersistError::Code code, std::string message) -> std::unique_ptr<Grid> {
        err = { code, std::move(message) };
        spdlog::warn("LoadGrid: {}", err.message);
        return nullptr;
    };

    try {
        std::ifstream ifs(file, std::ios::binary);
        if (!ifs)
            return fail(PersistError::Code::IoOpenFail, "Cannot open file: " + file.string());

        json doc = json::parse(ifs); // throws on malformed JSON

        if (!doc.is_object())
            return fail(PersistError::Code::JsonTypeError, "Root JSON must be an object");

        const int version = doc.value("version", 0);
        if (version != kGridFormatVersion)
            return fail(PersistError::Code::VersionMismatch,
                        "Unsupported grid version " + std::to_string(version));

        return GridFromJson(doc);
    }
    catch (const json::parse_error& e) {
        return fail(PersistError::Code::JsonParseError, e.what());
    }
    catch (const json::exception& e) {
        return fail(PersistError::Code::JsonTypeError, e.what());
    }
    catch (const std::invalid_argument& e) {
        // Settings the grid refuses, e.g. a zero cell size.
        return fail(PersistError::Code::JsonTypeError, e.what());
    }
}

} // namespace gridnav::save
