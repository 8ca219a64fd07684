#pragma once
#include "gridnav/grid/Connectivity.hpp"
#include "gridnav/grid/GridSettings.hpp"
#include "gridnav/pathfinding/Path.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace gridnav::core {

struct Config {
    GridSettings     grid;
    pf::PathSettings path;          // grid/pathCreator are runtime-only and never read from disk
    JumpSettings     jump;
    bool             generateJumps   = false;
    double           retraceInterval = 0.1;  // seconds
    unsigned         workerThreads   = 0;    // 0 = hardware threads - 2
};

// <dir>/gridnav.ini
std::filesystem::path ConfigPath(const std::filesystem::path& dir);

// key=value lines; unknown keys and unparsable values leave the defaults alone.
void ParseConfig(Config& cfg, std::string_view text);
std::string FormatConfig(const Config& cfg);

bool LoadConfig(Config& cfg, const std::filesystem::path& saveDir);
bool SaveConfig(const Config& cfg, const std::filesystem::path& saveDir);

} // namespace gridnav::core
