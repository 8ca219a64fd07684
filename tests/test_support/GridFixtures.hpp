#pragma once
// tests/test_support/GridFixtures.hpp
//
// Hand-built grids for search tests, no probing involved.

#include "gridnav/grid/Grid.hpp"
#include "gridnav/grid/GridSettings.hpp"

#include <array>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

namespace gridnav::test {

inline GridSettings FlatSettings(int width, int height, float cellSize = 100.0f, std::string id = "main") {
    const float w = static_cast<float>(width) * cellSize;
    const float h = static_cast<float>(height) * cellSize;
    return GridSettings::From(BBox{ Vec3{ 0.0f, 0.0f, -100.0f }, Vec3{ w, h, 500.0f } })
        .WithCellSize(cellSize)
        .WithIdentifier(std::move(id));
}

// width x height cells at z = 0, every one a plain neighbour of the next.
inline std::unique_ptr<Grid> MakeFlatGrid(int width, int height, float cellSize = 100.0f, std::string id = "main") {
    auto grid = std::make_unique<Grid>(FlatSettings(width, height, cellSize, std::move(id)));
    for (int y = 0; y < height; ++y)
        for (int x = 0; x < width; ++x)
            grid->AddCell(std::make_unique<Cell>(IVec2{ x, y }, grid->CoordinatesToPosition(IVec2{ x, y }, 0.0f),
                                                 std::array<float, 4>{ 0.0f, 0.0f, 0.0f, 0.0f }));
    return grid;
}

// Topmost cell of the column.
inline Cell* At(const Grid& grid, int x, int y) {
    return grid.GetCell(IVec2{ x, y }, 1.0e6f);
}

inline std::filesystem::path MakeUniqueTempDir(const std::string& prefix) {
    std::error_code ec;
    std::filesystem::path base = std::filesystem::temp_directory_path(ec);
    if (ec || base.empty())
        base = std::filesystem::path(".");

    const auto stamp = static_cast<long long>(
        std::chrono::high_resolution_clock::now().time_since_epoch().count());

    std::filesystem::path dir = base / (prefix + "_" + std::to_string(stamp));
    std::filesystem::create_directories(dir, ec);
    if (ec)
        return base;
    return dir;
}

} // namespace gridnav::test
