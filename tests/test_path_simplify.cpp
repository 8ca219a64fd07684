#include <doctest/doctest.h>
#include "gridnav/pathfinding/AStar.hpp"
#include "gridnav/pathfinding/Path.hpp"
#include "gridnav/grid/Grid.hpp"

#include "test_support/GridFixtures.hpp"

#include <string>

using namespace gridnav;
using namespace gridnav::pf;
using gridnav::test::At;
using gridnav::test::MakeFlatGrid;

namespace {

Path Search(const Grid& grid, const Cell* a, const Cell* b) {
    AStar astar(grid);
    auto found = astar.FindPath(a, b);
    Path p;
    p.nodes = std::move(found.waypoints);
    p.status = found.status;
    p.settings.grid = &grid;
    return p;
}

} // namespace

TEST_CASE("Simplify/DiagonalCollapsesToEnds") {
    auto grid = MakeFlatGrid(5, 5);
    Path path = Search(*grid, At(*grid, 0, 0), At(*grid, 4, 4));
    REQUIRE(path.Count() == 5u);

    CHECK(path.Simplify(2, 8) == 3u);
    REQUIRE(path.Count() == 2u);
    CHECK(path.Front().cell == At(*grid, 0, 0));
    CHECK(path.Back().cell == At(*grid, 4, 4));
}

TEST_CASE("Simplify/StraightLineKeepsLength") {
    auto grid = MakeFlatGrid(5, 1);
    Path path = Search(*grid, At(*grid, 0, 0), At(*grid, 4, 0));
    CHECK(path.Length() == doctest::Approx(400.0f));

    path.Simplify();
    CHECK(path.Count() == 2u);
    CHECK(path.Length() == doctest::Approx(400.0f));
}

TEST_CASE("Simplify/EveryShortcutIsWalkable") {
    auto grid = MakeFlatGrid(8, 8);
    for (int y = 0; y < 6; ++y) At(*grid, 4, y)->SetOccupant(3, Pose{});

    Path path = Search(*grid, At(*grid, 0, 0), At(*grid, 7, 0));
    REQUIRE(path.status == SearchStatus::Found);
    const std::size_t before = path.Count();
    const Cell* first = path.Front().cell;
    const Cell* last = path.Back().cell;

    path.Simplify(3, 8);
    CHECK(path.Count() <= before);
    CHECK(path.Front().cell == first);
    CHECK(path.Back().cell == last);
    for (std::size_t i = 1; i < path.Count(); ++i)
        CHECK(grid->LineOfSight(*path.nodes[i - 1].cell, *path.nodes[i].cell));
}

TEST_CASE("Simplify/ShortcutWaypointIsWalked") {
    auto grid = MakeFlatGrid(3, 1);
    Path path;
    path.settings.grid = grid.get();
    path.nodes = { Waypoint{ At(*grid, 0, 0), {} },
                   Waypoint{ At(*grid, 1, 0), "jump" },
                   Waypoint{ At(*grid, 2, 0), "drop" } };

    CHECK(path.Simplify() == 1u);
    REQUIRE(path.Count() == 2u);
    CHECK(path.Back().cell == At(*grid, 2, 0));
    CHECK(path.Back().movementTag.empty());
}

TEST_CASE("Simplify/NoOps") {
    auto grid = MakeFlatGrid(5, 1);

    SUBCASE("without a grid") {
        Path path = Search(*grid, At(*grid, 0, 0), At(*grid, 4, 0));
        path.settings.grid = nullptr;
        CHECK(path.Simplify() == 0u);
        CHECK(path.Count() == 5u);
    }

    SUBCASE("two waypoints or fewer") {
        Path path = Search(*grid, At(*grid, 0, 0), At(*grid, 1, 0));
        REQUIRE(path.Count() == 2u);
        CHECK(path.Simplify() == 0u);
    }

    SUBCASE("segment smaller than two") {
        Path path = Search(*grid, At(*grid, 0, 0), At(*grid, 4, 0));
        CHECK(path.Simplify(1, 8) == 0u);
    }

    SUBCASE("blocked shortcut") {
        Path path = Search(*grid, At(*grid, 0, 0), At(*grid, 4, 0));
        for (std::size_t i = 1; i + 1 < path.Count(); ++i)
            const_cast<Cell*>(path.nodes[i].cell)->SetOccupant(9, Pose{});
        // Owner 9 walks its own cells; everyone else can't see through them.
        path.settings.pathCreator = 1;
        CHECK(path.Simplify() == 0u);
        path.settings.pathCreator = 9;
        CHECK(path.Simplify() == 3u);
    }
}

TEST_CASE("Path/EmptyFactory") {
    const Path p = Path::Empty({}, SearchStatus::Cancelled);
    CHECK(p.IsEmpty());
    CHECK(p.Count() == 0u);
    CHECK(p.status == SearchStatus::Cancelled);
    CHECK(p.Length() == 0.0f);
    CHECK(std::string(ToString(SearchStatus::Partial)) == "partial");
}
