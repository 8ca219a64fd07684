#include <doctest/doctest.h>
#include "gridnav/pathfinding/AStar.hpp"
#include "gridnav/pathfinding/PathJobs.hpp"
#include "gridnav/grid/Grid.hpp"

#include "test_support/GridFixtures.hpp"

#include <stdexcept>

using namespace gridnav;
using namespace gridnav::pf;
using gridnav::test::At;
using gridnav::test::MakeFlatGrid;

namespace {

void OccupyColumn(Grid& grid, int x, int height, OccupantId who) {
    for (int y = 0; y < height; ++y) At(grid, x, y)->SetOccupant(who, Pose{});
}

// Two strips of floor with a three cell gap: x = 0,1 and x = 4,5.
std::unique_ptr<Grid> MakeIslands() {
    auto grid = std::make_unique<Grid>(test::FlatSettings(6, 1));
    for (int x : { 0, 1, 4, 5 })
        grid->AddCell(std::make_unique<Cell>(IVec2{ x, 0 }, grid->CoordinatesToPosition(IVec2{ x, 0 }),
                                             std::array<float, 4>{ 0.0f, 0.0f, 0.0f, 0.0f }));
    return grid;
}

} // namespace

TEST_CASE("AStar/StraightLine") {
    auto grid = MakeFlatGrid(5, 1);
    AStar astar(*grid);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 4, 0));

    REQUIRE(result.status == SearchStatus::Found);
    CHECK(result.waypoints.size() == 5u); // cells, including start
    CHECK(result.waypoints.front().cell == At(*grid, 0, 0));
    CHECK(result.waypoints.back().cell == At(*grid, 4, 0));
    for (const auto& wp : result.waypoints) CHECK(wp.movementTag.empty());
}

TEST_CASE("AStar/DiagonalIsShortest") {
    auto grid = MakeFlatGrid(5, 5);
    AStar astar(*grid);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 4, 4));

    REQUIRE(result.status == SearchStatus::Found);
    REQUIRE(result.waypoints.size() == 5u);
    for (int i = 0; i < 5; ++i)
        CHECK(result.waypoints[static_cast<std::size_t>(i)].cell->GridPosition() == IVec2{ i, i });
}

TEST_CASE("AStar/StartIsTarget") {
    auto grid = MakeFlatGrid(3, 3);
    AStar astar(*grid);
    auto result = astar.FindPath(At(*grid, 1, 1), At(*grid, 1, 1));

    CHECK(result.status == SearchStatus::Found);
    REQUIRE(result.waypoints.size() == 1u);
    CHECK(result.waypoints.front().cell == At(*grid, 1, 1));
}

TEST_CASE("AStar/Blocked") {
    auto grid = MakeFlatGrid(5, 5);
    OccupyColumn(*grid, 2, 5, 42);

    AStar astar(*grid);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 4, 4));
    CHECK(result.status == SearchStatus::NotFound);
    CHECK(result.waypoints.empty());
}

TEST_CASE("AStar/PartialEndsClosestToTarget") {
    auto grid = MakeFlatGrid(5, 5);
    OccupyColumn(*grid, 2, 5, 42);

    AStarConfig cfg;
    cfg.partial = true;
    AStar astar(*grid, cfg);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 4, 4));

    REQUIRE(result.status == SearchStatus::Partial);
    REQUIRE_FALSE(result.waypoints.empty());
    CHECK(result.waypoints.front().cell == At(*grid, 0, 0));
    CHECK(result.waypoints.back().cell->GridPosition() == IVec2{ 1, 4 });
}

TEST_CASE("AStar/PartialFromIsolatedStartIsEmpty") {
    auto grid = MakeIslands();
    AStarConfig cfg;
    cfg.partial = true;
    cfg.connections = false;

    // Nothing on the start's island is closer to the target than the start itself.
    AStar astar(*grid, cfg);
    auto result = astar.FindPath(At(*grid, 4, 0), At(*grid, 0, 0));
    CHECK(result.waypoints.empty());
    CHECK(result.status == SearchStatus::NotFound);
}

TEST_CASE("AStar/OwnOccupancyDoesNotBlock") {
    auto grid = MakeFlatGrid(5, 5);
    OccupyColumn(*grid, 2, 5, 7);

    AStarConfig cfg;
    cfg.pathCreator = 7;
    AStar astar(*grid, cfg);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 4, 4));
    CHECK(result.status == SearchStatus::Found);

    AStarConfig other;
    other.pathCreator = 8;
    AStar blocked(*grid, other);
    CHECK(blocked.FindPath(At(*grid, 0, 0), At(*grid, 4, 4)).status == SearchStatus::NotFound);
}

TEST_CASE("AStar/CancelledBeforeStart") {
    auto grid = MakeFlatGrid(5, 5);
    CancelToken token;
    token.Cancel();

    AStar astar(*grid);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 4, 4), &token);
    CHECK(result.status == SearchStatus::Cancelled);
    CHECK(result.waypoints.empty());
}

TEST_CASE("AStar/CancelledThroughParent") {
    auto grid = MakeFlatGrid(5, 5);
    auto parent = MakeCancelToken();
    auto child = MakeCancelToken(parent);
    CHECK_FALSE(child->IsCancelled());
    parent->Cancel();
    CHECK(child->IsCancelled());

    AStar astar(*grid);
    CHECK(astar.FindPath(At(*grid, 0, 0), At(*grid, 4, 4), child.get()).status == SearchStatus::Cancelled);
}

TEST_CASE("AStar/NullCellsThrow") {
    auto grid = MakeFlatGrid(2, 2);
    AStar astar(*grid);
    CHECK_THROWS_AS((void)astar.FindPath(nullptr, At(*grid, 1, 1)), std::invalid_argument);
    CHECK_THROWS_AS((void)astar.FindPath(At(*grid, 0, 0), nullptr), std::invalid_argument);
}

TEST_CASE("AStar/FollowsTaggedConnections") {
    auto grid = MakeIslands();
    At(*grid, 1, 0)->AddConnection(At(*grid, 4, 0), "drop");

    AStar astar(*grid);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 5, 0));
    REQUIRE(result.status == SearchStatus::Found);
    REQUIRE(result.waypoints.size() == 4u);
    CHECK(result.waypoints[2].cell == At(*grid, 4, 0));
    CHECK(result.waypoints[2].movementTag == "drop");
    CHECK(result.waypoints[3].movementTag.empty());

    SUBCASE("connections are one-way") {
        CHECK(astar.FindPath(At(*grid, 5, 0), At(*grid, 0, 0)).status == SearchStatus::NotFound);
    }

    SUBCASE("plain neighbours only") {
        AStarConfig cfg;
        cfg.connections = false;
        AStar walkOnly(*grid, cfg);
        CHECK(walkOnly.FindPath(At(*grid, 0, 0), At(*grid, 5, 0)).status == SearchStatus::NotFound);
    }
}

TEST_CASE("AStar/MaxDistance") {
    auto grid = MakeFlatGrid(10, 1);
    AStarConfig cfg;
    cfg.maxDistance = 250.0f;
    cfg.partial = true;

    AStar astar(*grid, cfg);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 9, 0));
    REQUIRE(result.status == SearchStatus::Partial);
    CHECK(result.waypoints.back().cell->GridPosition() == IVec2{ 2, 0 });
}

TEST_CASE("AStar/Reversed") {
    auto grid = MakeFlatGrid(4, 1);
    AStarConfig cfg;
    cfg.reversed = true;

    AStar astar(*grid, cfg);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 3, 0));
    REQUIRE(result.waypoints.size() == 4u);
    CHECK(result.waypoints.front().cell == At(*grid, 3, 0));
    CHECK(result.waypoints.back().cell == At(*grid, 0, 0));
}

TEST_CASE("AStar/ConsecutiveWaypointsAreLinked") {
    auto grid = MakeFlatGrid(6, 6);
    At(*grid, 3, 0)->SetOccupant(1, Pose{});
    At(*grid, 3, 1)->SetOccupant(1, Pose{});
    At(*grid, 3, 2)->SetOccupant(1, Pose{});

    AStar astar(*grid);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 5, 0));
    REQUIRE(result.status == SearchStatus::Found);
    for (std::size_t i = 1; i < result.waypoints.size(); ++i) {
        const Cell* a = result.waypoints[i - 1].cell;
        const Cell* b = result.waypoints[i].cell;
        CHECK((a->IsNeighbour(*b) || a->HasConnectionTo(b)));
        CHECK_FALSE(b->IsOccupied());
    }
}

TEST_CASE("AStar/CancelledMidSearch") {
    auto grid = MakeFlatGrid(20, 20);
    OccupyColumn(*grid, 10, 20, 42);

    AStarConfig full;
    full.partial = true;
    auto whole = AStar(*grid, full).FindPath(At(*grid, 0, 0), At(*grid, 19, 19));
    CHECK(whole.status == SearchStatus::Partial);
    CHECK(whole.expanded == 200u); // every cell left of the wall

    auto token = MakeCancelToken();
    std::size_t seen = 0;
    AStarConfig cfg = full;
    cfg.onExpand = [&](const Cell&) {
        if (++seen == 10) token->Cancel();
    };

    AStar astar(*grid, cfg);
    auto result = astar.FindPath(At(*grid, 0, 0), At(*grid, 19, 19), token.get());
    CHECK(result.status == SearchStatus::Cancelled);
    CHECK(result.waypoints.empty());
    CHECK(result.expanded == 10u);
    CHECK(seen == 10u);
}
