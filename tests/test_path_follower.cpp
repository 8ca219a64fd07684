#include <doctest/doctest.h>
#include "gridnav/nav/PathFollower.hpp"
#include "gridnav/grid/Grid.hpp"

#include "test_support/GridFixtures.hpp"

using namespace gridnav;
using namespace gridnav::pf;
using gridnav::nav::PathFollower;
using gridnav::test::At;
using gridnav::test::MakeFlatGrid;

namespace {

Path StraightPath(const Grid& grid, int length) {
    Path p;
    p.settings.grid = &grid;
    p.status = SearchStatus::Found;
    for (int x = 0; x < length; ++x) p.nodes.push_back(Waypoint{ At(grid, x, 0), {} });
    return p;
}

} // namespace

TEST_CASE("PathFollower/Adopt") {
    auto grid = MakeFlatGrid(5, 1);
    PathFollower follower;
    CHECK_FALSE(follower.IsFollowingPath());
    CHECK(follower.NextCell() == nullptr);
    CHECK(follower.CurrentCell() == nullptr);
    CHECK(follower.NextMovementTag().empty());

    CHECK_FALSE(follower.Adopt(Path{}));
    Path orphan = StraightPath(*grid, 3);
    orphan.settings.grid = nullptr;
    CHECK_FALSE(follower.Adopt(orphan));

    REQUIRE(follower.Adopt(StraightPath(*grid, 5)));
    CHECK(follower.IsFollowingPath());
    CHECK(follower.Index() == 0);
    CHECK(follower.CurrentCell() == At(*grid, 0, 0));
    CHECK(follower.NextCell() == At(*grid, 1, 0));
    CHECK(follower.LastCell() == At(*grid, 4, 0));
    CHECK(follower.Target() == At(*grid, 4, 0));
    CHECK_FALSE(follower.HasArrived());
}

TEST_CASE("PathFollower/TickWalksToTheEnd") {
    auto grid = MakeFlatGrid(5, 1);
    PathFollower follower;
    REQUIRE(follower.Adopt(StraightPath(*grid, 5)));

    // Too far from the next waypoint.
    follower.Tick(Vec3{ 50.0f, 50.0f, 0.0f });
    CHECK(follower.Index() == 0);

    for (int x = 1; x < 4; ++x) {
        follower.Tick(At(*grid, x, 0)->Position());
        CHECK(follower.Index() == x);
        CHECK(follower.NextCell() == At(*grid, x + 1, 0));
    }

    follower.Tick(At(*grid, 4, 0)->Position());
    CHECK(follower.HasArrived());
    CHECK_FALSE(follower.IsFollowingPath());
    CHECK(follower.NextCell() == nullptr);

    // Nothing to do once there.
    follower.Tick(At(*grid, 4, 0)->Position());
    CHECK(follower.Index() == -1);
}

TEST_CASE("PathFollower/NextMovementTag") {
    auto grid = MakeFlatGrid(4, 1);
    Path path = StraightPath(*grid, 4);
    path.nodes[2].movementTag = "drop";

    PathFollower follower;
    REQUIRE(follower.Adopt(path));
    CHECK(follower.NextMovementTag().empty());
    follower.Tick(At(*grid, 1, 0)->Position());
    CHECK(follower.NextMovementTag() == "drop");

    follower.Stop();
    CHECK_FALSE(follower.IsFollowingPath());
    CHECK(follower.NextMovementTag().empty());
}

TEST_CASE("PathFollower/NeedsRetrace") {
    auto grid = MakeFlatGrid(5, 5);
    PathFollower follower(0.5);
    const Vec3 onPath = At(*grid, 0, 0)->Position();

    // Idle followers never ask.
    CHECK_FALSE(follower.NeedsRetrace(0.0, onPath));

    REQUIRE(follower.Adopt(StraightPath(*grid, 5)));
    CHECK_FALSE(follower.NeedsRetrace(1.0, onPath));

    SUBCASE("strayed from the path") {
        const Vec3 away = At(*grid, 0, 3)->Position();
        CHECK_FALSE(follower.NeedsRetrace(1.2, away)); // interval not elapsed
        CHECK(follower.NeedsRetrace(1.6, away));
    }

    SUBCASE("target moved") {
        follower.SetTarget(At(*grid, 4, 4));
        CHECK(follower.NeedsRetrace(1.5, onPath));
    }

    SUBCASE("one diagonal cell is not straying") {
        CHECK_FALSE(follower.NeedsRetrace(1.5, At(*grid, 1, 1)->Position()));
    }
}

TEST_CASE("PathFollower/NavigateTo") {
    auto grid = MakeFlatGrid(5, 5);
    SearchExecutor executor(SearchExecutor::Config{ 2 });
    const PathBuilder builder = PathBuilder::From(*grid);
    PathFollower follower;

    CHECK_FALSE(follower.NavigateTo(nullptr, At(*grid, 0, 0), builder, executor));
    CHECK_FALSE(follower.NavigateTo(At(*grid, 0, 0), At(*grid, 0, 0), builder, executor));

    REQUIRE(follower.NavigateTo(At(*grid, 4, 4), At(*grid, 0, 0), builder, executor));
    CHECK(follower.IsFollowingPath());
    CHECK(follower.CurrentPath().Count() == 2u);
    CHECK(follower.Target() == At(*grid, 4, 4));

    SUBCASE("unreachable target leaves the current path alone") {
        for (int y = 0; y < 5; ++y) At(*grid, 2, y)->SetOccupant(9, Pose{});
        CHECK_FALSE(follower.NavigateTo(At(*grid, 4, 0), At(*grid, 0, 0), builder, executor));
        CHECK(follower.Target() == At(*grid, 4, 4));
    }

    SUBCASE("unsimplified builder still hands over a simplified path") {
        const PathBuilder raw = PathBuilder::From(*grid).WithoutSimplify();
        REQUIRE(follower.NavigateTo(At(*grid, 4, 0), At(*grid, 0, 0), raw, executor));
        CHECK(follower.CurrentPath().Count() == 2u);
    }
}
