#include <doctest/doctest.h>
#include "gridnav/pathfinding/PathBuilder.hpp"
#include "gridnav/pathfinding/PathJobs.hpp"
#include "gridnav/grid/Grid.hpp"

#include "test_support/GridFixtures.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace gridnav;
using namespace gridnav::pf;
using gridnav::test::At;
using gridnav::test::MakeFlatGrid;

namespace {

std::unique_ptr<Grid> MakeIslandsWithDrop() {
    auto grid = std::make_unique<Grid>(test::FlatSettings(6, 1));
    for (int x : { 0, 1, 4, 5 })
        grid->AddCell(std::make_unique<Cell>(IVec2{ x, 0 }, grid->CoordinatesToPosition(IVec2{ x, 0 }),
                                             std::array<float, 4>{ 0.0f, 0.0f, 0.0f, 0.0f }));
    At(*grid, 1, 0)->AddConnection(At(*grid, 4, 0), "drop");
    return grid;
}

// A two cell wide strip whose corner drops onto a 6x10 field. Nothing leads back up.
std::unique_ptr<Grid> MakeLedgeOverField() {
    auto grid = std::make_unique<Grid>(test::FlatSettings(10, 10));
    for (int y = 0; y < 10; ++y)
        for (int x : { 0, 1, 4, 5, 6, 7, 8, 9 })
            grid->AddCell(std::make_unique<Cell>(IVec2{ x, y }, grid->CoordinatesToPosition(IVec2{ x, y }),
                                                 std::array<float, 4>{ 0.0f, 0.0f, 0.0f, 0.0f }));
    At(*grid, 1, 0)->AddConnection(At(*grid, 4, 0), "drop");
    return grid;
}

} // namespace

TEST_CASE("PathBuilder/FluentSettings") {
    auto grid = MakeFlatGrid(2, 2);
    auto builder = PathBuilder::From(*grid)
        .WithPathCreator(5)
        .WithPartialEnabled()
        .WithMaxDistance(300.0f)
        .WithConnections(false)
        .WithReversed()
        .WithSimplify(3, 4);

    const PathSettings& s = builder.Settings();
    CHECK(s.grid == grid.get());
    CHECK(&builder.GetGrid() == grid.get());
    CHECK(s.pathCreator == 5u);
    CHECK(s.partial);
    CHECK(s.maxDistance == 300.0f);
    CHECK_FALSE(s.connections);
    CHECK(s.reversed);
    CHECK(s.simplify);
    CHECK(s.segmentSize == 3);
    CHECK(s.iterations == 4);

    builder.WithoutSimplify();
    CHECK_FALSE(builder.Settings().simplify);
}

TEST_CASE("PathBuilder/RunSimplifiesByDefault") {
    auto grid = MakeFlatGrid(5, 5);
    Path path = PathBuilder::From(*grid).Run(At(*grid, 0, 0), At(*grid, 4, 4));

    CHECK(path.status == SearchStatus::Found);
    REQUIRE(path.Count() == 2u);
    CHECK(path.Settings().grid == grid.get());

    Path raw = PathBuilder::From(*grid).WithoutSimplify().Run(At(*grid, 0, 0), At(*grid, 4, 4));
    CHECK(raw.Count() == 5u);
}

TEST_CASE("PathBuilder/PartialAndNotFound") {
    auto grid = MakeFlatGrid(5, 5);
    for (int y = 0; y < 5; ++y) At(*grid, 2, y)->SetOccupant(42, Pose{});

    Path none = PathBuilder::From(*grid).Run(At(*grid, 0, 0), At(*grid, 4, 4));
    CHECK(none.IsEmpty());
    CHECK(none.status == SearchStatus::NotFound);

    Path partial = PathBuilder::From(*grid).WithPartialEnabled().Run(At(*grid, 0, 0), At(*grid, 4, 4));
    CHECK(partial.status == SearchStatus::Partial);
    REQUIRE_FALSE(partial.IsEmpty());
    CHECK(partial.Back().cell->GridPosition().x == 1);
}

TEST_CASE("PathBuilder/NullCellsThrowBeforeQueueing") {
    auto grid = MakeFlatGrid(2, 2);
    SearchExecutor executor(SearchExecutor::Config{ 2 });
    auto builder = PathBuilder::From(*grid);

    CHECK_THROWS_AS((void)builder.Run(nullptr, At(*grid, 1, 1)), std::invalid_argument);
    CHECK_THROWS_AS((void)builder.RunAsync(executor, At(*grid, 0, 0), nullptr), std::invalid_argument);
    CHECK_THROWS_AS((void)builder.RunParallelAsync(executor, nullptr, nullptr), std::invalid_argument);
}

TEST_CASE("PathBuilder/RunAsync") {
    auto grid = MakeFlatGrid(8, 8);
    SearchExecutor executor(SearchExecutor::Config{ 2 });
    CHECK(executor.WorkerCount() == 2u);

    auto builder = PathBuilder::From(*grid).WithoutSimplify();
    std::vector<std::future<Path>> pending;
    for (int i = 0; i < 8; ++i)
        pending.push_back(builder.RunAsync(executor, At(*grid, 0, 0), At(*grid, 7, i)));

    for (int i = 0; i < 8; ++i) {
        Path p = pending[static_cast<std::size_t>(i)].get();
        CHECK(p.status == SearchStatus::Found);
        CHECK(p.Back().cell == At(*grid, 7, i));
    }
}

TEST_CASE("PathBuilder/RunAsyncHonoursCancellation") {
    auto grid = MakeFlatGrid(8, 8);
    SearchExecutor executor(SearchExecutor::Config{ 1 });
    auto token = MakeCancelToken();
    token->Cancel();

    Path p = PathBuilder::From(*grid).RunAsync(executor, At(*grid, 0, 0), At(*grid, 7, 7), token).get();
    CHECK(p.status == SearchStatus::Cancelled);
    CHECK(p.IsEmpty());
}

TEST_CASE("PathBuilder/RunParallelAsync") {
    SearchExecutor executor(SearchExecutor::Config{ 2 });

    SUBCASE("both sides can reach") {
        auto grid = MakeFlatGrid(6, 6);
        Path p = PathBuilder::From(*grid).WithoutSimplify()
                     .RunParallelAsync(executor, At(*grid, 0, 0), At(*grid, 5, 5)).get();
        REQUIRE(p.status == SearchStatus::Found);
        CHECK(p.Front().cell == At(*grid, 0, 0));
        CHECK(p.Back().cell == At(*grid, 5, 5));
        CHECK(p.Count() == 6u);
        CHECK_FALSE(p.Settings().reversed);
        CHECK(p.Settings().connections);
    }

    SUBCASE("only the forward side sees links") {
        auto grid = MakeIslandsWithDrop();
        Path p = PathBuilder::From(*grid).WithoutSimplify()
                     .RunParallelAsync(executor, At(*grid, 0, 0), At(*grid, 5, 0)).get();
        REQUIRE(p.status == SearchStatus::Found);
        REQUIRE(p.Count() == 4u);
        CHECK(p.nodes[2].movementTag == "drop");
    }

    SUBCASE("neither side reaches: forward result comes back") {
        auto grid = MakeFlatGrid(5, 5);
        for (int y = 0; y < 5; ++y) At(*grid, 2, y)->SetOccupant(42, Pose{});
        Path p = PathBuilder::From(*grid).WithPartialEnabled()
                     .RunParallelAsync(executor, At(*grid, 0, 0), At(*grid, 4, 4)).get();
        CHECK(p.status == SearchStatus::Partial);
        REQUIRE_FALSE(p.IsEmpty());
        CHECK(p.Front().cell == At(*grid, 0, 0));
    }

    SUBCASE("caller cancellation reaches both sides") {
        auto grid = MakeFlatGrid(6, 6);
        auto token = MakeCancelToken();
        token->Cancel();
        Path p = PathBuilder::From(*grid)
                     .RunParallelAsync(executor, At(*grid, 0, 0), At(*grid, 5, 5), token).get();
        CHECK(p.status == SearchStatus::Cancelled);
        CHECK(p.IsEmpty());
    }
}

TEST_CASE("SearchExecutor/RefusesWorkAfterShutdown") {
    auto grid = MakeFlatGrid(2, 2);
    SearchExecutor executor(SearchExecutor::Config{ 1 });
    auto f = executor.Submit([] { return 7; });
    CHECK(f.get() == 7);

    executor.Shutdown();
    CHECK(executor.IsStopping());
    CHECK_THROWS_AS((void)PathBuilder::From(*grid).RunAsync(executor, At(*grid, 0, 0), At(*grid, 1, 1)),
                    std::runtime_error);
}

TEST_CASE("PathBuilder/RaceCancelsTheLoser") {
    auto grid = MakeLedgeOverField();
    const Cell* start = At(*grid, 1, 0);
    const Cell* target = At(*grid, 4, 0);

    std::atomic<bool> released{ false };
    std::atomic<int> fieldExpansions{ 0 };
    SearchExecutor executor(SearchExecutor::Config{ 2 });

    // Only the backward search walks the field past the landing cell. It is held
    // there until the forward search has settled the race.
    auto builder = PathBuilder::From(*grid).WithoutSimplify().WithExpansionObserver([&](const Cell& cell) {
        if (cell.GridPosition().x < 4 || &cell == target) return;
        ++fieldExpansions;
        const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
        while (!released.load() && std::chrono::steady_clock::now() < deadline)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
    });

    Path p = builder.RunParallelAsync(executor, start, target).get();
    released = true;
    executor.Shutdown();

    REQUIRE(p.status == SearchStatus::Found);
    REQUIRE(p.Count() == 2u);
    CHECK(p.Back().movementTag == "drop");
    // 59 field cells stay unexpanded once the backward search sees its token.
    CHECK(fieldExpansions.load() <= 1);
}

TEST_CASE("PathBuilder/ExpansionObserver") {
    auto grid = MakeFlatGrid(5, 1);
    std::vector<IVec2> expanded;
    Path p = PathBuilder::From(*grid)
                 .WithExpansionObserver([&](const Cell& cell) { expanded.push_back(cell.GridPosition()); })
                 .Run(At(*grid, 0, 0), At(*grid, 4, 0));

    CHECK(p.status == SearchStatus::Found);
    REQUIRE(expanded.size() == 5u);
    CHECK(expanded.front() == IVec2{ 0, 0 });
    CHECK(expanded.back() == IVec2{ 4, 0 });
}
