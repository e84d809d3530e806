#include <gtest/gtest.h>

#include "grid.hpp"
#include "shuffler.hpp"
#include "move_engine.hpp"

#include <vector>
#include <algorithm>


TEST(Shuffler, DrawsExactlyThousandDirections) {
    GridModel grid(3);
    MoveEngine engine;
    Shuffler shuffler(engine, 42);

    auto drawn = shuffler.shuffle(grid);

    EXPECT_EQ(drawn.size(), static_cast<size_t>(SHUFFLE_MOVES));
    EXPECT_EQ(SHUFFLE_MOVES, 1000);
    EXPECT_TRUE(std::none_of(drawn.begin(), drawn.end(), [](Direction d) { return d == Direction::None; }));
}

TEST(Shuffler, UsesAllFourDirections) {
    GridModel grid(4);
    MoveEngine engine;
    Shuffler shuffler(engine, 7);

    auto drawn = shuffler.shuffle(grid);

    for (Direction dir : {Direction::Left, Direction::Up, Direction::Right, Direction::Down}) {
        auto n = std::count(drawn.begin(), drawn.end(), dir);
        // Roughly a quarter each
        EXPECT_GT(n, 150) << static_cast<int>(dir);
        EXPECT_LT(n, 350) << static_cast<int>(dir);
    }
}

TEST(Shuffler, NotifiesListenerOncePerEffectiveMove) {
    GridModel grid(3);
    MoveEngine engine;
    Shuffler shuffler(engine, 1234);

    int notified = 0;
    engine.set_listener([&](const MoveResult& r) {
        EXPECT_TRUE(r.moved());
        ++notified;
    });

    // Replay the draws on a second grid to count the moves that were not clamped
    auto drawn = shuffler.shuffle(grid);
    GridModel replay(3);
    MoveEngine quiet;
    int effective = 0;
    for (Direction dir : drawn) {
        if (quiet.apply_move(replay, dir).moved()) {
            ++effective;
        }
    }

    EXPECT_EQ(notified, effective);
    EXPECT_EQ(replay.cells(), grid.cells());
    EXPECT_LT(effective, SHUFFLE_MOVES);
}

TEST(Shuffler, ResultIsReachableFromSolved) {
    for (int size = 2; size <= 6; ++size) {
        GridModel grid(size);
        MoveEngine engine;
        Shuffler shuffler(engine, 99 + size);

        // Record the moves that actually happened
        std::vector<Direction> applied;
        GridModel replay(size);
        MoveEngine replay_engine;
        for (Direction dir : shuffler.shuffle(grid)) {
            if (replay_engine.apply_move(replay, dir).moved()) {
                applied.push_back(dir);
            }
        }
        ASSERT_EQ(replay.cells(), grid.cells());

        for (auto it = applied.rbegin(); it != applied.rend(); ++it) {
            ASSERT_TRUE(engine.apply_move(grid, MoveEngine::inverse(*it)).moved());
        }

        EXPECT_EQ(grid.cells(), GridModel(size).cells()) << "size " << size;
        EXPECT_EQ(grid.runner_index(), size * size - 1);
    }
}

TEST(Shuffler, SameSeedSameScramble) {
    GridModel a(4), b(4);
    MoveEngine engine_a, engine_b;
    Shuffler shuffler_a(engine_a, 555), shuffler_b(engine_b, 555);

    EXPECT_EQ(shuffler_a.shuffle(a), shuffler_b.shuffle(b));
    EXPECT_EQ(a.cells(), b.cells());
}

TEST(Shuffler, ScramblesLargerGrids) {
    GridModel grid(4);
    MoveEngine engine;
    Shuffler shuffler(engine, 2024);

    shuffler.shuffle(grid);

    int displaced = 0;
    for (int i = 0; i < grid.total_cells(); ++i) {
        if (grid.at(i) != RUNNER_TILE && grid.at(i) != i) {
            ++displaced;
        }
    }
    EXPECT_GT(displaced, 0);
}

TEST(Shuffler, CustomMoveCount) {
    GridModel grid(3);
    MoveEngine engine;
    Shuffler shuffler(engine, 3);

    EXPECT_EQ(shuffler.shuffle(grid, 17).size(), 17u);
    EXPECT_TRUE(shuffler.shuffle(grid, 0).empty());
}
