#pragma once

#include "grid.hpp"
#include "move_engine.hpp"

#include <vector>
#include <cstdint>

#include <opencv2/core.hpp>

constexpr int SHUFFLE_MOVES = 1000;


// Scrambles a grid with random moves issued through the engine, so the
// result is always reachable from the solved state.
class Shuffler {
public:
    Shuffler(MoveEngine& engine, uint64_t seed);

public:
    // Returns every direction drawn, including the ones the engine clamped.
    std::vector<Direction> shuffle(GridModel& grid, int moves = SHUFFLE_MOVES);

private:
    MoveEngine& engine;
    cv::RNG rng;
};
