#include "shuffler.hpp"

#include <array>
#include <vector>

#include <opencv2/core.hpp>


namespace {

constexpr std::array<Direction, 4> DIRECTIONS = {
    Direction::Left, Direction::Up, Direction::Right, Direction::Down
};

}


Shuffler::Shuffler(MoveEngine& engine, uint64_t seed) : engine(engine), rng(seed) {
}

std::vector<Direction> Shuffler::shuffle(GridModel& grid, int moves) {
    std::vector<Direction> drawn;
    drawn.reserve(moves > 0 ? moves : 0);

    for (int i = 0; i < moves; ++i) {
        Direction dir = DIRECTIONS[rng.uniform(0, static_cast<int>(DIRECTIONS.size()))];
        engine.apply_move(grid, dir);
        drawn.push_back(dir);
    }

    return drawn;
}
