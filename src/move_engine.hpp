#pragma once

#include "grid.hpp"

#include <utility>
#include <functional>


enum class Direction {
    None,
    Left,
    Up,
    Right,
    Down
};

enum class MoveStatus {
    Moved,
    Blocked,
    Unrecognized
};

// For Moved results, from is the runner's old cell and to its new cell.
struct MoveResult {
    MoveStatus status = MoveStatus::Unrecognized;
    int from = -1;
    int to = -1;

    bool moved() const { return status == MoveStatus::Moved; }
};

class MoveEngine {
public:
    using Listener = std::function<void(const MoveResult&)>;

    static int target_index(const GridModel& grid, Direction dir);
    static Direction inverse(Direction dir);
    static Direction direction_from_key(int key);

public:
    void set_listener(Listener listener) { this->listener = std::move(listener); }

    MoveResult apply_move(GridModel& grid, Direction dir);

private:
    Listener listener;
};
