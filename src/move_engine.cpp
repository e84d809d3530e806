#include "move_engine.hpp"

#include "grid.hpp"


namespace {

// Arrow key codes as reported by cv::waitKeyEx on each highgui backend.
constexpr int GTK_LEFT = 65361, GTK_UP = 65362, GTK_RIGHT = 65363, GTK_DOWN = 65364;
constexpr int QT_LEFT = 0x01000012, QT_UP = 0x01000013, QT_RIGHT = 0x01000014, QT_DOWN = 0x01000015;
constexpr int WIN_LEFT = 0x250000, WIN_UP = 0x260000, WIN_RIGHT = 0x270000, WIN_DOWN = 0x280000;

}


int MoveEngine::target_index(const GridModel& grid, Direction dir) {
    int runner = grid.runner_index();
    int size = grid.size();

    switch (dir) {
        case Direction::Left:
            return runner % size == 0 ? runner : runner - 1;
        case Direction::Up:
            return runner < size ? runner : runner - size;
        case Direction::Right:
            return runner % size == size - 1 ? runner : runner + 1;
        case Direction::Down:
            return runner >= grid.total_cells() - size ? runner : runner + size;
        default:
            return runner;
    }
}

Direction MoveEngine::inverse(Direction dir) {
    switch (dir) {
        case Direction::Left:  return Direction::Right;
        case Direction::Right: return Direction::Left;
        case Direction::Up:    return Direction::Down;
        case Direction::Down:  return Direction::Up;
        default:               return Direction::None;
    }
}

Direction MoveEngine::direction_from_key(int key) {
    switch (key) {
        case GTK_LEFT:  case QT_LEFT:  case WIN_LEFT:  return Direction::Left;
        case GTK_UP:    case QT_UP:    case WIN_UP:    return Direction::Up;
        case GTK_RIGHT: case QT_RIGHT: case WIN_RIGHT: return Direction::Right;
        case GTK_DOWN:  case QT_DOWN:  case WIN_DOWN:  return Direction::Down;
        default:        return Direction::None;
    }
}

MoveResult MoveEngine::apply_move(GridModel& grid, Direction dir) {
    if (dir == Direction::None) {
        return MoveResult{MoveStatus::Unrecognized};
    }

    int runner = grid.runner_index();
    int target = target_index(grid, dir);

    if (target == runner) {
        return MoveResult{MoveStatus::Blocked, runner, runner};
    }

    grid.swap(target, runner);

    MoveResult result{MoveStatus::Moved, runner, target};
    if (listener) {
        listener(result);
    }
    return result;
}
