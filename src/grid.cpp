#include "grid.hpp"

#include <string>
#include <numeric>
#include <utility>
#include <stdexcept>


GridModel GridModel::create(int size, int total_cells) {
    if (size < 2 || total_cells != size * size) {
        throw std::invalid_argument("Grid of size " + std::to_string(size) + " cannot hold " + std::to_string(total_cells) + " cells");
    }
    return GridModel(size);
}

GridModel::GridModel(int size) : size_(size), runner_index_(0) {
    if (size < 2) {
        throw std::invalid_argument("Grid size must be at least 2, got " + std::to_string(size));
    }

    cells_.resize(static_cast<size_t>(size) * size);
    std::iota(cells_.begin(), cells_.end(), 0);

    runner_index_ = total_cells() - 1;
    cells_[runner_index_] = RUNNER_TILE;
}

int GridModel::at(int index) const {
    check_index(index);
    return cells_[index];
}

void GridModel::swap(int a, int b) {
    check_index(a);
    check_index(b);

    std::swap(cells_[a], cells_[b]);

    if (cells_[a] == RUNNER_TILE) {
        runner_index_ = a;
    }
    else if (cells_[b] == RUNNER_TILE) {
        runner_index_ = b;
    }
}

void GridModel::check_index(int index) const {
    if (index < 0 || index >= total_cells()) {
        throw InvalidIndex("Cell index " + std::to_string(index) + " outside [0, " + std::to_string(total_cells()) + ")");
    }
}
