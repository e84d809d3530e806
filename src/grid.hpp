#pragma once

#include <string>
#include <vector>
#include <stdexcept>

// Sentinel stored in the cell that currently holds the empty slot.
constexpr int RUNNER_TILE = -1;

class InvalidIndex : public std::out_of_range {
public:
    explicit InvalidIndex(const std::string& what) : std::out_of_range(what) {}
};

// N x N board. cells()[i] is the original index of the image block shown at
// position i, or RUNNER_TILE.
class GridModel {
public:
    static GridModel create(int size, int total_cells);

public:
    explicit GridModel(int size);

public:
    int size() const { return size_; }
    int total_cells() const { return static_cast<int>(cells_.size()); }
    int runner_index() const { return runner_index_; }

    const std::vector<int>& cells() const { return cells_; }
    int at(int index) const;

    int tile_row(int original_pos) const { return original_pos / size_; }
    int tile_col(int original_pos) const { return original_pos % size_; }

    void swap(int a, int b);

private:
    void check_index(int index) const;

    int size_;
    int runner_index_;
    std::vector<int> cells_;
};
