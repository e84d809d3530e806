#pragma once

#include "grid.hpp"
#include "main.hpp"
#include "shuffler.hpp"
#include "move_engine.hpp"

#include <memory>
#include <vector>
#include <cstdint>

#include <opencv2/opencv.hpp>


// One puzzle session over a square image. The board image is kept in sync
// with the grid: every effective move repaints the two cells it exchanged.
class Puzzle {
public:
    static BoardLayout make_board_layout(const cv::Mat& image, int level);
    static cv::Rect cell_rect(int index, int level, int tile_size);
    static bool is_solved(const GridModel& grid);

public:
    Puzzle(const cv::Mat& image, int level);
    Puzzle(const cv::Mat& image, int level, uint64_t seed);

    Puzzle(const Puzzle&) = delete;
    Puzzle& operator=(const Puzzle&) = delete;

public:
    MoveResult handle_key(int key);
    MoveResult move(Direction dir);
    std::vector<Direction> shuffle(int moves = SHUFFLE_MOVES);

    bool is_solved() const { return is_solved(grid_); }
    bool shuffled() const { return shuffled_; }
    int moves_made() const { return moves_made_; }
    int repaints() const { return repaints_; }

    const GridModel& grid() const { return grid_; }
    const cv::Mat& board() const { return board_; }
    const cv::Mat& image() const { return image_; }
    const BoardLayout& layout() const { return layout_; }

private:
    void on_move(const MoveResult& result);
    void paint_board();
    void paint_cell(int index);

    cv::Mat image_;
    cv::Mat board_;
    BoardLayout layout_;

    GridModel grid_;
    MoveEngine engine;
    std::unique_ptr<Shuffler> shuffler;

    bool shuffled_ = false;
    int moves_made_ = 0;
    int repaints_ = 0;
};
