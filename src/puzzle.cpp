#include "puzzle.hpp"

#include "grid.hpp"
#include "main.hpp"
#include "shuffler.hpp"
#include "move_engine.hpp"

#include <memory>
#include <string>
#include <vector>
#include <stdexcept>

#include <opencv2/opencv.hpp>


BoardLayout Puzzle::make_board_layout(const cv::Mat& image, int level) {
    if (image.empty() || image.cols != image.rows) {
        throw std::invalid_argument("Puzzle image must be a non-empty square");
    }
    if (level < 2 || image.cols < level) {
        throw std::invalid_argument("Cannot cut a " + std::to_string(image.cols) + "px image into " + std::to_string(level) + " tiles per row");
    }

    // Any remainder after dividing into whole tiles is cropped off the right and bottom edges
    int tile_size = image.cols / level;
    return BoardLayout{tile_size * level, tile_size, cv::Scalar(30, 30, 30)};
}

cv::Rect Puzzle::cell_rect(int index, int level, int tile_size) {
    return cv::Rect((index % level) * tile_size, (index / level) * tile_size, tile_size, tile_size);
}

bool Puzzle::is_solved(const GridModel& grid) {
    const auto& cells = grid.cells();
    int last = grid.total_cells() - 1;

    for (int i = 0; i < last; ++i) {
        if (cells[i] != i) {
            return false;
        }
    }
    return cells[last] == RUNNER_TILE;
}

Puzzle::Puzzle(const cv::Mat& image, int level)
    : Puzzle(image, level, static_cast<uint64_t>(cv::getTickCount())) {
}

Puzzle::Puzzle(const cv::Mat& image, int level, uint64_t seed)
    : layout_(make_board_layout(image, level)),
      grid_(GridModel::create(level, level * level)),
      shuffler(std::make_unique<Shuffler>(engine, seed)) {
    image_ = image(cv::Rect(0, 0, layout_.board_size, layout_.board_size));
    engine.set_listener([this](const MoveResult& result) { on_move(result); });
    paint_board();
}

MoveResult Puzzle::handle_key(int key) {
    return move(MoveEngine::direction_from_key(key));
}

MoveResult Puzzle::move(Direction dir) {
    MoveResult result = engine.apply_move(grid_, dir);
    if (result.moved()) {
        ++moves_made_;
    }
    return result;
}

std::vector<Direction> Puzzle::shuffle(int moves) {
    auto drawn = shuffler->shuffle(grid_, moves);
    shuffled_ = true;
    moves_made_ = 0;
    return drawn;
}

void Puzzle::on_move(const MoveResult& result) {
    paint_cell(result.from);
    paint_cell(result.to);
}

void Puzzle::paint_board() {
    board_ = cv::Mat(layout_.board_size, layout_.board_size, image_.type(), layout_.runner_color);
    for (int i = 0; i < grid_.total_cells(); ++i) {
        paint_cell(i);
    }
    repaints_ = 0;
}

void Puzzle::paint_cell(int index) {
    int level = grid_.size();
    cv::Rect dst_rect = cell_rect(index, level, layout_.tile_size);
    int tile = grid_.at(index);

    if (tile == RUNNER_TILE) {
        board_(dst_rect).setTo(layout_.runner_color);
    }
    else {
        int ts = layout_.tile_size;
        cv::Rect src_rect(grid_.tile_col(tile) * ts, grid_.tile_row(tile) * ts, ts, ts);
        image_(src_rect).copyTo(board_(dst_rect));
    }

    ++repaints_;
}
