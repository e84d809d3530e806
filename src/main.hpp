#pragma once

#include <string>

#include <opencv2/opencv.hpp>

constexpr const char* WIN_NAME = "TileShift Sliding Puzzle";
constexpr const char* SETTINGS_FILE = "res/settings.json";

constexpr int ESCAPE_KEY = 27;
constexpr int ENTER_KEY = 13;

struct LevelClickParams {
    int img_x, img_y;
    int draw_w, draw_h;
    int btn_w, btn_h, btn_y;
    int left_btn_x, right_btn_x;
    int level, min_level, max_level;
    int* selected;
    int* nav_dir;
    std::string* hover;
};

struct BoardLayout {
    int board_size;
    int tile_size;
    cv::Scalar runner_color;
};
