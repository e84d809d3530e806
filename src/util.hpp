#pragma once

#include <cctype>
#include <string>

#include <opencv2/opencv.hpp>

class Util {
public:
    static bool contains(const cv::Rect& r, int x, int y) {
        return x >= r.x && x < r.x + r.width && y >= r.y && y < r.y + r.height;
    }

    static std::string level_caption(int level) {
        return std::to_string(level) + " x " + std::to_string(level);
    }

    // Letter keys only; waitKeyEx reports arrows as wide codes whose low byte aliases letters
    static bool is_key(int key, char c) {
        return key == std::tolower(c) || key == std::toupper(c);
    }
};
