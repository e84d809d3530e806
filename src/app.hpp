#pragma once

#include "main.hpp"
#include "menu.hpp"
#include "puzzle.hpp"
#include "gallery.hpp"
#include "settings.hpp"
#include "image_loader.hpp"
#include "ft2_text_render.hpp"

#include <memory>
#include <string>
#include <vector>

#include <opencv2/opencv.hpp>

constexpr int STATUS_BAR_H = 60;


class App {
public:
    enum class PlayExit {
        Menu,
        Quit
    };

    static std::string status_text(const Puzzle& puzzle);

public:
    explicit App(const Settings& settings);
    ~App();

    // Returns the process exit code.
    int run(const std::vector<std::string>& image_paths);

private:
    bool load_image(const std::string& error_hint);
    void turn_page(int page_dir);
    PlayExit play(int grid_level);

    void show_frame(const cv::Mat& board, const std::string& status);
    void show_message(const std::string& line1, const std::string& line2);
    void draw_text_overlay(cv::Mat& mat, const std::string& line1, const std::string& line2, int font_height1, int font_height2);

    Settings settings;
    ImageLoader loader;
    FT2TextRenderer ft2;
    std::unique_ptr<Menu> menu;
    std::unique_ptr<Gallery> gallery;
    std::unique_ptr<Puzzle> puzzle;

    cv::Mat image;
    int level;
};
