#pragma once

#include "main.hpp"
#include "settings.hpp"
#include "ft2_text_render.hpp"

#include <string>

#include <opencv2/opencv.hpp>

// Layout constants
constexpr int WIN_W = 900;
constexpr int WIN_H = 700;
constexpr int MARGIN = 20;
constexpr int BTN_W = 60;
constexpr int BTN_H = 120;
constexpr int CAPTION_FONT_HEIGHT = 36;

struct MenuLayout {
    int win_w, win_h;
    int margin;
    int thumb_w, thumb_h;
    int caption_y, y_offset;
    int draw_w, draw_h, img_x, img_y;
    int btn_w, btn_h, btn_y;
    int left_btn_x, right_btn_x;
};

struct MenuCallbackState {
    int selected;
    int nav_dir;
    std::string* hover;
};

struct MenuChoice {
    enum class Action {
        Play,
        Page,
        Quit
    };

    Action action;
    int level;
    int page_dir = 0;
};

// Level selector: the current image with buttons that step the grid size.
// Up/Down page through the other images.
class Menu {
public:
    static MenuLayout compute_menu_layout(const cv::Mat& preview);
    static int step_level(int level, int nav_dir, int min_level, int max_level);
    static void on_mouse(int event, int x, int y, int flags, void* userdata);

public:
    explicit Menu(const Settings& settings);

    MenuChoice show(const cv::Mat& preview, int level, int page, int total_pages);

private:
    const Settings& settings;
    FT2TextRenderer ft2;
    std::string hover;

private:
    void draw_arrow_btn(cv::Mat& canvas, int x, int y, int w, int h, bool hover, const std::string& arrow, const cv::Scalar& border_color, const cv::Scalar& hover_color, int border_thick, int hover_thick);

    cv::Mat draw_menu(const MenuLayout& menu_layout, const cv::Mat& preview, int level, int page, int total_pages);

    LevelClickParams make_click_params(const MenuLayout& menu_layout, int level, MenuCallbackState& state);
};
