#include "menu.hpp"

#include "main.hpp"
#include "util.hpp"
#include "settings.hpp"
#include "move_engine.hpp"

#include <string>
#include <algorithm>

#include <opencv2/opencv.hpp>


MenuLayout Menu::compute_menu_layout(const cv::Mat& preview) {
    MenuLayout menu_layout {
        .win_w = WIN_W,
        .win_h = WIN_H,
        .margin = MARGIN,
        .thumb_w = WIN_W - 2 * MARGIN - 2 * BTN_W,
        .thumb_h = WIN_H - 160,
        .caption_y = WIN_H - 60,
        .y_offset = MARGIN + CAPTION_FONT_HEIGHT,
    };

    int preview_area_x = menu_layout.margin + BTN_W;
    int preview_area_y = menu_layout.y_offset;
    int preview_area_w = menu_layout.thumb_w;
    int preview_area_h = menu_layout.thumb_h;

    // Previews are square, so the shorter side of the area bounds both
    int side = std::min(preview_area_w, preview_area_h);
    if (!preview.empty() && preview.cols != preview.rows) {
        double aspect = static_cast<double>(preview.cols) / preview.rows;
        side = static_cast<int>(std::min<double>(side, side * aspect));
    }

    menu_layout.draw_w = side;
    menu_layout.draw_h = side;
    menu_layout.img_x = preview_area_x + (preview_area_w - side) / 2;
    menu_layout.img_y = preview_area_y + (preview_area_h - side) / 2;
    menu_layout.btn_w = BTN_W;
    menu_layout.btn_h = BTN_H;
    menu_layout.btn_y = preview_area_y + (preview_area_h - menu_layout.btn_h) / 2;
    menu_layout.left_btn_x = menu_layout.margin;
    menu_layout.right_btn_x = menu_layout.win_w - menu_layout.margin - menu_layout.btn_w;
    return menu_layout;
}

int Menu::step_level(int level, int nav_dir, int min_level, int max_level) {
    return std::clamp(level + nav_dir, min_level, max_level);
}

void Menu::on_mouse(int event, int x, int y, int /*flags*/, void* userdata) {
    auto* params = static_cast<LevelClickParams*>(userdata);
    if (!params) {
        return;
    }

    cv::Rect left(params->left_btn_x, params->btn_y, params->btn_w, params->btn_h);
    cv::Rect right(params->right_btn_x, params->btn_y, params->btn_w, params->btn_h);
    cv::Rect image(params->img_x, params->img_y, params->draw_w, params->draw_h);

    std::string new_hover = "none";
    if (Util::contains(left, x, y))       new_hover = "left";
    else if (Util::contains(right, x, y)) new_hover = "right";
    else if (Util::contains(image, x, y)) new_hover = "image";

    if (event == cv::EVENT_MOUSEMOVE) {
        *params->hover = new_hover;
        return;
    }

    if (event != cv::EVENT_LBUTTONDOWN) {
        return;
    }

    if (new_hover == "left" && params->level > params->min_level) {
        *params->nav_dir = -1;
    }
    else if (new_hover == "right" && params->level < params->max_level) {
        *params->nav_dir = 1;
    }
    else if (new_hover == "image") {
        *params->selected = params->level;
    }
}

Menu::Menu(const Settings& settings) : settings(settings), ft2(settings.font_file, CAPTION_FONT_HEIGHT), hover("none") {}

// Helper to draw an arrow button (left/right)
void Menu::draw_arrow_btn(cv::Mat& canvas, int x, int y, int w, int h, bool hover, const std::string& arrow, const cv::Scalar& border_color, const cv::Scalar& hover_color, int border_thick, int hover_thick) {
    cv::Scalar color = hover ? hover_color : border_color;
    int thick = hover ? hover_thick : border_thick;

    cv::rectangle(canvas, cv::Rect(x, y, w, h), color, -1);
    cv::rectangle(canvas, cv::Rect(x, y, w, h), color, thick);

    int arrow_cx = x + w / 2;
    int arrow_cy = y + h / 2 + 12;
    ft2.draw_text(canvas, arrow, cv::Point(arrow_cx, arrow_cy), cv::Scalar(255,255,255), 3, true);
}

cv::Mat Menu::draw_menu(const MenuLayout& menu_layout, const cv::Mat& preview, int level, int page, int total_pages) {
    cv::namedWindow(WIN_NAME, cv::WINDOW_AUTOSIZE);
    cv::resizeWindow(WIN_NAME, menu_layout.win_w, menu_layout.win_h);
    cv::Mat canvas = cv::Mat(menu_layout.win_h, menu_layout.win_w, CV_8UC3, cv::Scalar(30,30,30));

    std::string title = "Choose a level";
    if (total_pages > 1) {
        title += "  (" + std::to_string(page + 1) + "/" + std::to_string(total_pages) + ")";
    }
    ft2.draw_text(canvas, title, cv::Point(menu_layout.win_w/2, menu_layout.y_offset - 8), cv::Scalar(255,255,255), 2, true);

    cv::Rect img_rect(menu_layout.img_x, menu_layout.img_y, menu_layout.draw_w, menu_layout.draw_h);
    cv::Mat thumb;
    cv::resize(preview, thumb, img_rect.size(), 0, 0, cv::INTER_AREA);
    thumb.copyTo(canvas(img_rect));

    cv::Scalar border_color(80,140,220);
    cv::Scalar hover_color(180,220,255);
    int border_thick = 4, hover_thick = 8;

    // Grid lines preview how the image will be cut
    int step = menu_layout.draw_w / level;
    for (int i = 1; i < level; ++i) {
        cv::line(canvas, cv::Point(img_rect.x + i * step, img_rect.y), cv::Point(img_rect.x + i * step, img_rect.br().y), border_color, 1);
        cv::line(canvas, cv::Point(img_rect.x, img_rect.y + i * step), cv::Point(img_rect.br().x, img_rect.y + i * step), border_color, 1);
    }

    cv::Scalar img_border = (hover == "image") ? hover_color : border_color;
    int img_thick = (hover == "image") ? hover_thick : border_thick;
    cv::rectangle(canvas, img_rect, img_border, img_thick);

    if (level > settings.min_level) {
        draw_arrow_btn(canvas, menu_layout.left_btn_x, menu_layout.btn_y, menu_layout.btn_w, menu_layout.btn_h, hover == "left", "<", border_color, hover_color, border_thick, hover_thick);
    }
    if (level < settings.max_level) {
        draw_arrow_btn(canvas, menu_layout.right_btn_x, menu_layout.btn_y, menu_layout.btn_w, menu_layout.btn_h, hover == "right", ">", border_color, hover_color, border_thick, hover_thick);
    }

    ft2.draw_text(canvas, Util::level_caption(level), cv::Point(menu_layout.win_w/2, menu_layout.caption_y), cv::Scalar(255,255,80), 2, true);
    cv::imshow(WIN_NAME, canvas);

    return canvas;
}

LevelClickParams Menu::make_click_params(const MenuLayout& menu_layout, int level, MenuCallbackState& state) {
    return LevelClickParams{
        menu_layout.img_x, menu_layout.img_y, menu_layout.draw_w, menu_layout.draw_h,
        menu_layout.btn_w, menu_layout.btn_h, menu_layout.btn_y, menu_layout.left_btn_x, menu_layout.right_btn_x,
        level, settings.min_level, settings.max_level,
        &state.selected, &state.nav_dir, state.hover
    };
}

MenuChoice Menu::show(const cv::Mat& preview, int level, int page, int total_pages) {
    level = std::clamp(level, settings.min_level, settings.max_level);
    MenuLayout menu_layout = compute_menu_layout(preview);

    while (true) {
        MenuCallbackState cb_state{ -1, 0, &hover };
        std::string last_hover = hover;
        int page_dir = 0;

        draw_menu(menu_layout, preview, level, page, total_pages);
        LevelClickParams cb_params = make_click_params(menu_layout, level, cb_state);
        cv::setMouseCallback(WIN_NAME, Menu::on_mouse, &cb_params);

        while (cb_state.selected == -1 && cb_state.nav_dir == 0 && page_dir == 0) {
            int key = cv::waitKeyEx(10);
            if (cv::getWindowProperty(WIN_NAME, cv::WND_PROP_VISIBLE) < 1 || key == ESCAPE_KEY) {
                cv::setMouseCallback(WIN_NAME, nullptr, nullptr);
                return MenuChoice{MenuChoice::Action::Quit, level};
            }

            if (key == ENTER_KEY || key == '\n' || key == ' ') {
                cb_state.selected = level;
            }
            else if (key != -1) {
                Direction dir = MoveEngine::direction_from_key(key);
                if (dir == Direction::Left) cb_state.nav_dir = -1;
                if (dir == Direction::Right) cb_state.nav_dir = 1;
                if (total_pages > 1 && dir == Direction::Up) page_dir = -1;
                if (total_pages > 1 && dir == Direction::Down) page_dir = 1;
            }

            if (hover != last_hover) {
                last_hover = hover;
                draw_menu(menu_layout, preview, level, page, total_pages);
            }
        }

        cv::setMouseCallback(WIN_NAME, nullptr, nullptr);
        if (cb_state.selected != -1) {
            return MenuChoice{MenuChoice::Action::Play, cb_state.selected};
        }
        if (page_dir != 0) {
            return MenuChoice{MenuChoice::Action::Page, level, page_dir};
        }

        level = step_level(level, cb_state.nav_dir, settings.min_level, settings.max_level);
    }
}
