#include "app.hpp"

#include "main.hpp"
#include "menu.hpp"
#include "util.hpp"
#include "puzzle.hpp"
#include "gallery.hpp"
#include "settings.hpp"
#include "image_loader.hpp"

#include <memory>
#include <string>
#include <vector>
#include <iostream>
#include <algorithm>
#include <stdexcept>

#include <opencv2/opencv.hpp>


std::string App::status_text(const Puzzle& puzzle) {
    if (!puzzle.shuffled()) {
        return "Press S to shuffle";
    }
    if (puzzle.is_solved()) {
        return "Solved in " + std::to_string(puzzle.moves_made()) + " moves";
    }
    return "Moves: " + std::to_string(puzzle.moves_made());
}

App::App(const Settings& settings)
    : settings(settings),
      loader(settings.board_size, static_cast<size_t>(settings.cache_limit)),
      ft2(settings.font_file, 28),
      menu(std::make_unique<Menu>(this->settings)),
      gallery(nullptr),
      puzzle(nullptr),
      level(settings.level) {
}

App::~App() {
    cv::destroyAllWindows();
}

int App::run(const std::vector<std::string>& image_paths) {
    std::vector<std::string> paths = image_paths.empty() ? settings.images : image_paths;
    if (paths.empty()) {
        std::cerr << "Usage: TileShift <image> [image...]" << std::endl;
        return 1;
    }

    gallery = std::make_unique<Gallery>(loader, paths);

    cv::namedWindow(WIN_NAME, cv::WINDOW_AUTOSIZE);
    if (!load_image("Press any key to exit")) {
        // Leave the error on screen until the player dismisses it
        cv::waitKey(0);
        return 1;
    }

    while (true) {
        MenuChoice choice = menu->show(image, level, gallery->page(), gallery->total_pages());
        level = choice.level;

        if (choice.action == MenuChoice::Action::Quit) {
            break;
        }
        if (choice.action == MenuChoice::Action::Page) {
            turn_page(choice.page_dir);
            continue;
        }

        if (play(level) == PlayExit::Quit) {
            break;
        }
    }

    puzzle.reset();
    cv::destroyAllWindows();
    return 0;
}

bool App::load_image(const std::string& error_hint) {
    show_message("Processing image...", "");
    cv::waitKey(1);

    try {
        image = gallery->current();
    }
    catch (const std::exception& e) {
        std::cerr << "Error processing image " << gallery->path() << ": " << e.what() << std::endl;
        show_message("Error processing image", error_hint);
        return false;
    }
    return true;
}

void App::turn_page(int page_dir) {
    // Any in-flight puzzle belongs to the previous image
    puzzle.reset();
    gallery->step(page_dir);

    if (load_image("Press any key to go back")) {
        return;
    }

    // image still holds the previous page
    cv::waitKey(0);
    gallery->step(-page_dir);
}

App::PlayExit App::play(int grid_level) {
    // Any previous session's grid is discarded here
    puzzle = std::make_unique<Puzzle>(image, grid_level);
    show_frame(puzzle->board(), status_text(*puzzle));

    while (true) {
        int key = cv::waitKeyEx(10);
        if (cv::getWindowProperty(WIN_NAME, cv::WND_PROP_VISIBLE) < 1 || key == ESCAPE_KEY) {
            return PlayExit::Quit;
        }
        if (key == -1) {
            continue;
        }

        if (Util::is_key(key, 'l')) {
            return PlayExit::Menu;
        }

        if (Util::is_key(key, 's')) {
            puzzle->shuffle(settings.shuffle_moves);
        }
        else if (!puzzle->handle_key(key).moved()) {
            continue;
        }

        show_frame(puzzle->board(), status_text(*puzzle));
    }
}

void App::show_frame(const cv::Mat& board, const std::string& status) {
    cv::Mat frame(board.rows + STATUS_BAR_H, board.cols, board.type(), cv::Scalar(30, 30, 30));
    board.copyTo(frame(cv::Rect(0, 0, board.cols, board.rows)));

    cv::Scalar color = (puzzle && puzzle->shuffled() && puzzle->is_solved()) ? cv::Scalar(0, 255, 0) : cv::Scalar(255, 255, 255);
    ft2.draw_text(frame, status, cv::Point(frame.cols / 2, board.rows + STATUS_BAR_H / 2 + 10), color, 2, true);
    ft2.draw_text(frame, Util::level_caption(puzzle ? puzzle->grid().size() : level), cv::Point(16, board.rows + STATUS_BAR_H / 2 + 10), cv::Scalar(200, 200, 200), 1);

    cv::imshow(WIN_NAME, frame);
}

void App::show_message(const std::string& line1, const std::string& line2) {
    cv::Mat canvas(settings.board_size, settings.board_size, CV_8UC3, cv::Scalar(30, 30, 30));
    draw_text_overlay(canvas, line1, line2, 48, 28);
    cv::imshow(WIN_NAME, canvas);
}

void App::draw_text_overlay(cv::Mat& mat, const std::string& line1, const std::string& line2, int font_height1, int font_height2) {
    int cx = mat.cols / 2;
    int cy = mat.rows / 2 - (font_height1 + font_height2) / 2;
    int box_w = std::max(ft2.text_width(line1, 2), ft2.text_width(line2, 2)) + 60;
    int box_h = font_height1 + font_height2 + 60;

    // Semi-transparent background box
    cv::Rect box_rect(cx - box_w / 2, cy - 30, box_w, box_h);
    box_rect &= cv::Rect(0, 0, mat.cols, mat.rows);
    cv::Mat overlay = mat.clone();
    cv::rectangle(overlay, box_rect, cv::Scalar(0, 0, 0), cv::FILLED);
    cv::addWeighted(overlay, 0.6, mat, 0.4, 0, mat);

    int text1_y = cy + font_height1;
    int text2_y = text1_y + font_height2 + 10;

    if (!line1.empty()) {
        ft2.draw_text(mat, line1, cv::Point(cx, text1_y), cv::Scalar(255, 255,  80), 2, true);
    }
    if (!line2.empty()) {
        ft2.draw_text(mat, line2, cv::Point(cx, text2_y), cv::Scalar(255, 255, 255), 2, true);
    }
}
