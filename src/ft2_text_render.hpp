#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <iostream>

#include <ft2build.h>
#include FT_FREETYPE_H
#include <opencv2/opencv.hpp>


inline std::vector<uint32_t> utf8_to_codepoints(const std::string& utf8) {
    std::vector<uint32_t> codepoints;
    size_t i = 0;
    auto cont = [&](size_t k) -> uint32_t { return i + k < utf8.size() ? (utf8[i + k] & 0x3F) : 0; };

    while (i < utf8.size()) {
        uint32_t cp = 0;
        unsigned char c = utf8[i];
        if (c < 0x80) { cp = c; i += 1; }
        else if ((c & 0xE0) == 0xC0) { cp = ((c & 0x1F) << 6) | cont(1); i += 2; }
        else if ((c & 0xF0) == 0xE0) { cp = ((c & 0x0F) << 12) | (cont(1) << 6) | cont(2); i += 3; }
        else if ((c & 0xF8) == 0xF0) { cp = ((c & 0x07) << 18) | (cont(1) << 12) | (cont(2) << 6) | cont(3); i += 4; }
        else { i += 1; continue; }
        codepoints.push_back(cp);
    }
    return codepoints;
}


// Status-line text for the puzzle window. Falls back to the Hershey font
// when the FreeType face can't be loaded.
class FT2TextRenderer {
public:
    FT2TextRenderer(const std::string& font_path, int font_height = 32) : font_height(font_height) {
        if (FT_Init_FreeType(&ftlib) != 0) {
            std::cerr << "Failed to initialise FreeType" << std::endl;
            ftlib = nullptr;
            return;
        }

        if (FT_New_Face(ftlib, font_path.c_str(), 0, &face) != 0) {
            std::cerr << "Failed to load font: " << font_path << std::endl;
            face = nullptr;
            return;
        }

        FT_Set_Pixel_Sizes(face, 0, font_height);
    }

    ~FT2TextRenderer() {
        if (face) FT_Done_Face(face);
        if (ftlib) FT_Done_FreeType(ftlib);
    }

    FT2TextRenderer(const FT2TextRenderer&) = delete;
    FT2TextRenderer& operator=(const FT2TextRenderer&) = delete;

    int text_width(const std::string& text, int thickness = 1) {
        if (!face) {
            int baseline = 0;
            return cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, font_height / 32.0, thickness, &baseline).width;
        }

        int width = 0;
        for (auto cp : utf8_to_codepoints(text)) {
            if (FT_Load_Char(face, cp, FT_LOAD_DEFAULT)) continue;
            width += (face->glyph->advance.x >> 6);
        }
        return width;
    }

    // Draws UTF-8 text with its baseline at org.y, in BGR color
    void draw_text(cv::Mat& img, const std::string& text, cv::Point org, cv::Scalar color, int thickness = 1, bool center = false) {
        int x = org.x;
        if (center) {
            x -= text_width(text, thickness) / 2;
        }

        if (!face) {
            cv::putText(img, text, cv::Point(x, org.y), cv::FONT_HERSHEY_SIMPLEX, font_height / 32.0, color, thickness, cv::LINE_AA);
            return;
        }

        for (auto cp : utf8_to_codepoints(text)) {
            if (FT_Load_Char(face, cp, FT_LOAD_RENDER)) continue;

            FT_GlyphSlot slot = face->glyph;
            int y = org.y - slot->bitmap_top;
            int w = slot->bitmap.width, h = slot->bitmap.rows;

            for (int row = 0; row < h; ++row) {
                for (int col = 0; col < w; ++col) {
                    int px = x + slot->bitmap_left + col;
                    int py = y + row;

                    if (px < 0 || py < 0 || px >= img.cols || py >= img.rows) {
                        continue;
                    }

                    uchar alpha = slot->bitmap.buffer[row * slot->bitmap.pitch + col];
                    auto& pixel = img.at<cv::Vec3b>(py, px);
                    for (int c = 0; c < 3; ++c) {
                        pixel[c] = (uchar)((pixel[c] * (255 - alpha) + color[c] * alpha) / 255);
                    }
                }
            }
            x += (slot->advance.x >> 6);
        }
    }

private:
    FT_Library ftlib = nullptr;
    FT_Face face = nullptr;
    int font_height = 32;
};
