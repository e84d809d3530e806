#include <gtest/gtest.h>

#include "ft2_text_render.hpp"

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>


TEST(TextRender, Utf8Decoding) {
    EXPECT_EQ(utf8_to_codepoints("Ab"), (std::vector<uint32_t>{'A', 'b'}));
    EXPECT_EQ(utf8_to_codepoints("\xE2\x86\x90"), (std::vector<uint32_t>{0x2190}));
    // Truncated sequence at the end of the string does not read past it
    EXPECT_EQ(utf8_to_codepoints("a\xE2\x86").size(), 2u);
}

TEST(TextRender, FallbackWidthFollowsThickness) {
    FT2TextRenderer ft2("no/such/font.ttf", 32);
    const std::string text = "Solved in 12 moves";

    int baseline = 0;
    int thin = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, 1.0, 1, &baseline).width;
    int thick = cv::getTextSize(text, cv::FONT_HERSHEY_SIMPLEX, 1.0, 4, &baseline).width;

    EXPECT_EQ(ft2.text_width(text), thin);
    EXPECT_EQ(ft2.text_width(text, 4), thick);
}
