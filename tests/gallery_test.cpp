#include <gtest/gtest.h>

#include "gallery.hpp"
#include "image_loader.hpp"

#include <cstdio>
#include <string>
#include <vector>
#include <stdexcept>

#include <opencv2/opencv.hpp>


class GalleryTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(cv::imwrite(first, cv::Mat(60, 90, CV_8UC3, cv::Scalar(10, 20, 30))));
        ASSERT_TRUE(cv::imwrite(second, cv::Mat(70, 70, CV_8UC3, cv::Scalar(200, 100, 50))));
    }

    void TearDown() override {
        std::remove(first.c_str());
        std::remove(second.c_str());
    }

    const std::string first = "gallery_test_first.png";
    const std::string second = "gallery_test_second.png";
};


TEST_F(GalleryTest, ReturningToAnImageReusesTheCachedPixels) {
    ImageLoader loader(50, 10);
    Gallery gallery(loader, {first, second});

    cv::Mat a = gallery.current();
    gallery.step(1);
    cv::Mat b = gallery.current();
    gallery.step(-1);
    cv::Mat again = gallery.current();

    EXPECT_EQ(loader.decodes(), 2);
    EXPECT_EQ(loader.cached(), 2u);
    EXPECT_EQ(again.data, a.data);
    EXPECT_NE(b.data, a.data);
    EXPECT_EQ(again.at<cv::Vec3b>(25, 25), cv::Vec3b(10, 20, 30));
    EXPECT_EQ(b.at<cv::Vec3b>(25, 25), cv::Vec3b(200, 100, 50));
}

TEST_F(GalleryTest, EvictedImageIsDecodedAgain) {
    ImageLoader loader(50, 1);
    Gallery gallery(loader, {first, second});

    gallery.current();
    gallery.step(1);
    gallery.current();
    gallery.step(1);
    gallery.current();

    EXPECT_EQ(loader.decodes(), 3);
    EXPECT_EQ(loader.cached(), 1u);
}

TEST_F(GalleryTest, StepWrapsAtBothEnds) {
    ImageLoader loader(50, 10);
    Gallery gallery(loader, {first, second, first});

    EXPECT_EQ(gallery.total_pages(), 3);
    EXPECT_EQ(gallery.step(-1), 2);
    EXPECT_EQ(gallery.step(1), 0);
    EXPECT_EQ(gallery.step(4), 1);
    EXPECT_EQ(gallery.path(), second);
}

TEST_F(GalleryTest, SamePathTwiceDecodesOnce) {
    ImageLoader loader(50, 10);
    Gallery gallery(loader, {first, second, first});

    cv::Mat a = gallery.current();
    gallery.step(2);
    cv::Mat c = gallery.current();

    EXPECT_EQ(loader.decodes(), 1);
    EXPECT_EQ(a.data, c.data);
}

TEST(Gallery, RejectsEmptyPathList) {
    ImageLoader loader(50, 10);
    EXPECT_THROW(Gallery(loader, std::vector<std::string>{}), std::invalid_argument);
}

TEST(Gallery, UnreadablePageThrowsAndKeepsPosition) {
    ImageLoader loader(50, 10);
    Gallery gallery(loader, {"no/such/image.png"});

    EXPECT_THROW(gallery.current(), std::runtime_error);
    EXPECT_EQ(gallery.page(), 0);
    EXPECT_EQ(loader.decodes(), 0);
}
