#pragma once

#include <list>
#include <string>
#include <vector>
#include <cstdint>
#include <utility>

#include <opencv2/opencv.hpp>


struct ImageKey {
    uint32_t crc;
    size_t length;

    bool operator==(const ImageKey&) const = default;
};

class ImageLoader {
public:
    static ImageKey make_key(const std::vector<uchar>& bytes);
    static cv::Mat crop_square(const cv::Mat& img);
    static cv::Mat resize_square(const cv::Mat& img, int target_size);

public:
    ImageLoader(int target_size, size_t cache_limit);

public:
    // Square image of target_size pixels, decoded once per distinct file content.
    cv::Mat load(const std::string& path);
    cv::Mat decode(const std::vector<uchar>& bytes);

    size_t cached() const { return cache.size(); }
    int decodes() const { return decodes_; }
    bool contains(const ImageKey& key) const;

private:
    void insert(const ImageKey& key, const cv::Mat& image);

    int target_size;
    size_t cache_limit;
    std::list<std::pair<ImageKey, cv::Mat>> cache;
    int decodes_ = 0;
};
