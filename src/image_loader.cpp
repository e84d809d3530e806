#include "image_loader.hpp"

#include <string>
#include <vector>
#include <fstream>
#include <iterator>
#include <iostream>
#include <algorithm>
#include <stdexcept>

#include <zlib.h>
#include <opencv2/opencv.hpp>


ImageKey ImageLoader::make_key(const std::vector<uchar>& bytes) {
    uLong crc = crc32(0L, Z_NULL, 0);
    crc = crc32(crc, bytes.data(), static_cast<uInt>(bytes.size()));
    return ImageKey{static_cast<uint32_t>(crc), bytes.size()};
}

cv::Mat ImageLoader::crop_square(const cv::Mat& img) {
    int size = std::min(img.cols, img.rows);
    int x = img.cols > size ? (img.cols - size) / 2 : 0;
    int y = img.rows > size ? (img.rows - size) / 2 : 0;
    return img(cv::Rect(x, y, size, size));
}

cv::Mat ImageLoader::resize_square(const cv::Mat& img, int target_size) {
    if (img.empty()) {
        throw std::invalid_argument("Cannot resize an empty image");
    }

    cv::Mat resized;
    cv::resize(crop_square(img), resized, cv::Size(target_size, target_size), 0, 0, cv::INTER_AREA);
    return resized;
}

ImageLoader::ImageLoader(int target_size, size_t cache_limit) : target_size(target_size), cache_limit(cache_limit) {
}

cv::Mat ImageLoader::load(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) {
        throw std::runtime_error("Failed to open image file: " + path);
    }

    std::vector<uchar> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (bytes.empty()) {
        throw std::runtime_error("Image file is empty: " + path);
    }

    return decode(bytes);
}

cv::Mat ImageLoader::decode(const std::vector<uchar>& bytes) {
    ImageKey key = make_key(bytes);
    auto it = std::find_if(cache.begin(), cache.end(), [&](const auto& entry) { return entry.first == key; });
    if (it != cache.end()) {
        return it->second;
    }

    cv::Mat decoded = cv::imdecode(bytes, cv::IMREAD_COLOR);
    ++decodes_;
    if (decoded.empty()) {
        throw std::runtime_error("Failed to decode image (" + std::to_string(bytes.size()) + " bytes)");
    }

    cv::Mat square = resize_square(decoded, target_size);
    insert(key, square);

    std::cout << "Loaded " << decoded.cols << "x" << decoded.rows << " image as " << target_size << "x" << target_size << std::endl;
    return square;
}

bool ImageLoader::contains(const ImageKey& key) const {
    return std::any_of(cache.begin(), cache.end(), [&](const auto& entry) { return entry.first == key; });
}

void ImageLoader::insert(const ImageKey& key, const cv::Mat& image) {
    cache.emplace_back(key, image);

    while (cache.size() > cache_limit) {
        cache.pop_front();
    }
}
