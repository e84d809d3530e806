#pragma once

#include "image_loader.hpp"

#include <string>
#include <vector>

#include <opencv2/opencv.hpp>


// Image paths the player pages through. Every page goes through the loader,
// so returning to an image already seen is a cache hit.
class Gallery {
public:
    Gallery(ImageLoader& loader, std::vector<std::string> paths);

public:
    cv::Mat current();
    // Moves by nav_dir pages, wrapping at either end, and returns the new page.
    int step(int nav_dir);

    int page() const { return page_; }
    int total_pages() const { return static_cast<int>(paths.size()); }
    const std::string& path() const { return paths[page_]; }

private:
    ImageLoader& loader;
    std::vector<std::string> paths;
    int page_ = 0;
};
