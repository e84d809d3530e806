#include "gallery.hpp"

#include "image_loader.hpp"

#include <string>
#include <vector>
#include <utility>
#include <stdexcept>

#include <opencv2/opencv.hpp>


Gallery::Gallery(ImageLoader& loader, std::vector<std::string> paths) : loader(loader), paths(std::move(paths)) {
    if (this->paths.empty()) {
        throw std::invalid_argument("Gallery needs at least one image path");
    }
}

cv::Mat Gallery::current() {
    return loader.load(paths[page_]);
}

int Gallery::step(int nav_dir) {
    int total = total_pages();
    page_ = ((page_ + nav_dir) % total + total) % total;
    return page_;
}
