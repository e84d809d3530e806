#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>


struct Settings {
    int level = 3;
    int min_level = 2;
    int max_level = 8;
    int board_size = 800;
    int shuffle_moves = 1000;
    int cache_limit = 10;

    std::vector<std::string> images;
    std::string font_file = "res/NotoSansJP-Regular.ttf";

    static Settings load(const std::string& json_path);
    static Settings from_json(const nlohmann::json& j);
};
