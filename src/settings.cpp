#include "settings.hpp"

#include <string>
#include <vector>
#include <fstream>
#include <iostream>
#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>


Settings Settings::load(const std::string& json_path) {
    std::ifstream f(json_path);
    if (!f) {
        std::cerr << "No settings file at " << json_path << ", using defaults" << std::endl;
        return Settings{};
    }

    nlohmann::json j;
    try {
        f >> j;
    }
    catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed settings file " + json_path + ": " + e.what());
    }

    return from_json(j);
}

Settings Settings::from_json(const nlohmann::json& j) {
    Settings defaults;
    Settings s;

    s.min_level = std::max(2, j.value("min_level", defaults.min_level));
    s.max_level = std::max(s.min_level, j.value("max_level", defaults.max_level));
    s.level = std::clamp(j.value("level", defaults.level), s.min_level, s.max_level);
    s.board_size = j.value("board_size", defaults.board_size);
    s.shuffle_moves = j.value("shuffle_moves", defaults.shuffle_moves);
    s.cache_limit = j.value("cache_limit", defaults.cache_limit);
    s.images = j.value("images", defaults.images);
    s.font_file = j.value("font_file", defaults.font_file);

    if (s.board_size < s.max_level) {
        throw std::runtime_error("board_size " + std::to_string(s.board_size) + " is too small for " + std::to_string(s.max_level) + " tiles per row");
    }
    if (s.cache_limit < 1) {
        throw std::runtime_error("cache_limit must be positive");
    }
    return s;
}
