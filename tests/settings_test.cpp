#include <gtest/gtest.h>

#include "settings.hpp"

#include <cstdio>
#include <string>
#include <vector>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>


TEST(Settings, DefaultsWhenKeysMissing) {
    Settings s = Settings::from_json(nlohmann::json::object());

    EXPECT_EQ(s.level, 3);
    EXPECT_EQ(s.min_level, 2);
    EXPECT_EQ(s.max_level, 8);
    EXPECT_EQ(s.board_size, 800);
    EXPECT_EQ(s.shuffle_moves, 1000);
    EXPECT_EQ(s.cache_limit, 10);
    EXPECT_TRUE(s.images.empty());
}

TEST(Settings, OverridesAndClampsLevel) {
    auto j = nlohmann::json{{"level", 12}, {"max_level", 6}, {"board_size", 600}, {"images", {"cat.jpg", "dog.png"}}};
    Settings s = Settings::from_json(j);

    EXPECT_EQ(s.max_level, 6);
    EXPECT_EQ(s.level, 6);
    EXPECT_EQ(s.board_size, 600);
    EXPECT_EQ(s.images, (std::vector<std::string>{"cat.jpg", "dog.png"}));
}

TEST(Settings, MinLevelNeverBelowTwo) {
    Settings s = Settings::from_json(nlohmann::json{{"min_level", 1}, {"level", 1}});
    EXPECT_EQ(s.min_level, 2);
    EXPECT_EQ(s.level, 2);
}

TEST(Settings, RejectsImpossibleValues) {
    EXPECT_THROW(Settings::from_json(nlohmann::json{{"board_size", 4}}), std::runtime_error);
    EXPECT_THROW(Settings::from_json(nlohmann::json{{"cache_limit", 0}}), std::runtime_error);
}

TEST(Settings, MissingFileGivesDefaults) {
    Settings s = Settings::load("no_such_settings.json");
    EXPECT_EQ(s.level, 3);
}

TEST(Settings, MalformedFileThrows) {
    const char* path = "settings_test_bad.json";
    {
        std::ofstream f(path);
        f << "{ \"level\": ";
    }
    EXPECT_THROW(Settings::load(path), std::runtime_error);
    std::remove(path);
}
