#include "app.hpp"
#include "main.hpp"
#include "settings.hpp"

#include <string>
#include <vector>
#include <iostream>
#include <exception>


int main(int argc, char** argv) {
    try {
        Settings settings = Settings::load(SETTINGS_FILE);
        App app(settings);
        std::vector<std::string> image_paths;
        for (int i = 1; i < argc; ++i) {
            image_paths.emplace_back(argv[i]);
        }
        return app.run(image_paths);
    }
    catch (const std::exception& e) {
        std::cerr << "Fatal: " << e.what() << std::endl;
        return 1;
    }
}
