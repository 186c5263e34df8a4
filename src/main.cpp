#include "app/Application.hpp"

#include <spdlog/spdlog.h>

#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    try {
        camlink::app::Application app(std::move(args));
        return app.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal error: {}", e.what());
        return 1;
    }
}
