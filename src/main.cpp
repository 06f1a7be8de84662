#include <exception>
#include <iostream>
#include <stdexcept>

#include "app/shell_app.hpp"
#include "config/settings.hpp"
#include "logging/logger.hpp"

int main() {
    guardsh::Settings settings;
    try {
        settings = guardsh::Settings::load();
    } catch (const std::runtime_error &ex) {
        std::cerr << "guardsh: " << ex.what() << std::endl;
        return 2;
    }

    guardsh::Logger::instance().initialize(settings.logging);

    try {
        guardsh::ShellApp app(settings);
        return app.run();
    } catch (const std::exception &ex) {
        GUARDSH_ERROR("fatal: {}", ex.what());
        std::cerr << "guardsh: " << ex.what() << std::endl;
        return 1;
    }
}
