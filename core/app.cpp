/**
 * @file app.cpp
 * @brief Implementation of core application functionality
 */

#include "app.h"
#include "../greeting.h"
#include <cstdlib>
#include <iostream>

namespace Greeting {

AppConfig defaultConfig() {
    AppConfig config;
    config.names = {"Alice", "Bob", "Charlie"};
    return config;
}

bool initializeApp(const AppConfig& config) {
    // Any name list is valid, the empty one included.
    static_cast<void>(config);
    return true;
}

bool greetAll(std::ostream& out, const std::vector<std::string>& names) {
    for (const auto& name : names) {
        out << greet(name) << '\n';
        if (!out) {
            return false;
        }
    }
    return true;
}

bool shutdownApp() {
    std::cout.flush();
    return static_cast<bool>(std::cout);
}

int runApp(const AppConfig& config, std::ostream& out) {
    if (!initializeApp(config)) {
        std::cerr << "Failed to initialize app" << std::endl;
        return EXIT_FAILURE;
    }

    bool written = greetAll(out, config.names);
    out.flush();

    if (!written || !out) {
        std::cerr << "Failed to write greetings" << std::endl;
        return EXIT_FAILURE;
    }

    if (!shutdownApp()) {
        std::cerr << "Failed to flush standard output" << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}

} // namespace Greeting
