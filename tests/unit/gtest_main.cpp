#include <gtest/gtest.h>
#include <cstdlib>
#include <iostream>

#include "config/Config.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        auto level = spdlog::level::warn;
        if (const char* raw = std::getenv("VOLCAT_TEST_LOG_LEVEL"); raw && *raw)
            level = vc::config::parseLogLevel(raw);
        vc::logging::LogRegistry::initConsole(level);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize volcat test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
