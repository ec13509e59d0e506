#include <gtest/gtest.h>
#include <iostream>

#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        pc::config::ConfigRegistry::init();
        pc::logging::LogRegistry::init();
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize potcheck test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
