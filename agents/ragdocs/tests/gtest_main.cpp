#include <gtest/gtest.h>
#include <filesystem>
#include <iostream>

#include "log_registry.hpp"

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    try {
        LogConfig cfg;
        cfg.dir = fs::temp_directory_path() / "ragdocs_test_logs";
        cfg.console_level = "warn";
        LogRegistry::init(cfg);
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize ragdocs test environment: " << e.what() << std::endl;
        return 1;
    }

    return RUN_ALL_TESTS();
}
