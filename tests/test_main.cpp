/**
 * @file test_main.cpp
 * @brief GoogleTest main entry point
 *
 * Build: cmake --build . --target locsync_tests
 * Run:   ./locsync_tests
 */

#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    spdlog::set_level(spdlog::level::off);
    return RUN_ALL_TESTS();
}
