#include <lib/system/logger.hpp>

#include <gtest/gtest.h>

int main(int argc, char** argv) {
    logger::initialize(logging::settings{});

    ::testing::InitGoogleTest(&argc, argv);
    const int result = RUN_ALL_TESTS();

    logger::cleanup();
    return result;
}
