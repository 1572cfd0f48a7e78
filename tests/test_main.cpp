#include <gtest/gtest.h>

#include "omr/Logger.hpp"

#include <iostream>

int main(int argc, char** argv) {
    std::cout << "========================================\n";
    std::cout << "omrfeedback Unit Tests\n";
    std::cout << "========================================\n\n";

    // decoder and pipeline log every run at info level
    omr::setLogLevel(omr::LogLevel::Warning);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
