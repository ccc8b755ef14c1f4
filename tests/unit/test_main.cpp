#include <gtest/gtest.h>
#include <opencv2/core.hpp>

#include <iostream>

#include "omr/Logging.hpp"

int main(int argc, char** argv) {
    std::cout << "========================================\n";
    std::cout << "omr-grader Unit Tests\n";
    std::cout << "OpenCV: " << CV_VERSION << "\n";
    std::cout << "========================================\n\n";

    omr::setupLogging("warn");

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
