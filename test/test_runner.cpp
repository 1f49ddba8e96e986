// test/test_runner.cpp
// -----------------------------------------------------------
// Google Test entry point shared by the unit and integration suites.
// Console logging is muted so test output stays readable; set
// PIIANON_TEST_LOGS=1 to see it.

#include <cstdlib>
#include <string>
#include <gtest/gtest.h>

#include "util/logger.hpp"

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);

    const char* showLogs = std::getenv("PIIANON_TEST_LOGS");
    if (!showLogs || std::string(showLogs) != "1") {
        piianon::util::logger::Logger::getInstance().setConsoleOutput(false);
    }
    return RUN_ALL_TESTS();
}
