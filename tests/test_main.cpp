/**
 * @file test_main.cpp
 * @brief snipq Test Suite Entry Point
 *
 * Uses Google Test for unit and integration tests.
 */

#include <gtest/gtest.h>

#include <csignal>

int main(int argc, char** argv) {
    // Socket tests close connections the server may still write to
    signal(SIGPIPE, SIG_IGN);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
