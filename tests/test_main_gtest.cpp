/*
 * nexrun - Two-stage simulation driver
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

/**
 * @file test_main_gtest.cpp
 * @brief Main entry point for the GTest suite
 */

#include <gtest/gtest.h>
#include <cstdlib>
#include "nexrun/logger.hpp"

int main(int argc, char **argv) {
    // Keep test output readable unless a level is requested explicitly
    if (!std::getenv("NEXRUN_LOG_LEVEL")) {
        nexrun::Logger::setLevel(nexrun::LogLevel::ERROR);
    }

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
