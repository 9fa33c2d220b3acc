/**
 * @file main.cpp
 * @brief Entry point of the Catch unit test runner
 */

#define CATCH_CONFIG_CONSOLE_WIDTH 120
#define CATCH_CONFIG_MAIN  // Catch provides main() - only do this in one cpp file

#include <catch2/catch.hpp>
