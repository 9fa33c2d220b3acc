/**
 * @file main.cpp
 * @brief marginalia-id entry point
 */

#include <marginalia/cli/command.hpp>

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    const std::vector<std::string> args(argv + 1, argv + argc);
    return marginalia::cli::run(args, std::cin, std::cout, std::cerr);
}
