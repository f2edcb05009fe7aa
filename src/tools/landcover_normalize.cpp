/**
 * @file landcover_normalize.cpp
 * @brief Command-line driver running both normalizers from a run config.
 */

#include "normalize_runtime.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    const std::vector<std::string> args(argv, argv + argc);
    return lcn::run_normalize_command(args, std::cout, std::cerr);
}
