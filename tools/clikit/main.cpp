/**
 * clikit CLI - Entry Point
 */

#include "launcher.hpp"

#include <iostream>
#include <string>
#include <vector>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return clikit::cli::run_launcher(args, {std::cout, std::cerr, std::cin});
}
