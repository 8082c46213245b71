/*
 * optfile-expand
 * Expands @file references in its own arguments and prints the result, one
 * argument per record (newline, or NUL with -0).
 */
#include <optfile/cli/front_end.hpp>
#include <optfile/config/config.hpp>
#include <iostream>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return optfile::run_front_end(args, optfile::load_config(optfile::default_config_path()), std::cout, std::cerr);
}
