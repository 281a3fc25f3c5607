#include "cli.hpp"
#include "runner.hpp"

#include <iostream>

/**
 * Entry point for the check_jitter monitoring plugin.
 */
int main(int argc, char** argv) {
    CliOptions options = parse_args(argc, argv);
    return run_jitter_check(options, std::cout);
}
