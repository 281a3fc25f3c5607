#pragma once
#include <string>
#include <vector>
#include "cjitter/check.hpp"
#include "cjitter/error.hpp"

/**
 * Parsed command-line options for the check_jitter executable.
 *
 * Flat and CLI-oriented; the measurement parameters live in the
 * embedded cjitter::CheckConfig and are handed over unchanged.
 */
struct CliOptions {
    cjitter::CheckConfig check;   // Host, samples, intervals, thresholds...

    int verbose{0};               // Number of -v flags, 0..3
    bool show_help{false};        // -h / --help
    bool show_version{false};     // -V / --version

    cjitter::CheckError error;    // Set when the command line is invalid
};

/**
 * Parse all command-line arguments into a CliOptions struct.
 * Parsing stops at the first invalid argument, recorded in `error`.
 */
CliOptions parse_args(int argc, char** argv);

/**
 * Same, on arguments without the program name.
 */
CliOptions parse_args(const std::vector<std::string>& args);

std::string usage_text();

std::string version_text();
