/**
 * Check execution logic.
 *
 * Exposes a single entry point used by the CLI frontend.
 * The measurement itself is delegated to cjitter::run_check().
 */

#pragma once
#include <ostream>
#include "cli.hpp"

/**
 * Runs one jitter check and writes the plugin output to `out`:
 * - help/version text, or
 * - an UNKNOWN line for any fatal error, or
 * - the status line with performance data.
 *
 * Returns the monitoring plugin exit code (0..3).
 */
int run_jitter_check(const CliOptions& opt, std::ostream& out);
