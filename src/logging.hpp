#pragma once
#include "cjitter/error.hpp"

/**
 * Install the process-wide spdlog logger "check_jitter".
 *
 * Everything goes to stderr: stdout carries nothing but the plugin
 * status line. Verbosity (number of -v flags):
 *   0-1 : errors only
 *   2   : info
 *   3   : debug, with [file:line]
 */
cjitter::CheckError init_logging(int verbosity);
