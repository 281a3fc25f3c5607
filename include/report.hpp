#pragma once
#include <string>
#include "cjitter/check.hpp"
#include "cjitter/error.hpp"
#include "cjitter/evaluator.hpp"
#include "cjitter/jitter.hpp"

/**
 * Monitoring plugin output.
 *
 * One line on stdout: human readable status, then "|" and the
 * performance data  'label'=value[uom];warn;crit;min
 */

/**
 * "Average Jitter", "Median Jitter", ...
 */
std::string jitter_label(cjitter::AggregationMethod method);

/**
 * Status line for a completed check, value rounded to jitter.precision:
 *   OK - Average Jitter: 1.667ms|'Average Jitter'=1.667ms;0:5;0:10;0
 */
std::string format_status(cjitter::Status status,
                          const cjitter::JitterValue& jitter,
                          const cjitter::Thresholds& thresholds);

/**
 * UNKNOWN line for a fatal error, worded after the error kind.
 */
std::string format_unknown(const cjitter::CheckError& error);

/**
 * Either of the above, depending on whether the check succeeded.
 */
std::string format_result(const cjitter::CheckResult& result);
