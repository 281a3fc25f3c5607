#pragma once
#include <optional>
#include "cjitter/range.hpp"
#include "cjitter/visibility.hpp"

namespace cjitter {

/**
 * Plugin status, ordered by severity. Unknown is reserved for fatal
 * errors and is never returned by evaluate().
 */
enum class Status {
    Ok = 0,
    Warning = 1,
    Critical = 2,
    Unknown = 3
};

struct Thresholds {
    std::optional<ThresholdRange> warning;
    std::optional<ThresholdRange> critical;
};

/**
 * Critical is checked first, then warning; Ok when neither fires
 * (or neither is set).
 */
CJITTER_API Status evaluate(double value, const Thresholds& thresholds);

/**
 * "OK", "WARNING", "CRITICAL", "UNKNOWN".
 */
CJITTER_API const char* status_name(Status status);

/**
 * Process exit code: 0, 1, 2, 3.
 */
CJITTER_API int exit_code(Status status);

} // namespace cjitter
