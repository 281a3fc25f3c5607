#pragma once
#include <string>
#include <utility>
#include "cjitter/visibility.hpp"

namespace cjitter {

/**
 * Every fatal condition a check can run into.
 *
 * Probe failures (timeouts, unreachable replies) are NOT listed here:
 * they are recorded as ProbeFailure outcomes and never stop a run.
 */
enum class ErrorKind {
    None,
    CommandLine,          // Unknown flag, missing or malformed value
    LoggerInit,           // Log sink could not be created
    NoThresholds,         // Neither --warning nor --critical given
    InvalidSampleCount,   // Fewer than 3 samples
    InvalidTimeout,       // Per-probe timeout of 0ms
    InvalidInterval,      // min_interval > max_interval
    RangeSyntax,          // Malformed range expression
    RangeBounds,          // Range start greater than range end
    InvalidHost,          // Host string is not a hostname or IP
    DnsLookupFailed,      // Resolver returned no address
    DnsResolution,        // Resolver itself failed
    PermissionDenied,     // Socket creation refused (missing capability)
    SocketError,          // Any other socket setup failure
    EmptyDeltas           // No pair of adjacent successful samples
};

/**
 * Coarse grouping used when deciding how an error is reported.
 */
enum class ErrorCategory {
    None,
    Configuration,   // Detected before the first probe is sent
    Transport,       // The ICMP socket could not be set up
    Measurement      // Sampling finished but yielded nothing to report
};

/**
 * Error value carried by every fallible operation.
 * A default constructed CheckError means "no error".
 */
struct CheckError {
    ErrorKind kind{ErrorKind::None};
    std::string message;

    bool is_error() const { return kind != ErrorKind::None; }
};

CJITTER_API ErrorCategory error_category(ErrorKind kind);

CJITTER_API const char* error_kind_name(ErrorKind kind);

inline CheckError make_error(ErrorKind kind, std::string message) {
    return CheckError{kind, std::move(message)};
}

} // namespace cjitter
