#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "cjitter/error.hpp"
#include "cjitter/evaluator.hpp"
#include "cjitter/jitter.hpp"
#include "cjitter/probe.hpp"
#include "cjitter/resolver.hpp"
#include "cjitter/sampler.hpp"
#include "cjitter/scheduler.hpp"
#include "cjitter/visibility.hpp"

namespace cjitter {

/**
 * Everything one check invocation needs, as supplied by the operator.
 */
struct CheckConfig {
    std::string host;                                  // Hostname or IP
    SocketType socket_type{SocketType::Raw};
    int samples{10};                                   // Must be > 2
    std::chrono::milliseconds timeout{1000};           // Per probe, > 0
    std::chrono::milliseconds min_interval{0};
    std::chrono::milliseconds max_interval{0};
    AggregationMethod method{AggregationMethod::Average};
    int precision{3};                                  // Output decimals only
    std::optional<std::string> warning;                // Range expressions
    std::optional<std::string> critical;
};

/**
 * Numeric sanity checks: interval bounds, sample count, timeout.
 * Thresholds and host are checked separately.
 */
CJITTER_API CheckError validate_config(const CheckConfig& cfg);

struct ThresholdsResult {
    Thresholds thresholds;
    CheckError error;

    bool ok() const { return !error.is_error(); }
};

/**
 * Parse the warning/critical expressions of `cfg`. Absent expressions
 * stay absent; the error message names the offending expression.
 */
CJITTER_API ThresholdsResult parse_thresholds(const CheckConfig& cfg);

struct CheckResult {
    Status status{Status::Unknown};
    JitterValue jitter;
    Thresholds thresholds;
    std::vector<ProbeOutcome> samples;
    std::vector<double> deltas;
    CheckError error;             // Set => status is Unknown

    bool ok() const { return !error.is_error(); }
};

/**
 * Full measurement pipeline against an already resolved target:
 * validate, sample, compute deltas, aggregate, evaluate.
 *
 * Configuration errors are returned before the first probe is sent.
 * Worst case runtime is samples * (timeout + max_interval).
 */
CJITTER_API CheckResult run_check(const CheckConfig& cfg,
                                  const Target& target,
                                  Prober& prober,
                                  Scheduler& scheduler,
                                  const Sleeper& sleeper = thread_sleeper());

} // namespace cjitter
