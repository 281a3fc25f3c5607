#pragma once
#include <string>
#include <vector>
#include "cjitter/error.hpp"
#include "cjitter/probe.hpp"
#include "cjitter/visibility.hpp"

namespace cjitter {

enum class AggregationMethod {
    Average,
    Median,
    Max,
    Min
};

/**
 * Parse a method name, case-insensitively.
 * Accepts average/avg/mean, median/med, max/maximum, min/minimum.
 *
 * @return false (and leaves `out` untouched) on unknown names
 */
CJITTER_API bool parse_aggregation_method(const std::string& s, AggregationMethod& out);

/**
 * Display name: "Average", "Median", "Max", "Min".
 */
CJITTER_API const char* aggregation_method_name(AggregationMethod method);

struct DeltaResult {
    std::vector<double> deltas;   // Milliseconds, all >= 0
    CheckError error;

    bool ok() const { return !error.is_error(); }
};

/**
 * Absolute RTT differences between samples that are adjacent in the
 * original sequence and both successful. A failed sample breaks the
 * pair on its left and the pair on its right; it is never bridged.
 *
 * Fails with EmptyDeltas when no such pair exists.
 */
CJITTER_API DeltaResult compute_deltas(const std::vector<ProbeOutcome>& samples);

/**
 * Aggregated jitter, full precision. `precision` only matters to
 * whoever renders the value.
 */
struct JitterValue {
    double value{0.0};
    AggregationMethod method{AggregationMethod::Average};
    int precision{3};
};

struct JitterResult {
    JitterValue jitter;
    CheckError error;

    bool ok() const { return !error.is_error(); }
};

/**
 * Reduce a delta sequence to one value.
 * Median of an even count is the mean of the two middle values.
 */
CJITTER_API JitterResult aggregate(const std::vector<double>& deltas,
                                   AggregationMethod method);

} // namespace cjitter
