#include "cjitter/jitter.hpp"
#include "cjitter/util.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <sstream>

namespace cjitter {

// ============================================================================
// Aggregation method names
// ============================================================================
bool parse_aggregation_method(const std::string& s, AggregationMethod& out) {
    const std::string m = to_lower(s);

    if (m == "average" || m == "avg" || m == "mean") {
        out = AggregationMethod::Average;
    } else if (m == "median" || m == "med") {
        out = AggregationMethod::Median;
    } else if (m == "max" || m == "maximum") {
        out = AggregationMethod::Max;
    } else if (m == "min" || m == "minimum") {
        out = AggregationMethod::Min;
    } else {
        return false;
    }
    return true;
}

const char* aggregation_method_name(AggregationMethod method) {
    switch (method) {
    case AggregationMethod::Average: return "Average";
    case AggregationMethod::Median:  return "Median";
    case AggregationMethod::Max:     return "Max";
    case AggregationMethod::Min:     return "Min";
    }
    return "Average";
}

static std::string join_ms(const std::vector<double>& values) {
    std::ostringstream os;
    os << "[";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i) os << ", ";
        os << format_number(values[i]) << "ms";
    }
    os << "]";
    return os.str();
}


// ============================================================================
// Deltas (temporal order, no sorting)
// ============================================================================
DeltaResult compute_deltas(const std::vector<ProbeOutcome>& samples) {
    DeltaResult res{};

    if (samples.size() < 2) {
        res.error = make_error(ErrorKind::InvalidSampleCount,
                               "At least 3 samples are required to calculate jitter, got " +
                               std::to_string(samples.size()) + ".");
        return res;
    }

    res.deltas.reserve(samples.size() - 1);

    for (size_t i = 1; i < samples.size(); ++i) {
        const auto* prev = std::get_if<ProbeSuccess>(&samples[i - 1]);
        const auto* cur  = std::get_if<ProbeSuccess>(&samples[i]);

        // A failure on either side breaks continuity
        if (!prev || !cur)
            continue;
        if (cur->index != prev->index + 1)
            continue;

        res.deltas.push_back(std::fabs(cur->rtt_ms - prev->rtt_ms));
    }

    if (res.deltas.empty()) {
        res.error = make_error(ErrorKind::EmptyDeltas,
                               "The delta count is 0. Cannot calculate jitter.");
        return res;
    }

    SPDLOG_DEBUG("Deltas: {}", join_ms(res.deltas));
    return res;
}


// ============================================================================
// Aggregation
// ============================================================================
static double average_of(const std::vector<double>& deltas) {
    const double sum = std::accumulate(deltas.begin(), deltas.end(), 0.0);
    SPDLOG_DEBUG("Sum of deltas: {}ms", sum);
    return sum / static_cast<double>(deltas.size());
}

static double median_of(const std::vector<double>& deltas) {
    auto sorted = deltas;
    std::sort(sorted.begin(), sorted.end());
    SPDLOG_DEBUG("Sorted deltas: {}", join_ms(sorted));

    const size_t n = sorted.size();
    return (n % 2 == 0)
        ? (sorted[n / 2 - 1] + sorted[n / 2]) / 2.0
        : sorted[n / 2];
}

JitterResult aggregate(const std::vector<double>& deltas, AggregationMethod method) {
    JitterResult res{};
    res.jitter.method = method;

    if (deltas.empty()) {
        res.error = make_error(ErrorKind::EmptyDeltas,
                               "The delta count is 0. Cannot calculate jitter.");
        return res;
    }

    switch (method) {
    case AggregationMethod::Average:
        res.jitter.value = average_of(deltas);
        break;
    case AggregationMethod::Median:
        res.jitter.value = median_of(deltas);
        break;
    case AggregationMethod::Max:
        res.jitter.value = *std::max_element(deltas.begin(), deltas.end());
        break;
    case AggregationMethod::Min:
        res.jitter.value = *std::min_element(deltas.begin(), deltas.end());
        break;
    }

    SPDLOG_DEBUG("{} jitter: {}ms", aggregation_method_name(method), res.jitter.value);
    return res;
}

} // namespace cjitter
