#pragma once
#include <string>
#include "cjitter/error.hpp"
#include "cjitter/visibility.hpp"

namespace cjitter {

/**
 * Monitoring plugin threshold range.
 *
 *   10      alert if x < 0 or x > 10
 *   10:     alert if x < 10
 *   ~:10    alert if x > 10
 *   10:20   alert if x < 10 or x > 20
 *   @10:20  alert if 10 <= x <= 20
 *
 * Bounds are inclusive. Infinite bounds are stored as +/-infinity.
 */
class CJITTER_API ThresholdRange {
public:
    ThresholdRange();
    ThresholdRange(double lower, double upper, bool invert);

    double lower() const { return lower_; }
    double upper() const { return upper_; }
    bool inverted() const { return invert_; }

    /**
     * True when `value` must raise an alert: outside [lower, upper],
     * or inside it for an inverted ("@") range.
     */
    bool matches(double value) const;

    /**
     * Canonical text used in performance data, e.g. "0:10", "10:",
     * "~:10", "@10:20".
     */
    std::string to_string() const;

    bool operator==(const ThresholdRange& other) const;

private:
    double lower_;
    double upper_;
    bool invert_;
};

struct RangeParseResult {
    ThresholdRange range;
    CheckError error;          // RangeSyntax or RangeBounds

    bool ok() const { return !error.is_error(); }
};

CJITTER_API RangeParseResult parse_range(const std::string& expr);

} // namespace cjitter
