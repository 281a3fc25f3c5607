/**
 * Monitoring plugin range expressions.
 *
 *   [@] ( N | N: | ~:N | N:M | :M | ~: )
 *
 * A bare N means {0 .. N}, "~" is negative infinity, an empty end is
 * positive infinity and "@" alerts inside the range instead of outside.
 */

#include "cjitter/range.hpp"
#include "cjitter/util.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>

namespace cjitter {

static constexpr double kInf = std::numeric_limits<double>::infinity();

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

// [+-]? ( digits [. digits*] | . digits ), nothing else: strtod alone
// would also accept "inf", "nan", hex floats and exponents
static bool parse_number(const std::string& s, double& out) {
    size_t i = 0;
    if (i < s.size() && (s[i] == '+' || s[i] == '-'))
        ++i;

    size_t int_digits = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        ++i;
        ++int_digits;
    }

    size_t frac_digits = 0;
    if (i < s.size() && s[i] == '.') {
        ++i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
            ++i;
            ++frac_digits;
        }
    }

    if (i != s.size() || (int_digits == 0 && frac_digits == 0))
        return false;

    out = std::strtod(s.c_str(), nullptr);
    return true;
}

static RangeParseResult syntax_error(const std::string& detail) {
    RangeParseResult res{};
    res.error = make_error(ErrorKind::RangeSyntax, detail);
    return res;
}


// ============================================================================
// ThresholdRange
// ============================================================================
ThresholdRange::ThresholdRange() : lower_(0.0), upper_(kInf), invert_(false) {}

ThresholdRange::ThresholdRange(double lower, double upper, bool invert)
    : lower_(lower), upper_(upper), invert_(invert)
{
}

bool ThresholdRange::matches(double value) const {
    const bool inside = value >= lower_ && value <= upper_;
    return inside == invert_;
}

std::string ThresholdRange::to_string() const {
    std::string s = invert_ ? "@" : "";
    s += (lower_ == -kInf) ? "~" : format_number(lower_);
    s += ":";
    if (upper_ != kInf)
        s += format_number(upper_);
    return s;
}

bool ThresholdRange::operator==(const ThresholdRange& other) const {
    return lower_ == other.lower_ && upper_ == other.upper_ &&
           invert_ == other.invert_;
}


// ============================================================================
// Parser
// ============================================================================
RangeParseResult parse_range(const std::string& expr) {
    std::string s = trim(expr);
    if (s.empty())
        return syntax_error("empty range expression");

    bool invert = false;
    if (s[0] == '@') {
        invert = true;
        s.erase(0, 1);
        if (s.empty())
            return syntax_error("missing range after '@'");
    }

    double lower = 0.0;
    double upper = kInf;

    const size_t colon = s.find(':');
    if (colon == std::string::npos) {
        // Bare N: {0 .. N}
        if (!parse_number(s, upper))
            return syntax_error("'" + s + "' is not a valid number");
    } else {
        if (s.find(':', colon + 1) != std::string::npos)
            return syntax_error("more than one ':' in range");

        const std::string start = s.substr(0, colon);
        const std::string end   = s.substr(colon + 1);

        if (start == "~") {
            lower = -kInf;
        } else if (!start.empty() && !parse_number(start, lower)) {
            return syntax_error("'" + start + "' is not a valid range start");
        }

        if (!end.empty() && !parse_number(end, upper))
            return syntax_error("'" + end + "' is not a valid range end");
    }

    RangeParseResult res{};
    if (lower > upper) {
        res.error = make_error(ErrorKind::RangeBounds,
                               "start of range (" + format_number(lower) +
                               ") is greater than end (" + format_number(upper) + ")");
        return res;
    }

    res.range = ThresholdRange(lower, upper, invert);
    return res;
}

} // namespace cjitter
