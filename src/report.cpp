#include "report.hpp"
#include "cjitter/util.hpp"

#include <sstream>

using namespace cjitter;

std::string jitter_label(AggregationMethod method) {
    return std::string(aggregation_method_name(method)) + " Jitter";
}


// ------------------------------------------------------------
// Completed check
// ------------------------------------------------------------

std::string format_status(Status status,
                          const JitterValue& jitter,
                          const Thresholds& thresholds)
{
    const std::string label = jitter_label(jitter.method);
    const std::string value =
        format_number(round_to_precision(jitter.value, jitter.precision));
    const char* uom = "ms";

    std::ostringstream os;
    os << status_name(status) << " - " << label << ": " << value << uom
       << "|'" << label << "'=" << value << uom << ";"
       << (thresholds.warning ? thresholds.warning->to_string() : "") << ";"
       << (thresholds.critical ? thresholds.critical->to_string() : "") << ";"
       << 0;
    return os.str();
}


// ------------------------------------------------------------
// Fatal errors
// ------------------------------------------------------------

std::string format_unknown(const CheckError& error) {
    const std::string prefix = std::string(status_name(Status::Unknown)) + " - ";

    switch (error.kind) {
    case ErrorKind::CommandLine:
        return prefix + "Command line parsing produced an error: " + error.message;
    case ErrorKind::LoggerInit:
        return prefix + "Failed to initialize logger with error: '" + error.message + "'";
    case ErrorKind::NoThresholds:
    case ErrorKind::InvalidInterval:
    case ErrorKind::InvalidHost:
    case ErrorKind::RangeSyntax:
    case ErrorKind::RangeBounds:
        return prefix + error.message;
    default:
        return prefix + "An error occurred: '" + error.message + "'";
    }
}


std::string format_result(const CheckResult& result) {
    if (!result.ok())
        return format_unknown(result.error);
    return format_status(result.status, result.jitter, result.thresholds);
}
