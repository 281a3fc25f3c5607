#include "cjitter/evaluator.hpp"

#include <spdlog/spdlog.h>

namespace cjitter {

Status evaluate(double value, const Thresholds& thresholds) {
    SPDLOG_INFO("Evaluating jitter: {}", value);

    if (thresholds.critical) {
        SPDLOG_INFO("Checking critical threshold: {}", thresholds.critical->to_string());
        if (thresholds.critical->matches(value)) {
            SPDLOG_INFO("Jitter is critical: {}", value);
            return Status::Critical;
        }
        SPDLOG_INFO("Jitter is not critical: {}", value);
    } else {
        SPDLOG_INFO("No critical threshold provided");
    }

    if (thresholds.warning) {
        SPDLOG_INFO("Checking warning threshold: {}", thresholds.warning->to_string());
        if (thresholds.warning->matches(value)) {
            SPDLOG_INFO("Jitter is warning: {}", value);
            return Status::Warning;
        }
        SPDLOG_INFO("Jitter is not warning: {}", value);
    } else {
        SPDLOG_INFO("No warning threshold provided");
    }

    return Status::Ok;
}

const char* status_name(Status status) {
    switch (status) {
    case Status::Ok:       return "OK";
    case Status::Warning:  return "WARNING";
    case Status::Critical: return "CRITICAL";
    case Status::Unknown:  return "UNKNOWN";
    }
    return "UNKNOWN";
}

int exit_code(Status status) {
    return static_cast<int>(status);
}

} // namespace cjitter
