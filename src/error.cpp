#include "cjitter/error.hpp"

namespace cjitter {

ErrorCategory error_category(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return ErrorCategory::None;
    case ErrorKind::PermissionDenied:
    case ErrorKind::SocketError:
        return ErrorCategory::Transport;
    case ErrorKind::EmptyDeltas:
        return ErrorCategory::Measurement;
    case ErrorKind::CommandLine:
    case ErrorKind::LoggerInit:
    case ErrorKind::NoThresholds:
    case ErrorKind::InvalidSampleCount:
    case ErrorKind::InvalidTimeout:
    case ErrorKind::InvalidInterval:
    case ErrorKind::RangeSyntax:
    case ErrorKind::RangeBounds:
    case ErrorKind::InvalidHost:
    case ErrorKind::DnsLookupFailed:
    case ErrorKind::DnsResolution:
        return ErrorCategory::Configuration;
    }
    return ErrorCategory::Configuration;
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:               return "None";
    case ErrorKind::CommandLine:        return "CommandLine";
    case ErrorKind::LoggerInit:         return "LoggerInit";
    case ErrorKind::NoThresholds:       return "NoThresholds";
    case ErrorKind::InvalidSampleCount: return "InvalidSampleCount";
    case ErrorKind::InvalidTimeout:     return "InvalidTimeout";
    case ErrorKind::InvalidInterval:    return "InvalidInterval";
    case ErrorKind::RangeSyntax:        return "RangeSyntax";
    case ErrorKind::RangeBounds:        return "RangeBounds";
    case ErrorKind::InvalidHost:        return "InvalidHost";
    case ErrorKind::DnsLookupFailed:    return "DnsLookupFailed";
    case ErrorKind::DnsResolution:      return "DnsResolution";
    case ErrorKind::PermissionDenied:   return "PermissionDenied";
    case ErrorKind::SocketError:        return "SocketError";
    case ErrorKind::EmptyDeltas:        return "EmptyDeltas";
    }
    return "Unknown";
}

} // namespace cjitter
