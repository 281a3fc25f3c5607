#include "cjitter/probe.hpp"

namespace cjitter {

std::size_t outcome_index(const ProbeOutcome& outcome) {
    if (const auto* ok = std::get_if<ProbeSuccess>(&outcome))
        return ok->index;
    return std::get<ProbeFailure>(outcome).index;
}

const char* failure_reason_name(FailureReason reason) {
    switch (reason) {
    case FailureReason::Timeout:     return "timeout";
    case FailureReason::Unreachable: return "unreachable";
    case FailureReason::Other:       return "other";
    }
    return "other";
}

const char* socket_type_name(SocketType type) {
    return type == SocketType::Datagram ? "Datagram" : "Raw";
}

} // namespace cjitter
