#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <variant>
#include "cjitter/error.hpp"
#include "cjitter/resolver.hpp"
#include "cjitter/visibility.hpp"

namespace cjitter {

enum class FailureReason {
    Timeout,       // No matching reply before the deadline
    Unreachable,   // ICMP error or EHOSTUNREACH-style socket error
    Other          // send()/recv() failed for another reason
};

/**
 * A reply arrived; rtt_ms is the measured round trip.
 */
struct ProbeSuccess {
    double rtt_ms{0.0};
    std::size_t index{0};
};

struct ProbeFailure {
    std::size_t index{0};
    FailureReason reason{FailureReason::Timeout};
    std::string detail;            // Human readable cause, for debug logs
};

/**
 * Result of one probe. Closed sum type: code that walks a sample
 * sequence has to handle both alternatives explicitly.
 */
using ProbeOutcome = std::variant<ProbeSuccess, ProbeFailure>;

inline bool is_success(const ProbeOutcome& outcome) {
    return std::holds_alternative<ProbeSuccess>(outcome);
}

CJITTER_API std::size_t outcome_index(const ProbeOutcome& outcome);

CJITTER_API const char* failure_reason_name(FailureReason reason);

/**
 * Transport used to send echo requests.
 */
enum class SocketType {
    Raw,        // SOCK_RAW, needs root or CAP_NET_RAW
    Datagram    // SOCK_DGRAM ping socket, needs net.ipv4.ping_group_range
};

CJITTER_API const char* socket_type_name(SocketType type);

/**
 * Sends exactly one echo request per call and blocks until the reply or
 * the timeout. Implementations never retry.
 */
class CJITTER_API Prober {
public:
    virtual ~Prober() = default;

    virtual ProbeOutcome probe(const Target& target,
                               std::chrono::milliseconds timeout,
                               std::size_t index) = 0;
};

/**
 * ICMP/ICMPv6 prober backed by a single socket.
 *
 * open() must succeed before the first probe(); the socket is released
 * by the destructor, whatever path the check leaves through.
 */
class CJITTER_API IcmpProber : public Prober {
public:
    explicit IcmpProber(SocketType type);
    ~IcmpProber() override;

    IcmpProber(const IcmpProber&) = delete;
    IcmpProber& operator=(const IcmpProber&) = delete;

    CheckError open(const Target& target);
    bool is_open() const { return sock_ >= 0; }

    ProbeOutcome probe(const Target& target,
                       std::chrono::milliseconds timeout,
                       std::size_t index) override;

private:
    void close();

    SocketType type_;
    int sock_{-1};
    uint16_t id_{0};
};

} // namespace cjitter
