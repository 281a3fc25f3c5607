#if !defined(__linux__)
#include "cjitter/probe.hpp"

namespace cjitter {

// Stub for non-Linux builds
IcmpProber::IcmpProber(SocketType type) : type_(type) {}
IcmpProber::~IcmpProber() = default;
void IcmpProber::close() {}

CheckError IcmpProber::open(const Target&) {
    return make_error(ErrorKind::SocketError,
                      "ICMP probing is only implemented for Linux");
}

ProbeOutcome IcmpProber::probe(const Target&, std::chrono::milliseconds, std::size_t index) {
    return ProbeFailure{index, FailureReason::Other, "unsupported platform"};
}

} // namespace cjitter

#else

/**
 * Linux ICMP prober.
 *
 * One socket for the whole check, opened before the first probe:
 *   - SOCK_RAW   + IPPROTO_ICMP(V6): default, needs CAP_NET_RAW
 *   - SOCK_DGRAM + IPPROTO_ICMP(V6): "ping socket", unprivileged but
 *     subject to net.ipv4.ping_group_range; connect()ed so that ICMP
 *     errors surface as EHOSTUNREACH & co. on recv()
 *
 * Each probe sends one Echo Request (seq = sample index) and waits with
 * poll() until the matching reply, a quoted ICMP error or the deadline.
 */

#include "cjitter/probe.hpp"
#include "cjitter/icmp.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <string>

#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace cjitter {

// ============================================================================
// Helpers
// ============================================================================
static bool is_unreachable_errno(int err) {
    return err == EHOSTUNREACH || err == ENETUNREACH ||
           err == ECONNREFUSED || err == EHOSTDOWN;
}

static ProbeFailure failure_from_errno(std::size_t index, int err, const char* call) {
    ProbeFailure f{};
    f.index  = index;
    f.reason = is_unreachable_errno(err) ? FailureReason::Unreachable
                                         : FailureReason::Other;
    f.detail = std::string(call) + "() failed: " + std::strerror(err);
    return f;
}


// ============================================================================
// Lifecycle
// ============================================================================
IcmpProber::IcmpProber(SocketType type)
    : type_(type),
      id_(static_cast<uint16_t>(::getpid() & 0xFFFF))
{
}

IcmpProber::~IcmpProber() {
    close();
}

void IcmpProber::close() {
    if (sock_ >= 0) {
        ::close(sock_);
        sock_ = -1;
    }
}

CheckError IcmpProber::open(const Target& target) {
    close();

    const bool v6 = target.is_ipv6();
    const int domain = v6 ? AF_INET6 : AF_INET;
    const int proto  = v6 ? IPPROTO_ICMPV6 : IPPROTO_ICMP;
    const int kind   = (type_ == SocketType::Raw) ? SOCK_RAW : SOCK_DGRAM;

    int s = ::socket(domain, kind, proto);
    if (s < 0) {
        int err = errno;
        if (err == EPERM || err == EACCES) {
            return make_error(ErrorKind::PermissionDenied,
                type_ == SocketType::Raw
                    ? "Ping failed because of insufficient permissions: raw ICMP "
                      "sockets need root or CAP_NET_RAW (or use --dgram-socket)"
                    : "Ping failed because of insufficient permissions: datagram "
                      "ICMP sockets need a group listed in net.ipv4.ping_group_range");
        }
        return make_error(ErrorKind::SocketError,
                          std::string("Ping failed with IO error: ") + std::strerror(err));
    }

    // Ping sockets only report ICMP errors when connected
    if (type_ == SocketType::Datagram) {
        if (::connect(s, reinterpret_cast<const sockaddr*>(&target.addr),
                      target.addr_len) < 0)
        {
            int err = errno;
            ::close(s);
            return make_error(ErrorKind::SocketError,
                              std::string("Ping failed with IO error: connect() failed: ") +
                              std::strerror(err));
        }
    }

    sock_ = s;
    SPDLOG_DEBUG("Opened {} ICMP{} socket for {}",
                 socket_type_name(type_), v6 ? "v6" : "", target.ip);
    return {};
}


// ============================================================================
// Single probe (blocking)
// ============================================================================
ProbeOutcome IcmpProber::probe(const Target& target,
                               std::chrono::milliseconds timeout,
                               std::size_t index)
{
    if (sock_ < 0)
        return ProbeFailure{index, FailureReason::Other, "socket not open"};

    const bool v6 = target.is_ipv6();
    const uint16_t seq = static_cast<uint16_t>(index & 0xFFFF);

    uint64_t ticks = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch())
            .count());

    std::vector<uint8_t> packet = build_echo_request(v6, id_, seq, ticks);

    // ---------------------------------------------------------------------
    // Send
    // ---------------------------------------------------------------------
    auto t_send = std::chrono::steady_clock::now();

    ssize_t sent = (type_ == SocketType::Datagram)
        ? ::send(sock_, packet.data(), packet.size(), 0)
        : ::sendto(sock_, packet.data(), packet.size(), 0,
                   reinterpret_cast<const sockaddr*>(&target.addr),
                   target.addr_len);

    if (sent < 0)
        return failure_from_errno(index, errno, "send");

    // ---------------------------------------------------------------------
    // Receive loop
    // ---------------------------------------------------------------------
    const auto deadline = t_send + timeout;
    const bool has_ip_header = !v6 && type_ == SocketType::Raw;
    const bool match_id = type_ == SocketType::Raw;

    uint8_t recv_buf[1500];

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;

        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        int wait_ms = static_cast<int>(left.count()) + 1;

        pollfd pfd{};
        pfd.fd = sock_;
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, wait_ms);
        if (ready < 0) {
            if (errno == EINTR)
                continue;
            return failure_from_errno(index, errno, "poll");
        }
        if (ready == 0)
            continue;

        ssize_t n = ::recv(sock_, recv_buf, sizeof(recv_buf), 0);
        if (n < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
                continue;
            return failure_from_errno(index, errno, "recv");
        }

        auto t_recv = std::chrono::steady_clock::now();

        switch (classify_reply(recv_buf, static_cast<size_t>(n), v6,
                               has_ip_header, id_, seq, match_id)) {
        case ReplyKind::EchoReply: {
            double rtt_ms =
                std::chrono::duration<double, std::milli>(t_recv - t_send).count();
            SPDLOG_DEBUG("Ping round {}, duration: {:.3f}ms", index + 1, rtt_ms);
            return ProbeSuccess{rtt_ms, index};
        }
        case ReplyKind::Unreachable:
            SPDLOG_DEBUG("Ping round {}, destination unreachable", index + 1);
            return ProbeFailure{index, FailureReason::Unreachable,
                                "ICMP error quoting our echo request"};
        case ReplyKind::Unrelated:
            break;
        }
    }

    SPDLOG_DEBUG("Ping round {}, no reply within {}ms", index + 1, timeout.count());
    return ProbeFailure{index, FailureReason::Timeout,
                        "No reply within " + std::to_string(timeout.count()) + "ms"};
}

} // namespace cjitter

#endif // __linux__
