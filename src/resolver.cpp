/**
 * Host validation and one-shot name resolution.
 *
 * Resolution happens exactly once, before the ICMP socket is opened;
 * a failure here is a configuration error, never a probe failure.
 */

#include "cjitter/resolver.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cstring>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>

namespace cjitter {

// ============================================================================
// Helpers
// ============================================================================
static bool is_ipv4_literal(const std::string& s, in_addr* out) {
    in_addr tmp{};
    if (inet_pton(AF_INET, s.c_str(), &tmp) != 1)
        return false;
    if (out) *out = tmp;
    return true;
}

static bool is_ipv6_literal(const std::string& s, in6_addr* out) {
    in6_addr tmp{};
    if (inet_pton(AF_INET6, s.c_str(), &tmp) != 1)
        return false;
    if (out) *out = tmp;
    return true;
}

static std::string numeric_host(const sockaddr* sa, socklen_t len) {
    char buf[NI_MAXHOST];
    if (getnameinfo(sa, len, buf, sizeof(buf), nullptr, 0, NI_NUMERICHOST) != 0)
        return {};
    return buf;
}

// A single hostname label: letters, digits, hyphens, not at the edges
static bool valid_label(const std::string& label) {
    if (label.empty() || label.size() > 63)
        return false;
    if (label.front() == '-' || label.back() == '-')
        return false;
    for (unsigned char c : label) {
        if (!std::isalnum(c) && c != '-')
            return false;
    }
    return true;
}


// ============================================================================
// Public API
// ============================================================================
bool validate_host(const std::string& host) {
    if (host.empty() || host.size() > 253)
        return false;

    if (is_ipv4_literal(host, nullptr) || is_ipv6_literal(host, nullptr))
        return true;

    // Looks like an IPv4 address but is not one, e.g. 999.999.999.999
    bool numeric = true;
    for (unsigned char c : host) {
        if (!std::isdigit(c) && c != '.') {
            numeric = false;
            break;
        }
    }
    if (numeric)
        return false;

    // Fully qualified names may carry a trailing dot
    std::string name = host;
    if (name.back() == '.')
        name.pop_back();

    size_t start = 0;
    while (start <= name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos)
            dot = name.size();
        if (!valid_label(name.substr(start, dot - start)))
            return false;
        start = dot + 1;
    }
    return true;
}


ResolveResult resolve_host(const std::string& host) {
    ResolveResult res{};
    res.target.host = host;

    // Literals: no lookup at all
    in_addr v4{};
    if (is_ipv4_literal(host, &v4)) {
        auto* sa = reinterpret_cast<sockaddr_in*>(&res.target.addr);
        sa->sin_family = AF_INET;
        sa->sin_addr   = v4;
        res.target.family   = AF_INET;
        res.target.addr_len = sizeof(sockaddr_in);
        res.target.ip       = host;
        return res;
    }

    in6_addr v6{};
    if (is_ipv6_literal(host, &v6)) {
        auto* sa = reinterpret_cast<sockaddr_in6*>(&res.target.addr);
        sa->sin6_family = AF_INET6;
        sa->sin6_addr   = v6;
        res.target.family   = AF_INET6;
        res.target.addr_len = sizeof(sockaddr_in6);
        res.target.ip       = host;
        return res;
    }

    addrinfo hints{};
    hints.ai_family   = AF_UNSPEC;
    hints.ai_socktype = SOCK_RAW;
    hints.ai_protocol = 0;

    addrinfo* ai = nullptr;
    int status = getaddrinfo(host.c_str(), nullptr, &hints, &ai);
    if (status != 0) {
        res.error = make_error(ErrorKind::DnsResolution,
                               "DNS resolution error for '" + host + "': " +
                               gai_strerror(status));
        return res;
    }

    // First usable address wins, the rest is ignored
    for (auto* p = ai; p; p = p->ai_next) {
        if (p->ai_family != AF_INET && p->ai_family != AF_INET6)
            continue;
        std::memcpy(&res.target.addr, p->ai_addr, p->ai_addrlen);
        res.target.family   = p->ai_family;
        res.target.addr_len = static_cast<socklen_t>(p->ai_addrlen);
        res.target.ip       = numeric_host(p->ai_addr, res.target.addr_len);
        break;
    }
    freeaddrinfo(ai);

    if (res.target.family == AF_UNSPEC) {
        res.error = make_error(ErrorKind::DnsLookupFailed,
                               "DNS Lookup failed for: " + host);
        return res;
    }

    SPDLOG_DEBUG("Resolved {} to {}", host, res.target.ip);
    return res;
}

} // namespace cjitter
