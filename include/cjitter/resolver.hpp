#pragma once
#include <string>
#include <sys/socket.h>
#include <sys/types.h>
#include "cjitter/error.hpp"
#include "cjitter/visibility.hpp"

namespace cjitter {

/**
 * A host resolved once, before sampling starts.
 */
struct Target {
    std::string host;           // Hostname or literal as given by the operator
    std::string ip;             // Numeric address actually probed
    int family{AF_UNSPEC};      // AF_INET or AF_INET6
    sockaddr_storage addr{};    // Destination for sendto()
    socklen_t addr_len{0};

    bool is_ipv6() const { return family == AF_INET6; }
};

struct ResolveResult {
    Target target;
    CheckError error;

    bool ok() const { return !error.is_error(); }
};

/**
 * Syntactic host check, performed without any DNS traffic.
 *
 * Accepts IPv4/IPv6 literals and anything shaped like a hostname.
 * Rejects dotted all-numeric strings that are not valid IPv4
 * (e.g. "999.999.999.999") so they never reach the resolver.
 */
CJITTER_API bool validate_host(const std::string& host);

/**
 * Resolve `host` to the first address returned by the system resolver.
 * IP literals are converted directly and never trigger a lookup.
 */
CJITTER_API ResolveResult resolve_host(const std::string& host);

} // namespace cjitter
