#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>
#include "cjitter/visibility.hpp"

/**
 * ICMP / ICMPv6 echo header. Both protocols share the same layout for
 * Echo Request/Reply, only the type values differ.
 * Matches wire format exactly, so keep this struct packed.
 */
#pragma pack(push, 1)
struct IcmpHeader {
    uint8_t  type;      // Echo Request: 8 (v4) / 128 (v6)
    uint8_t  code;      // unused for Echo
    uint16_t checksum;  // left at 0 for ICMPv6, the kernel fills it
    uint16_t id;        // Identifier (host-chosen, rewritten on ping sockets)
    uint16_t seq;       // Sequence number = sample index
    // The echo payload follows immediately
};
#pragma pack(pop)

namespace cjitter {

constexpr uint8_t kIcmpEchoReply        = 0;
constexpr uint8_t kIcmpDestUnreachable  = 3;
constexpr uint8_t kIcmpEchoRequest      = 8;
constexpr uint8_t kIcmpTimeExceeded     = 11;

constexpr uint8_t kIcmp6DestUnreachable = 1;
constexpr uint8_t kIcmp6TimeExceeded    = 3;
constexpr uint8_t kIcmp6EchoRequest     = 128;
constexpr uint8_t kIcmp6EchoReply       = 129;

// Same data size as ping(8): 8 bytes of timestamp + 48 bytes of padding
constexpr size_t kEchoPayloadSize = 56;

/**
 * What a datagram read from the ICMP socket means for the probe in flight.
 */
enum class ReplyKind {
    Unrelated,     // Someone else's traffic, keep waiting
    EchoReply,     // The reply to our request
    Unreachable    // An ICMP error quoting our request
};

/**
 * Build an Echo Request ready to hand to send()/sendto().
 *
 * @param ipv6       Build an ICMPv6 request instead of ICMPv4
 * @param id         Identifier in host byte order
 * @param seq        Sequence number in host byte order
 * @param timestamp  Opaque send timestamp copied into the payload
 */
CJITTER_API std::vector<uint8_t> build_echo_request(bool ipv6,
                                                    uint16_t id,
                                                    uint16_t seq,
                                                    uint64_t timestamp);

/**
 * Match a received datagram against the request identified by (id, seq).
 *
 * @param has_ip_header  Raw IPv4 sockets prepend the IPv4 header
 * @param match_id       Ping (datagram) sockets rewrite the identifier,
 *                       in that case only the sequence number is compared
 */
CJITTER_API ReplyKind classify_reply(const uint8_t* buf,
                                     size_t len,
                                     bool ipv6,
                                     bool has_ip_header,
                                     uint16_t id,
                                     uint16_t seq,
                                     bool match_id);

} // namespace cjitter
